/**
 * @file test_session_end_to_end.cpp
 * @brief Playback, steering and replanning through a simulation session.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "edlsim/phase/mission_profiles.hpp"
#include "edlsim/session/simulation_session.hpp"

namespace {

bool same_position(const edlsim::core::TrajectorySample& a, const edlsim::core::TrajectorySample& b) {
  return a.time_s == b.time_s && a.position_m.x == b.position_m.x && a.position_m.y == b.position_m.y &&
         a.position_m.z == b.position_m.z;
}

}  // namespace

int main() {
  using namespace edlsim;
  const core::PhysicsConfig physics{};
  session::SimulationSession sim(trajectory::make_sample_trajectory(trajectory::make_trajectory_config(physics)),
                                 phase::make_mars2020_profile(), physics);

  std::size_t prev_phase = 0;
  std::size_t transitions = 0;
  for (double t = 0.0; t < 262.0; t += 1.0) {
    const auto step = sim.step_to(t);
    if (!step.sample || step.phase.new_phase < prev_phase || step.phase.mission_status == phase::MissionStatus::Failure ||
        step.phase_progress < 0.0 || step.phase_progress > 1.0) {
      spdlog::error("playback broke at t={}", t);
      return 1;
    }
    transitions += step.phase.phase_changed ? 1 : 0;
    prev_phase = step.phase.new_phase;
  }
  if (sim.phases().state().status != phase::MissionStatus::Success || transitions != 4 || sim.current_time() != 260.65) {
    spdlog::error("playback should finish in success status={} transitions={} t={}",
                  phase::to_string(sim.phases().state().status), transitions, sim.current_time());
    return 2;
  }

  // Rewinding is a seek and recomputes the phase.
  const auto rewound = sim.step_to(50.0);
  if (rewound.phase.new_phase != 1 || rewound.phase.mission_status != phase::MissionStatus::Active ||
      sim.phases().current_phase().name != "Guidance Start") {
    spdlog::error("rewind to t=50 should land in guidance start");
    return 3;
  }

  const auto at_cut = sim.seek(100.0);
  const std::size_t cut = sim.trajectory().current_index();
  if (!at_cut.sample || sim.trajectory().past().size() != cut + 1) {
    spdlog::error("seek did not move the playback cursor");
    return 4;
  }
  const auto steered = sim.steer(1.0, 0.0, 0.1);
  if (steered.status != core::Status::Ok || steered.cut_index != cut || steered.mutated_count == 0) {
    spdlog::error("steer failed status={}", core::to_string(steered.status));
    return 5;
  }
  for (std::size_t i = 0; i <= cut; ++i) {
    if (!same_position(sim.trajectory()[i], sim.original()[i])) {
      spdlog::error("steer changed the traveled path at {}", i);
      return 6;
    }
  }
  const std::size_t last = sim.trajectory().size() - 1;
  if (same_position(sim.trajectory()[last], sim.original()[last])) {
    spdlog::error("steer did not change the untraveled path");
    return 7;
  }

  const auto replanned = sim.replan(trajectory::BankAngleProfile::constant(30.0));
  if (replanned.status != core::Status::Ok || sim.trajectory().empty() ||
      !(std::abs(sim.trajectory().end_time() - sim.original().end_time()) < 1e-9)) {
    spdlog::error("replan failed status={}", core::to_string(replanned.status));
    return 8;
  }
  for (std::size_t i = 0; i <= cut; ++i) {
    if (!same_position(sim.trajectory()[i], sim.original()[i])) {
      spdlog::error("replan changed the traveled path at {}", i);
      return 9;
    }
  }
  if (sim.trajectory()[cut + 1].bank_angle_deg != 30.0) {
    spdlog::error("replanned samples should carry the commanded bank");
    return 10;
  }

  sim.reset_to_original();
  if (sim.current_time() != 0.0 || sim.trajectory().size() != sim.original().size() ||
      !same_position(sim.trajectory()[last], sim.original()[last]) || sim.phases().state().phase_index != 0) {
    spdlog::error("reset did not restore the loaded trajectory");
    return 11;
  }
  return 0;
}
