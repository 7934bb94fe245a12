/**
 * @file simulation_session.cpp
 * @brief Simulation session implementation.
 * @author Watosn
 */

#include "edlsim/session/simulation_session.hpp"

#include <utility>

#include "edlsim/phase/vehicle_state.hpp"

namespace edlsim::session {

SimulationSession::SimulationSession(edlsim::trajectory::Trajectory trajectory,
                                     edlsim::phase::MissionProfile profile,
                                     const edlsim::core::PhysicsConfig& physics,
                                     const edlsim::models::AtmosphereConfig& atmosphere)
    : physics_(physics),
      atmosphere_(physics_, atmosphere),
      original_(trajectory),
      trajectory_(std::move(trajectory)),
      phases_(std::move(profile)),
      current_time_s_(trajectory_.start_time()) {}

StepResult SimulationSession::observe(const double time_s, const bool seeking) {
  StepResult out{};
  out.sample = trajectory_.query(time_s);
  if (!out.sample) {
    return out;
  }
  current_time_s_ = out.sample->time_s;
  trajectory_.set_current_time(current_time_s_);

  out.vehicle = edlsim::phase::make_vehicle_state(*out.sample, atmosphere_, physics_);
  out.phase = seeking ? phases_.seek(out.vehicle) : phases_.update(out.vehicle);
  out.phase_progress = phases_.progress(current_time_s_);
  return out;
}

StepResult SimulationSession::step_to(const double time_s) {
  return observe(time_s, time_s < current_time_s_);
}

StepResult SimulationSession::seek(const double time_s) { return observe(time_s, true); }

edlsim::dynamics::DeflectionResult SimulationSession::steer(const double lateral, const double radial, const double final_percent) {
  auto result = edlsim::dynamics::apply_deflection(
      trajectory_,
      edlsim::dynamics::DeflectionRequest{
          .cut_time_s = current_time_s_, .lateral = lateral, .radial = radial, .final_percent = final_percent});
  if (result.status == edlsim::core::Status::Ok) {
    trajectory_ = result.trajectory;
  }
  return result;
}

edlsim::dynamics::IntegrationResult SimulationSession::replan(const edlsim::trajectory::BankAngleProfile& profile) {
  const edlsim::dynamics::EntryIntegrator integrator(atmosphere_, physics_);
  auto result = integrator.continue_from(trajectory_, current_time_s_, profile);
  if (result.status == edlsim::core::Status::Ok) {
    trajectory_ = result.trajectory;
  }
  return result;
}

void SimulationSession::reset_to_original() {
  trajectory_ = original_;
  trajectory_.set_current_index(0);
  phases_.reset();
  current_time_s_ = trajectory_.start_time();
}

}  // namespace edlsim::session
