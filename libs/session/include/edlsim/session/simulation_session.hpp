/**
 * @file simulation_session.hpp
 * @brief Single owner of a trajectory, its phase machine and steering operations.
 * @author Watosn
 */
#pragma once

#include <optional>

#include "edlsim/core/physics_config.hpp"
#include "edlsim/dynamics/deflection.hpp"
#include "edlsim/dynamics/entry_integrator.hpp"
#include "edlsim/models/exponential_atmosphere.hpp"
#include "edlsim/phase/phase_machine.hpp"
#include "edlsim/trajectory/bank_angle_profile.hpp"
#include "edlsim/trajectory/trajectory.hpp"

namespace edlsim::session {

/**
 * @brief State exposed to presentation after a time step.
 */
struct StepResult {
  std::optional<edlsim::core::TrajectorySample> sample{};
  edlsim::phase::VehicleState vehicle{};
  edlsim::phase::PhaseUpdate phase{};
  double phase_progress{};
};

/**
 * @brief Playback session over one trajectory.
 *
 * The session is the only writer of its trajectory. Steering and replanning rewrite the
 * samples after the current time; the loaded trajectory is kept for `reset_to_original`.
 */
class SimulationSession {
 public:
  SimulationSession(edlsim::trajectory::Trajectory trajectory,
                    edlsim::phase::MissionProfile profile,
                    const edlsim::core::PhysicsConfig& physics,
                    const edlsim::models::AtmosphereConfig& atmosphere = {});

  /**
   * @brief Advance playback to `time_s` and update the phase machine.
   *
   * Moving backwards is handled as a `seek`.
   */
  [[nodiscard]] StepResult step_to(double time_s);

  /**
   * @brief Jump to `time_s`, recomputing phase state from scratch.
   */
  [[nodiscard]] StepResult seek(double time_s);

  /**
   * @brief Deflect the untraveled trajectory from the current time.
   */
  [[nodiscard]] edlsim::dynamics::DeflectionResult steer(double lateral, double radial, double final_percent);

  /**
   * @brief Re-integrate the untraveled trajectory under a new bank-angle profile.
   */
  [[nodiscard]] edlsim::dynamics::IntegrationResult replan(const edlsim::trajectory::BankAngleProfile& profile);

  /**
   * @brief Restore the loaded trajectory and rewind to its start.
   */
  void reset_to_original();

  [[nodiscard]] double current_time() const noexcept { return current_time_s_; }
  [[nodiscard]] const edlsim::trajectory::Trajectory& trajectory() const noexcept { return trajectory_; }
  [[nodiscard]] const edlsim::trajectory::Trajectory& original() const noexcept { return original_; }
  [[nodiscard]] const edlsim::phase::PhaseMachine& phases() const noexcept { return phases_; }
  [[nodiscard]] const edlsim::models::ExponentialAtmosphereModel& atmosphere() const noexcept { return atmosphere_; }
  [[nodiscard]] const edlsim::core::PhysicsConfig& physics() const noexcept { return physics_; }

 private:
  StepResult observe(double time_s, bool seeking);

  edlsim::core::PhysicsConfig physics_{};
  edlsim::models::ExponentialAtmosphereModel atmosphere_;
  edlsim::trajectory::Trajectory original_{};
  edlsim::trajectory::Trajectory trajectory_{};
  edlsim::phase::PhaseMachine phases_;
  double current_time_s_{};
};

}  // namespace edlsim::session
