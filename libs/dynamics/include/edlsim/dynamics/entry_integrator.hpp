/**
 * @file entry_integrator.hpp
 * @brief Fixed-step semi-implicit Euler propagation of a banked entry.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <vector>

#include "edlsim/atmo/interfaces.hpp"
#include "edlsim/core/physics_config.hpp"
#include "edlsim/trajectory/bank_angle_profile.hpp"
#include "edlsim/trajectory/trajectory.hpp"

namespace edlsim::dynamics {

/**
 * @brief Per-step force breakdown recorded alongside the emitted samples.
 */
struct StepDiagnostics {
  double time_s{};
  double density_kg_m3{};
  double dynamic_pressure_pa{};
  double mach{};
  double drag_acceleration_mps2{};
  double lift_acceleration_mps2{};
  double gravity_acceleration_mps2{};
};

struct IntegratorOptions {
  double start_time_s{0.0};
  // Stop after the first sample at or below this altitude.
  std::optional<double> terminal_altitude_m{};
  edlsim::core::Vec3 target_m{};
};

struct IntegrationResult {
  edlsim::trajectory::Trajectory trajectory{};
  std::vector<StepDiagnostics> diagnostics{};
  bool reached_terminal_altitude{false};
  edlsim::core::Status status{edlsim::core::Status::Ok};
};

/**
 * @brief Propagates position and velocity under gravity, drag and banked lift.
 *
 * Each step reads the bank angle at the current time, evaluates accelerations at the
 * current state, then updates `v += a dt` followed by `r += v dt`. The initial state
 * is emitted as the first sample. Results are bit-for-bit reproducible.
 */
class EntryIntegrator {
 public:
  EntryIntegrator(const edlsim::atmo::IAtmosphereModel& atmosphere, const edlsim::core::PhysicsConfig& physics)
      : atmosphere_(atmosphere), physics_(physics) {}

  /**
   * @brief Integrate from an initial state.
   * @param duration_s Total propagated time; the last step is shortened to land on it.
   * @param step_s Fixed step size.
   * @return Trajectory plus diagnostics; `InvalidInput` for bad arguments or config,
   *         `NumericalError` if the state stops being finite.
   */
  [[nodiscard]] IntegrationResult integrate(const edlsim::core::Vec3& initial_position_m,
                                            const edlsim::core::Vec3& initial_velocity_mps,
                                            double duration_s,
                                            double step_s,
                                            const edlsim::trajectory::BankAngleProfile& profile,
                                            const IntegratorOptions& options = {}) const;

  /**
   * @brief Re-integrate the future of `trajectory` from the sample at or before `cut_time_s`.
   *
   * Samples up to the cut index are kept unchanged and the new samples are spliced after
   * them. The default duration runs to the existing end time.
   */
  [[nodiscard]] IntegrationResult continue_from(const edlsim::trajectory::Trajectory& trajectory,
                                                double cut_time_s,
                                                const edlsim::trajectory::BankAngleProfile& profile,
                                                std::optional<double> duration_s = {}) const;

 private:
  const edlsim::atmo::IAtmosphereModel& atmosphere_;
  const edlsim::core::PhysicsConfig& physics_;
};

}  // namespace edlsim::dynamics
