/**
 * @file entry_integrator.cpp
 * @brief Entry propagation implementation.
 * @author Watosn
 */

#include "edlsim/dynamics/entry_integrator.hpp"

#include <cmath>
#include <utility>

#include "edlsim/dynamics/aero_model.hpp"

namespace edlsim::dynamics {

namespace {

using edlsim::core::Status;
using edlsim::core::TrajectorySample;
using edlsim::core::Vec3;

bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

}  // namespace

IntegrationResult EntryIntegrator::integrate(const Vec3& initial_position_m,
                                             const Vec3& initial_velocity_mps,
                                             const double duration_s,
                                             const double step_s,
                                             const edlsim::trajectory::BankAngleProfile& profile,
                                             const IntegratorOptions& options) const {
  if (edlsim::core::validate(physics_) != Status::Ok || !(step_s > 0.0) || !(duration_s >= 0.0) ||
      !std::isfinite(duration_s) || !std::isfinite(options.start_time_s) || !is_finite(initial_position_m) ||
      !is_finite(initial_velocity_mps)) {
    return IntegrationResult{.status = Status::InvalidInput};
  }

  const auto config = edlsim::trajectory::make_trajectory_config(physics_, options.target_m);
  const EntryAeroModel aero(atmosphere_, physics_);

  // Step count is fixed up front so times are start + k * step with no accumulated drift.
  const auto full_steps = static_cast<std::size_t>(std::floor(duration_s / step_s + 1e-9));
  const double remainder = duration_s - static_cast<double>(full_steps) * step_s;
  const std::size_t total_steps = full_steps + ((remainder > 1e-9 * step_s) ? 1 : 0);

  std::vector<TrajectorySample> samples;
  std::vector<StepDiagnostics> diagnostics;
  samples.reserve(total_steps + 1);
  diagnostics.reserve(total_steps);

  Vec3 r = initial_position_m;
  Vec3 v = initial_velocity_mps;
  samples.push_back(TrajectorySample{.time_s = options.start_time_s,
                                     .position_m = r,
                                     .velocity_mps = v,
                                     .bank_angle_deg = profile.at(options.start_time_s)});

  IntegrationResult out{};
  const auto at_terminal = [&](const Vec3& position) {
    return options.terminal_altitude_m && edlsim::core::norm(position) - physics_.body_radius_m <= *options.terminal_altitude_m;
  };
  out.reached_terminal_altitude = at_terminal(r);

  for (std::size_t k = 0; k < total_steps && !out.reached_terminal_altitude; ++k) {
    const double dt = (k < full_steps) ? step_s : remainder;
    const double t = options.start_time_s + static_cast<double>(k) * step_s;

    const double bank_deg = profile.at(t);
    const auto a = aero.evaluate(r, v, bank_deg);
    if (a.status != Status::Ok) {
      out.status = a.status;
      break;
    }
    const Vec3 g = gravity_acceleration(r, physics_);
    const Vec3 accel = g + a.drag_acceleration_mps2 + a.lift_acceleration_mps2;

    v = v + accel * dt;
    r = r + v * dt;
    if (!is_finite(r) || !is_finite(v)) {
      out.status = Status::NumericalError;
      break;
    }

    diagnostics.push_back(StepDiagnostics{.time_s = t,
                                          .density_kg_m3 = a.density_kg_m3,
                                          .dynamic_pressure_pa = a.dynamic_pressure_pa,
                                          .mach = a.mach,
                                          .drag_acceleration_mps2 = edlsim::core::norm(a.drag_acceleration_mps2),
                                          .lift_acceleration_mps2 = edlsim::core::norm(a.lift_acceleration_mps2),
                                          .gravity_acceleration_mps2 = edlsim::core::norm(g)});
    // The final sample lands on the requested end time exactly.
    const double t_next = (k + 1 < total_steps) ? options.start_time_s + static_cast<double>(k + 1) * step_s
                                                : options.start_time_s + duration_s;
    samples.push_back(TrajectorySample{.time_s = t_next, .position_m = r, .velocity_mps = v, .bank_angle_deg = profile.at(t_next)});
    out.reached_terminal_altitude = at_terminal(r);
  }

  out.trajectory = edlsim::trajectory::Trajectory(std::move(samples), config);
  out.diagnostics = std::move(diagnostics);
  return out;
}

IntegrationResult EntryIntegrator::continue_from(const edlsim::trajectory::Trajectory& trajectory,
                                                 const double cut_time_s,
                                                 const edlsim::trajectory::BankAngleProfile& profile,
                                                 const std::optional<double> duration_s) const {
  if (trajectory.empty()) {
    return IntegrationResult{.status = Status::InvalidInput};
  }
  const std::size_t cut = trajectory.index_at_or_before(cut_time_s);
  const TrajectorySample& start = trajectory[cut];
  const double remaining = duration_s.value_or(trajectory.end_time() - start.time_s);

  IntegrationResult out{.trajectory = trajectory};
  if (!(remaining > 0.0)) {
    return out;
  }

  const Vec3 velocity = start.has_velocity ? start.velocity_mps : trajectory.velocity_vector_at(start.time_s);
  auto tail = integrate(start.position_m, velocity, remaining, physics_.step_s, profile,
                        IntegratorOptions{.start_time_s = start.time_s, .target_m = trajectory.config().target_m});
  if (tail.status != Status::Ok) {
    return IntegrationResult{.trajectory = trajectory, .status = tail.status};
  }

  out.status = out.trajectory.splice_after(cut, tail.trajectory.samples());
  out.diagnostics = std::move(tail.diagnostics);
  out.reached_terminal_altitude = tail.reached_terminal_altitude;
  return out;
}

}  // namespace edlsim::dynamics
