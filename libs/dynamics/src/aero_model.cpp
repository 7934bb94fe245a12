/**
 * @file aero_model.cpp
 * @brief Entry aerodynamics implementation.
 * @author Watosn
 */

#include "edlsim/dynamics/aero_model.hpp"

#include <cmath>

#include "edlsim/core/math_utils.hpp"

namespace edlsim::dynamics {

using edlsim::core::Vec3;

Vec3 gravity_acceleration(const Vec3& position_m, const edlsim::core::PhysicsConfig& physics) {
  double r = 0.0;
  const Vec3 up = edlsim::core::unit_direction(position_m, &r);
  if (r <= 0.0 || !std::isfinite(r)) {
    return Vec3{};
  }
  const double ratio = physics.body_radius_m / r;
  return -physics.surface_gravity_mps2 * ratio * ratio * up;
}

Vec3 base_lift_direction(const Vec3& position_m, const Vec3& velocity_dir) {
  const Vec3 normal = edlsim::core::unit_direction(edlsim::core::vec_cross(position_m, velocity_dir));
  if (!edlsim::core::is_degenerate(normal)) {
    return edlsim::core::unit_direction(edlsim::core::vec_cross(normal, velocity_dir));
  }

  Vec3 up = edlsim::core::unit_direction(position_m);
  if (edlsim::core::is_degenerate(up)) {
    up = Vec3{0.0, 1.0, 0.0};
  }
  const Vec3 fallback = edlsim::core::orthogonalize(up, velocity_dir);
  if (!edlsim::core::is_degenerate(fallback)) {
    return fallback;
  }
  return edlsim::core::any_perpendicular(velocity_dir);
}

AeroResult EntryAeroModel::evaluate(const Vec3& position_m, const Vec3& velocity_mps, const double bank_angle_deg) const {
  if (physics_.vehicle_mass_kg <= 0.0 || !std::isfinite(bank_angle_deg)) {
    return AeroResult{.status = edlsim::core::Status::InvalidInput};
  }

  const double altitude = edlsim::core::norm(position_m) - physics_.body_radius_m;
  const auto atm = atmosphere_.evaluate(altitude);
  if (atm.status != edlsim::core::Status::Ok) {
    return AeroResult{.altitude_m = altitude, .status = atm.status};
  }

  double speed = 0.0;
  Vec3 v_dir = edlsim::core::unit_direction(velocity_mps, &speed);
  if (!std::isfinite(speed)) {
    return AeroResult{.altitude_m = altitude, .status = edlsim::core::Status::NumericalError};
  }
  if (edlsim::core::is_degenerate(v_dir)) {
    v_dir = edlsim::core::unit_direction(physics_.fallback_direction);
  }

  const double q_pa = 0.5 * atm.density_kg_m3 * speed * speed;
  const double drag_n = q_pa * physics_.reference_area_m2;
  const double bank_rad = bank_angle_deg * edlsim::core::constants::kDegToRad;
  const double lift_n = drag_n * physics_.lift_to_drag * std::sin(std::abs(bank_rad));

  const Vec3 lift_dir = edlsim::core::rotate_about_axis(base_lift_direction(position_m, v_dir), v_dir, bank_rad);

  return AeroResult{.drag_acceleration_mps2 = -(drag_n / physics_.vehicle_mass_kg) * v_dir,
                    .lift_acceleration_mps2 = (lift_n / physics_.vehicle_mass_kg) * lift_dir,
                    .lift_direction = lift_dir,
                    .altitude_m = altitude,
                    .density_kg_m3 = atm.density_kg_m3,
                    .temperature_k = atm.temperature_k,
                    .sound_speed_mps = atm.sound_speed_mps,
                    .speed_mps = speed,
                    .dynamic_pressure_pa = q_pa,
                    .mach = atm.sound_speed_mps > 0.0 ? speed / atm.sound_speed_mps : 0.0,
                    .drag_n = drag_n,
                    .lift_n = lift_n,
                    .status = edlsim::core::Status::Ok};
}

}  // namespace edlsim::dynamics
