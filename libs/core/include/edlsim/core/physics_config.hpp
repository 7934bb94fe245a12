/**
 * @file physics_config.hpp
 * @brief Body, vehicle and integration parameters shared by all models.
 * @author Watosn
 */
#pragma once

#include "edlsim/core/constants.hpp"
#include "edlsim/core/types.hpp"

namespace edlsim::core {

/**
 * @brief Immutable-after-construction physics record.
 *
 * Defaults describe an MSL-class capsule entering Mars. `reference_area_m2` has the
 * drag coefficient folded in (drag = q * reference_area).
 */
struct PhysicsConfig {
  double body_radius_m{constants::kMarsRadiusM};
  double scale_height_m{constants::kMarsScaleHeightM};
  double surface_density_kg_m3{constants::kMarsSurfaceDensityKgM3};
  double vehicle_mass_kg{899.0};
  double reference_area_m2{15.9};
  double lift_to_drag{0.13};
  double mu_m3_s2{constants::kMarsMuM3S2};
  double surface_gravity_mps2{constants::kMarsSurfaceGravityMps2};
  double nose_radius_m{1.125};
  double step_s{0.1};
  double position_scale{1.0e-5};
  Vec3 fallback_direction{0.0, -1.0, 0.0};
};

/**
 * @brief Check that every physical parameter is finite and in range.
 * @return `Status::Ok` or `Status::InvalidInput`.
 */
[[nodiscard]] Status validate(const PhysicsConfig& config);

/**
 * @brief Ballistic coefficient m / (Cd A) for the configured vehicle.
 */
[[nodiscard]] inline double ballistic_coefficient(const PhysicsConfig& config) {
  return config.vehicle_mass_kg / config.reference_area_m2;
}

/**
 * @brief Convert a body-centered position to presentation units.
 */
[[nodiscard]] inline Vec3 to_scene_units(const PhysicsConfig& config, const Vec3& position_m) {
  return config.position_scale * position_m;
}

}  // namespace edlsim::core
