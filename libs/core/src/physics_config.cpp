/**
 * @file physics_config.cpp
 * @brief Physics configuration validation.
 * @author Watosn
 */

#include "edlsim/core/physics_config.hpp"

#include <cmath>

#include "edlsim/core/math_utils.hpp"

namespace edlsim::core {
namespace {

bool positive_finite(const double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

Status validate(const PhysicsConfig& config) {
  if (!positive_finite(config.body_radius_m) || !positive_finite(config.scale_height_m) ||
      !positive_finite(config.vehicle_mass_kg) || !positive_finite(config.reference_area_m2) ||
      !positive_finite(config.mu_m3_s2) || !positive_finite(config.step_s) || !positive_finite(config.nose_radius_m)) {
    return Status::InvalidInput;
  }
  if (!std::isfinite(config.surface_density_kg_m3) || config.surface_density_kg_m3 < 0.0) {
    return Status::InvalidInput;
  }
  if (!std::isfinite(config.lift_to_drag) || config.lift_to_drag < 0.0) {
    return Status::InvalidInput;
  }
  if (!std::isfinite(config.surface_gravity_mps2) || config.surface_gravity_mps2 < 0.0) {
    return Status::InvalidInput;
  }
  if (!positive_finite(config.position_scale) || is_degenerate(config.fallback_direction)) {
    return Status::InvalidInput;
  }
  return Status::Ok;
}

}  // namespace edlsim::core
