/**
 * @file exponential_atmosphere.cpp
 * @brief Basic atmosphere model implementation.
 * @author Watosn
 */

#include "edlsim/models/exponential_atmosphere.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace edlsim::models {

ExponentialAtmosphereModel::ExponentialAtmosphereModel(const edlsim::core::PhysicsConfig& physics,
                                                       const AtmosphereConfig& config)
    : rho0_(physics.surface_density_kg_m3), hs_(physics.scale_height_m), config_(config) {
  // Each layer starts where the previous one ends.
  layer_base_temperature_k_[0] = config_.surface_temperature_k;
  for (std::size_t i = 1; i < layer_base_temperature_k_.size(); ++i) {
    const double thickness = config_.layer_base_altitude_m[i] - config_.layer_base_altitude_m[i - 1];
    layer_base_temperature_k_[i] = layer_base_temperature_k_[i - 1] - config_.lapse_rate_k_per_m[i - 1] * thickness;
  }
}

double ExponentialAtmosphereModel::density(const double altitude_m) const {
  if (altitude_m > config_.ceiling_altitude_m) {
    return 0.0;
  }
  return rho0_ * std::exp(-std::max(0.0, altitude_m) / hs_);
}

double ExponentialAtmosphereModel::pressure(const double altitude_m) const {
  if (altitude_m > config_.ceiling_altitude_m) {
    return 0.0;
  }
  return config_.surface_pressure_pa * std::exp(-std::max(0.0, altitude_m) / hs_);
}

double ExponentialAtmosphereModel::temperature(const double altitude_m) const {
  if (altitude_m > config_.ceiling_altitude_m) {
    return config_.space_temperature_k;
  }
  const double h = std::max(0.0, altitude_m);
  std::size_t layer = 0;
  for (std::size_t i = 1; i < config_.layer_base_altitude_m.size(); ++i) {
    if (h >= config_.layer_base_altitude_m[i]) {
      layer = i;
    }
  }
  return layer_base_temperature_k_[layer] - config_.lapse_rate_k_per_m[layer] * (h - config_.layer_base_altitude_m[layer]);
}

double ExponentialAtmosphereModel::sound_speed(const double altitude_m) const {
  const double t = std::max(config_.min_temperature_k, temperature(altitude_m));
  return std::sqrt(config_.heat_capacity_ratio * config_.gas_constant_j_kg_k * t);
}

edlsim::core::AtmosphereSample ExponentialAtmosphereModel::evaluate(const double altitude_m) const {
  if (!std::isfinite(altitude_m)) {
    return edlsim::core::AtmosphereSample{.status = edlsim::core::Status::InvalidInput};
  }
  return edlsim::core::AtmosphereSample{.density_kg_m3 = density(altitude_m),
                                        .pressure_pa = pressure(altitude_m),
                                        .temperature_k = temperature(altitude_m),
                                        .sound_speed_mps = sound_speed(altitude_m),
                                        .status = edlsim::core::Status::Ok};
}

}  // namespace edlsim::models
