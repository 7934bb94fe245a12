/**
 * @file exponential_atmosphere.hpp
 * @brief Exponential-density atmosphere with a three-layer lapse temperature profile.
 * @author Watosn
 */
#pragma once

#include <array>

#include "edlsim/atmo/interfaces.hpp"
#include "edlsim/core/physics_config.hpp"

namespace edlsim::models {

/**
 * @brief Temperature/pressure parameters complementing `PhysicsConfig`.
 *
 * Layer `i` starts at `layer_base_altitude_m[i]` and cools at `lapse_rate_k_per_m[i]`.
 * Defaults approximate the Mars troposphere, stratosphere and mesosphere.
 */
struct AtmosphereConfig {
  double ceiling_altitude_m{200000.0};
  double surface_pressure_pa{edlsim::core::constants::kMarsSurfacePressurePa};
  double surface_temperature_k{edlsim::core::constants::kMarsSurfaceTemperatureK};
  std::array<double, 3> layer_base_altitude_m{0.0, 7000.0, 40000.0};
  std::array<double, 3> lapse_rate_k_per_m{0.0025, 0.0012, 0.0002};
  double gas_constant_j_kg_k{edlsim::core::constants::kCo2GasConstantJKgK};
  double heat_capacity_ratio{edlsim::core::constants::kCo2HeatCapacityRatio};
  double min_temperature_k{150.0};
  double space_temperature_k{edlsim::core::constants::kCosmicBackgroundTemperatureK};
};

/**
 * @brief Pure altitude -> density/pressure/temperature/sound-speed model.
 *
 * Above the ceiling density and pressure are exactly zero and temperature is the
 * cosmic background value. Below the surface, density and pressure hold their
 * surface values.
 */
class ExponentialAtmosphereModel final : public edlsim::atmo::IAtmosphereModel {
 public:
  /**
   * @brief Construct model from body physics and atmosphere layering.
   */
  explicit ExponentialAtmosphereModel(const edlsim::core::PhysicsConfig& physics, const AtmosphereConfig& config = {});

  [[nodiscard]] double density(double altitude_m) const;
  [[nodiscard]] double pressure(double altitude_m) const;
  [[nodiscard]] double temperature(double altitude_m) const;
  [[nodiscard]] double sound_speed(double altitude_m) const;

  /**
   * @brief Evaluate all four quantities at once.
   */
  [[nodiscard]] edlsim::core::AtmosphereSample evaluate(double altitude_m) const override;

  [[nodiscard]] const AtmosphereConfig& config() const noexcept { return config_; }

 private:
  double rho0_{};
  double hs_{};
  AtmosphereConfig config_{};
  std::array<double, 3> layer_base_temperature_k_{};
};

}  // namespace edlsim::models
