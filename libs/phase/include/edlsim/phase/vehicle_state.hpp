/**
 * @file vehicle_state.hpp
 * @brief Aerothermal vehicle state used for phase classification.
 * @author Watosn
 */
#pragma once

#include "edlsim/atmo/interfaces.hpp"
#include "edlsim/core/physics_config.hpp"
#include "edlsim/core/types.hpp"

namespace edlsim::phase {

struct VehicleState {
  double time_s{};
  double altitude_m{};
  double speed_mps{};
  double density_kg_m3{};
  double dynamic_pressure_pa{};
  double mach{};
  double heat_flux_w_m2{};
};

/**
 * @brief Sutton-Graves stagnation-point convective heat flux.
 */
[[nodiscard]] double stagnation_heat_flux(double density_kg_m3, double speed_mps, double nose_radius_m);

/**
 * @brief Derive the classification state of one trajectory sample.
 *
 * Atmosphere failures leave the aerothermal fields at zero.
 */
[[nodiscard]] VehicleState make_vehicle_state(const edlsim::core::TrajectorySample& sample,
                                              const edlsim::atmo::IAtmosphereModel& atmosphere,
                                              const edlsim::core::PhysicsConfig& physics);

}  // namespace edlsim::phase
