/**
 * @file vehicle_state.cpp
 * @brief Vehicle aerothermal state implementation.
 * @author Watosn
 */

#include "edlsim/phase/vehicle_state.hpp"

#include <cmath>

namespace edlsim::phase {

double stagnation_heat_flux(const double density_kg_m3, const double speed_mps, const double nose_radius_m) {
  if (!(density_kg_m3 > 0.0) || !(nose_radius_m > 0.0)) {
    return 0.0;
  }
  return edlsim::core::constants::kSuttonGravesMarsKgHalfM * std::sqrt(density_kg_m3 / nose_radius_m) * speed_mps *
         speed_mps * speed_mps;
}

VehicleState make_vehicle_state(const edlsim::core::TrajectorySample& sample,
                                const edlsim::atmo::IAtmosphereModel& atmosphere,
                                const edlsim::core::PhysicsConfig& physics) {
  VehicleState out{.time_s = sample.time_s, .altitude_m = sample.altitude_m, .speed_mps = sample.speed_mps};
  const auto atm = atmosphere.evaluate(sample.altitude_m);
  if (atm.status != edlsim::core::Status::Ok) {
    return out;
  }
  out.density_kg_m3 = atm.density_kg_m3;
  out.dynamic_pressure_pa = 0.5 * atm.density_kg_m3 * sample.speed_mps * sample.speed_mps;
  out.mach = atm.sound_speed_mps > 0.0 ? sample.speed_mps / atm.sound_speed_mps : 0.0;
  out.heat_flux_w_m2 = stagnation_heat_flux(atm.density_kg_m3, sample.speed_mps, physics.nose_radius_m);
  return out;
}

}  // namespace edlsim::phase
