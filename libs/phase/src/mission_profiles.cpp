/**
 * @file mission_profiles.cpp
 * @brief Built-in mission phase tables.
 * @author Watosn
 */

#include "edlsim/phase/mission_profiles.hpp"

#include <utility>
#include <vector>

namespace edlsim::phase {

namespace {

NamedCondition always(const char* name) {
  return NamedCondition{.name = name, .predicate = [](const VehicleState&) { return true; }};
}

NamedCondition after(const char* name, const double time_s) {
  return NamedCondition{.name = name, .predicate = [time_s](const VehicleState& s) { return s.time_s >= time_s; }};
}

std::vector<NamedCondition> common_criticals() {
  return {
      NamedCondition{.name = "Heat shield failure",
                     .predicate = [](const VehicleState& s) { return s.heat_flux_w_m2 > kHeatShieldLimitWM2; }},
      NamedCondition{.name = "Surface impact", .predicate = [](const VehicleState& s) { return s.altitude_m <= 0.0; }},
  };
}

}  // namespace

MissionProfile make_mars2020_profile() {
  MissionProfile profile{.name = "Mars 2020", .end_time_s = kMars2020ParachuteDeployTimeS};

  profile.phases.push_back(PhaseDefinition{
      .name = "Entry Interface",
      .description = "Atmospheric entry at 132 km; aerodynamic heating and deceleration begin.",
      .entry_time_s = 0.0,
      .end_conditions = {after("Entry interface passed", 0.0)},
      .events = {always("Atmospheric entry")},
      .critical_failures = common_criticals(),
  });

  profile.phases.push_back(PhaseDefinition{
      .name = "Guidance Start",
      .description = "Backshell thrusters steer the lift vector to correct for density dispersions.",
      .entry_time_s = 26.0,
      .start_conditions = {NamedCondition{.name = "Sensible atmosphere",
                                          .predicate = [](const VehicleState& s) { return s.density_kg_m3 > 0.0; }}},
      .events = {always("Guidance enabled")},
      .critical_failures = common_criticals(),
  });

  auto heading = PhaseDefinition{
      .name = "Heading Alignment",
      .description = "Guided entry removes the remaining cross-range error.",
      .entry_time_s = 87.0,
      .start_conditions = {NamedCondition{.name = "Speed below 6 km/s",
                                          .predicate = [](const VehicleState& s) { return s.speed_mps < 6000.0; }}},
      .events = {after("Peak heating", 80.0), after("Peak deceleration", 150.0)},
      .critical_failures = common_criticals(),
  };
  profile.phases.push_back(std::move(heading));

  profile.phases.push_back(PhaseDefinition{
      .name = "Begin SUFR",
      .description = "Balance masses are ejected and the angle of attack is driven to zero before deployment.",
      .entry_time_s = 174.0,
      .start_conditions = {NamedCondition{.name = "Speed below 3 km/s",
                                          .predicate = [](const VehicleState& s) { return s.speed_mps < 3000.0; }}},
      .events = {always("Balance mass jettison")},
      .critical_failures = common_criticals(),
  });

  auto chute_criticals = common_criticals();
  chute_criticals.push_back(NamedCondition{.name = "Parachute failure", .predicate = [](const VehicleState& s) {
                                             return s.dynamic_pressure_pa > kParachuteMaxDynamicPressurePa ||
                                                    s.mach > kParachuteMaxMach;
                                           }});
  profile.phases.push_back(PhaseDefinition{
      .name = "Parachute Deploy",
      .description = "Range trigger fires the supersonic parachute near 13.5 km.",
      .entry_time_s = 240.0,
      .start_conditions = {NamedCondition{.name = "Mach within parachute envelope",
                                          .predicate = [](const VehicleState& s) { return s.mach <= kParachuteMaxMach; }}},
      .events = {always("Range trigger"), after("Parachute deployment", kMars2020ParachuteDeployTimeS)},
      .critical_failures = std::move(chute_criticals),
  });

  profile.success_condition = after("Parachute deployed", kMars2020ParachuteDeployTimeS);
  return profile;
}

}  // namespace edlsim::phase
