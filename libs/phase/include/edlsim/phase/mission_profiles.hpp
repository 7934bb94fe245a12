/**
 * @file mission_profiles.hpp
 * @brief Built-in mission phase tables.
 * @author Watosn
 */
#pragma once

#include "edlsim/phase/phase_machine.hpp"

namespace edlsim::phase {

inline constexpr double kMars2020ParachuteDeployTimeS = 260.65;
inline constexpr double kMars2020ParachuteDeployAltitudeM = 13462.9;
inline constexpr double kHeatShieldLimitWM2 = 2.5e6;
inline constexpr double kParachuteMaxDynamicPressurePa = 1200.0;
inline constexpr double kParachuteMaxMach = 2.8;

/**
 * @brief Mars 2020 entry from entry interface through parachute deployment.
 *
 * Phases are entered on time after entry interface (0, 26, 87, 174 and 240 s). Heat
 * shield overload and surface impact are critical in every phase, parachute overload
 * in the last one. The mission succeeds once the deploy time is reached in the
 * parachute phase.
 */
[[nodiscard]] MissionProfile make_mars2020_profile();

}  // namespace edlsim::phase
