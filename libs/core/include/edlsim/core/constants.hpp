/**
 * @file constants.hpp
 * @brief Shared physical constants for Mars entry models.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace edlsim::core::constants {

inline constexpr double kMarsRadiusM = 3390000.0;
inline constexpr double kMarsMuM3S2 = 4.2828e13;
inline constexpr double kMarsSurfaceGravityMps2 = 3.71;
inline constexpr double kMarsScaleHeightM = 11100.0;
inline constexpr double kMarsSurfaceDensityKgM3 = 0.020;
inline constexpr double kMarsSurfacePressurePa = 636.0;
inline constexpr double kMarsSurfaceTemperatureK = 210.0;
inline constexpr double kCo2GasConstantJKgK = 188.92;
inline constexpr double kCo2HeatCapacityRatio = 1.29;
inline constexpr double kCosmicBackgroundTemperatureK = 2.725;

// Sutton-Graves stagnation-point heating constant for a CO2 atmosphere.
inline constexpr double kSuttonGravesMarsKgHalfM = 1.9027e-4;

inline constexpr double kDegToRad = std::numbers::pi / 180.0;
inline constexpr double kRadToDeg = 180.0 / std::numbers::pi;

}  // namespace edlsim::core::constants
