/**
 * @file test_atmosphere.cpp
 * @brief Exponential/lapse-rate atmosphere tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "edlsim/models/exponential_atmosphere.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace edlsim;
  const core::PhysicsConfig physics{};
  const models::ExponentialAtmosphereModel atm(physics);

  if (!approx(atm.density(0.0), physics.surface_density_kg_m3, 1e-15) ||
      !approx(atm.density(physics.scale_height_m), physics.surface_density_kg_m3 / std::exp(1.0), 1e-12)) {
    spdlog::error("exponential density mismatch");
    return 1;
  }
  if (!approx(atm.pressure(22200.0), core::constants::kMarsSurfacePressurePa * std::exp(-2.0), 1e-12)) {
    spdlog::error("exponential pressure mismatch");
    return 2;
  }

  const double above = atm.config().ceiling_altitude_m + 1.0;
  if (atm.density(above) != 0.0 || atm.pressure(above) != 0.0 ||
      atm.temperature(above) != core::constants::kCosmicBackgroundTemperatureK) {
    spdlog::error("above-ceiling values not exact");
    return 3;
  }

  if (atm.density(-500.0) != atm.density(0.0) || atm.pressure(-500.0) != atm.pressure(0.0) ||
      atm.temperature(-500.0) != atm.temperature(0.0)) {
    spdlog::error("subsurface altitude not clamped");
    return 4;
  }

  if (!approx(atm.temperature(0.0), 210.0, 1e-15) || !approx(atm.temperature(7000.0), 192.5, 1e-12) ||
      !approx(atm.temperature(40000.0), 152.9, 1e-12)) {
    spdlog::error("layer temperatures mismatch t0={} t7={} t40={}", atm.temperature(0.0), atm.temperature(7000.0),
                  atm.temperature(40000.0));
    return 5;
  }
  for (const double boundary : {7000.0, 40000.0}) {
    if (!approx(atm.temperature(boundary - 1e-6), atm.temperature(boundary), 1e-9)) {
      spdlog::error("temperature discontinuous at {}", boundary);
      return 6;
    }
  }

  // 150 km sits in the top layer below the 150 K floor.
  const double t_high = atm.temperature(150000.0);
  const double floor_speed = std::sqrt(core::constants::kCo2HeatCapacityRatio * core::constants::kCo2GasConstantJKgK * 150.0);
  if (!(t_high < 150.0) || !approx(atm.sound_speed(150000.0), floor_speed, 1e-12)) {
    spdlog::error("sound speed floor not applied t={} a={}", t_high, atm.sound_speed(150000.0));
    return 7;
  }
  const double surface_speed = std::sqrt(core::constants::kCo2HeatCapacityRatio * core::constants::kCo2GasConstantJKgK * 210.0);
  if (!approx(atm.sound_speed(0.0), surface_speed, 1e-12)) {
    spdlog::error("surface sound speed mismatch");
    return 8;
  }

  double prev = atm.density(0.0);
  for (double h = 1000.0; h <= 200000.0; h += 1000.0) {
    const double rho = atm.density(h);
    if (!(rho < prev)) {
      spdlog::error("density not decreasing at {}", h);
      return 9;
    }
    prev = rho;
  }

  const auto sample = atm.evaluate(10000.0);
  if (sample.status != core::Status::Ok || sample.density_kg_m3 != atm.density(10000.0) ||
      sample.sound_speed_mps != atm.sound_speed(10000.0)) {
    spdlog::error("evaluate bundle mismatch");
    return 10;
  }
  if (atm.evaluate(std::numeric_limits<double>::quiet_NaN()).status != core::Status::InvalidInput) {
    spdlog::error("nan altitude accepted");
    return 11;
  }
  return 0;
}
