/**
 * @file main.cpp
 * @brief edlsim single-entry command-line entrypoint.
 * @author Watosn
 */

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "edlsim/core/math_utils.hpp"
#include "edlsim/dynamics/entry_integrator.hpp"
#include "edlsim/io/physics_config_file.hpp"
#include "edlsim/models/exponential_atmosphere.hpp"
#include "edlsim/phase/mission_profiles.hpp"
#include "edlsim/phase/vehicle_state.hpp"
#include "edlsim/trajectory/bank_angle_profile.hpp"

namespace {

bool parse_number(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

// Accepts a single angle ("30") or keyframes ("0:0,60:45,120:-45").
bool parse_bank(const std::string& text, edlsim::trajectory::BankAngleProfile& out) {
  double constant = 0.0;
  if (parse_number(text, constant)) {
    out = edlsim::trajectory::BankAngleProfile::constant(constant);
    return true;
  }
  std::vector<edlsim::trajectory::BankKeyframe> keys;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto comma = text.find(',', start);
    const std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    const auto colon = item.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    edlsim::trajectory::BankKeyframe k{};
    if (!parse_number(item.substr(0, colon), k.time_s) || !parse_number(item.substr(colon + 1), k.bank_angle_deg)) {
      return false;
    }
    keys.push_back(k);
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  out = edlsim::trajectory::BankAngleProfile::from_keyframes(std::move(keys));
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 10) {
    spdlog::error(
        "usage: edl_cli <bank_deg|t:deg,...> [duration_s] [altitude_m] [speed_mps] [fpa_deg] [lat_deg] [lon_deg] "
        "[heading_deg] [physics_cfg]");
    return 1;
  }

  edlsim::trajectory::BankAngleProfile bank{};
  if (!parse_bank(argv[1], bank)) {
    spdlog::error("invalid bank angle argument: {}", argv[1]);
    return 1;
  }

  // Mars 2020 entry interface defaults.
  std::vector<double> numeric{260.65, 132000.0, 5800.0, -15.5, -4.6, 137.4, 0.0};
  for (int i = 2; i < argc && i < 9; ++i) {
    if (!parse_number(argv[i], numeric[static_cast<std::size_t>(i - 2)])) {
      spdlog::error("argument {} is not a number: {}", i, argv[i]);
      return 1;
    }
  }
  const double duration_s = numeric[0];

  edlsim::core::PhysicsConfig physics{};
  if (argc == 10) {
    const auto loaded = edlsim::io::load_physics_config(argv[9]);
    if (loaded.status != edlsim::core::Status::Ok) {
      spdlog::error("failed to load physics config {}: {}", argv[9], edlsim::core::to_string(loaded.status));
      return 2;
    }
    for (const auto& key : loaded.unknown_keys) {
      spdlog::warn("ignoring unknown config key '{}'", key);
    }
    physics = loaded.config;
  }

  const auto entry = edlsim::core::entry_state_from_spherical(
      edlsim::core::SphericalEntryState{.altitude_m = numeric[1],
                                        .speed_mps = numeric[2],
                                        .longitude_rad = numeric[5] * edlsim::core::constants::kDegToRad,
                                        .latitude_rad = numeric[4] * edlsim::core::constants::kDegToRad,
                                        .flight_path_angle_rad = numeric[3] * edlsim::core::constants::kDegToRad,
                                        .heading_rad = numeric[6] * edlsim::core::constants::kDegToRad},
      physics.body_radius_m);

  const edlsim::models::ExponentialAtmosphereModel atmosphere(physics);
  const edlsim::dynamics::EntryIntegrator integrator(atmosphere, physics);
  const auto result = integrator.integrate(entry.position_m, entry.velocity_mps, duration_s, physics.step_s, bank,
                                           edlsim::dynamics::IntegratorOptions{.terminal_altitude_m = 0.0});
  if (result.status != edlsim::core::Status::Ok) {
    spdlog::error("integration failed: {}", edlsim::core::to_string(result.status));
    return 3;
  }
  spdlog::info("integrated {} samples", result.trajectory.size());

  edlsim::phase::PhaseMachine machine(edlsim::phase::make_mars2020_profile());
  double peak_heat_flux = 0.0;
  double peak_q = 0.0;
  for (const auto& sample : result.trajectory.samples()) {
    const auto state = edlsim::phase::make_vehicle_state(sample, atmosphere, physics);
    peak_heat_flux = std::max(peak_heat_flux, state.heat_flux_w_m2);
    peak_q = std::max(peak_q, state.dynamic_pressure_pa);

    const auto update = machine.update(state);
    if (update.phase_changed) {
      fmt::print("t={:.2f}s phase {} -> {} alt_m={:.1f} speed_mps={:.1f}\n", state.time_s,
                 machine.profile().phases[update.previous_phase].name, machine.current_phase().name, state.altitude_m,
                 state.speed_mps);
      if (!update.transition.valid) {
        spdlog::warn("{}", update.transition.reason);
      }
    }
    for (const auto& event : update.newly_fired_events) {
      fmt::print("t={:.2f}s event {}\n", state.time_s, event);
    }
    if (update.status_changed && update.failure_reason) {
      fmt::print("t={:.2f}s failure {}\n", state.time_s, *update.failure_reason);
    }
  }

  const auto& last = result.trajectory.samples().back();
  fmt::print("final t_s={:.2f} alt_m={:.1f} speed_mps={:.1f} bank_deg={:.1f} terminal={}\n", last.time_s, last.altitude_m,
             last.speed_mps, last.bank_angle_deg, result.reached_terminal_altitude ? 1 : 0);
  fmt::print("peak heat_flux_w_m2={:.1f} q_pa={:.1f}\n", peak_heat_flux, peak_q);
  fmt::print("phase={} mission_status={}\n", machine.current_phase().name, edlsim::phase::to_string(machine.state().status));
  return 0;
}
