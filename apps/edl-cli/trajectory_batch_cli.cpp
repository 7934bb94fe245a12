/**
 * @file trajectory_batch_cli.cpp
 * @brief Batch runner: load or generate a trajectory, optionally deflect it, classify phases, export CSV.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "edlsim/dynamics/deflection.hpp"
#include "edlsim/io/physics_config_file.hpp"
#include "edlsim/io/trajectory_csv.hpp"
#include "edlsim/models/exponential_atmosphere.hpp"
#include "edlsim/phase/mission_profiles.hpp"
#include "edlsim/phase/vehicle_state.hpp"
#include "edlsim/trajectory/trajectory.hpp"

namespace {

bool parse_number(const char* text, double& value) {
  char* end = nullptr;
  value = std::strtod(text, &end);
  return end != text && *end == '\0';
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 3 && argc != 4 && argc != 7 && argc != 8) {
    spdlog::error(
        "usage: edl_batch_cli <input_csv|sample> <output_csv> [cut_time_s lateral radial final_percent] [physics_cfg]");
    spdlog::error("input row: time_s,x_m,y_m,z_m (extra columns ignored)");
    return 1;
  }

  const std::string input = argv[1];
  const std::filesystem::path output_path = argv[2];
  const bool deflect = argc >= 7;
  const char* config_path = (argc == 4) ? argv[3] : (argc == 8 ? argv[7] : nullptr);

  edlsim::dynamics::DeflectionRequest request{};
  if (deflect && (!parse_number(argv[3], request.cut_time_s) || !parse_number(argv[4], request.lateral) ||
                  !parse_number(argv[5], request.radial) || !parse_number(argv[6], request.final_percent))) {
    spdlog::error("deflection arguments must be numbers");
    return 1;
  }

  edlsim::core::PhysicsConfig physics{};
  if (config_path) {
    const auto loaded = edlsim::io::load_physics_config(config_path);
    if (loaded.status != edlsim::core::Status::Ok) {
      spdlog::error("failed to load physics config {}: {}", config_path, edlsim::core::to_string(loaded.status));
      return 5;
    }
    physics = loaded.config;
  }
  const auto traj_config = edlsim::trajectory::make_trajectory_config(physics);

  edlsim::trajectory::Trajectory trajectory{};
  if (input == "sample") {
    trajectory = edlsim::trajectory::make_sample_trajectory(traj_config);
  } else {
    const auto loaded = edlsim::io::load_trajectory_csv(
        edlsim::io::TrajectoryCsvConfig{.csv_file = input, .trajectory = traj_config});
    if (loaded.status != edlsim::core::Status::Ok) {
      spdlog::error("failed to load trajectory csv {}: {}", input, edlsim::core::to_string(loaded.status));
      return 2;
    }
    if (loaded.rows_skipped > 0) {
      spdlog::warn("skipped {} malformed rows", loaded.rows_skipped);
    }
    trajectory = loaded.trajectory;
  }

  const auto report = edlsim::trajectory::validate(trajectory);
  for (const auto& w : report.warnings) {
    spdlog::warn("{}", w);
  }
  for (const auto& e : report.errors) {
    spdlog::error("{}", e);
  }
  if (!report.valid()) {
    return 2;
  }

  if (deflect) {
    const auto result = edlsim::dynamics::apply_deflection(trajectory, request);
    if (result.status != edlsim::core::Status::Ok) {
      spdlog::error("deflection failed: {}", edlsim::core::to_string(result.status));
      return 4;
    }
    spdlog::info("deflected {} samples after index {}", result.mutated_count, result.cut_index);
    trajectory = result.trajectory;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  const edlsim::models::ExponentialAtmosphereModel atmosphere(physics);
  edlsim::phase::PhaseMachine machine(edlsim::phase::make_mars2020_profile());
  for (const auto& sample : trajectory.samples()) {
    const auto update = machine.update(edlsim::phase::make_vehicle_state(sample, atmosphere, physics));
    if (update.phase_changed) {
      fmt::print("t={:.2f}s phase={} alt_m={:.1f}\n", sample.time_s, machine.current_phase().name, sample.altitude_m);
    }
    if (update.status_changed) {
      fmt::print("t={:.2f}s mission_status={}{}\n", sample.time_s, edlsim::phase::to_string(update.mission_status),
                 update.failure_reason ? fmt::format(" ({})", *update.failure_reason) : std::string{});
    }
  }

  edlsim::io::write_trajectory_csv(out, trajectory);
  fmt::print("samples={} span_s={:.2f} final_phase={} mission_status={}\n", trajectory.size(),
             trajectory.end_time() - trajectory.start_time(), machine.current_phase().name,
             edlsim::phase::to_string(machine.state().status));
  return 0;
}
