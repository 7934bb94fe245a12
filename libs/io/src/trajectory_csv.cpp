/**
 * @file trajectory_csv.cpp
 * @brief Trajectory CSV reader/writer implementation.
 * @author Watosn
 */

#include "edlsim/io/trajectory_csv.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "csv_fields.hpp"

namespace edlsim::io {
namespace {

constexpr std::size_t kTimeCol = 0;
constexpr std::size_t kMinColumns = 4;

bool parse_row(const std::vector<std::string>& fields, edlsim::trajectory::PositionRow& row) {
  if (fields.size() < kMinColumns) {
    return false;
  }
  std::array<double, kMinColumns> v{};
  for (std::size_t i = 0; i < kMinColumns; ++i) {
    if (!detail::parse_double(fields[kTimeCol + i], v[i]) || !std::isfinite(v[i])) {
      return false;
    }
  }
  row = edlsim::trajectory::PositionRow{.time_s = v[0], .position_m = edlsim::core::Vec3{v[1], v[2], v[3]}};
  return true;
}

}  // namespace

TrajectoryLoadResult load_trajectory_csv(const TrajectoryCsvConfig& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return TrajectoryLoadResult{.status = edlsim::core::Status::DataUnavailable};
  }

  TrajectoryLoadResult out{};
  std::vector<edlsim::trajectory::PositionRow> rows;
  std::string line;
  bool first_line = true;
  while (std::getline(in, line)) {
    if (detail::trim(line).empty()) {
      continue;
    }
    edlsim::trajectory::PositionRow row{};
    const bool ok = parse_row(detail::split_fields(line, ','), row);
    if (first_line) {
      first_line = false;
      if (!ok) {
        // Header.
        continue;
      }
    }
    if (!ok) {
      ++out.rows_skipped;
      continue;
    }
    rows.push_back(row);
  }

  out.rows_read = rows.size();
  if (rows.empty()) {
    out.status = edlsim::core::Status::DataUnavailable;
    return out;
  }
  out.trajectory = edlsim::trajectory::Trajectory::from_positions(std::move(rows), config.trajectory);
  return out;
}

void write_trajectory_csv(std::ostream& out, const edlsim::trajectory::Trajectory& trajectory) {
  fmt::print(out, "time,x,y,z,vx,vy,vz,altitude,bankAngle\n");
  for (const auto& s : trajectory.samples()) {
    fmt::print(out, "{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f}\n", s.time_s, s.position_m.x,
               s.position_m.y, s.position_m.z, s.velocity_mps.x, s.velocity_mps.y, s.velocity_mps.z, s.altitude_m,
               s.bank_angle_deg);
  }
}

}  // namespace edlsim::io
