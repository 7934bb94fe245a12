/**
 * @file trajectory_csv.hpp
 * @brief Plain-table trajectory ingest and export.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>

#include "edlsim/trajectory/trajectory.hpp"

namespace edlsim::io {

/**
 * @brief Reader configuration.
 */
struct TrajectoryCsvConfig {
  std::filesystem::path csv_file{};
  edlsim::trajectory::TrajectoryConfig trajectory{};
};

struct TrajectoryLoadResult {
  edlsim::trajectory::Trajectory trajectory{};
  std::size_t rows_read{};
  std::size_t rows_skipped{};
  edlsim::core::Status status{edlsim::core::Status::Ok};
};

/**
 * @brief Read `time,x,y,z` rows into a trajectory with finite-difference velocities.
 *
 * A non-numeric first line is treated as a header. Columns past the fourth are ignored;
 * rows with fewer than four finite numeric fields are skipped and counted. Returns
 * `DataUnavailable` when the file cannot be opened or holds no valid rows.
 */
[[nodiscard]] TrajectoryLoadResult load_trajectory_csv(const TrajectoryCsvConfig& config);

/**
 * @brief Write `time,x,y,z,vx,vy,vz,altitude,bankAngle` rows with a header line.
 */
void write_trajectory_csv(std::ostream& out, const edlsim::trajectory::Trajectory& trajectory);

}  // namespace edlsim::io
