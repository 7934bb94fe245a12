/**
 * @file deflection.hpp
 * @brief Ramped lateral/radial deflection of the untraveled part of a trajectory.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "edlsim/trajectory/trajectory.hpp"

namespace edlsim::dynamics {

/**
 * @brief Steering input for a deflection.
 *
 * `lateral` scales the horizontal axis `velocity_dir x up` at the cut sample and
 * `radial` scales `up`. Only the direction of the combination matters.
 */
struct DeflectionRequest {
  double cut_time_s{};
  double lateral{};
  double radial{};
  double final_percent{};
};

struct DeflectionResult {
  edlsim::trajectory::Trajectory trajectory{};
  std::size_t cut_index{};
  std::size_t mutated_count{};
  edlsim::core::Vec3 offset_direction{};
  edlsim::core::Status status{edlsim::core::Status::Ok};
};

/**
 * @brief Bend every sample after the cut away from its original path.
 *
 * Sample `i > cut` moves along the offset direction by
 * `final_percent * (i - cut) / (N - 1 - cut) * |p_i - p_cut|`. Afterwards, in ascending
 * order, each moved sample's velocity is re-derived from its already-moved predecessor;
 * the first moved sample keeps its velocity. Samples at or before the cut are copied
 * unchanged. The input trajectory is not modified.
 *
 * A cut at the final sample or a degenerate offset direction returns an unchanged copy.
 */
[[nodiscard]] DeflectionResult apply_deflection(const edlsim::trajectory::Trajectory& trajectory,
                                                const DeflectionRequest& request);

}  // namespace edlsim::dynamics
