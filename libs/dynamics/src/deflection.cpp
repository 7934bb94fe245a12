/**
 * @file deflection.cpp
 * @brief Trajectory deflection implementation.
 * @author Watosn
 */

#include "edlsim/dynamics/deflection.hpp"

#include <cmath>
#include <utility>
#include <vector>

#include "edlsim/core/math_utils.hpp"

namespace edlsim::dynamics {

using edlsim::core::Status;
using edlsim::core::TrajectorySample;
using edlsim::core::Vec3;

DeflectionResult apply_deflection(const edlsim::trajectory::Trajectory& trajectory, const DeflectionRequest& request) {
  if (trajectory.empty() || !std::isfinite(request.lateral) || !std::isfinite(request.radial) ||
      !std::isfinite(request.final_percent)) {
    return DeflectionResult{.trajectory = trajectory, .status = Status::InvalidInput};
  }

  DeflectionResult out{.trajectory = trajectory};
  const std::size_t n = trajectory.size();
  const std::size_t cut = trajectory.index_at_or_before(request.cut_time_s);
  out.cut_index = cut;
  if (cut + 1 >= n) {
    return out;
  }

  const TrajectorySample& anchor = trajectory[cut];
  const Vec3 anchor_velocity = anchor.has_velocity ? anchor.velocity_mps : trajectory.velocity_vector_at(anchor.time_s);
  const auto basis =
      edlsim::core::local_basis(anchor.position_m, anchor_velocity, trajectory.config().fallback_direction);

  const Vec3 offset = edlsim::core::unit_direction(request.lateral * basis.horizontal + request.radial * basis.up);
  if (edlsim::core::is_degenerate(offset)) {
    return out;
  }
  out.offset_direction = offset;

  std::vector<TrajectorySample> tail(trajectory.samples().begin() + static_cast<std::ptrdiff_t>(cut) + 1,
                                     trajectory.samples().end());
  const double span = static_cast<double>(n - 1 - cut);

  // All displacements are applied before any velocity is re-derived.
  for (std::size_t k = 0; k < tail.size(); ++k) {
    const double percent = request.final_percent * (static_cast<double>(k + 1) / span);
    const double reach = edlsim::core::distance(tail[k].position_m, anchor.position_m);
    tail[k].position_m = tail[k].position_m + offset * (reach * percent);
  }

  for (std::size_t k = 1; k < tail.size(); ++k) {
    const TrajectorySample& prev = tail[k - 1];
    tail[k].velocity_mps = (tail[k].position_m - prev.position_m) / (tail[k].time_s - prev.time_s);
    tail[k].has_velocity = true;
  }

  out.mutated_count = tail.size();
  out.status = out.trajectory.splice_after(cut, std::move(tail));
  return out;
}

}  // namespace edlsim::dynamics
