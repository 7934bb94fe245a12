/**
 * @file trajectory.cpp
 * @brief Kinematic sample store implementation.
 * @author Watosn
 */

#include "edlsim/trajectory/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <utility>

#include <fmt/format.h>

#include "edlsim/core/math_utils.hpp"

namespace edlsim::trajectory {

namespace {

using edlsim::core::TrajectorySample;
using edlsim::core::Vec3;

double ease_in_out_cubic(const double t) {
  if (t < 0.5) {
    return 4.0 * t * t * t;
  }
  const double u = -2.0 * t + 2.0;
  return 1.0 - u * u * u / 2.0;
}

double lerp(const double a, const double b, const double t) { return a + (b - a) * t; }

bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

bool time_less(const TrajectorySample& a, const TrajectorySample& b) { return a.time_s < b.time_s; }

}  // namespace

TrajectoryConfig make_trajectory_config(const edlsim::core::PhysicsConfig& physics, const Vec3& target_m) {
  return TrajectoryConfig{.body_radius_m = physics.body_radius_m,
                          .target_m = target_m,
                          .fallback_direction = physics.fallback_direction,
                          .velocity_lookahead_s = physics.step_s};
}

void refresh_derived(TrajectorySample& sample, const TrajectoryConfig& config) {
  sample.altitude_m = edlsim::core::norm(sample.position_m) - config.body_radius_m;
  sample.speed_mps = edlsim::core::norm(sample.velocity_mps);
  sample.distance_to_target_m = edlsim::core::distance(sample.position_m, config.target_m);
}

Trajectory::Trajectory(std::vector<TrajectorySample> samples, TrajectoryConfig config)
    : samples_(std::move(samples)), config_(config) {
  // NaN times have no place in the ordering.
  std::erase_if(samples_, [](const TrajectorySample& s) { return !std::isfinite(s.time_s); });
  std::stable_sort(samples_.begin(), samples_.end(), time_less);
  const auto last = std::unique(samples_.begin(), samples_.end(), [](const TrajectorySample& a, const TrajectorySample& b) {
    return a.time_s == b.time_s;
  });
  samples_.erase(last, samples_.end());
  for (auto& s : samples_) {
    refresh_derived(s, config_);
  }
}

Trajectory Trajectory::from_positions(std::vector<PositionRow> rows, TrajectoryConfig config) {
  std::erase_if(rows, [](const PositionRow& r) { return !std::isfinite(r.time_s); });
  std::stable_sort(rows.begin(), rows.end(), [](const PositionRow& a, const PositionRow& b) { return a.time_s < b.time_s; });
  const auto last = std::unique(rows.begin(), rows.end(), [](const PositionRow& a, const PositionRow& b) {
    return a.time_s == b.time_s;
  });
  rows.erase(last, rows.end());

  std::vector<TrajectorySample> samples;
  samples.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    TrajectorySample s{.time_s = rows[i].time_s, .position_m = rows[i].position_m};
    if (rows.size() < 2) {
      s.has_velocity = false;
    } else {
      const std::size_t a = (i == 0) ? 0 : i - 1;
      const std::size_t b = (i == 0) ? 1 : i;
      s.velocity_mps = (rows[b].position_m - rows[a].position_m) / (rows[b].time_s - rows[a].time_s);
    }
    samples.push_back(s);
  }
  return Trajectory(std::move(samples), config);
}

std::optional<TrajectorySample> Trajectory::query(const double time_s) const {
  if (samples_.empty()) {
    return std::nullopt;
  }
  if (samples_.size() < 2) {
    return samples_.front();
  }

  const double t = std::isfinite(time_s) ? std::clamp(time_s, start_time(), end_time()) : start_time();
  const auto it = std::upper_bound(samples_.begin(), samples_.end(), t,
                                   [](const double x, const TrajectorySample& s) { return x < s.time_s; });
  if (it == samples_.end()) {
    return samples_.back();
  }
  const TrajectorySample& s1 = *it;
  const TrajectorySample& s0 = *(it - 1);
  const double frac = (t - s0.time_s) / (s1.time_s - s0.time_s);
  const double eased = ease_in_out_cubic(frac);

  TrajectorySample out{};
  out.time_s = t;
  out.position_m = s0.position_m + (s1.position_m - s0.position_m) * eased;
  out.velocity_mps = s0.velocity_mps + (s1.velocity_mps - s0.velocity_mps) * eased;
  out.altitude_m = lerp(s0.altitude_m, s1.altitude_m, frac);
  out.speed_mps = lerp(s0.speed_mps, s1.speed_mps, frac);
  out.distance_to_target_m = lerp(s0.distance_to_target_m, s1.distance_to_target_m, frac);
  out.bank_angle_deg = lerp(s0.bank_angle_deg, s1.bank_angle_deg, frac);
  out.has_velocity = s0.has_velocity && s1.has_velocity;
  return out;
}

Vec3 Trajectory::velocity_vector_at(const double time_s) const {
  const auto here = query(time_s);
  if (!here) {
    return config_.fallback_direction;
  }

  Vec3 v = here->velocity_mps;
  if (!here->has_velocity) {
    const double eps = config_.velocity_lookahead_s;
    if (here->time_s + eps <= end_time()) {
      v = (query(here->time_s + eps)->position_m - here->position_m) / eps;
    } else {
      // No room to look ahead at the tail.
      v = (here->position_m - query(here->time_s - eps)->position_m) / eps;
    }
  }
  if (edlsim::core::is_degenerate(v) || !is_finite(v)) {
    return config_.fallback_direction;
  }
  return v;
}

std::size_t Trajectory::index_at_or_before(const double time_s) const {
  if (samples_.empty() || !(time_s >= samples_.front().time_s)) {
    return 0;
  }
  const auto it = std::upper_bound(samples_.begin(), samples_.end(), time_s,
                                   [](const double x, const TrajectorySample& s) { return x < s.time_s; });
  return static_cast<std::size_t>(it - samples_.begin()) - 1;
}

std::optional<double> Trajectory::closest_time(const Vec3& position_m) const {
  if (samples_.empty()) {
    return std::nullopt;
  }
  double best_time = samples_.front().time_s;
  double best_distance = std::numeric_limits<double>::infinity();
  for (const auto& s : samples_) {
    const double d = edlsim::core::distance(s.position_m, position_m);
    if (d < best_distance) {
      best_distance = d;
      best_time = s.time_s;
    }
  }
  return best_time;
}

void Trajectory::set_current_index(const std::size_t index) noexcept {
  current_index_ = samples_.empty() ? 0 : std::min(index, samples_.size() - 1);
}

std::span<const TrajectorySample> Trajectory::past() const noexcept {
  if (samples_.empty()) {
    return {};
  }
  return std::span<const TrajectorySample>(samples_.data(), current_index_ + 1);
}

std::span<const TrajectorySample> Trajectory::future() const noexcept {
  if (samples_.empty()) {
    return {};
  }
  return std::span<const TrajectorySample>(samples_.data() + current_index_ + 1, samples_.size() - current_index_ - 1);
}

edlsim::core::Status Trajectory::splice_after(const std::size_t index, std::vector<TrajectorySample> future_samples) {
  if (index >= samples_.size()) {
    return edlsim::core::Status::InvalidInput;
  }
  samples_.resize(index + 1);
  std::erase_if(future_samples, [](const TrajectorySample& s) { return !std::isfinite(s.time_s); });
  std::stable_sort(future_samples.begin(), future_samples.end(), time_less);
  for (auto& s : future_samples) {
    if (!(s.time_s > samples_.back().time_s)) {
      continue;
    }
    refresh_derived(s, config_);
    samples_.push_back(s);
  }
  set_current_index(current_index_);
  return edlsim::core::Status::Ok;
}

ValidationReport validate(const Trajectory& trajectory) {
  ValidationReport report{};
  if (trajectory.empty()) {
    report.errors.push_back("trajectory has no samples");
    return report;
  }
  for (std::size_t i = 0; i < trajectory.size(); ++i) {
    const auto& s = trajectory[i];
    if (!std::isfinite(s.time_s) || !is_finite(s.position_m) || !is_finite(s.velocity_mps)) {
      report.errors.push_back(fmt::format("sample {} at t={:.3f}s has a non-finite state", i, s.time_s));
      continue;
    }
    if (i > 0 && !(s.time_s > trajectory[i - 1].time_s)) {
      report.errors.push_back(fmt::format("sample {} at t={:.3f}s is not after its predecessor", i, s.time_s));
    }
    if (s.altitude_m < -10000.0) {
      report.warnings.push_back(fmt::format("sample {} at t={:.3f}s is {:.1f} m below the surface", i, s.time_s, -s.altitude_m));
    }
    if (s.speed_mps > 10000.0) {
      report.warnings.push_back(fmt::format("sample {} at t={:.3f}s has speed {:.1f} m/s", i, s.time_s, s.speed_mps));
    }
  }
  return report;
}

Trajectory make_sample_trajectory(const TrajectoryConfig& config,
                                  const std::size_t points,
                                  const double duration_s,
                                  const double entry_altitude_m,
                                  const double final_altitude_m) {
  constexpr double kEntrySpeedMps = 5800.0;
  constexpr double kFinalSpeedMps = 430.0;
  constexpr double kDecayRate = 3.5;
  constexpr double kDecayShape = 1.8;
  constexpr double kCrossRangeRad = 0.002;

  const std::size_t n = std::max<std::size_t>(points, 2);
  const double decay_floor = std::exp(-kDecayRate);

  std::vector<PositionRow> rows;
  rows.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double t = (i + 1 == n) ? duration_s : duration_s * static_cast<double>(i) / static_cast<double>(n - 1);
    const double p = t / duration_s;
    const double decay = (std::exp(-kDecayRate * std::pow(p, kDecayShape)) - decay_floor) / (1.0 - decay_floor);
    const double altitude = final_altitude_m + (entry_altitude_m - final_altitude_m) * decay;
    // Ground speed falls as 430 + 5370 (1 - p)^2; downrange is its integral.
    const double downrange =
        kFinalSpeedMps * t + (kEntrySpeedMps - kFinalSpeedMps) * duration_s / 3.0 * (1.0 - std::pow(1.0 - p, 3.0));
    const double lon = downrange / config.body_radius_m;
    const double lat = kCrossRangeRad * std::sin(std::numbers::pi * p);
    const double r = config.body_radius_m + altitude;
    rows.push_back(PositionRow{.time_s = t,
                               .position_m = Vec3{r * std::cos(lat) * std::cos(lon),
                                                  r * std::cos(lat) * std::sin(lon),
                                                  r * std::sin(lat)}});
  }
  return Trajectory::from_positions(std::move(rows), config);
}

}  // namespace edlsim::trajectory
