/**
 * @file trajectory.hpp
 * @brief Time-indexed kinematic sample store with eased interpolation.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "edlsim/core/physics_config.hpp"
#include "edlsim/core/types.hpp"

namespace edlsim::trajectory {

/**
 * @brief Geometry used to derive cached scalars on each sample.
 */
struct TrajectoryConfig {
  double body_radius_m{edlsim::core::constants::kMarsRadiusM};
  edlsim::core::Vec3 target_m{};
  edlsim::core::Vec3 fallback_direction{0.0, -1.0, 0.0};
  double velocity_lookahead_s{0.1};
};

/**
 * @brief Trajectory geometry derived from a physics configuration.
 */
[[nodiscard]] TrajectoryConfig make_trajectory_config(const edlsim::core::PhysicsConfig& physics,
                                                      const edlsim::core::Vec3& target_m = {});

/**
 * @brief Recompute altitude, speed and distance-to-target from position/velocity.
 */
void refresh_derived(edlsim::core::TrajectorySample& sample, const TrajectoryConfig& config);

/**
 * @brief Raw `{time, position}` input row.
 */
struct PositionRow {
  double time_s{};
  edlsim::core::Vec3 position_m{};
};

/**
 * @brief Ordered trajectory buffer split into an immutable past and mutable future.
 *
 * Samples are kept sorted by strictly increasing time; the past is every index
 * up to and including `current_index()`.
 */
class Trajectory {
 public:
  Trajectory() = default;

  /**
   * @brief Build from samples, sorting by time and dropping non-finite or duplicate times.
   *
   * Derived scalars are refreshed from position and velocity.
   */
  Trajectory(std::vector<edlsim::core::TrajectorySample> samples, TrajectoryConfig config);

  /**
   * @brief Build from raw positions with finite-difference velocities.
   *
   * Each sample differences against its predecessor; the first sample uses a forward
   * difference. A single row has no velocity.
   */
  static Trajectory from_positions(std::vector<PositionRow> rows, TrajectoryConfig config);

  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] const std::vector<edlsim::core::TrajectorySample>& samples() const noexcept { return samples_; }
  [[nodiscard]] const edlsim::core::TrajectorySample& operator[](std::size_t i) const { return samples_[i]; }
  [[nodiscard]] const TrajectoryConfig& config() const noexcept { return config_; }

  [[nodiscard]] double start_time() const noexcept { return samples_.empty() ? 0.0 : samples_.front().time_s; }
  [[nodiscard]] double end_time() const noexcept { return samples_.empty() ? 0.0 : samples_.back().time_s; }

  /**
   * @brief Interpolated sample at `time_s`, clamped to the trajectory span.
   *
   * Position and velocity use a cubic ease-in-out parameter; scalar fields are linear.
   * @return `std::nullopt` only for an empty trajectory.
   */
  [[nodiscard]] std::optional<edlsim::core::TrajectorySample> query(double time_s) const;

  /**
   * @brief Velocity at `time_s`.
   *
   * Uses interpolated explicit velocity where present, otherwise a forward difference
   * over `velocity_lookahead_s`; returns `fallback_direction` when the result is
   * near zero.
   */
  [[nodiscard]] edlsim::core::Vec3 velocity_vector_at(double time_s) const;

  /**
   * @brief Last index with `time <= time_s`, or 0 when `time_s` precedes the first sample.
   */
  [[nodiscard]] std::size_t index_at_or_before(double time_s) const;

  /**
   * @brief Time of the stored sample nearest to `position_m`.
   */
  [[nodiscard]] std::optional<double> closest_time(const edlsim::core::Vec3& position_m) const;

  [[nodiscard]] std::size_t current_index() const noexcept { return current_index_; }
  void set_current_index(std::size_t index) noexcept;
  void set_current_time(double time_s) { set_current_index(index_at_or_before(time_s)); }

  [[nodiscard]] std::span<const edlsim::core::TrajectorySample> past() const noexcept;
  [[nodiscard]] std::span<const edlsim::core::TrajectorySample> future() const noexcept;

  /**
   * @brief Keep samples `[0, index]` and append `future_samples` after them.
   *
   * Replacement samples at or before the kept sample's time are dropped.
   * @return `Status::InvalidInput` when `index` is out of range.
   */
  [[nodiscard]] edlsim::core::Status splice_after(std::size_t index,
                                                  std::vector<edlsim::core::TrajectorySample> future_samples);

 private:
  std::vector<edlsim::core::TrajectorySample> samples_{};
  TrajectoryConfig config_{};
  std::size_t current_index_{};
};

/**
 * @brief Physical-plausibility report for a trajectory.
 */
struct ValidationReport {
  std::vector<std::string> errors{};
  std::vector<std::string> warnings{};
  [[nodiscard]] bool valid() const noexcept { return errors.empty(); }
};

/**
 * @brief Flag non-finite states (errors) and subsurface or very fast samples (warnings).
 */
[[nodiscard]] ValidationReport validate(const Trajectory& trajectory);

/**
 * @brief Procedural entry trajectory for demos and tests.
 *
 * Altitude decays from `entry_altitude_m` to `final_altitude_m` while ground speed falls
 * quadratically from 5800 m/s to 430 m/s along a great circle in the x-y plane, with a
 * small cross-range drift. Velocities are finite differences of the positions.
 */
[[nodiscard]] Trajectory make_sample_trajectory(const TrajectoryConfig& config,
                                                std::size_t points = 500,
                                                double duration_s = 260.65,
                                                double entry_altitude_m = 132000.0,
                                                double final_altitude_m = 13462.9);

}  // namespace edlsim::trajectory
