/**
 * @file math_utils.hpp
 * @brief Shared vector helpers: cross products, basis construction and axis-angle rotation.
 * @author Watosn
 */
#pragma once

#include "edlsim/core/types.hpp"

namespace edlsim::core {

/**
 * @brief Squared-length threshold below which a direction is treated as degenerate.
 */
inline constexpr double kDegenerateLengthSq = 1e-8;

/**
 * @brief Vector cross product.
 */
inline Vec3 vec_cross(const Vec3& a, const Vec3& b) {
  return Vec3{
      a.y * b.z - a.z * b.y,
      a.z * b.x - a.x * b.z,
      a.x * b.y - a.y * b.x,
  };
}

/**
 * @brief Normalize a vector with optional returned norm.
 *
 * Returns the zero vector for zero-length or non-finite input.
 */
inline Vec3 unit_direction(const Vec3& v, double* norm_out = nullptr) {
  const double n = norm(v);
  if (norm_out) {
    *norm_out = n;
  }
  if (n <= 0.0 || !std::isfinite(n)) {
    return Vec3{};
  }
  return v / n;
}

/**
 * @brief True when `v` is too short to define a direction.
 */
inline bool is_degenerate(const Vec3& v) { return !(dot(v, v) >= kDegenerateLengthSq); }

/**
 * @brief Rotate `v` about `axis` by `angle_rad` (right-hand rule).
 *
 * `axis` need not be normalized; a degenerate axis returns `v` unchanged.
 */
[[nodiscard]] Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, double angle_rad);

/**
 * @brief Single Gram-Schmidt pass: remove the `unit_ref` component of `v` and normalize.
 *
 * Returns the zero vector when the remainder is degenerate.
 */
[[nodiscard]] Vec3 orthogonalize(const Vec3& v, const Vec3& unit_ref);

/**
 * @brief Deterministic unit vector perpendicular to `unit_ref`.
 *
 * Tries the +X axis first and falls back to +Y, then +Z.
 */
[[nodiscard]] Vec3 any_perpendicular(const Vec3& unit_ref);

/**
 * @brief Local radial/along-track/horizontal frame at a trajectory point.
 */
struct LocalBasis {
  Vec3 up{};
  Vec3 velocity_dir{};
  Vec3 horizontal{};
};

/**
 * @brief Build `up = r/|r|`, `velocity_dir = v/|v|`, `horizontal = velocity_dir x up`.
 *
 * `fallback_velocity_dir` is used when `velocity` is degenerate; `horizontal`
 * falls back to a vector perpendicular to `up` when velocity is parallel to it.
 */
[[nodiscard]] LocalBasis local_basis(const Vec3& position, const Vec3& velocity, const Vec3& fallback_velocity_dir);

/**
 * @brief Spherical entry conditions relative to a body-centered inertial frame.
 */
struct SphericalEntryState {
  double altitude_m{};
  double speed_mps{};
  double longitude_rad{};
  double latitude_rad{};
  double flight_path_angle_rad{};
  double heading_rad{};
};

/**
 * @brief Cartesian position/velocity pair.
 */
struct CartesianState {
  Vec3 position_m{};
  Vec3 velocity_mps{};
};

/**
 * @brief Convert spherical entry conditions to body-centered Cartesian state.
 *
 * Heading is measured from local east toward north, flight-path angle positive above
 * the local horizon.
 */
[[nodiscard]] CartesianState entry_state_from_spherical(const SphericalEntryState& entry, double body_radius_m);

}  // namespace edlsim::core
