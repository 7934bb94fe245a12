/**
 * @file math_utils.cpp
 * @brief Vector helper implementation.
 * @author Watosn
 */

#include "edlsim/core/math_utils.hpp"

#include <array>
#include <cmath>

#include <Eigen/Geometry>

namespace edlsim::core {
namespace {

Eigen::Vector3d to_eigen(const Vec3& v) { return Eigen::Vector3d(v.x, v.y, v.z); }

Vec3 from_eigen(const Eigen::Vector3d& v) { return Vec3{v.x(), v.y(), v.z()}; }

}  // namespace

Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, const double angle_rad) {
  const Vec3 unit_axis = unit_direction(axis);
  if (is_degenerate(unit_axis) || !std::isfinite(angle_rad)) {
    return v;
  }
  const Eigen::AngleAxisd rotation(angle_rad, to_eigen(unit_axis));
  return from_eigen(rotation * to_eigen(v));
}

Vec3 orthogonalize(const Vec3& v, const Vec3& unit_ref) {
  const Vec3 remainder = v - dot(v, unit_ref) * unit_ref;
  if (is_degenerate(remainder)) {
    return Vec3{};
  }
  return unit_direction(remainder);
}

Vec3 any_perpendicular(const Vec3& unit_ref) {
  static constexpr std::array<Vec3, 3> kAxes{Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}, Vec3{0.0, 0.0, 1.0}};
  for (const auto& axis : kAxes) {
    const Vec3 candidate = unit_direction(vec_cross(axis, unit_ref));
    if (!is_degenerate(candidate)) {
      return candidate;
    }
  }
  return kAxes[0];
}

LocalBasis local_basis(const Vec3& position, const Vec3& velocity, const Vec3& fallback_velocity_dir) {
  LocalBasis basis{};
  basis.up = unit_direction(position);
  if (is_degenerate(basis.up)) {
    basis.up = Vec3{0.0, 1.0, 0.0};
  }

  basis.velocity_dir = unit_direction(velocity);
  if (is_degenerate(basis.velocity_dir)) {
    basis.velocity_dir = unit_direction(fallback_velocity_dir);
  }

  basis.horizontal = unit_direction(vec_cross(basis.velocity_dir, basis.up));
  if (is_degenerate(basis.horizontal)) {
    // Velocity parallel to up: the along-track plane is undefined.
    basis.horizontal = any_perpendicular(basis.up);
  }
  return basis;
}

CartesianState entry_state_from_spherical(const SphericalEntryState& entry, const double body_radius_m) {
  const double r = body_radius_m + entry.altitude_m;
  const double cos_lat = std::cos(entry.latitude_rad);
  const double sin_lat = std::sin(entry.latitude_rad);
  const double cos_lon = std::cos(entry.longitude_rad);
  const double sin_lon = std::sin(entry.longitude_rad);

  const Vec3 up{cos_lat * cos_lon, cos_lat * sin_lon, sin_lat};
  const Vec3 east{-sin_lon, cos_lon, 0.0};
  const Vec3 north{-sin_lat * cos_lon, -sin_lat * sin_lon, cos_lat};

  const double cos_fpa = std::cos(entry.flight_path_angle_rad);
  const Vec3 v_dir = cos_fpa * std::cos(entry.heading_rad) * east + cos_fpa * std::sin(entry.heading_rad) * north +
                     std::sin(entry.flight_path_angle_rad) * up;

  return CartesianState{.position_m = r * up, .velocity_mps = entry.speed_mps * v_dir};
}

}  // namespace edlsim::core
