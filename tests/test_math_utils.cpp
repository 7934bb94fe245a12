/**
 * @file test_math_utils.cpp
 * @brief Vector helper and entry-state conversion tests.
 * @author Watosn
 */

#include <cmath>
#include <numbers>

#include <spdlog/spdlog.h>

#include "edlsim/core/constants.hpp"
#include "edlsim/core/math_utils.hpp"

namespace {

bool near(const edlsim::core::Vec3& a, const edlsim::core::Vec3& b, double tol) {
  return edlsim::core::distance(a, b) <= tol;
}

}  // namespace

int main() {
  using namespace edlsim;
  const core::Vec3 x{1.0, 0.0, 0.0};
  const core::Vec3 y{0.0, 1.0, 0.0};
  const core::Vec3 z{0.0, 0.0, 1.0};

  if (!near(core::vec_cross(x, y), z, 0.0) || !near(core::vec_cross(y, x), -z, 0.0)) {
    spdlog::error("cross product mismatch");
    return 1;
  }

  double n = 0.0;
  const auto u = core::unit_direction(core::Vec3{3.0, 4.0, 0.0}, &n);
  if (n != 5.0 || !near(u, core::Vec3{0.6, 0.8, 0.0}, 1e-15) || !core::is_degenerate(core::unit_direction(core::Vec3{}))) {
    spdlog::error("unit_direction mismatch");
    return 2;
  }

  if (!near(core::rotate_about_axis(x, z, std::numbers::pi / 2.0), y, 1e-15) ||
      !near(core::rotate_about_axis(x, core::Vec3{0.0, 0.0, 5.0}, std::numbers::pi), -x, 1e-15)) {
    spdlog::error("axis-angle rotation mismatch");
    return 3;
  }
  if (!near(core::rotate_about_axis(x, core::Vec3{}, 1.0), x, 0.0)) {
    spdlog::error("degenerate axis should leave vector unchanged");
    return 4;
  }

  if (!near(core::orthogonalize(core::Vec3{1.0, 1.0, 0.0}, x), y, 1e-15) || !core::is_degenerate(core::orthogonalize(x * 2.0, x))) {
    spdlog::error("orthogonalize mismatch");
    return 5;
  }

  for (const auto& ref : {x, y, z, core::unit_direction(core::Vec3{1.0, 1.0, 1.0})}) {
    const auto p = core::any_perpendicular(ref);
    if (std::abs(core::dot(p, ref)) > 1e-15 || std::abs(core::norm(p) - 1.0) > 1e-15) {
      spdlog::error("any_perpendicular not orthonormal");
      return 6;
    }
  }

  const double r = core::constants::kMarsRadiusM + 100000.0;
  const auto basis = core::local_basis(core::Vec3{r, 0.0, 0.0}, core::Vec3{0.0, 4000.0, 0.0}, core::Vec3{0.0, -1.0, 0.0});
  if (!near(basis.up, x, 0.0) || !near(basis.velocity_dir, y, 0.0) || !near(basis.horizontal, -z, 0.0)) {
    spdlog::error("local basis mismatch");
    return 7;
  }
  const auto fallback = core::local_basis(core::Vec3{r, 0.0, 0.0}, core::Vec3{}, core::Vec3{0.0, 0.0, 2.0});
  if (!near(fallback.velocity_dir, z, 0.0)) {
    spdlog::error("fallback velocity direction not used");
    return 8;
  }
  const auto radial = core::local_basis(core::Vec3{r, 0.0, 0.0}, core::Vec3{-100.0, 0.0, 0.0}, y);
  if (core::is_degenerate(radial.horizontal) || std::abs(core::dot(radial.horizontal, radial.up)) > 1e-15) {
    spdlog::error("radial velocity basis degenerate");
    return 9;
  }

  const auto equator = core::entry_state_from_spherical(
      core::SphericalEntryState{.altitude_m = 100000.0, .speed_mps = 5000.0}, core::constants::kMarsRadiusM);
  if (!near(equator.position_m, core::Vec3{r, 0.0, 0.0}, 1e-6) || !near(equator.velocity_mps, core::Vec3{0.0, 5000.0, 0.0}, 1e-9)) {
    spdlog::error("equatorial eastward entry mismatch");
    return 10;
  }

  const auto steep = core::entry_state_from_spherical(
      core::SphericalEntryState{.altitude_m = 100000.0,
                                .speed_mps = 5000.0,
                                .longitude_rad = 0.7,
                                .latitude_rad = -0.3,
                                .flight_path_angle_rad = -15.5 * core::constants::kDegToRad,
                                .heading_rad = 0.4},
      core::constants::kMarsRadiusM);
  const double fpa = std::asin(core::dot(core::unit_direction(steep.position_m), core::unit_direction(steep.velocity_mps)));
  if (std::abs(core::norm(steep.position_m) - r) > 1e-6 || std::abs(core::norm(steep.velocity_mps) - 5000.0) > 1e-9 ||
      std::abs(fpa - (-15.5 * core::constants::kDegToRad)) > 1e-12) {
    spdlog::error("flight path angle not preserved");
    return 11;
  }
  return 0;
}
