/**
 * @file test_entry_integrator.cpp
 * @brief Forward integrator and aerodynamics tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "edlsim/core/math_utils.hpp"
#include "edlsim/dynamics/aero_model.hpp"
#include "edlsim/dynamics/entry_integrator.hpp"
#include "edlsim/models/exponential_atmosphere.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

bool same(const edlsim::core::Vec3& a, const edlsim::core::Vec3& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }

}  // namespace

int main() {
  using namespace edlsim;
  const core::PhysicsConfig physics{};
  const models::ExponentialAtmosphereModel atmosphere(physics);
  const dynamics::EntryIntegrator integrator(atmosphere, physics);

  // Entry plane tilted away from every coordinate plane.
  const auto entry = core::entry_state_from_spherical(
      core::SphericalEntryState{.altitude_m = 132000.0,
                                .speed_mps = 5800.0,
                                .longitude_rad = 0.8,
                                .latitude_rad = 0.3,
                                .flight_path_angle_rad = -15.5 * core::constants::kDegToRad,
                                .heading_rad = 0.6},
      physics.body_radius_m);
  const auto plane_normal = core::unit_direction(core::vec_cross(entry.position_m, entry.velocity_mps));

  const auto zero_bank = integrator.integrate(entry.position_m, entry.velocity_mps, 60.0, 0.1, trajectory::BankAngleProfile{});
  if (zero_bank.status != core::Status::Ok || zero_bank.trajectory.size() != 601 || zero_bank.diagnostics.size() != 600) {
    spdlog::error("zero-bank integration failed status={} n={}", core::to_string(zero_bank.status), zero_bank.trajectory.size());
    return 1;
  }
  const auto& first = zero_bank.trajectory[0];
  if (first.time_s != 0.0 || !same(first.position_m, entry.position_m) || !same(first.velocity_mps, entry.velocity_mps)) {
    spdlog::error("initial state must be the first sample");
    return 2;
  }
  for (const auto& d : zero_bank.diagnostics) {
    if (d.lift_acceleration_mps2 != 0.0) {
      spdlog::error("nonzero lift at t={} with zero bank", d.time_s);
      return 3;
    }
  }
  for (const auto& s : zero_bank.trajectory.samples()) {
    if (std::abs(core::dot(s.position_m, plane_normal)) > 1e-9 * core::norm(s.position_m)) {
      spdlog::error("zero-bank trajectory left the entry plane at t={}", s.time_s);
      return 4;
    }
  }
  if (!(zero_bank.trajectory.samples().back().speed_mps < 5800.0) ||
      !(zero_bank.trajectory.samples().back().altitude_m < 132000.0)) {
    spdlog::error("entry should decelerate and descend");
    return 5;
  }

  const auto repeat = integrator.integrate(entry.position_m, entry.velocity_mps, 60.0, 0.1, trajectory::BankAngleProfile{});
  for (std::size_t i = 0; i < repeat.trajectory.size(); ++i) {
    if (!same(repeat.trajectory[i].position_m, zero_bank.trajectory[i].position_m) ||
        !same(repeat.trajectory[i].velocity_mps, zero_bank.trajectory[i].velocity_mps)) {
      spdlog::error("integration not deterministic at {}", i);
      return 6;
    }
  }

  // Above the ceiling only gravity acts: one step is exactly v + g dt, r + v dt.
  const core::Vec3 r_high{physics.body_radius_m + 250000.0, 0.0, 0.0};
  const core::Vec3 v_high{0.0, 3000.0, 0.0};
  const auto vacuum = integrator.integrate(r_high, v_high, 1.0, 1.0, trajectory::BankAngleProfile::constant(45.0));
  const double g = physics.surface_gravity_mps2 * std::pow(physics.body_radius_m / r_high.x, 2.0);
  if (vacuum.status != core::Status::Ok || vacuum.trajectory.size() != 2 ||
      !approx(vacuum.trajectory[1].velocity_mps.x, -g, 1e-12) || vacuum.trajectory[1].velocity_mps.y != 3000.0 ||
      !approx(vacuum.trajectory[1].position_m.x, r_high.x - g, 1e-14) || vacuum.diagnostics[0].lift_acceleration_mps2 != 0.0) {
    spdlog::error("vacuum step mismatch");
    return 7;
  }

  const auto banked = integrator.integrate(entry.position_m, entry.velocity_mps, 60.0, 0.1, trajectory::BankAngleProfile::constant(90.0));
  const auto& end = banked.trajectory.samples().back();
  if (banked.status != core::Status::Ok || std::abs(core::dot(end.position_m, plane_normal)) < 100.0 ||
      banked.trajectory[10].bank_angle_deg != 90.0) {
    spdlog::error("full bank should steer out of the entry plane");
    return 8;
  }

  // Lift at 90 deg bank is perpendicular to velocity with magnitude drag * L/D.
  const dynamics::EntryAeroModel aero(atmosphere, physics);
  const core::Vec3 r_mid{physics.body_radius_m + 40000.0, 0.0, 0.0};
  const core::Vec3 v_mid{-300.0, 4000.0, 0.0};
  const auto a = aero.evaluate(r_mid, v_mid, 90.0);
  const double q = 0.5 * atmosphere.density(40000.0) * core::dot(v_mid, v_mid);
  if (a.status != core::Status::Ok || !approx(a.dynamic_pressure_pa, q, 1e-12) ||
      !approx(core::norm(a.drag_acceleration_mps2), q * physics.reference_area_m2 / physics.vehicle_mass_kg, 1e-12) ||
      !approx(core::norm(a.lift_acceleration_mps2), q * physics.reference_area_m2 * physics.lift_to_drag / physics.vehicle_mass_kg, 1e-12) ||
      std::abs(core::dot(a.lift_direction, core::unit_direction(v_mid))) > 1e-12) {
    spdlog::error("aero force magnitudes mismatch");
    return 9;
  }
  if (!approx(core::norm(dynamics::gravity_acceleration(r_mid, physics)),
              physics.surface_gravity_mps2 * std::pow(physics.body_radius_m / r_mid.x, 2.0), 1e-12)) {
    spdlog::error("inverse-square gravity mismatch");
    return 10;
  }

  // Purely radial velocity exercises the degenerate-normal fallback.
  const auto radial = aero.evaluate(r_mid, core::Vec3{-1000.0, 0.0, 0.0}, 30.0);
  if (radial.status != core::Status::Ok || core::is_degenerate(radial.lift_direction) ||
      std::abs(core::dot(radial.lift_direction, core::Vec3{1.0, 0.0, 0.0})) > 1e-12) {
    spdlog::error("degenerate-normal lift fallback failed");
    return 11;
  }

  const auto drop = integrator.integrate(core::Vec3{physics.body_radius_m + 1000.0, 0.0, 0.0}, core::Vec3{-100.0, 0.0, 0.0}, 60.0, 0.1,
                                         trajectory::BankAngleProfile{}, dynamics::IntegratorOptions{.terminal_altitude_m = 0.0});
  if (drop.status != core::Status::Ok || !drop.reached_terminal_altitude || !(drop.trajectory.samples().back().altitude_m <= 0.0) ||
      !(drop.trajectory[drop.trajectory.size() - 2].altitude_m > 0.0)) {
    spdlog::error("terminal altitude stop failed");
    return 12;
  }

  if (integrator.integrate(entry.position_m, entry.velocity_mps, 10.0, 0.0, trajectory::BankAngleProfile{}).status !=
      core::Status::InvalidInput) {
    spdlog::error("zero step accepted");
    return 13;
  }

  const auto partial = integrator.integrate(entry.position_m, entry.velocity_mps, 1.05, 0.1, trajectory::BankAngleProfile{});
  if (partial.trajectory.size() != 12 || partial.trajectory.end_time() != 1.05) {
    spdlog::error("partial final step mismatch n={} end={}", partial.trajectory.size(), partial.trajectory.end_time());
    return 14;
  }

  auto base = zero_bank.trajectory;
  const auto continued = integrator.continue_from(base, 30.0, trajectory::BankAngleProfile::constant(60.0));
  const std::size_t cut = base.index_at_or_before(30.0);
  if (continued.status != core::Status::Ok || !approx(continued.trajectory.end_time(), base.end_time(), 1e-12)) {
    spdlog::error("continuation failed");
    return 15;
  }
  for (std::size_t i = 0; i <= cut; ++i) {
    if (!same(continued.trajectory[i].position_m, base[i].position_m)) {
      spdlog::error("continuation changed the past at {}", i);
      return 16;
    }
  }
  for (std::size_t i = 1; i < continued.trajectory.size(); ++i) {
    if (!(continued.trajectory[i].time_s > continued.trajectory[i - 1].time_s)) {
      spdlog::error("continuation broke time ordering at {}", i);
      return 17;
    }
  }
  if (same(continued.trajectory.samples().back().position_m, base.samples().back().position_m)) {
    spdlog::error("continuation did not change the future");
    return 18;
  }
  return 0;
}
