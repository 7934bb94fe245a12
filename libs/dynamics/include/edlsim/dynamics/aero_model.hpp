/**
 * @file aero_model.hpp
 * @brief Drag, lift and gravity accelerations for a lifting entry capsule.
 * @author Watosn
 */
#pragma once

#include "edlsim/atmo/interfaces.hpp"
#include "edlsim/core/physics_config.hpp"

namespace edlsim::dynamics {

struct AeroResult {
  edlsim::core::Vec3 drag_acceleration_mps2{};
  edlsim::core::Vec3 lift_acceleration_mps2{};
  edlsim::core::Vec3 lift_direction{};
  double altitude_m{};
  double density_kg_m3{};
  double temperature_k{};
  double sound_speed_mps{};
  double speed_mps{};
  double dynamic_pressure_pa{};
  double mach{};
  double drag_n{};
  double lift_n{};
  edlsim::core::Status status{edlsim::core::Status::Ok};
};

/**
 * @brief Inverse-square gravity scaled from the configured surface gravity.
 *
 * Returns zero at the body center.
 */
[[nodiscard]] edlsim::core::Vec3 gravity_acceleration(const edlsim::core::Vec3& position_m,
                                                      const edlsim::core::PhysicsConfig& physics);

/**
 * @brief Base lift direction: perpendicular to velocity, in the plane of position and velocity.
 *
 * Computed as `normalize(normalize(r x v) x v_hat)`. When the orbital-plane normal is
 * degenerate the radial direction is orthogonalized against `v_hat` instead, with an
 * arbitrary perpendicular axis as the last resort.
 */
[[nodiscard]] edlsim::core::Vec3 base_lift_direction(const edlsim::core::Vec3& position_m,
                                                     const edlsim::core::Vec3& velocity_dir);

class EntryAeroModel {
 public:
  EntryAeroModel(const edlsim::atmo::IAtmosphereModel& atmosphere, const edlsim::core::PhysicsConfig& physics)
      : atmosphere_(atmosphere), physics_(physics) {}

  /**
   * @brief Evaluate drag and banked lift at one state.
   * @param bank_angle_deg Rotation of the lift vector about the velocity axis.
   */
  [[nodiscard]] AeroResult evaluate(const edlsim::core::Vec3& position_m,
                                    const edlsim::core::Vec3& velocity_mps,
                                    double bank_angle_deg) const;

 private:
  const edlsim::atmo::IAtmosphereModel& atmosphere_;
  const edlsim::core::PhysicsConfig& physics_;
};

}  // namespace edlsim::dynamics
