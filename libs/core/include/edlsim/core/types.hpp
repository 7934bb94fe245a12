/**
 * @file types.hpp
 * @brief Core domain types for edlsim.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>

namespace edlsim::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, NumericalError };

inline const char* to_string(const Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator-(const Vec3& v) { return Vec3{-v.x, -v.y, -v.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline double distance(const Vec3& a, const Vec3& b) { return norm(a - b); }

/**
 * @brief One instant of vehicle state along a trajectory.
 *
 * `altitude_m`, `speed_mps` and `distance_to_target_m` are caches derived from
 * `position_m`/`velocity_mps`; they are recomputed after every position edit.
 */
struct TrajectorySample {
  double time_s{};
  Vec3 position_m{};
  Vec3 velocity_mps{};
  double altitude_m{};
  double speed_mps{};
  double distance_to_target_m{};
  double bank_angle_deg{};
  bool has_velocity{true};
};

/**
 * @brief Atmospheric state at one altitude.
 */
struct AtmosphereSample {
  double density_kg_m3{};
  double pressure_pa{};
  double temperature_k{};
  double sound_speed_mps{};
  Status status{Status::Ok};
};

}  // namespace edlsim::core
