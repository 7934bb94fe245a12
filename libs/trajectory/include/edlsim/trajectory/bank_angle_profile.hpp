/**
 * @file bank_angle_profile.hpp
 * @brief Bank-angle command schedule as a function or keyframe table.
 * @author Watosn
 */
#pragma once

#include <functional>
#include <vector>

namespace edlsim::trajectory {

/**
 * @brief One bank-angle keyframe.
 */
struct BankKeyframe {
  double time_s{};
  double bank_angle_deg{};
};

/**
 * @brief Bank-angle schedule in degrees.
 *
 * Keyframes are linearly interpolated, held at the first value before the first
 * keyframe and at the last value after the final one. A default-constructed profile
 * commands zero bank for all time.
 */
class BankAngleProfile {
 public:
  using Function = std::function<double(double)>;

  BankAngleProfile() = default;

  static BankAngleProfile constant(double bank_angle_deg);
  static BankAngleProfile from_function(Function fn);
  /**
   * @brief Build from keyframes; input order does not matter.
   */
  static BankAngleProfile from_keyframes(std::vector<BankKeyframe> keyframes);

  /**
   * @brief Bank angle in degrees at `time_s`.
   */
  [[nodiscard]] double at(double time_s) const;

  [[nodiscard]] const std::vector<BankKeyframe>& keyframes() const noexcept { return keyframes_; }

 private:
  Function fn_{};
  std::vector<BankKeyframe> keyframes_{};
};

}  // namespace edlsim::trajectory
