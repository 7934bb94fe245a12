/**
 * @file test_bank_angle_profile.cpp
 * @brief Bank-angle schedule tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "edlsim/trajectory/bank_angle_profile.hpp"

int main() {
  using namespace edlsim::trajectory;

  const BankAngleProfile none{};
  if (none.at(0.0) != 0.0 || none.at(100.0) != 0.0) {
    spdlog::error("empty profile should command zero bank");
    return 1;
  }

  const auto constant = BankAngleProfile::constant(35.0);
  if (constant.at(-10.0) != 35.0 || constant.at(1.0e4) != 35.0) {
    spdlog::error("constant profile mismatch");
    return 2;
  }

  // Out of order on purpose.
  const auto keyed = BankAngleProfile::from_keyframes({BankKeyframe{.time_s = 100.0, .bank_angle_deg = -60.0},
                                                       BankKeyframe{.time_s = 20.0, .bank_angle_deg = 0.0},
                                                       BankKeyframe{.time_s = 60.0, .bank_angle_deg = 60.0}});
  if (keyed.keyframes().front().time_s != 20.0 || keyed.keyframes().back().time_s != 100.0) {
    spdlog::error("keyframes not sorted");
    return 3;
  }
  if (keyed.at(0.0) != 0.0 || keyed.at(20.0) != 0.0) {
    spdlog::error("value before first keyframe should hold the first value");
    return 4;
  }
  if (keyed.at(40.0) != 30.0 || keyed.at(60.0) != 60.0 || keyed.at(80.0) != 0.0) {
    spdlog::error("linear interpolation mismatch at40={} at60={} at80={}", keyed.at(40.0), keyed.at(60.0), keyed.at(80.0));
    return 5;
  }
  if (keyed.at(100.0) != -60.0 || keyed.at(500.0) != -60.0) {
    spdlog::error("value after last keyframe should hold the last value");
    return 6;
  }
  if (keyed.at(std::numeric_limits<double>::quiet_NaN()) != 0.0) {
    spdlog::error("nan time should resolve to the first keyframe");
    return 7;
  }

  const auto fn = BankAngleProfile::from_function([](double t) { return t < 50.0 ? 10.0 : -10.0; });
  if (fn.at(10.0) != 10.0 || fn.at(75.0) != -10.0) {
    spdlog::error("function profile mismatch");
    return 8;
  }
  return 0;
}
