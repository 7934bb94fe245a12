/**
 * @file bank_angle_profile.cpp
 * @brief Bank-angle schedule implementation.
 * @author Watosn
 */

#include "edlsim/trajectory/bank_angle_profile.hpp"

#include <algorithm>
#include <utility>

namespace edlsim::trajectory {

BankAngleProfile BankAngleProfile::constant(const double bank_angle_deg) {
  return from_keyframes({BankKeyframe{.time_s = 0.0, .bank_angle_deg = bank_angle_deg}});
}

BankAngleProfile BankAngleProfile::from_function(Function fn) {
  BankAngleProfile out;
  out.fn_ = std::move(fn);
  return out;
}

BankAngleProfile BankAngleProfile::from_keyframes(std::vector<BankKeyframe> keyframes) {
  std::stable_sort(keyframes.begin(), keyframes.end(),
                   [](const BankKeyframe& a, const BankKeyframe& b) { return a.time_s < b.time_s; });
  BankAngleProfile out;
  out.keyframes_ = std::move(keyframes);
  return out;
}

double BankAngleProfile::at(const double time_s) const {
  if (fn_) {
    return fn_(time_s);
  }
  if (keyframes_.empty()) {
    return 0.0;
  }
  if (!(time_s > keyframes_.front().time_s)) {
    return keyframes_.front().bank_angle_deg;
  }
  if (time_s >= keyframes_.back().time_s) {
    return keyframes_.back().bank_angle_deg;
  }

  const auto it = std::upper_bound(keyframes_.begin(), keyframes_.end(), time_s,
                                   [](const double t, const BankKeyframe& k) { return t < k.time_s; });
  const BankKeyframe& k1 = *it;
  const BankKeyframe& k0 = *(it - 1);
  const double dt = k1.time_s - k0.time_s;
  if (dt <= 0.0) {
    return k1.bank_angle_deg;
  }
  const double alpha = (time_s - k0.time_s) / dt;
  return k0.bank_angle_deg + alpha * (k1.bank_angle_deg - k0.bank_angle_deg);
}

}  // namespace edlsim::trajectory
