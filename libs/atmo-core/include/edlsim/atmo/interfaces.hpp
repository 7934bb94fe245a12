/**
 * @file interfaces.hpp
 * @brief Atmosphere model interface.
 * @author Watosn
 */
#pragma once

#include "edlsim/core/types.hpp"

namespace edlsim::atmo {

/**
 * @brief Interface for altitude-driven atmosphere models.
 */
class IAtmosphereModel {
 public:
  virtual ~IAtmosphereModel() = default;
  /**
   * @brief Evaluate atmospheric state at a geometric altitude.
   * @param altitude_m Altitude above the body's reference radius.
   * @return Atmosphere sample with `status` set.
   */
  [[nodiscard]] virtual edlsim::core::AtmosphereSample evaluate(double altitude_m) const = 0;
};

}  // namespace edlsim::atmo
