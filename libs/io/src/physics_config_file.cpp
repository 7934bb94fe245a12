/**
 * @file physics_config_file.cpp
 * @brief Physics configuration reader implementation.
 * @author Watosn
 */

#include "edlsim/io/physics_config_file.hpp"

#include <fstream>
#include <map>

#include "csv_fields.hpp"

namespace edlsim::io {
namespace {

using edlsim::core::PhysicsConfig;

const std::map<std::string, double PhysicsConfig::*>& scalar_fields() {
  static const std::map<std::string, double PhysicsConfig::*> kFields{
      {"body_radius_m", &PhysicsConfig::body_radius_m},
      {"scale_height_m", &PhysicsConfig::scale_height_m},
      {"surface_density_kg_m3", &PhysicsConfig::surface_density_kg_m3},
      {"vehicle_mass_kg", &PhysicsConfig::vehicle_mass_kg},
      {"reference_area_m2", &PhysicsConfig::reference_area_m2},
      {"lift_to_drag", &PhysicsConfig::lift_to_drag},
      {"mu_m3_s2", &PhysicsConfig::mu_m3_s2},
      {"surface_gravity_mps2", &PhysicsConfig::surface_gravity_mps2},
      {"nose_radius_m", &PhysicsConfig::nose_radius_m},
      {"step_s", &PhysicsConfig::step_s},
      {"position_scale", &PhysicsConfig::position_scale},
  };
  return kFields;
}

bool parse_vec3(const std::string& text, edlsim::core::Vec3& out) {
  const auto parts = detail::split_fields(text, ',');
  edlsim::core::Vec3 v{};
  if (parts.size() != 3 || !detail::parse_double(parts[0], v.x) || !detail::parse_double(parts[1], v.y) ||
      !detail::parse_double(parts[2], v.z)) {
    return false;
  }
  out = v;
  return true;
}

}  // namespace

PhysicsConfigLoadResult load_physics_config(const std::filesystem::path& path, const PhysicsConfig& base) {
  std::ifstream in(path);
  if (!in) {
    return PhysicsConfigLoadResult{.config = base, .status = edlsim::core::Status::DataUnavailable};
  }

  PhysicsConfigLoadResult out{.config = base};
  std::string line;
  while (std::getline(in, line)) {
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    if (detail::trim(line).empty()) {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      ++out.lines_skipped;
      continue;
    }
    const std::string key = detail::trim(line.substr(0, eq));
    const std::string value = line.substr(eq + 1);

    if (key == "fallback_direction") {
      if (!parse_vec3(value, out.config.fallback_direction)) {
        ++out.lines_skipped;
      }
      continue;
    }
    const auto it = scalar_fields().find(key);
    if (it == scalar_fields().end()) {
      out.unknown_keys.push_back(key);
      continue;
    }
    double parsed = 0.0;
    if (!detail::parse_double(value, parsed)) {
      ++out.lines_skipped;
      continue;
    }
    out.config.*(it->second) = parsed;
  }

  out.status = edlsim::core::validate(out.config);
  return out;
}

}  // namespace edlsim::io
