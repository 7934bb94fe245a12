/**
 * @file physics_config_file.hpp
 * @brief `key = value` physics configuration reader.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "edlsim/core/physics_config.hpp"

namespace edlsim::io {

struct PhysicsConfigLoadResult {
  edlsim::core::PhysicsConfig config{};
  std::vector<std::string> unknown_keys{};
  std::size_t lines_skipped{};
  edlsim::core::Status status{edlsim::core::Status::Ok};
};

/**
 * @brief Overlay `key = value` lines from `path` onto `base`.
 *
 * Keys are the `PhysicsConfig` field names; `fallback_direction` takes three
 * comma-separated components. `#` starts a comment. Unknown keys are collected,
 * unparseable lines counted. The merged config must pass `validate`, otherwise
 * the status is `InvalidInput`.
 */
[[nodiscard]] PhysicsConfigLoadResult load_physics_config(const std::filesystem::path& path,
                                                          const edlsim::core::PhysicsConfig& base = {});

}  // namespace edlsim::io
