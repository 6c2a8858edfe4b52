#pragma once

#include "tactical/domain/tactical_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// ConfigLoader — JSON overlay on the TacticalConfig defaults
// -----------------------------------------------------------------------------
//
// @brief  Reads a JSON object whose keys are TacticalConfig field names and
//         copies each present value over the defaults.
//
// @details
// Regime buckets are nested objects:
//   { "normal": { "min_score": 4.5, "min_edge": 2.2, "cooldown_seconds": 480 } }
// asset_type is the string form ("CRYPTO", "FOREX", "EQUITY").
//
// Unknown keys are ignored and missing keys keep their default. A present
// key with the wrong JSON type throws nlohmann::json::type_error. After the
// overlay the result is checked for consistency (target ladder lengths and
// allocation, positive limits); a violation throws std::invalid_argument.
// A file that cannot be opened throws std::runtime_error.
//
// main() catches all three and exits with a message before any thread is
// started.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static domain::TacticalConfig fromJson(
      const nlohmann::json& j,
      const domain::TacticalConfig& base = domain::TacticalConfig{});

  static domain::TacticalConfig loadFile(const std::string& path);

  /// Throws std::invalid_argument describing the first violation.
  static void validate(const domain::TacticalConfig& config);
};

}  // namespace tactical
