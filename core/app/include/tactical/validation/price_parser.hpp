#pragma once

#include <optional>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// PriceParser — lenient price text to number
// -----------------------------------------------------------------------------
//
// Accepts the shapes advisory sources produce: "$84,500", "84500.5",
// "91000 USDT", "84000-84500" (a range, resolved to its midpoint).
// Thousands separators and '$' are dropped; surrounding words are ignored.
// Returns nullopt when there is no number, when a number is malformed
// ("84.000.5"), when more than two numbers appear, or when two numbers are
// separated by anything other than a single '-' ("84000 / 84500",
// "84000 to 84500"). Sign and magnitude checks are left to SignalValidator.
// -----------------------------------------------------------------------------
class PriceParser {
 public:
  static std::optional<double> parse(const std::string& text);

 private:
  static std::optional<double> parseNumber(const std::string& text);
};

}  // namespace tactical
