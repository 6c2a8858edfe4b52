#pragma once

#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/validation/signal_validator.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace tactical {

struct ValidAdvisorySignal {
  domain::EnhancedTradeSignal signal;
};

struct InvalidAdvisorySignal {
  std::string reason;
};

using ParsedAdvisorySignal =
    std::variant<ValidAdvisorySignal, InvalidAdvisorySignal>;

// -----------------------------------------------------------------------------
// parseAdvisorySignal — ingestion boundary for untrusted candidate signals
// -----------------------------------------------------------------------------
//
// @brief  Converts a weakly-typed JSON candidate into a validated
//         EnhancedTradeSignal or an InvalidAdvisorySignal. Never throws.
//
// @details
// Recognised fields (everything else is ignored):
//
//   "id"            string     optional
//   "symbol"        string     default "BTCUSDT"
//   "type"          "LONG" | "SHORT"   ("direction" accepted as alias)
//   "entryZone"     string | number    e.g. "84000-84500" -> 84250
//   "invalidation"  string | number
//   "targets"       array of string | number, nearest first
//   "confidence"    number, clamped to [0, 100], default 50
//   "reasoning"     string
//   "source"        "ai" | "hybrid"   (anything else is treated as ai)
//
// Any supplied risk:reward is ignored. Target allocation comes from the
// configured percentages when the tier count matches, otherwise an even
// split with the remainder on the last tier. The result always passes
// through SignalValidator, and its approval status is PendingReview.
// -----------------------------------------------------------------------------
ParsedAdvisorySignal parseAdvisorySignal(const nlohmann::json& payload,
                                         const ValidationContext& context,
                                         const domain::TacticalConfig& config);

std::vector<double> allocateTargetPcts(std::size_t target_count,
                                       const domain::TacticalConfig& config);

}  // namespace tactical
