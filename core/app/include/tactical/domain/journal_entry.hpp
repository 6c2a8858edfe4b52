#pragma once

#include "tactical/domain/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

enum class TradeResult {
  Win,
  Loss,
  BreakEven,
};

// -----------------------------------------------------------------------------
// JournalEntry — human-facing record of a closed position
// -----------------------------------------------------------------------------
// Emitted once per close alongside the TradeOutcome. exit_price is the
// size-weighted average of all partial releases and the final close.
// -----------------------------------------------------------------------------
struct JournalEntry {
  std::string id;
  std::string position_id;
  std::string symbol;
  Direction direction{Direction::Long};
  double entry_price{0.0};
  double exit_price{0.0};
  double size{0.0};
  double leverage{1.0};
  double pnl{0.0};
  double pnl_pct{0.0};
  std::int64_t entry_time_ms{0};
  std::int64_t exit_time_ms{0};
  CloseReason reason{CloseReason::Manual};
  std::string notes;
  std::vector<std::string> tags;
  TradeResult result{TradeResult::BreakEven};
};

}  // namespace domain
}  // namespace tactical
