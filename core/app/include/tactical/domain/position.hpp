#pragma once

#include "tactical/domain/pattern.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/domain/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// PositionState — per-position close state machine
// -----------------------------------------------------------------------------
//
//   Open ──> Closing ──> Closed
//
// The transition to Closing happens under the monitor lock BEFORE any close
// side effect runs. A tick that finds a position in Closing skips it, which
// is what makes check-then-close idempotent under re-entrant or overlapping
// ticks. The state travels with the position, so it is persisted with it.
// -----------------------------------------------------------------------------
enum class PositionState {
  Open,
  Closing,
  Closed,
};

// -----------------------------------------------------------------------------
// Position — a live (paper or exchange) position under monitoring
// -----------------------------------------------------------------------------
//
// @brief  Created by ExecutionGate when a signal is executed, mutated on
//         every PositionMonitor tick, and converted into a JournalEntry and
//         a TradeOutcome when closed.
//
// @details
// PnL convention:
//   pnl     = (price - entry) * size * leverage   (negated for SHORT)
//   margin  = entry * size / leverage
//   pnl_pct = pnl / margin * 100
//
// remaining_fraction is the share of the original size still open after
// partial target releases; realized_pnl accumulates the released parts.
//
// Ownership:
//   PositionMonitor owns the authoritative copy. Everyone else receives
//   snapshots by value.
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string signal_id;
  std::string symbol;
  Direction direction{Direction::Long};

  double entry_price{0.0};
  double size{0.0};
  double leverage{1.0};
  double liquidation_price{0.0};
  double stop_loss{0.0};
  double initial_stop{0.0};
  double take_profit{0.0};

  double unrealized_pnl{0.0};
  double unrealized_pnl_pct{0.0};
  double realized_pnl{0.0};
  double remaining_fraction{1.0};

  std::vector<TargetLevel> targets;
  int break_even_tier{1};
  bool break_even_moved{false};

  double max_favorable_pct{0.0};
  double max_adverse_pct{0.0};

  std::int64_t opened_at_ms{0};
  PositionState state{PositionState::Open};
  PatternFingerprint fingerprint;
};

}  // namespace domain
}  // namespace tactical
