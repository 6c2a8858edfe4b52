#pragma once

#include "tactical/domain/pattern.hpp"
#include "tactical/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

enum class TargetStatus {
  Pending,
  Hit,        // Crossed in sequence; released at the tier price
  Missed,     // Crossed out of sequence; released at the observed price
  Cancelled,  // Position closed (stop/liquidation) before the tier was reached
};

// -----------------------------------------------------------------------------
// TargetLevel — one take-profit tier
// -----------------------------------------------------------------------------
// position_pct is the share of the ORIGINAL position released at this tier.
// fill_price and filled_at_ms are set when the tier leaves Pending through a
// price crossing (Hit or Missed).
// -----------------------------------------------------------------------------
struct TargetLevel {
  double price{0.0};
  double r_multiple{0.0};
  double position_pct{0.0};
  TargetStatus status{TargetStatus::Pending};
  double fill_price{0.0};
  std::int64_t filled_at_ms{0};
};

enum class SignalStatus {
  Scanning,
  Active,
  Filled,
  Completed,
  Stopped,
  Closed,
  Invalidated,
  Expired,
};

enum class SignalSource {
  Tactical,  // Rule-based pipeline: trusted path
  Ai,        // External advisory input
  Hybrid,
};

enum class ApprovalStatus {
  Active,
  PendingReview,
};

// -----------------------------------------------------------------------------
// TradeSignal — base trade idea
// -----------------------------------------------------------------------------
//
// @brief  A directional trade idea with entry, invalidation and an ordered
//         target ladder.
//
// @details
// Invariants (enforced by SignalValidator for every emitted signal):
//   LONG:  stop_loss < entry_price < targets[0].price < targets[1].price ...
//   SHORT: stop_loss > entry_price > targets[0].price > targets[1].price ...
//   sum(targets[i].position_pct) == 100
//
// risk_reward is always recomputed by SignalValidator from absolute price
// distances; any value supplied upstream is overwritten.
// -----------------------------------------------------------------------------
struct TradeSignal {
  std::string id;
  std::string symbol;
  Direction direction{Direction::Long};

  double entry_price{0.0};
  double entry_zone_low{0.0};
  double entry_zone_high{0.0};
  double stop_loss{0.0};
  std::vector<TargetLevel> targets;

  double risk_reward{0.0};
  double confidence{0.0};  // 0-100
  Regime regime{Regime::Normal};
  std::vector<std::string> reasoning;

  SignalStatus status{SignalStatus::Scanning};
  SignalSource source{SignalSource::Tactical};
  ApprovalStatus approval_status{ApprovalStatus::PendingReview};

  std::int64_t created_at_ms{0};
  double atr_at_entry{0.0};
};

// -----------------------------------------------------------------------------
// EnhancedTradeSignal — signal plus live management state
// -----------------------------------------------------------------------------
//
// Adds the fields needed to manage the trade after emission: sizing, the
// moving stop, remaining position fraction and PnL, and the fingerprint
// that will be stored with the eventual TradeOutcome.
// -----------------------------------------------------------------------------
struct EnhancedTradeSignal : TradeSignal {
  double suggested_position_size{0.0};
  std::optional<double> break_even_price;
  bool trailing_stop{false};  // Stop has left its initial level
  double current_stop{0.0};
  double remaining_fraction{1.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double decayed_confidence{0.0};
  PatternFingerprint fingerprint;
};

}  // namespace domain
}  // namespace tactical
