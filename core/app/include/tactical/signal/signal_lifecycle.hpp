#pragma once

#include "tactical/domain/position.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/domain/types.hpp"

#include <cstdint>

namespace tactical {

// -----------------------------------------------------------------------------
// SignalLifecycle — status transitions for emitted signals
// -----------------------------------------------------------------------------
//
// @brief  Advances signals that were emitted but not executed, and mirrors
//         the position of signals that were.
//
// @details
//   Active (unfilled):
//     stop crossed            -> Invalidated
//     age > max age           -> Expired
//     otherwise decayed_confidence is refreshed:
//       confidence - 0.8 x minutes - 5.0 x adverse drift %, floored at 0
//
//   Filled (a position exists):
//     followPosition() copies the ladder, stop and PnL from the position.
//     Once the position's stop has moved to break-even the signal records
//     the break-even price and flags trailing_stop; the flag never clears.
//     onPositionClosed():
//       every tier released        -> Completed
//       StopLoss                   -> Stopped
//       Liquidated/Manual/EndOfData -> Closed
//
// Terminal statuses are never left.
// -----------------------------------------------------------------------------
class SignalLifecycle {
 public:
  static bool isTerminal(domain::SignalStatus status);

  static double decayedConfidence(const domain::EnhancedTradeSignal& signal,
                                  double price, std::int64_t now_ms,
                                  const domain::TacticalConfig& config);

  /// Returns true when the status changed.
  static bool advance(domain::EnhancedTradeSignal& signal, double price,
                      std::int64_t now_ms,
                      const domain::TacticalConfig& config);

  static void markFilled(domain::EnhancedTradeSignal& signal);

  static void followPosition(domain::EnhancedTradeSignal& signal,
                             const domain::Position& position);

  static void onPositionClosed(domain::EnhancedTradeSignal& signal,
                               const domain::Position& position,
                               domain::CloseReason reason);
};

}  // namespace tactical
