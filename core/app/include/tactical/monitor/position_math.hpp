#pragma once

#include "tactical/domain/position.hpp"
#include "tactical/domain/types.hpp"

#include <optional>

namespace tactical {

// -----------------------------------------------------------------------------
// PositionMath — pure PnL, margin, liquidation and close-check arithmetic
// -----------------------------------------------------------------------------
//
// @details
//   pnl        = (price - entry) x size x leverage, negated for SHORT
//   margin     = entry x size / leverage
//   pnl_pct    = pnl / margin x 100
//   liquidation = entry x (1 - buffer / leverage) for LONG
//               entry x (1 + buffer / leverage) for SHORT
//   size       = balance x risk% / (|entry - stop| x leverage)
//
// checkClose() evaluates in strict priority order: liquidation, then stop,
// then the single take-profit level (only used when the position carries
// no target ladder). A price that crosses both the stop and the
// liquidation level always reports Liquidated.
// -----------------------------------------------------------------------------
class PositionMath {
 public:
  static double pnl(domain::Direction direction, double entry, double price,
                    double size, double leverage);

  static double margin(double entry, double size, double leverage);

  static double pnlPct(double pnl, double margin);

  static double liquidationPrice(domain::Direction direction, double entry,
                                 double leverage, double buffer);

  static double positionSize(double balance, double risk_pct, double entry,
                             double stop, double leverage);

  /// Signed percentage move in the position's favour.
  static double favorableMovePct(domain::Direction direction, double entry,
                                 double price);

  static bool liquidationCrossed(const domain::Position& position,
                                 double price);
  static bool stopCrossed(const domain::Position& position, double price);

  static std::optional<domain::CloseReason> checkClose(
      const domain::Position& position, double price);
};

}  // namespace tactical
