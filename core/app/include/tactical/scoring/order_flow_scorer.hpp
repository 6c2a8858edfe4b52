#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/scores.hpp"

#include <cstdint>
#include <optional>

namespace tactical {

// -----------------------------------------------------------------------------
// OrderFlowScorer — bull/bear checklist over order-flow statistics
// -----------------------------------------------------------------------------
//
// @brief  Scores directional bias from CVD, absorption, liquidations and
//         aggressor pressure. Optional by construction: score() returns
//         std::nullopt when order flow is absent, disabled or stale, and the
//         pipeline then simply runs without an order-flow vote.
//
// @details
// Checklist:
//
//   cvd trend     cumulative CVD > 0 and short-term CVD >= 0 -> bull +1.2
//                 cumulative CVD < 0 and short-term CVD <= 0 -> bear +1.2
//   divergence    two falling closes with short-term CVD > 0 -> bull +2.0
//                 two rising closes with short-term CVD < 0  -> bear +2.0
//   absorption    24h volume > 1.8x average with < 0.15% move on the last
//                 bar -> +1.5 to the side of short-term CVD
//   cascade       liquidation volume > 15M and a side count > 5, with that
//                 side at least 2x the other. Flushed longs -> bear +2.5,
//                 squeezed shorts -> bull +2.5
//   pressure      buy or sell pressure >= 70% -> +1.0 to that side
//   large trades  >= 5 large trades -> +0.5 to the dominant pressure side
//
// signal_strength = min(100, max(bull, bear) * 15).
//
// Thread model:
//   Stateless static functions.
// -----------------------------------------------------------------------------
class OrderFlowScorer {
 public:
  static constexpr double kCascadeVolume = 15'000'000.0;
  static constexpr int kCascadeCount = 5;
  static constexpr double kExtremePressurePct = 70.0;
  static constexpr int kLargeTradeCount = 5;

  /// @param now_ms           Evaluation time for the staleness check.
  /// @param stale_after_ms   Order flow older than this is ignored.
  static std::optional<domain::OrderFlowScore> score(
      const domain::MarketSnapshot& snap, std::int64_t now_ms,
      std::int64_t stale_after_ms, double tie_tolerance);

  static domain::CvdTrend cvdTrend(const domain::OrderFlowBundle& flow);
};

}  // namespace tactical
