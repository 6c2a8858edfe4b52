#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/market_structure.hpp"

#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// StructureAnalyzer — swing structure, S/R levels and tradability
// -----------------------------------------------------------------------------
//
// @brief  Derives a MarketStructure from the snapshot's candle window and
//         indicator bundle.
//
// @details
// Pipeline (all on the candle window, oldest first):
//
//   1. Swing pivots over the last kSwingLookback bars. A pivot high is a
//      bar whose high exceeds the two bars on each side; pivot lows mirror.
//      Consecutive pivots are compared to count HH/LH and HL/LL.
//   2. Trend: HH>=2 && HL>=2 -> Up, LH>=2 && LL>=2 -> Down. A directional
//      trend is StrongTrend when ADX >= 25, WeakTrend otherwise. Without a
//      trend the market is Ranging, or Breakout when the last close leaves
//      the prior 20-bar range while ranges expand.
//   3. Exhaustion: mean range of the last 5 bars < 0.55 x the 5 before.
//   4. Volatility percentile of the current ATR within atr_history.
//   5. Regime: RegimeClassifier result refined by the structure
//      (LowVol + exhaustion -> Contraction, expanding ranges with a high
//      percentile -> Expansion, extreme percentiles override Normal).
//   6. Support/resistance levels from swing pivots (last 100 bars) and
//      round numbers, clustered within 0.2% of price.
//   7. Structure score and tradability score.
//
// Thread model:
//   Stateless. analyze() is a static pure function.
// -----------------------------------------------------------------------------
class StructureAnalyzer {
 public:
  static constexpr int kSwingLookback = 25;
  static constexpr int kLevelLookback = 100;
  static constexpr int kRangeWindow = 20;
  static constexpr double kNearLevelFraction = 0.08;
  static constexpr double kExhaustionRatio = 0.55;
  static constexpr double kExpansionRatio = 1.5;
  static constexpr double kClusterPct = 0.002;
  static constexpr int kMaxLevelStrength = 5;

  /// @param use_structure_levels  When false, no S/R levels are detected.
  static domain::MarketStructure analyze(const domain::MarketSnapshot& snap,
                                         bool use_structure_levels = true);

  /// Rank of `current` within `history` as a 0-100 percentile.
  /// Returns 50 for an empty history.
  static double volatilityPercentile(const std::vector<double>& history,
                                     double current);

  /// Swing-pivot and round-number levels around `price`, clustered.
  static std::vector<domain::StructureLevel> detectLevels(
      const std::vector<domain::Candle>& candles, double price);
};

}  // namespace tactical
