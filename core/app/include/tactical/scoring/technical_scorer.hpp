#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/scores.hpp"

namespace tactical {

// -----------------------------------------------------------------------------
// TechnicalScorer — bull/bear checklist over indicator values
// -----------------------------------------------------------------------------
//
// @brief  Scores directional bias from EMA structure, RSI and MACD.
//
// @details
// Checklist (each check adds to exactly one side):
//
//   trend      price above EMA200 -> bull +1.0, else bear +1.0
//   alignment  fast EMA above slow EMA -> bull +1.5, below -> bear +1.5
//   rsi        > 55 -> bull +0.5, > 65 -> bull +0.5 more
//              < 45 -> bear +0.5, < 35 -> bear +0.5 more
//   crossover  fast crossed above slow on the last bar -> bull +2.5
//              fast crossed below slow on the last bar -> bear +2.5
//   macd       histogram > 0 -> bull +0.5, < 0 -> bear +0.5
//              histogram rising -> bull +0.5, falling -> bear +0.5
//
// Maximum per side is 7.0. edge = |bull - bear|. direction is Neutral when
// edge <= tie_tolerance, otherwise the larger side.
//
// Thread model:
//   Stateless static function.
// -----------------------------------------------------------------------------
class TechnicalScorer {
 public:
  static domain::TechnicalScore score(const domain::IndicatorBundle& ind,
                                      double price, double tie_tolerance);

  /// True when the fast EMA crossed the slow EMA between the previous and
  /// the current bar.
  static bool hasCrossover(const domain::IndicatorBundle& ind);
};

}  // namespace tactical
