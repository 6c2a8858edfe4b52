#pragma once

#include "tactical/domain/types.hpp"

namespace tactical {

// -----------------------------------------------------------------------------
// RegimeClassifier — discrete volatility/trend regime from ATR and ADX
// -----------------------------------------------------------------------------
//
// @brief  Converts ATR statistics and ADX into one of
//         Trending / LowVol / HighVol / Normal.
//
// @details
//   normATR = (atr - atr_sma) / atr_stddev
//
// Decision order (first match wins):
//   1. atr_stddev == 0        -> Normal   (no dispersion, cannot normalize)
//   2. adx > 25               -> Trending
//   3. normATR < -0.5         -> LowVol
//   4. normATR > 1.0          -> HighVol
//   5. otherwise              -> Normal
//
// Both comparisons against the normalized ATR are strict: normATR == 1.0
// is Normal, not HighVol.
//
// Thread model:
//   Stateless. classify() is a static pure function.
// -----------------------------------------------------------------------------
class RegimeClassifier {
 public:
  static constexpr double kTrendingAdx = 25.0;
  static constexpr double kLowVolNormAtr = -0.5;
  static constexpr double kHighVolNormAtr = 1.0;

  static domain::Regime classify(double atr, double atr_sma,
                                 double atr_stddev, double adx);
};

}  // namespace tactical
