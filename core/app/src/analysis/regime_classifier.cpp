#include "tactical/analysis/regime_classifier.hpp"

namespace tactical {

domain::Regime RegimeClassifier::classify(double atr, double atr_sma,
                                          double atr_stddev, double adx) {
  if (atr_stddev == 0.0) {
    return domain::Regime::Normal;
  }

  if (adx > kTrendingAdx) {
    return domain::Regime::Trending;
  }

  const double norm_atr = (atr - atr_sma) / atr_stddev;
  if (norm_atr < kLowVolNormAtr) {
    return domain::Regime::LowVol;
  }
  if (norm_atr > kHighVolNormAtr) {
    return domain::Regime::HighVol;
  }
  return domain::Regime::Normal;
}

}  // namespace tactical
