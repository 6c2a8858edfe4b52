#include "tactical/scoring/technical_scorer.hpp"

#include <cmath>

namespace tactical {

namespace {

constexpr double kTrendWeight = 1.0;
constexpr double kAlignmentWeight = 1.5;
constexpr double kRsiStepWeight = 0.5;
constexpr double kCrossoverWeight = 2.5;
constexpr double kMacdStepWeight = 0.5;

}  // namespace

bool TechnicalScorer::hasCrossover(const domain::IndicatorBundle& ind) {
  const bool was_above = ind.prev_ema_fast > ind.prev_ema_slow;
  const bool is_above = ind.ema_fast > ind.ema_slow;
  const bool was_below = ind.prev_ema_fast < ind.prev_ema_slow;
  const bool is_below = ind.ema_fast < ind.ema_slow;
  return (!was_above && is_above) || (!was_below && is_below);
}

domain::TechnicalScore TechnicalScorer::score(
    const domain::IndicatorBundle& ind, double price, double tie_tolerance) {
  domain::TechnicalScore out;
  auto& c = out.components;

  // Signed helper: positive goes to bull, negative to bear.
  auto add = [&out](double& component, double signed_points) {
    component += signed_points;
    if (signed_points > 0.0) {
      out.bull_score += signed_points;
    } else {
      out.bear_score -= signed_points;
    }
  };

  // --- Trend vs EMA200 --------------------------------------------------------
  add(c.trend, price > ind.ema_200 ? kTrendWeight : -kTrendWeight);

  // --- Fast/slow alignment ----------------------------------------------------
  if (ind.ema_fast > ind.ema_slow) {
    add(c.alignment, kAlignmentWeight);
  } else if (ind.ema_fast < ind.ema_slow) {
    add(c.alignment, -kAlignmentWeight);
  }

  // --- RSI positioning --------------------------------------------------------
  if (ind.rsi > 55.0) add(c.rsi, kRsiStepWeight);
  if (ind.rsi > 65.0) add(c.rsi, kRsiStepWeight);
  if (ind.rsi < 45.0) add(c.rsi, -kRsiStepWeight);
  if (ind.rsi < 35.0) add(c.rsi, -kRsiStepWeight);

  // --- Fresh crossover --------------------------------------------------------
  if (hasCrossover(ind)) {
    add(c.crossover,
        ind.ema_fast > ind.ema_slow ? kCrossoverWeight : -kCrossoverWeight);
  }

  // --- MACD histogram sign and slope -----------------------------------------
  if (ind.macd_histogram > 0.0) {
    add(c.macd, kMacdStepWeight);
  } else if (ind.macd_histogram < 0.0) {
    add(c.macd, -kMacdStepWeight);
  }
  if (ind.macd_histogram > ind.prev_macd_histogram) {
    add(c.macd, kMacdStepWeight);
  } else if (ind.macd_histogram < ind.prev_macd_histogram) {
    add(c.macd, -kMacdStepWeight);
  }

  out.edge = std::abs(out.bull_score - out.bear_score);
  if (out.edge <= tie_tolerance) {
    out.direction = domain::Bias::Neutral;
  } else {
    out.direction = out.bull_score > out.bear_score ? domain::Bias::Bullish
                                                    : domain::Bias::Bearish;
  }
  return out;
}

}  // namespace tactical
