#pragma once

#include "tactical/domain/types.hpp"

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// TechnicalScore — directional bias from price/indicator structure
// -----------------------------------------------------------------------------
//
// @details
// Component fields are signed contributions: positive values were added to
// the bull score, negative values to the bear score. They exist so the
// reasoning trail can show which checks fired.
// -----------------------------------------------------------------------------
struct TechnicalComponents {
  double trend{0.0};      // Price vs EMA200
  double alignment{0.0};  // Fast vs slow EMA
  double rsi{0.0};
  double crossover{0.0};  // Fresh fast/slow crossover on the last bar
  double macd{0.0};       // Histogram sign and slope
};

struct TechnicalScore {
  double bull_score{0.0};
  double bear_score{0.0};
  Bias direction{Bias::Neutral};
  double edge{0.0};  // |bull - bear|
  TechnicalComponents components;
};

// -----------------------------------------------------------------------------
// OrderFlowScore — directional bias from order-flow statistics
// -----------------------------------------------------------------------------
struct OrderFlowComponents {
  CvdTrend cvd_trend{CvdTrend::Neutral};
  CvdDivergence divergence{CvdDivergence::None};
  AbsorptionSide absorption{AbsorptionSide::None};
  LiquidationCascade cascade{LiquidationCascade::None};
  bool extreme_pressure{false};
  bool large_trade_participation{false};
};

struct OrderFlowScore {
  double bull_score{0.0};
  double bear_score{0.0};
  Bias direction{Bias::Neutral};
  double edge{0.0};
  double signal_strength{0.0};  // 0-100
  OrderFlowComponents components;
};

}  // namespace domain
}  // namespace tactical
