#include "tactical/domain/pattern.hpp"

#include <algorithm>

namespace tactical {
namespace domain {

namespace {

double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

double flag(bool b) { return b ? 1.0 : 0.0; }

}  // namespace

// -----------------------------------------------------------------------------
// toVector(): fixed slot layout documented in pattern.hpp
// -----------------------------------------------------------------------------
std::array<double, PatternFingerprint::kWidth> PatternFingerprint::toVector()
    const {
  return {
      static_cast<double>(regime),
      static_cast<double>(trend_type),
      static_cast<double>(trend_direction),
      static_cast<double>(signal_type),
      static_cast<double>(cvd_trend),
      static_cast<double>(cvd_divergence),
      flag(near_support),
      flag(near_resistance),
      flag(trend_exhaustion),
      clamp01(trend_strength),
      clamp01(volatility_percentile),
      clamp01(rsi),
      clamp01(technical_edge),
      clamp01(order_flow_edge),
      clamp01(consensus_agreement),
      clamp01(entry_confidence),
  };
}

}  // namespace domain
}  // namespace tactical
