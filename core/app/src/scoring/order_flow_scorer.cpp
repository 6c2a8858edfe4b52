#include "tactical/scoring/order_flow_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace tactical {

domain::CvdTrend OrderFlowScorer::cvdTrend(
    const domain::OrderFlowBundle& flow) {
  if (flow.cvd_cumulative > 0.0 && flow.cvd >= 0.0) {
    return domain::CvdTrend::Bullish;
  }
  if (flow.cvd_cumulative < 0.0 && flow.cvd <= 0.0) {
    return domain::CvdTrend::Bearish;
  }
  return domain::CvdTrend::Neutral;
}

std::optional<domain::OrderFlowScore> OrderFlowScorer::score(
    const domain::MarketSnapshot& snap, std::int64_t now_ms,
    std::int64_t stale_after_ms, double tie_tolerance) {
  if (!snap.order_flow) {
    return std::nullopt;
  }
  const domain::OrderFlowBundle& flow = *snap.order_flow;
  if (flow.updated_at_ms > 0 && now_ms - flow.updated_at_ms > stale_after_ms) {
    return std::nullopt;
  }

  domain::OrderFlowScore out;
  auto& c = out.components;

  // --- CVD trend --------------------------------------------------------------
  c.cvd_trend = cvdTrend(flow);
  if (c.cvd_trend == domain::CvdTrend::Bullish) {
    out.bull_score += 1.2;
  } else if (c.cvd_trend == domain::CvdTrend::Bearish) {
    out.bear_score += 1.2;
  }

  // --- CVD divergence against the last three closes ---------------------------
  const auto& candles = snap.candles;
  const std::size_t n = candles.size();
  double prev_price = snap.price;
  if (n >= 3) {
    const double p0 = candles[n - 1].close;
    const double p1 = candles[n - 2].close;
    const double p2 = candles[n - 3].close;
    prev_price = p1;
    const bool price_down = p0 < p1 && p1 < p2;
    const bool price_up = p0 > p1 && p1 > p2;
    if (price_down && flow.cvd > 0.0) {
      c.divergence = domain::CvdDivergence::Bullish;
      out.bull_score += 2.0;
    } else if (price_up && flow.cvd < 0.0) {
      c.divergence = domain::CvdDivergence::Bearish;
      out.bear_score += 2.0;
    }
  }

  // --- Absorption -------------------------------------------------------------
  const double move =
      prev_price > 0.0 ? std::abs(snap.price - prev_price) / prev_price : 0.0;
  const double avg_volume =
      flow.avg_volume_24h > 0.0 ? flow.avg_volume_24h : 1.0;
  if (flow.volume_24h > avg_volume * 1.8 && move < 0.0015) {
    c.absorption = flow.cvd > 0.0 ? domain::AbsorptionSide::Buy
                                  : domain::AbsorptionSide::Sell;
    if (c.absorption == domain::AbsorptionSide::Buy) {
      out.bull_score += 1.5;
    } else {
      out.bear_score += 1.5;
    }
  }

  // --- Liquidation cascade ----------------------------------------------------
  if (flow.liquidation_volume > kCascadeVolume &&
      (flow.long_liquidations > kCascadeCount ||
       flow.short_liquidations > kCascadeCount)) {
    if (flow.long_liquidations > flow.short_liquidations * 2) {
      c.cascade = domain::LiquidationCascade::LongLiquidations;
      out.bear_score += 2.5;
    } else if (flow.short_liquidations > flow.long_liquidations * 2) {
      c.cascade = domain::LiquidationCascade::ShortLiquidations;
      out.bull_score += 2.5;
    }
  }

  // --- Aggressor pressure and large trades ------------------------------------
  const bool buy_dominant = flow.buy_pressure_pct > flow.sell_pressure_pct;
  const bool sell_dominant = flow.sell_pressure_pct > flow.buy_pressure_pct;
  if (flow.buy_pressure_pct >= kExtremePressurePct) {
    c.extreme_pressure = true;
    out.bull_score += 1.0;
  } else if (flow.sell_pressure_pct >= kExtremePressurePct) {
    c.extreme_pressure = true;
    out.bear_score += 1.0;
  }
  if (flow.large_trade_count >= kLargeTradeCount &&
      (buy_dominant || sell_dominant)) {
    c.large_trade_participation = true;
    if (buy_dominant) {
      out.bull_score += 0.5;
    } else {
      out.bear_score += 0.5;
    }
  }

  out.edge = std::abs(out.bull_score - out.bear_score);
  if (out.edge <= tie_tolerance) {
    out.direction = domain::Bias::Neutral;
  } else {
    out.direction = out.bull_score > out.bear_score ? domain::Bias::Bullish
                                                    : domain::Bias::Bearish;
  }
  out.signal_strength =
      std::min(100.0, std::max(out.bull_score, out.bear_score) * 15.0);
  return out;
}

}  // namespace tactical
