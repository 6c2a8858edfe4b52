// =============================================================================
// scoring_test.cpp
// =============================================================================
// Unit tests for tactical::TechnicalScorer and tactical::OrderFlowScorer.
// =============================================================================

#include "tactical/scoring/order_flow_scorer.hpp"
#include "tactical/scoring/technical_scorer.hpp"

#include <gtest/gtest.h>

using tactical::OrderFlowScorer;
using tactical::TechnicalScorer;
using tactical::domain::Bias;

namespace {

constexpr std::int64_t kNow = 1'700'000'000'000;

tactical::domain::IndicatorBundle bullishBundle() {
  tactical::domain::IndicatorBundle ind;
  ind.ema_200 = 90.0;
  ind.ema_fast = 101.0;
  ind.ema_slow = 100.0;
  ind.prev_ema_fast = 99.0;  // Crossed above on this bar
  ind.prev_ema_slow = 100.0;
  ind.rsi = 70.0;
  ind.macd_histogram = 0.4;
  ind.prev_macd_histogram = 0.1;
  return ind;
}

tactical::domain::MarketSnapshot flowSnapshot() {
  tactical::domain::MarketSnapshot snap;
  snap.symbol = "BTCUSDT";
  snap.price = 100.0;
  snap.order_flow = tactical::domain::OrderFlowBundle{};
  snap.order_flow->updated_at_ms = kNow;
  return snap;
}

}  // namespace

// -----------------------------------------------------------------------------
// TechnicalScorer
// -----------------------------------------------------------------------------

TEST(TechnicalScorerTest, FullBullChecklistScoresSeven) {
  auto s = TechnicalScorer::score(bullishBundle(), 105.0, 0.5);

  EXPECT_DOUBLE_EQ(s.bull_score, 7.0);
  EXPECT_DOUBLE_EQ(s.bear_score, 0.0);
  EXPECT_DOUBLE_EQ(s.edge, 7.0);
  EXPECT_EQ(s.direction, Bias::Bullish);
}

TEST(TechnicalScorerTest, MixedChecklistWithinToleranceIsNeutral) {
  tactical::domain::IndicatorBundle ind;
  ind.ema_200 = 110.0;  // Price below: bear +1.0
  ind.ema_fast = 101.0;  // Above slow: bull +1.5
  ind.ema_slow = 100.0;
  ind.prev_ema_fast = 101.0;
  ind.prev_ema_slow = 100.0;
  ind.rsi = 50.0;
  ind.macd_histogram = 0.0;
  ind.prev_macd_histogram = 0.0;

  auto s = TechnicalScorer::score(ind, 105.0, 0.5);
  EXPECT_DOUBLE_EQ(s.edge, 0.5);
  EXPECT_EQ(s.direction, Bias::Neutral);
}

TEST(TechnicalScorerTest, CrossoverDetectedOnlyOnTheCrossingBar) {
  auto ind = bullishBundle();
  EXPECT_TRUE(TechnicalScorer::hasCrossover(ind));
  ind.prev_ema_fast = 100.5;
  EXPECT_FALSE(TechnicalScorer::hasCrossover(ind));
}

// -----------------------------------------------------------------------------
// OrderFlowScorer
// -----------------------------------------------------------------------------

TEST(OrderFlowScorerTest, AbsentOrStaleFlowYieldsNoScore) {
  tactical::domain::MarketSnapshot snap;
  EXPECT_FALSE(OrderFlowScorer::score(snap, kNow, 60'000, 0.5).has_value());

  auto stale = flowSnapshot();
  stale.order_flow->updated_at_ms = kNow - 120'000;
  EXPECT_FALSE(OrderFlowScorer::score(stale, kNow, 60'000, 0.5).has_value());
}

TEST(OrderFlowScorerTest, LongCascadeIsBearish) {
  auto snap = flowSnapshot();
  auto& flow = *snap.order_flow;
  flow.liquidation_volume = 20'000'000.0;
  flow.long_liquidations = 12;
  flow.short_liquidations = 2;

  auto s = OrderFlowScorer::score(snap, kNow, 60'000, 0.5);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->components.cascade,
            tactical::domain::LiquidationCascade::LongLiquidations);
  EXPECT_DOUBLE_EQ(s->bear_score, 2.5);
  EXPECT_EQ(s->direction, Bias::Bearish);
}

TEST(OrderFlowScorerTest, FallingPriceWithBuyingCvdIsBullishDivergence) {
  auto snap = flowSnapshot();
  for (double close : {103.0, 102.0, 101.0}) {
    tactical::domain::Candle c;
    c.close = close;
    snap.candles.push_back(c);
  }
  snap.order_flow->cvd = 500.0;
  snap.order_flow->cvd_cumulative = 1000.0;

  auto s = OrderFlowScorer::score(snap, kNow, 60'000, 0.5);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->components.divergence, tactical::domain::CvdDivergence::Bullish);
  EXPECT_EQ(s->components.cvd_trend, tactical::domain::CvdTrend::Bullish);
  EXPECT_NEAR(s->bull_score, 3.2, 1e-9);
  EXPECT_NEAR(s->signal_strength, 48.0, 1e-9);
}

TEST(OrderFlowScorerTest, ExtremeBuyPressureWithLargeTrades) {
  auto snap = flowSnapshot();
  snap.order_flow->buy_pressure_pct = 75.0;
  snap.order_flow->sell_pressure_pct = 25.0;
  snap.order_flow->large_trade_count = 6;

  auto s = OrderFlowScorer::score(snap, kNow, 60'000, 0.5);
  ASSERT_TRUE(s.has_value());
  EXPECT_TRUE(s->components.extreme_pressure);
  EXPECT_TRUE(s->components.large_trade_participation);
  EXPECT_DOUBLE_EQ(s->bull_score, 1.5);
}
