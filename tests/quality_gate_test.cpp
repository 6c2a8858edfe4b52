// =============================================================================
// quality_gate_test.cpp
// =============================================================================
// Unit tests for tactical::QualityGateEvaluator.
//
// The fixture builds a candidate that passes every gate on a Wednesday at
// 12:00 UTC; each test perturbs one input.
// =============================================================================

#include "tactical/gating/quality_gate.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using tactical::CombinedScore;
using tactical::GateInput;
using tactical::QualityGateEvaluator;
using tactical::domain::Bias;
using tactical::domain::Direction;
using tactical::domain::RejectStage;

class QualityGateTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kWednesdayNoon = 1'704'888'000'000;  // 2024-01-10
  static constexpr std::int64_t kSaturdayNoon = 1'705'147'200'000;   // 2024-01-13

  void SetUp() override {
    input.direction = Direction::Long;
    input.regime = tactical::domain::Regime::Normal;
    input.now_ms = kWednesdayNoon;
    input.price = 100.0;
    input.ema_200 = 98.0;
    input.adx = 30.0;
    input.volume_ratio = 1.0;
    input.technical.bull_score = 5.0;
    input.technical.bear_score = 1.0;
    input.technical.edge = 4.0;
    input.technical.direction = Bias::Bullish;
    input.structure.volatility_percentile = 50.0;
    input.structure.tradability_score = 60.0;
  }

  void addHistory(std::int64_t ago_seconds, Direction dir = Direction::Long) {
    tactical::domain::SignalHistoryEntry e;
    e.signal_id = "s" + std::to_string(history.entries.size());
    e.timestamp_ms = input.now_ms - ago_seconds * 1000;
    e.direction = dir;
    history.entries.push_back(e);
    history.last_signal_ms = std::max(history.last_signal_ms, e.timestamp_ms);
  }

  GateInput input;
  tactical::domain::SignalHistoryState history;
  tactical::domain::TacticalConfig config;
};

TEST_F(QualityGateTest, CleanCandidatePassesWithRegimeThresholds) {
  auto r = QualityGateEvaluator::evaluate(input, history, config);

  EXPECT_TRUE(r.passed());
  EXPECT_DOUBLE_EQ(r.penalty_multiplier, 1.0);
  EXPECT_DOUBLE_EQ(r.effective_min_score, 4.5);
  EXPECT_DOUBLE_EQ(r.effective_min_edge, 2.2);
  EXPECT_TRUE(r.soft_penalties.empty());
}

TEST_F(QualityGateTest, CooldownRejectsRecentSignal) {
  addHistory(100);
  auto r = QualityGateEvaluator::evaluate(input, history, config);

  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.rejection->stage, RejectStage::Cooldown);
}

TEST_F(QualityGateTest, CooldownFollowsRegimeBucket) {
  addHistory(200);
  input.regime = tactical::domain::Regime::HighVol;  // 180 s bucket
  EXPECT_TRUE(QualityGateEvaluator::evaluate(input, history, config).passed());
}

// -----------------------------------------------------------------------------
// Chop: max_signals_in_window (3) same-direction signals already inside the
// window reject the next one. Opposite-direction entries do not count.
// -----------------------------------------------------------------------------
TEST_F(QualityGateTest, ChopRejectsWhenWindowIsFull) {
  addHistory(1500);
  addHistory(1200);
  addHistory(1000);
  auto r = QualityGateEvaluator::evaluate(input, history, config);

  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.rejection->stage, RejectStage::ChopDetected);
  EXPECT_EQ(r.signals_in_window, 3);
}

TEST_F(QualityGateTest, ChopIgnoresOppositeDirection) {
  addHistory(1500);
  addHistory(1200, Direction::Short);
  addHistory(1000);
  auto r = QualityGateEvaluator::evaluate(input, history, config);

  EXPECT_TRUE(r.passed());
  EXPECT_EQ(r.signals_in_window, 2);
}

TEST_F(QualityGateTest, LowAdxRaisesThresholds) {
  input.adx = 12.0;
  auto chop = QualityGateEvaluator::evaluate(input, history, config);
  EXPECT_DOUBLE_EQ(chop.adx_factor, 1.5);
  EXPECT_DOUBLE_EQ(chop.effective_min_score, 4.5 * 1.5);
  EXPECT_DOUBLE_EQ(chop.effective_min_edge, 2.2 * 1.5);

  input.adx = 18.0;
  auto weak = QualityGateEvaluator::evaluate(input, history, config);
  EXPECT_DOUBLE_EQ(weak.adx_factor, 1.2);
}

TEST_F(QualityGateTest, StrongOpposingOrderFlowVetoesWeakTechnicals) {
  tactical::domain::OrderFlowScore of;
  of.direction = Bias::Bearish;
  of.edge = 2.5;
  input.order_flow = of;
  input.technical.edge = 2.0;

  auto r = QualityGateEvaluator::evaluate(input, history, config);
  ASSERT_FALSE(r.passed());
  EXPECT_EQ(r.rejection->stage, RejectStage::OrderFlowVeto);
}

TEST_F(QualityGateTest, StrongTechnicalsTurnVetoIntoPenalty) {
  tactical::domain::OrderFlowScore of;
  of.direction = Bias::Bearish;
  of.edge = 2.5;
  input.order_flow = of;
  input.technical.edge = 3.5;

  auto r = QualityGateEvaluator::evaluate(input, history, config);
  EXPECT_TRUE(r.passed());
  EXPECT_DOUBLE_EQ(r.penalty_multiplier, 0.85);
  EXPECT_EQ(r.soft_penalties.size(), 1u);
}

TEST_F(QualityGateTest, MarketConditionHardGates) {
  input.volume_ratio = 0.5;
  EXPECT_EQ(QualityGateEvaluator::evaluate(input, history, config)
                .rejection->stage,
            RejectStage::LowVolume);

  input.volume_ratio = 1.0;
  input.structure.volatility_percentile = 95.0;
  EXPECT_EQ(QualityGateEvaluator::evaluate(input, history, config)
                .rejection->stage,
            RejectStage::VolatilityExtreme);

  input.structure.volatility_percentile = 50.0;
  input.structure.tradability_score = 20.0;
  EXPECT_EQ(QualityGateEvaluator::evaluate(input, history, config)
                .rejection->stage,
            RejectStage::LowTradability);
}

TEST_F(QualityGateTest, OverextensionAndWeekendAreSoftPenalties) {
  input.price = 115.0;
  input.ema_200 = 100.0;
  input.now_ms = kSaturdayNoon;
  config.disable_weekend_penalty = false;

  auto r = QualityGateEvaluator::evaluate(input, history, config);
  EXPECT_TRUE(r.passed());
  EXPECT_EQ(r.soft_penalties.size(), 2u);
  EXPECT_NEAR(r.penalty_multiplier, 0.88 * 0.88, 1e-12);
}

TEST_F(QualityGateTest, CryptoIgnoresWeekendByDefault) {
  input.now_ms = kSaturdayNoon;
  auto r = QualityGateEvaluator::evaluate(input, history, config);
  EXPECT_DOUBLE_EQ(r.penalty_multiplier, 1.0);
}

// -----------------------------------------------------------------------------
// combine / checkScores
// -----------------------------------------------------------------------------

TEST_F(QualityGateTest, AlignedOrderFlowIsMergedWithWeight) {
  tactical::domain::OrderFlowScore of;
  of.direction = Bias::Bullish;
  of.bull_score = 3.0;
  of.bear_score = 0.0;

  auto merged = QualityGateEvaluator::combine(input.technical, of, config);
  EXPECT_TRUE(merged.order_flow_merged);
  EXPECT_NEAR(merged.bull, 5.9, 1e-12);
  EXPECT_NEAR(merged.edge, 4.9, 1e-12);

  of.direction = Bias::Bearish;
  auto unmerged = QualityGateEvaluator::combine(input.technical, of, config);
  EXPECT_FALSE(unmerged.order_flow_merged);
  EXPECT_DOUBLE_EQ(unmerged.bull, 5.0);
}

TEST_F(QualityGateTest, CheckScoresOrder) {
  auto gate = QualityGateEvaluator::evaluate(input, history, config);

  CombinedScore thin{5.0, 3.5, 1.5, false};
  EXPECT_EQ(QualityGateEvaluator::checkScores(thin, Direction::Long, gate, config)
                ->stage,
            RejectStage::EdgeInsufficient);

  CombinedScore low{4.0, 1.0, 3.0, false};
  EXPECT_EQ(QualityGateEvaluator::checkScores(low, Direction::Long, gate, config)
                ->stage,
            RejectStage::ScoreInsufficient);

  CombinedScore opposed{6.0, 2.5, 3.5, false};
  EXPECT_EQ(
      QualityGateEvaluator::checkScores(opposed, Direction::Long, gate, config)
          ->stage,
      RejectStage::OpposingScore);

  CombinedScore good{6.0, 1.0, 5.0, false};
  EXPECT_FALSE(
      QualityGateEvaluator::checkScores(good, Direction::Long, gate, config)
          .has_value());
}
