// =============================================================================
// pattern_learner_test.cpp
// =============================================================================
// Unit tests for tactical::PatternLearner.
//
// Validates:
//   - Similarity is 1.0 for identical fingerprints and drops by the slot
//     weight on a categorical mismatch
//   - Learning stays inactive below min_patterns_for_learning
//   - Adjustment formula and its clamp
//   - Aggregate statistics (profit factor, expectancy, per-regime groups)
//   - addOutcome() leaves the input state untouched
// =============================================================================

#include "tactical/domain/tactical_config.hpp"
#include "tactical/learning/pattern_learner.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using tactical::PatternLearner;
namespace dom = tactical::domain;

class PatternLearnerTest : public ::testing::Test {
 protected:
  dom::TacticalConfig config;

  static dom::PatternFingerprint baseFingerprint() {
    dom::PatternFingerprint fp;
    fp.regime = dom::Regime::Normal;
    fp.trend_type = dom::TrendType::StrongTrend;
    fp.trend_direction = dom::TrendDirection::Up;
    fp.signal_type = dom::SignalType::TrendContinuation;
    fp.cvd_trend = dom::CvdTrend::Bullish;
    fp.cvd_divergence = dom::CvdDivergence::None;
    fp.trend_strength = 0.6;
    fp.volatility_percentile = 0.5;
    fp.rsi = 0.55;
    fp.technical_edge = 0.5;
    fp.order_flow_edge = 0.3;
    fp.consensus_agreement = 0.8;
    fp.entry_confidence = 0.7;
    return fp;
  }

  // Differs from baseFingerprint() in five categorical slots worth 15 of
  // the 27 weight points, well under the 0.7 threshold.
  static dom::PatternFingerprint dissimilarFingerprint() {
    auto fp = baseFingerprint();
    fp.regime = dom::Regime::HighVol;
    fp.trend_type = dom::TrendType::Ranging;
    fp.signal_type = dom::SignalType::Reversal;
    fp.cvd_divergence = dom::CvdDivergence::Bearish;
    fp.trend_exhaustion = true;
    return fp;
  }

  static dom::TradeOutcome makeOutcome(const dom::PatternFingerprint& fp,
                                       double r, int n) {
    dom::TradeOutcome o;
    o.signal_id = "tactical-" + std::to_string(n) + "-0";
    o.symbol = "BTCUSDT";
    o.fingerprint = fp;
    o.realized_r = r;
    o.exit_reason = r > 0 ? dom::CloseReason::TakeProfit
                          : dom::CloseReason::StopLoss;
    return o;
  }

  static dom::PatternLearningState buildState(int winners, double win_r,
                                              int losers, double loss_r,
                                              bool winners_match) {
    std::vector<dom::TradeOutcome> outcomes;
    int n = 0;
    const auto matching = baseFingerprint();
    const auto other = dissimilarFingerprint();
    for (int i = 0; i < winners; ++i) {
      outcomes.push_back(
          makeOutcome(winners_match ? matching : other, win_r, n++));
    }
    for (int i = 0; i < losers; ++i) {
      outcomes.push_back(
          makeOutcome(winners_match ? other : matching, loss_r, n++));
    }
    return PatternLearner::rebuild(std::move(outcomes));
  }
};

TEST_F(PatternLearnerTest, IdenticalFingerprintsHaveSimilarityOne) {
  const auto fp = baseFingerprint();
  EXPECT_DOUBLE_EQ(PatternLearner::similarity(fp, fp), 1.0);
}

TEST_F(PatternLearnerTest, RegimeMismatchCostsItsWeight) {
  const auto a = baseFingerprint();
  auto b = a;
  b.regime = dom::Regime::Expansion;
  EXPECT_NEAR(PatternLearner::similarity(a, b), 24.0 / 27.0, 1e-12);
}

TEST_F(PatternLearnerTest, SimilarityIsSymmetric) {
  const auto a = baseFingerprint();
  auto b = dissimilarFingerprint();
  b.rsi = 0.3;
  EXPECT_DOUBLE_EQ(PatternLearner::similarity(a, b),
                   PatternLearner::similarity(b, a));
  EXPECT_LT(PatternLearner::similarity(a, b), config.similarity_threshold);
}

TEST_F(PatternLearnerTest, InactiveBelowMinimumOutcomes) {
  const auto state = buildState(19, 1.5, 0, -1.0, true);
  const auto analysis =
      PatternLearner::analyze(baseFingerprint(), state, config);

  EXPECT_FALSE(analysis.learning_active);
  EXPECT_TRUE(analysis.matches.empty());
  EXPECT_DOUBLE_EQ(analysis.confidence_adjustment, 0.0);
}

// -----------------------------------------------------------------------------
// 20 matching winners at +1.5R, 5 unrelated losers.
//   baseline  = 20 / 25 = 0.8
//   matched   = top 10 winners, win rate 1.0, avg R 1.5
//   adj       = (1.0 - 0.8) x 20 + 1.5 x 5 = 11.5
// -----------------------------------------------------------------------------
TEST_F(PatternLearnerTest, AdjustmentFromMatchedWinners) {
  const auto state = buildState(20, 1.5, 5, -1.0, true);
  const auto analysis =
      PatternLearner::analyze(baseFingerprint(), state, config);

  ASSERT_TRUE(analysis.learning_active);
  EXPECT_EQ(analysis.matches.size(), 10u);
  EXPECT_NEAR(analysis.baseline_win_rate, 0.8, 1e-12);
  EXPECT_NEAR(analysis.matched_win_rate, 1.0, 1e-12);
  EXPECT_NEAR(analysis.matched_avg_r, 1.5, 1e-12);
  EXPECT_NEAR(analysis.confidence_adjustment, 11.5, 1e-9);
}

TEST_F(PatternLearnerTest, MatchesKeepInsertionOrderOnTies) {
  const auto state = buildState(20, 1.5, 5, -1.0, true);
  const auto matches =
      PatternLearner::findMatches(baseFingerprint(), state, config);

  ASSERT_EQ(matches.size(), 10u);
  for (std::size_t i = 0; i < matches.size(); ++i) {
    EXPECT_EQ(matches[i].outcome_index, i);
  }
}

// Matched losers at -5R: (0 - 0.2) x 20 + (-5) x 5 = -29, clamped to -20.
TEST_F(PatternLearnerTest, PenaltyIsClamped) {
  const auto state = buildState(5, 1.0, 20, -5.0, false);
  const auto analysis =
      PatternLearner::analyze(baseFingerprint(), state, config);

  ASSERT_TRUE(analysis.learning_active);
  EXPECT_DOUBLE_EQ(analysis.confidence_adjustment,
                   -config.max_confidence_penalty);
}

TEST_F(PatternLearnerTest, DisabledLearningFindsNothing) {
  config.pattern_learning_enabled = false;
  const auto state = buildState(20, 1.5, 5, -1.0, true);
  EXPECT_TRUE(
      PatternLearner::findMatches(baseFingerprint(), state, config).empty());
}

TEST_F(PatternLearnerTest, ComputeStats) {
  const auto fp = baseFingerprint();
  const auto a = makeOutcome(fp, 2.0, 0);
  const auto b = makeOutcome(fp, 2.0, 1);
  const auto c = makeOutcome(fp, -1.0, 2);

  const auto s = PatternLearner::computeStats({&a, &b, &c});
  EXPECT_EQ(s.total, 3);
  EXPECT_EQ(s.wins, 2);
  EXPECT_EQ(s.losses, 1);
  EXPECT_NEAR(s.win_rate, 2.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(s.avg_win_r, 2.0);
  EXPECT_DOUBLE_EQ(s.avg_loss_r, 1.0);
  EXPECT_DOUBLE_EQ(s.profit_factor, 4.0);
  EXPECT_DOUBLE_EQ(s.expectancy, 1.0);
}

TEST_F(PatternLearnerTest, ProfitFactorCappedWithoutLosses) {
  const auto a = makeOutcome(baseFingerprint(), 1.2, 0);
  const auto s = PatternLearner::computeStats({&a});
  EXPECT_DOUBLE_EQ(s.profit_factor, PatternLearner::kMaxProfitFactor);
}

TEST_F(PatternLearnerTest, AddOutcomeReturnsNewState) {
  const auto before = buildState(3, 1.0, 1, -1.0, true);
  const auto after = PatternLearner::addOutcome(
      before, makeOutcome(dissimilarFingerprint(), -1.0, 99));

  EXPECT_EQ(before.outcomes.size(), 4u);
  EXPECT_EQ(before.overall.total, 4);
  EXPECT_EQ(after.outcomes.size(), 5u);
  EXPECT_EQ(after.overall.total, 5);
  EXPECT_EQ(after.outcomes.back().signal_id, "tactical-99-0");

  ASSERT_EQ(after.by_regime.count("NORMAL"), 1u);
  ASSERT_EQ(after.by_regime.count("HIGH_VOL"), 1u);
  EXPECT_EQ(after.by_regime.at("HIGH_VOL").total, 2);
  EXPECT_EQ(after.by_signal_type.at("REVERSAL").losses, 2);
}

TEST_F(PatternLearnerTest, RecentWindowCoversLastTwenty) {
  const auto state = buildState(10, 1.0, 20, -1.0, true);
  EXPECT_EQ(state.overall.total, 30);
  EXPECT_EQ(state.recent.total, 20);
  EXPECT_EQ(state.recent.losses, 20);
}

TEST_F(PatternLearnerTest, BuildFingerprintNormalizes) {
  PatternLearner::FingerprintInput in;
  in.structure.regime = dom::Regime::Trending;
  in.structure.volatility_percentile = 80.0;
  in.technical.edge = 4.0;
  in.adx = 75.0;
  in.rsi = 62.0;
  in.entry_confidence = 70.0;

  const auto fp = PatternLearner::buildFingerprint(in);
  EXPECT_EQ(fp.regime, dom::Regime::Trending);
  EXPECT_DOUBLE_EQ(fp.trend_strength, 1.0);
  EXPECT_DOUBLE_EQ(fp.volatility_percentile, 0.8);
  EXPECT_DOUBLE_EQ(fp.rsi, 0.62);
  EXPECT_DOUBLE_EQ(fp.technical_edge, 0.4);
  EXPECT_DOUBLE_EQ(fp.entry_confidence, 0.7);
  EXPECT_EQ(fp.cvd_divergence, dom::CvdDivergence::None);
}
