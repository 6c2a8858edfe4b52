// =============================================================================
// position_monitor_test.cpp
// =============================================================================
// Unit tests for tactical::PositionMonitor and tactical::PositionMath.
//
// Validates:
//   - PnL on the remaining fraction, partial target releases, break-even
//   - Close priority: liquidation before stop before targets
//   - A position closes exactly once even when evaluated again
//   - Journal, trade outcome, balance and circuit breaker on close
//   - Trigger-level fills for the backtest option
//   - A closed trade's outcome survives learning and persistence and is
//     found again as an exact match for its own fingerprint
//   - A failed close leaves the other positions unaffected and is retried
//     on the next update without double-counting its PnL
//
// Position used throughout: LONG 10 @ 100, stop 98 (1R = $20),
// ladder 102 / 104 / 106 / 110 at 25 / 35 / 25 / 15 %.
// =============================================================================

#include "tactical/concurrent/id_generator.hpp"
#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/learning/pattern_learner.hpp"
#include "tactical/monitor/position_math.hpp"
#include "tactical/monitor/position_monitor.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/signal/target_ladder.hpp"
#include "tactical/storage/i_key_value_store.hpp"
#include "tactical/storage/state_store.hpp"
#include "tactical/time/i_time_provider.hpp"
#include "tactical/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using tactical::PatternLearner;
using tactical::PositionMath;
using tactical::PositionMonitor;
namespace dom = tactical::domain;

namespace {

constexpr std::int64_t kNow = 1'704'888'000'000;

// Fails the next `failures` reads, then reports a fixed time.
class FlakyClock : public tactical::ITimeProvider {
 public:
  mutable int failures{0};

  std::int64_t now_ms() const override {
    if (failures > 0) {
      --failures;
      throw std::runtime_error("clock unavailable");
    }
    return kNow;
  }
};

}  // namespace

class PositionMonitorTest : public ::testing::Test {
 protected:
  dom::TacticalConfig config;
  tactical::EventBus bus;
  tactical::SimulationTimeProvider clock{kNow};
  tactical::IdGenerator ids;
  std::unique_ptr<tactical::CircuitBreaker> breaker;
  std::unique_ptr<PositionMonitor> monitor;
  int closed_events{0};

  void SetUp() override {
    dom::CircuitBreakerState state;
    state.daily_loss_limit = config.daily_loss_limit;
    state.last_reset_date = "2024-01-10";
    breaker = std::make_unique<tactical::CircuitBreaker>(state, clock);
    monitor = std::make_unique<PositionMonitor>(bus, *breaker, config, ids);
    bus.subscribe<tactical::PositionClosedEvent>(
        [this](const tactical::PositionClosedEvent&) { ++closed_events; });
  }

  dom::Position makeLong(const std::string& id, double leverage = 1.0) const {
    dom::Position p;
    p.id = id;
    p.signal_id = "tactical-1-0";
    p.symbol = "BTCUSDT";
    p.direction = dom::Direction::Long;
    p.entry_price = 100.0;
    p.size = 10.0;
    p.leverage = leverage;
    p.stop_loss = 98.0;
    p.liquidation_price = PositionMath::liquidationPrice(
        dom::Direction::Long, 100.0, leverage, config.liquidation_buffer);
    p.targets = tactical::TargetLadder::build(dom::Direction::Long, 100.0,
                                              98.0, dom::MarketStructure{},
                                              config);
    p.break_even_tier = config.break_even_tier;
    p.opened_at_ms = kNow;
    return p;
  }
};

TEST_F(PositionMonitorTest, OpenRejectsDuplicateId) {
  EXPECT_TRUE(monitor->open(makeLong("pos-1")));
  EXPECT_FALSE(monitor->open(makeLong("pos-1")));
  EXPECT_EQ(monitor->openCount(), 1u);
}

TEST_F(PositionMonitorTest, MarksUnrealizedPnl) {
  monitor->open(makeLong("pos-1"));
  EXPECT_TRUE(monitor->updatePrice("BTCUSDT", 101.0, kNow + 1000).empty());

  const auto p = monitor->position("pos-1");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->unrealized_pnl, 10.0);
  EXPECT_DOUBLE_EQ(p->unrealized_pnl_pct, 1.0);
  EXPECT_NEAR(p->max_favorable_pct, 1.0, 1e-12);
}

TEST_F(PositionMonitorTest, OtherSymbolIsIgnored) {
  monitor->open(makeLong("pos-1"));
  monitor->updatePrice("ETHUSDT", 50.0, kNow);
  EXPECT_EQ(monitor->openCount(), 1u);
  EXPECT_DOUBLE_EQ(monitor->position("pos-1")->unrealized_pnl, 0.0);
}

TEST_F(PositionMonitorTest, InvalidPriceIsIgnored) {
  monitor->open(makeLong("pos-1"));
  EXPECT_TRUE(monitor->updatePrice("BTCUSDT", -1.0, kNow).empty());
  EXPECT_EQ(monitor->openCount(), 1u);
}

// First tier at 102 releases 25% for +$5 and moves the stop to entry.
TEST_F(PositionMonitorTest, FirstTargetReleasesAndMovesStopToBreakEven) {
  monitor->open(makeLong("pos-1"));
  EXPECT_TRUE(monitor->updatePrice("BTCUSDT", 102.5, kNow + 1000).empty());

  const auto p = monitor->position("pos-1");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->realized_pnl, 5.0);
  EXPECT_DOUBLE_EQ(p->remaining_fraction, 0.75);
  EXPECT_DOUBLE_EQ(p->unrealized_pnl, 18.75);
  EXPECT_TRUE(p->break_even_moved);
  EXPECT_DOUBLE_EQ(p->stop_loss, 100.0);
  EXPECT_DOUBLE_EQ(p->initial_stop, 98.0);
  EXPECT_EQ(p->targets[0].status, dom::TargetStatus::Hit);
}

TEST_F(PositionMonitorTest, StopLossClosesWithJournalAndOutcome) {
  monitor->open(makeLong("pos-1"));
  const auto closed = monitor->updatePrice("BTCUSDT", 97.0, kNow + 5000);

  ASSERT_EQ(closed.size(), 1u);
  const auto& e = closed[0];
  EXPECT_EQ(e.reason, dom::CloseReason::StopLoss);
  EXPECT_EQ(e.position.state, dom::PositionState::Closed);
  EXPECT_DOUBLE_EQ(e.journal.pnl, -30.0);
  EXPECT_EQ(e.journal.result, dom::TradeResult::Loss);
  EXPECT_DOUBLE_EQ(e.outcome.realized_r, -1.5);
  EXPECT_EQ(e.outcome.duration_ms, 5000);
  EXPECT_EQ(e.outcome.exit_reason, dom::CloseReason::StopLoss);
  EXPECT_FALSE(e.outcome.isWin());
  for (const auto& t : e.position.targets) {
    EXPECT_EQ(t.status, dom::TargetStatus::Cancelled);
  }

  EXPECT_EQ(monitor->openCount(), 0u);
  EXPECT_DOUBLE_EQ(monitor->balance(), config.initial_balance - 30.0);
  EXPECT_EQ(monitor->journal().size(), 1u);
  EXPECT_DOUBLE_EQ(breaker->state().daily_pnl, -30.0);
  EXPECT_EQ(closed_events, 1);
}

// -----------------------------------------------------------------------------
// Close -> PatternLearner -> StateStore -> reload -> findMatches.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, ClosedOutcomeIsMatchedAfterPersistence) {
  auto pos = makeLong("pos-1");
  pos.fingerprint.regime = dom::Regime::Trending;
  pos.fingerprint.trend_type = dom::TrendType::StrongTrend;
  pos.fingerprint.trend_direction = dom::TrendDirection::Up;
  pos.fingerprint.cvd_trend = dom::CvdTrend::Bullish;
  pos.fingerprint.near_support = true;
  pos.fingerprint.trend_strength = 0.62;
  pos.fingerprint.volatility_percentile = 0.41;
  pos.fingerprint.rsi = 0.57;
  pos.fingerprint.technical_edge = 0.5;
  pos.fingerprint.order_flow_edge = 0.3;
  pos.fingerprint.consensus_agreement = 0.8;
  pos.fingerprint.entry_confidence = 0.74;
  const auto fingerprint = pos.fingerprint;
  ASSERT_TRUE(monitor->open(pos));

  const auto closed = monitor->updatePrice("BTCUSDT", 97.0, kNow + 5000);
  ASSERT_EQ(closed.size(), 1u);
  const auto& outcome = closed[0].outcome;

  // Older history that the new fingerprint does not resemble.
  dom::TradeOutcome other;
  other.signal_id = "tactical-0-0";
  other.symbol = "BTCUSDT";
  other.fingerprint.regime = dom::Regime::HighVol;
  other.fingerprint.trend_type = dom::TrendType::Ranging;
  other.fingerprint.signal_type = dom::SignalType::Reversal;
  other.fingerprint.cvd_divergence = dom::CvdDivergence::Bearish;
  other.fingerprint.trend_exhaustion = true;
  other.realized_r = 2.0;
  auto learning = PatternLearner::rebuild({other, other});
  learning = PatternLearner::addOutcome(learning, outcome);
  ASSERT_EQ(learning.outcomes.size(), 3u);

  tactical::InMemoryStore kv;
  {
    tactical::StateStore store(kv);
    ASSERT_TRUE(store.savePatternLearning(learning));
  }
  tactical::StateStore store(kv);
  const auto loaded = store.loadPatternLearning();
  ASSERT_EQ(loaded.outcomes.size(), 3u);
  EXPECT_EQ(loaded.overall.losses, 1);

  dom::TacticalConfig learn = config;
  learn.min_patterns_for_learning = 1;
  const auto matches = PatternLearner::findMatches(fingerprint, loaded, learn);

  ASSERT_FALSE(matches.empty());
  EXPECT_EQ(matches[0].outcome_index, 2u);
  EXPECT_DOUBLE_EQ(matches[0].similarity, 1.0);
  EXPECT_FALSE(matches[0].win);
  EXPECT_DOUBLE_EQ(matches[0].realized_r, -1.5);

  const auto& reloaded = loaded.outcomes[matches[0].outcome_index];
  EXPECT_EQ(reloaded.signal_id, "tactical-1-0");
  EXPECT_EQ(reloaded.exit_reason, dom::CloseReason::StopLoss);
  EXPECT_EQ(reloaded.duration_ms, 5000);
  EXPECT_DOUBLE_EQ(reloaded.exit_price, outcome.exit_price);
}

// -----------------------------------------------------------------------------
// Two evaluations in a row at a closing price must emit one close event.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, DoubleEvaluationClosesOnce) {
  monitor->open(makeLong("pos-1"));
  EXPECT_EQ(monitor->updatePrice("BTCUSDT", 97.0, kNow).size(), 1u);
  EXPECT_TRUE(monitor->tick(kNow + 1000).empty());
  EXPECT_TRUE(monitor->updatePrice("BTCUSDT", 96.0, kNow + 2000).empty());
  EXPECT_FALSE(
      monitor->closePosition("pos-1", 96.0, dom::CloseReason::Manual, kNow)
          .has_value());
  EXPECT_EQ(closed_events, 1);
}

// 10x leverage: liquidation at 91. A print at 90 crosses both the stop and
// liquidation and must report Liquidated.
TEST_F(PositionMonitorTest, LiquidationTakesPriorityOverStop) {
  monitor->open(makeLong("pos-1", 10.0));
  const auto closed = monitor->updatePrice("BTCUSDT", 90.0, kNow);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, dom::CloseReason::Liquidated);
}

TEST_F(PositionMonitorTest, GapThroughLadderTakesProfit) {
  monitor->open(makeLong("pos-1"));
  const auto closed = monitor->updatePrice("BTCUSDT", 111.0, kNow);

  ASSERT_EQ(closed.size(), 1u);
  const auto& e = closed[0];
  EXPECT_EQ(e.reason, dom::CloseReason::TakeProfit);
  // 25% at 102, the remaining 75% at 111.
  EXPECT_NEAR(e.journal.pnl, 87.5, 1e-9);
  EXPECT_NEAR(e.journal.exit_price, 108.75, 1e-9);
  ASSERT_EQ(e.outcome.targets_hit.size(), 1u);
  EXPECT_EQ(e.outcome.targets_hit[0], 1);
  EXPECT_NEAR(e.outcome.realized_r, 87.5 / 20.0, 1e-9);
}

TEST_F(PositionMonitorTest, BreakEvenStopAfterFirstTarget) {
  monitor->open(makeLong("pos-1"));
  monitor->updatePrice("BTCUSDT", 102.5, kNow);
  const auto closed = monitor->updatePrice("BTCUSDT", 99.5, kNow + 1000);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, dom::CloseReason::StopLoss);
  // +5 from the first tier, -3.75 on the 75% closed at 99.5.
  EXPECT_NEAR(closed[0].journal.pnl, 1.25, 1e-9);
  EXPECT_EQ(closed[0].journal.result, dom::TradeResult::Win);
}

TEST_F(PositionMonitorTest, CloseAllUsesLastObservedPrice) {
  monitor->open(makeLong("pos-1"));
  dom::Position other = makeLong("pos-2");
  other.symbol = "ETHUSDT";
  monitor->open(other);
  monitor->updatePrice("BTCUSDT", 101.0, kNow);

  const auto closed = monitor->closeAll(dom::CloseReason::EndOfData, kNow);
  ASSERT_EQ(closed.size(), 2u);
  EXPECT_EQ(monitor->openCount(), 0u);
  // pos-1 at 101 (+10), pos-2 never priced so flat at entry.
  EXPECT_DOUBLE_EQ(closed[0].journal.pnl, 10.0);
  EXPECT_DOUBLE_EQ(closed[1].journal.pnl, 0.0);
  EXPECT_EQ(closed[1].journal.result, dom::TradeResult::BreakEven);
}

TEST_F(PositionMonitorTest, LargeLossTripsBreaker) {
  auto big = makeLong("pos-1");
  big.size = 2000.0;  // 1R = $4000
  monitor->open(big);
  monitor->updatePrice("BTCUSDT", 97.0, kNow);
  EXPECT_TRUE(breaker->isTripped());
}

TEST_F(PositionMonitorTest, TriggerLevelFillWhenCrossedIntraBar) {
  PositionMonitor backtest(bus, *breaker, config, ids,
                           PositionMonitor::Options{true});
  backtest.open(makeLong("pos-1"));
  backtest.updatePrice("BTCUSDT", 99.0, kNow);
  const auto closed = backtest.updatePrice("BTCUSDT", 97.0, kNow + 1000);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_DOUBLE_EQ(closed[0].journal.exit_price, 98.0);
  EXPECT_DOUBLE_EQ(closed[0].outcome.realized_r, -1.0);
}

TEST_F(PositionMonitorTest, GapThroughStopFillsAtObservedPrice) {
  PositionMonitor backtest(bus, *breaker, config, ids,
                           PositionMonitor::Options{true});
  backtest.open(makeLong("pos-1"));
  const auto closed = backtest.updatePrice("BTCUSDT", 97.0, kNow);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_DOUBLE_EQ(closed[0].journal.exit_price, 97.0);
}

// -----------------------------------------------------------------------------
// Failure isolation. The breaker reads its clock first thing in record(), so
// a failing clock aborts one close before any of its effects are applied.
// -----------------------------------------------------------------------------
class PositionMonitorFailureTest : public PositionMonitorTest {
 protected:
  FlakyClock flaky;

  void SetUp() override {
    PositionMonitorTest::SetUp();
    monitor.reset();
    dom::CircuitBreakerState state;
    state.daily_loss_limit = config.daily_loss_limit;
    state.last_reset_date = "2024-01-10";
    breaker = std::make_unique<tactical::CircuitBreaker>(state, flaky);
    monitor = std::make_unique<PositionMonitor>(bus, *breaker, config, ids);
  }
};

TEST_F(PositionMonitorFailureTest, FailedCloseDoesNotBlockOthersAndRetries) {
  monitor->open(makeLong("pos-1"));
  monitor->open(makeLong("pos-2"));

  // pos-1 is closed first (ids are ordered) and fails.
  flaky.failures = 1;
  const auto first = monitor->updatePrice("BTCUSDT", 97.0, kNow + 1000);

  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].position.id, "pos-2");
  EXPECT_EQ(closed_events, 1);

  const auto stranded = monitor->position("pos-1");
  ASSERT_TRUE(stranded.has_value());
  EXPECT_EQ(stranded->state, dom::PositionState::Open);
  EXPECT_DOUBLE_EQ(breaker->state().daily_pnl, -30.0);
  EXPECT_DOUBLE_EQ(monitor->balance(), config.initial_balance - 30.0);
  EXPECT_EQ(monitor->journal().size(), 1u);

  // The periodic tick retries at the last observed price.
  const auto retried = monitor->tick(kNow + 2000);
  ASSERT_EQ(retried.size(), 1u);
  EXPECT_EQ(retried[0].position.id, "pos-1");
  EXPECT_EQ(retried[0].reason, dom::CloseReason::StopLoss);
  EXPECT_DOUBLE_EQ(retried[0].journal.pnl, -30.0);

  EXPECT_EQ(closed_events, 2);
  EXPECT_EQ(monitor->openCount(), 0u);
  EXPECT_FALSE(monitor->position("pos-1").has_value());
  EXPECT_DOUBLE_EQ(breaker->state().daily_pnl, -60.0);
  EXPECT_DOUBLE_EQ(monitor->balance(), config.initial_balance - 60.0);
  EXPECT_EQ(monitor->journal().size(), 2u);
}

TEST_F(PositionMonitorTest, ThrowingBreakerHandlerStillCloses) {
  int handler_calls = 0;
  breaker->setChangeHandler(
      [&](const dom::CircuitBreakerState&, const std::string&) {
        ++handler_calls;
        throw std::runtime_error("persist failed");
      });
  monitor->open(makeLong("pos-1"));

  const auto closed = monitor->updatePrice("BTCUSDT", 97.0, kNow + 1000);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(handler_calls, 1);
  EXPECT_EQ(monitor->openCount(), 0u);
  EXPECT_DOUBLE_EQ(breaker->state().daily_pnl, -30.0);
  EXPECT_DOUBLE_EQ(monitor->balance(), config.initial_balance - 30.0);

  // Nothing left to retry.
  EXPECT_TRUE(monitor->tick(kNow + 2000).empty());
  EXPECT_DOUBLE_EQ(breaker->state().daily_pnl, -30.0);
  EXPECT_EQ(closed_events, 1);
}

// -----------------------------------------------------------------------------
// PositionMath
// -----------------------------------------------------------------------------
TEST(PositionMathTest, PnlSignAndMargin) {
  EXPECT_DOUBLE_EQ(PositionMath::pnl(dom::Direction::Long, 100, 110, 2, 3),
                   60.0);
  EXPECT_DOUBLE_EQ(PositionMath::pnl(dom::Direction::Short, 100, 110, 2, 3),
                   -60.0);
  EXPECT_DOUBLE_EQ(PositionMath::margin(100, 2, 4), 50.0);
  EXPECT_DOUBLE_EQ(PositionMath::pnlPct(60.0, 50.0), 120.0);
  EXPECT_DOUBLE_EQ(PositionMath::pnlPct(60.0, 0.0), 0.0);
}

TEST(PositionMathTest, LiquidationPriceUsesBuffer) {
  EXPECT_NEAR(
      PositionMath::liquidationPrice(dom::Direction::Long, 100, 10, 0.9), 91.0,
      1e-9);
  EXPECT_NEAR(
      PositionMath::liquidationPrice(dom::Direction::Short, 100, 10, 0.9),
      109.0, 1e-9);
}

TEST(PositionMathTest, SizeRisksConfiguredPercent) {
  // $10,000 x 1% = $100 at risk over a $2 stop.
  EXPECT_DOUBLE_EQ(PositionMath::positionSize(10000, 1.0, 100, 98, 1), 50.0);
  EXPECT_DOUBLE_EQ(PositionMath::positionSize(10000, 1.0, 100, 100, 1), 0.0);
}

TEST(PositionMathTest, CheckCloseWithoutLadder) {
  dom::Position p;
  p.direction = dom::Direction::Short;
  p.entry_price = 100.0;
  p.stop_loss = 102.0;
  p.take_profit = 95.0;
  p.liquidation_price = 105.0;

  EXPECT_FALSE(PositionMath::checkClose(p, 99.0).has_value());
  EXPECT_EQ(PositionMath::checkClose(p, 94.0).value_or(dom::CloseReason::Manual),
            dom::CloseReason::TakeProfit);
  EXPECT_EQ(PositionMath::checkClose(p, 103.0).value_or(dom::CloseReason::Manual),
            dom::CloseReason::StopLoss);
  EXPECT_EQ(PositionMath::checkClose(p, 106.0).value_or(dom::CloseReason::Manual),
            dom::CloseReason::Liquidated);
}
