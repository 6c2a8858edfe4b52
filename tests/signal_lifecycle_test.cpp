// =============================================================================
// signal_lifecycle_test.cpp
// =============================================================================
// Unit tests for tactical::SignalLifecycle.
//
// Validates:
//   - Active signals invalidate on a stop cross and expire past max age
//   - Confidence decay by age and adverse drift, floored at zero
//   - Filled signals mirror their position and settle to the right
//     terminal status on close
//   - The break-even stop move marks the signal as trailing, once and for good
//   - Terminal statuses are never left
// =============================================================================

#include "tactical/domain/position.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/signal/signal_lifecycle.hpp"

#include <gtest/gtest.h>

using tactical::SignalLifecycle;
namespace dom = tactical::domain;

namespace {

constexpr std::int64_t kCreated = 1'700'000'000'000;
constexpr std::int64_t kMinute = 60'000;

}  // namespace

class SignalLifecycleTest : public ::testing::Test {
 protected:
  dom::TacticalConfig config;
  dom::EnhancedTradeSignal signal;

  void SetUp() override {
    signal.id = "tactical-1-0";
    signal.symbol = "BTCUSDT";
    signal.direction = dom::Direction::Long;
    signal.status = dom::SignalStatus::Active;
    signal.entry_price = 100.0;
    signal.stop_loss = 98.0;
    signal.current_stop = 98.0;
    signal.confidence = 70.0;
    signal.decayed_confidence = 70.0;
    signal.created_at_ms = kCreated;
    for (double p : {102.0, 104.0}) {
      dom::TargetLevel t;
      t.price = p;
      t.position_pct = 50.0;
      signal.targets.push_back(t);
    }
  }

  dom::Position positionFor(dom::TargetStatus tier_status) const {
    dom::Position p;
    p.id = "pos-1";
    p.signal_id = signal.id;
    p.entry_price = signal.entry_price;
    p.stop_loss = 98.0;
    p.targets = signal.targets;
    for (auto& t : p.targets) {
      t.status = tier_status;
    }
    p.realized_pnl = 12.5;
    p.unrealized_pnl = 3.0;
    p.remaining_fraction = 0.5;
    return p;
  }
};

TEST_F(SignalLifecycleTest, StopCrossInvalidates) {
  EXPECT_TRUE(SignalLifecycle::advance(signal, 97.9, kCreated + kMinute,
                                       config));
  EXPECT_EQ(signal.status, dom::SignalStatus::Invalidated);
  EXPECT_TRUE(SignalLifecycle::isTerminal(signal.status));
}

TEST_F(SignalLifecycleTest, ShortStopCrossInvalidates) {
  signal.direction = dom::Direction::Short;
  signal.stop_loss = 102.0;
  signal.current_stop = 102.0;
  EXPECT_FALSE(SignalLifecycle::advance(signal, 101.0, kCreated, config));
  EXPECT_TRUE(SignalLifecycle::advance(signal, 102.0, kCreated, config));
  EXPECT_EQ(signal.status, dom::SignalStatus::Invalidated);
}

TEST_F(SignalLifecycleTest, ExpiresPastMaxAge) {
  const std::int64_t max_age_ms =
      static_cast<std::int64_t>(config.signal_max_age_seconds) * 1000;
  EXPECT_FALSE(
      SignalLifecycle::advance(signal, 100.0, kCreated + max_age_ms, config));
  EXPECT_TRUE(SignalLifecycle::advance(signal, 100.0,
                                       kCreated + max_age_ms + 1, config));
  EXPECT_EQ(signal.status, dom::SignalStatus::Expired);
}

// 10 minutes at 0.8/min = 8, plus 1% adverse drift at 5/% = 5 -> 70 - 13.
TEST_F(SignalLifecycleTest, ConfidenceDecaysWithAgeAndDrift) {
  EXPECT_FALSE(SignalLifecycle::advance(signal, 99.0, kCreated + 10 * kMinute,
                                        config));
  EXPECT_NEAR(signal.decayed_confidence, 57.0, 1e-9);
  EXPECT_DOUBLE_EQ(signal.confidence, 70.0);
}

TEST_F(SignalLifecycleTest, FavourableDriftDoesNotDecay) {
  EXPECT_NEAR(SignalLifecycle::decayedConfidence(signal, 101.5, kCreated,
                                                 config),
              70.0, 1e-9);
}

TEST_F(SignalLifecycleTest, DecayFloorsAtZero) {
  signal.confidence = 30.0;
  EXPECT_DOUBLE_EQ(SignalLifecycle::decayedConfidence(
                       signal, 98.5, kCreated + 59 * kMinute, config),
                   0.0);
}

TEST_F(SignalLifecycleTest, FilledSignalIsNotAdvanced) {
  SignalLifecycle::markFilled(signal);
  EXPECT_EQ(signal.status, dom::SignalStatus::Filled);
  EXPECT_FALSE(SignalLifecycle::advance(signal, 90.0, kCreated, config));
  EXPECT_EQ(signal.status, dom::SignalStatus::Filled);
}

TEST_F(SignalLifecycleTest, FollowPositionCopiesState) {
  SignalLifecycle::markFilled(signal);
  auto p = positionFor(dom::TargetStatus::Pending);
  p.targets[0].status = dom::TargetStatus::Hit;
  p.stop_loss = 100.0;
  p.break_even_moved = true;

  EXPECT_FALSE(signal.trailing_stop);
  SignalLifecycle::followPosition(signal, p);
  EXPECT_EQ(signal.targets[0].status, dom::TargetStatus::Hit);
  EXPECT_DOUBLE_EQ(signal.current_stop, 100.0);
  EXPECT_DOUBLE_EQ(signal.remaining_fraction, 0.5);
  EXPECT_DOUBLE_EQ(signal.realized_pnl, 12.5);
  ASSERT_TRUE(signal.break_even_price.has_value());
  EXPECT_DOUBLE_EQ(*signal.break_even_price, 100.0);
  EXPECT_TRUE(signal.trailing_stop);
}

TEST_F(SignalLifecycleTest, StopStaysFixedBeforeBreakEven) {
  SignalLifecycle::markFilled(signal);
  auto p = positionFor(dom::TargetStatus::Pending);
  SignalLifecycle::followPosition(signal, p);
  EXPECT_FALSE(signal.trailing_stop);
  EXPECT_FALSE(signal.break_even_price.has_value());

  // Once set, a later snapshot without the move keeps the flag.
  p.break_even_moved = true;
  SignalLifecycle::followPosition(signal, p);
  p.break_even_moved = false;
  SignalLifecycle::followPosition(signal, p);
  EXPECT_TRUE(signal.trailing_stop);
}

TEST_F(SignalLifecycleTest, AllTiersReleasedCompletes) {
  SignalLifecycle::markFilled(signal);
  auto p = positionFor(dom::TargetStatus::Hit);
  p.targets[1].status = dom::TargetStatus::Missed;

  SignalLifecycle::onPositionClosed(signal, p, dom::CloseReason::TakeProfit);
  EXPECT_EQ(signal.status, dom::SignalStatus::Completed);
  EXPECT_DOUBLE_EQ(signal.unrealized_pnl, 0.0);
}

TEST_F(SignalLifecycleTest, StopLossCloseIsStopped) {
  SignalLifecycle::markFilled(signal);
  SignalLifecycle::onPositionClosed(
      signal, positionFor(dom::TargetStatus::Cancelled),
      dom::CloseReason::StopLoss);
  EXPECT_EQ(signal.status, dom::SignalStatus::Stopped);
}

TEST_F(SignalLifecycleTest, OtherClosesAreClosed) {
  for (auto reason : {dom::CloseReason::Liquidated, dom::CloseReason::Manual,
                      dom::CloseReason::EndOfData}) {
    signal = dom::EnhancedTradeSignal{};
    SetUp();
    SignalLifecycle::markFilled(signal);
    SignalLifecycle::onPositionClosed(
        signal, positionFor(dom::TargetStatus::Cancelled), reason);
    EXPECT_EQ(signal.status, dom::SignalStatus::Closed);
  }
}

TEST_F(SignalLifecycleTest, TerminalStatusIsNeverLeft) {
  signal.status = dom::SignalStatus::Expired;
  SignalLifecycle::onPositionClosed(signal,
                                    positionFor(dom::TargetStatus::Hit),
                                    dom::CloseReason::TakeProfit);
  EXPECT_EQ(signal.status, dom::SignalStatus::Expired);
  EXPECT_FALSE(SignalLifecycle::advance(signal, 50.0, kCreated, config));
}
