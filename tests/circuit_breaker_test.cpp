// =============================================================================
// circuit_breaker_test.cpp
// =============================================================================
// Unit tests for tactical::CircuitBreaker.
//
// Validates:
//   - Trip on cumulative realized loss reaching the daily limit
//   - UTC day rollover clears the trip and the running PnL
//   - Manual reset
//   - Change handler fires on trip and rollover, not on no-op checks
//   - A throwing change handler does not undo or repeat the update
//   - The simulation clock only moves forward
//
// Clock: SimulationTimeProvider starting 2024-01-10 12:00 UTC.
// =============================================================================

#include "tactical/domain/state.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/time/simulation_time_provider.hpp"
#include "tactical/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using tactical::CircuitBreaker;
namespace dom = tactical::domain;

namespace {

constexpr std::int64_t kNoon = 1'704'888'000'000;  // 2024-01-10 12:00 UTC
constexpr std::int64_t kDay = 86'400'000;

}  // namespace

class CircuitBreakerTest : public ::testing::Test {
 protected:
  tactical::SimulationTimeProvider clock{kNoon};

  static dom::CircuitBreakerState limitOf(double limit) {
    dom::CircuitBreakerState s;
    s.daily_loss_limit = limit;
    s.last_reset_date = "2024-01-10";
    return s;
  }
};

TEST_F(CircuitBreakerTest, DateStringIsUtcDay) {
  EXPECT_EQ(tactical::utc_date_string(kNoon), "2024-01-10");
  EXPECT_EQ(tactical::utc_date_string(kNoon + 12 * 3'600'000), "2024-01-11");
}

// -----------------------------------------------------------------------------
// Limit 500, losses -200, -200, -150: running total -550 trips on the third.
// -----------------------------------------------------------------------------
TEST_F(CircuitBreakerTest, TripsWhenCumulativeLossReachesLimit) {
  CircuitBreaker breaker(limitOf(500.0), clock);

  EXPECT_FALSE(breaker.record(-200.0));
  EXPECT_FALSE(breaker.isTripped());
  EXPECT_FALSE(breaker.record(-200.0));
  EXPECT_FALSE(breaker.isTripped());
  EXPECT_TRUE(breaker.record(-150.0));
  EXPECT_TRUE(breaker.isTripped());

  const auto s = breaker.state();
  EXPECT_DOUBLE_EQ(s.daily_pnl, -550.0);
  ASSERT_TRUE(s.tripped_at_ms.has_value());
  EXPECT_EQ(*s.tripped_at_ms, kNoon);

  // Already tripped: a further loss does not report a new trip.
  EXPECT_FALSE(breaker.record(-10.0));
}

TEST_F(CircuitBreakerTest, ExactLimitTrips) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  EXPECT_TRUE(breaker.record(-500.0));
}

TEST_F(CircuitBreakerTest, WinsOffsetLosses) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  breaker.record(-400.0);
  breaker.record(300.0);
  EXPECT_FALSE(breaker.record(-350.0));
  EXPECT_DOUBLE_EQ(breaker.state().daily_pnl, -450.0);
}

TEST_F(CircuitBreakerTest, NewUtcDayResets) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  ASSERT_TRUE(breaker.record(-600.0));

  clock.advance_by(kDay);
  EXPECT_FALSE(breaker.isTripped());
  const auto s = breaker.state();
  EXPECT_DOUBLE_EQ(s.daily_pnl, 0.0);
  EXPECT_EQ(s.last_reset_date, "2024-01-11");
  EXPECT_FALSE(s.tripped_at_ms.has_value());
}

TEST_F(CircuitBreakerTest, ManualResetClearsTrip) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  ASSERT_TRUE(breaker.record(-600.0));

  breaker.reset();
  EXPECT_FALSE(breaker.isTripped());
  EXPECT_DOUBLE_EQ(breaker.state().daily_pnl, 0.0);
}

TEST_F(CircuitBreakerTest, ChangeHandlerSeesTripAndRollover) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  std::vector<std::string> reasons;
  std::vector<bool> tripped;
  breaker.setChangeHandler(
      [&](const dom::CircuitBreakerState& s, const std::string& reason) {
        reasons.push_back(reason);
        tripped.push_back(s.tripped);
      });

  EXPECT_FALSE(breaker.isTripped());  // Same day, nothing changes
  EXPECT_TRUE(reasons.empty());

  breaker.record(-600.0);
  clock.advance_by(kDay);
  breaker.isTripped();

  ASSERT_EQ(reasons.size(), 2u);
  EXPECT_EQ(reasons[0], "realized_pnl");
  EXPECT_TRUE(tripped[0]);
  EXPECT_EQ(reasons[1], "check");
  EXPECT_FALSE(tripped[1]);
}

TEST_F(CircuitBreakerTest, ThrowingHandlerKeepsStateChange) {
  CircuitBreaker breaker(limitOf(500.0), clock);
  int calls = 0;
  breaker.setChangeHandler(
      [&](const dom::CircuitBreakerState&, const std::string&) {
        ++calls;
        throw std::runtime_error("state file unwritable");
      });

  EXPECT_NO_THROW(breaker.record(-30.0));
  EXPECT_EQ(calls, 1);
  EXPECT_DOUBLE_EQ(breaker.state().daily_pnl, -30.0);

  EXPECT_TRUE(breaker.record(-470.0));
  EXPECT_TRUE(breaker.isTripped());
  EXPECT_DOUBLE_EQ(breaker.state().daily_pnl, -500.0);
}

TEST(CircuitBreakerPureTest, CheckRollsStaleDate) {
  dom::CircuitBreakerState s;
  s.daily_loss_limit = 100.0;
  s.daily_pnl = -150.0;
  s.tripped = true;
  s.last_reset_date = "2024-01-09";

  const auto next = CircuitBreaker::check(s, "2024-01-10", kNoon);
  EXPECT_FALSE(next.tripped);
  EXPECT_DOUBLE_EQ(next.daily_pnl, 0.0);
  EXPECT_EQ(next.last_reset_date, "2024-01-10");
  // Input untouched.
  EXPECT_TRUE(s.tripped);
}

TEST(CircuitBreakerPureTest, ZeroLimitNeverTrips) {
  dom::CircuitBreakerState s;
  s.daily_loss_limit = 0.0;
  s.last_reset_date = "2024-01-10";
  const auto next =
      CircuitBreaker::recordRealizedPnl(s, -1e9, "2024-01-10", kNoon);
  EXPECT_FALSE(next.tripped);
}

// A rewound replay clock would undo the day roll above.
TEST(SimulationClockTest, NeverRunsBackwards) {
  tactical::SimulationTimeProvider clock{kNoon};
  EXPECT_EQ(clock.advance_time(kNoon + kDay), kNoon + kDay);
  EXPECT_EQ(clock.advance_time(kNoon), kNoon + kDay);
  clock.advance_by(-kDay);
  EXPECT_EQ(clock.now_ms(), kNoon + kDay);
  EXPECT_EQ(tactical::utc_date_string(clock.now_ms()), "2024-01-11");
}
