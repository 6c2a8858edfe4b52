// =============================================================================
// execution_gate_test.cpp
// =============================================================================
// Unit tests for tactical::ExecutionGate.
//
// Validates:
//   - Pre-trade check order: breaker first, then halt, review, status, price
//   - Risk-based sizing and liquidation price on the opened position
//   - Every request publishes an ExecutionResultEvent
//   - auto_execute paper-fills SignalEmittedEvent at the signal's entry
// =============================================================================

#include "tactical/concurrent/id_generator.hpp"
#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event_types.hpp"
#include "tactical/monitor/position_monitor.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/risk/execution_gate.hpp"
#include "tactical/signal/target_ladder.hpp"
#include "tactical/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using tactical::ExecutionGate;
using tactical::ExecutionStatus;
namespace dom = tactical::domain;

namespace {

constexpr std::int64_t kNow = 1'704'888'000'000;

}  // namespace

class ExecutionGateTest : public ::testing::Test {
 protected:
  dom::TacticalConfig config;
  tactical::EventBus bus;
  tactical::SimulationTimeProvider clock{kNow};
  tactical::IdGenerator ids;
  std::unique_ptr<tactical::CircuitBreaker> breaker;
  std::unique_ptr<tactical::PositionMonitor> monitor;
  std::unique_ptr<ExecutionGate> gate;

  std::vector<tactical::ExecutionResultEvent> reports;
  int opened_events{0};

  void SetUp() override {
    config.auto_execute = false;
    build();
  }

  void build() {
    gate.reset();
    monitor.reset();
    dom::CircuitBreakerState state;
    state.daily_loss_limit = config.daily_loss_limit;
    state.last_reset_date = "2024-01-10";
    breaker = std::make_unique<tactical::CircuitBreaker>(state, clock);
    monitor =
        std::make_unique<tactical::PositionMonitor>(bus, *breaker, config, ids);
    gate = std::make_unique<ExecutionGate>(bus, *monitor, *breaker, ids, clock,
                                           config);
  }

  void subscribe() {
    bus.subscribe<tactical::ExecutionResultEvent>(
        [this](const tactical::ExecutionResultEvent& e) {
          reports.push_back(e);
        });
    bus.subscribe<tactical::PositionOpenedEvent>(
        [this](const tactical::PositionOpenedEvent&) { ++opened_events; });
  }

  dom::EnhancedTradeSignal makeSignal() const {
    dom::EnhancedTradeSignal s;
    s.id = "tactical-1704888000000-1";
    s.symbol = "BTCUSDT";
    s.direction = dom::Direction::Long;
    s.status = dom::SignalStatus::Active;
    s.source = dom::SignalSource::Tactical;
    s.approval_status = dom::ApprovalStatus::Active;
    s.entry_price = 100.0;
    s.stop_loss = 98.0;
    s.current_stop = 98.0;
    s.targets = tactical::TargetLadder::build(
        dom::Direction::Long, 100.0, 98.0, dom::MarketStructure{}, config);
    s.fingerprint.regime = dom::Regime::Trending;
    return s;
  }
};

// $10,000 x 1% over a $2 stop at 1x -> 50 units.
TEST_F(ExecutionGateTest, AcceptsAndSizesPosition) {
  subscribe();
  const auto result = gate->requestExecution(makeSignal(), 100.0);

  ASSERT_TRUE(result.accepted()) << result.reason;
  ASSERT_TRUE(result.position.has_value());
  const auto& p = *result.position;
  EXPECT_DOUBLE_EQ(p.size, 50.0);
  EXPECT_DOUBLE_EQ(p.entry_price, 100.0);
  EXPECT_DOUBLE_EQ(p.stop_loss, 98.0);
  EXPECT_DOUBLE_EQ(p.initial_stop, 98.0);
  EXPECT_NEAR(p.liquidation_price, 10.0, 1e-9);
  EXPECT_DOUBLE_EQ(p.take_profit, 110.0);
  EXPECT_EQ(p.targets.size(), 4u);
  EXPECT_EQ(p.signal_id, "tactical-1704888000000-1");
  EXPECT_EQ(p.fingerprint.regime, dom::Regime::Trending);
  EXPECT_EQ(p.opened_at_ms, kNow);

  EXPECT_EQ(monitor->openCount(), 1u);
  EXPECT_EQ(opened_events, 1);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].status, ExecutionStatus::Accepted);
}

// The breaker is reported even when the operator halt is also active.
TEST_F(ExecutionGateTest, TrippedBreakerIsCheckedFirst) {
  subscribe();
  breaker->record(-3000.0);
  gate->haltTrading();

  const auto result = gate->requestExecution(makeSignal(), 100.0);
  EXPECT_EQ(result.status, ExecutionStatus::CircuitBreakerTripped);
  EXPECT_FALSE(result.position.has_value());
  EXPECT_EQ(monitor->openCount(), 0u);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].status, ExecutionStatus::CircuitBreakerTripped);
}

TEST_F(ExecutionGateTest, HaltBlocksUntilResumed) {
  gate->haltTrading();
  EXPECT_TRUE(gate->isHalted());
  const auto halted = gate->requestExecution(makeSignal(), 100.0);
  EXPECT_EQ(halted.status, ExecutionStatus::Rejected);
  EXPECT_EQ(halted.reason, "Trading halted by operator");

  gate->resumeTrading();
  EXPECT_FALSE(gate->isHalted());
  EXPECT_TRUE(gate->requestExecution(makeSignal(), 100.0).accepted());
}

TEST_F(ExecutionGateTest, PendingReviewIsRejected) {
  auto s = makeSignal();
  s.approval_status = dom::ApprovalStatus::PendingReview;
  const auto result = gate->requestExecution(s, 100.0);
  EXPECT_EQ(result.status, ExecutionStatus::Rejected);
  EXPECT_EQ(result.reason, "Signal is pending review");
}

TEST_F(ExecutionGateTest, InactiveSignalIsRejected) {
  auto s = makeSignal();
  s.status = dom::SignalStatus::Expired;
  EXPECT_FALSE(gate->requestExecution(s, 100.0).accepted());
}

TEST_F(ExecutionGateTest, PriceChecks) {
  EXPECT_FALSE(gate->requestExecution(makeSignal(), 0.0).accepted());
  EXPECT_FALSE(gate->requestExecution(makeSignal(), 97.5).accepted());
  EXPECT_EQ(monitor->openCount(), 0u);
}

TEST_F(ExecutionGateTest, AutoExecuteFillsAtSignalEntry) {
  config.auto_execute = true;
  build();

  auto s = makeSignal();
  s.entry_price = 100.03;  // Slipped entry
  tactical::SignalEmittedEvent emitted;
  emitted.signal = s;
  emitted.timestamp_ms = kNow;
  bus.publish(emitted);

  const auto positions = monitor->getSnapshots();
  ASSERT_EQ(positions.size(), 1u);
  EXPECT_DOUBLE_EQ(positions[0].entry_price, 100.03);
}

TEST_F(ExecutionGateTest, NoSubscriptionWithoutAutoExecute) {
  tactical::SignalEmittedEvent emitted;
  emitted.signal = makeSignal();
  bus.publish(emitted);
  EXPECT_EQ(monitor->openCount(), 0u);
}
