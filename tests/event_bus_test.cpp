// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tactical::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription filters by alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish (the snapshot -> signal -> position chain on the
//     risk loop relies on it)
//   - A throwing subscriber does not starve the others
//   - EventLoopThread delivers on its worker and counts failed callbacks
//
// Single-threaded. Cross-thread delivery is covered in
// tactical_engine_test.cpp.
// =============================================================================

#include "tactical/concurrent/event_loop_thread.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event.hpp"
#include "tactical/events/event_types.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

class EventBusTest : public ::testing::Test {
 protected:
  tactical::EventBus bus;

  static tactical::SnapshotEvent makeSnapshot(const std::string& symbol,
                                              double price) {
    tactical::SnapshotEvent e;
    e.snapshot.symbol = symbol;
    e.snapshot.price = price;
    e.snapshot.timestamp_ms = 1'700'000'000'000;
    return e;
  }

  static tactical::SignalEmittedEvent makeSignal(const std::string& id) {
    tactical::SignalEmittedEvent e;
    e.signal.id = id;
    e.signal.symbol = "BTCUSDT";
    return e;
  }
};

TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const tactical::Event&) { ++call_count; });

  bus.publish(makeSnapshot("BTCUSDT", 65000.0));
  bus.publish(makeSignal("tactical-1-0"));
  bus.publish(tactical::HeartbeatEvent{"engine", "ok", 0});

  EXPECT_EQ(call_count, 3);
}

TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int snapshot_count = 0;
  bus.subscribe<tactical::SnapshotEvent>(
      [&snapshot_count](const tactical::SnapshotEvent&) { ++snapshot_count; });

  bus.publish(makeSnapshot("BTCUSDT", 65000.0));
  bus.publish(makeSignal("tactical-1-0"));
  bus.publish(tactical::MonitorTickEvent{0, 1});

  EXPECT_EQ(snapshot_count, 1);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  bus.subscribe<tactical::MonitorTickEvent>(
      [&count_a](const tactical::MonitorTickEvent&) { ++count_a; });
  bus.subscribe<tactical::MonitorTickEvent>(
      [&count_b](const tactical::MonitorTickEvent&) { ++count_b; });

  bus.publish(tactical::MonitorTickEvent{10, 1});

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// Components unsubscribe in their destructors; a late callback would touch
// freed state.
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<tactical::SnapshotEvent>(
      [&call_count](const tactical::SnapshotEvent&) { ++call_count; });

  bus.publish(makeSnapshot("BTCUSDT", 65000.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeSnapshot("BTCUSDT", 65100.0));
  EXPECT_EQ(call_count, 1);
}

TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeSnapshot("BTCUSDT", 65000.0)));
}

// -----------------------------------------------------------------------------
// A subscriber that publishes from inside its callback must not deadlock.
// Scenario: snapshot subscriber publishes a SignalEmittedEvent, which a
// second subscriber receives before the outer publish returns.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::string received_id;

  bus.subscribe<tactical::SignalEmittedEvent>(
      [&received_id](const tactical::SignalEmittedEvent& e) {
        received_id = e.signal.id;
      });
  bus.subscribe<tactical::SnapshotEvent>(
      [this](const tactical::SnapshotEvent&) {
        bus.publish(makeSignal("tactical-42-0"));
      });

  bus.publish(makeSnapshot("BTCUSDT", 65000.0));

  EXPECT_EQ(received_id, "tactical-42-0");
}

TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string received_symbol;
  double received_price = 0.0;

  bus.subscribe<tactical::SnapshotEvent>(
      [&](const tactical::SnapshotEvent& e) {
        received_symbol = e.snapshot.symbol;
        received_price = e.snapshot.price;
      });

  bus.publish(makeSnapshot("ETHUSDT", 3412.25));

  EXPECT_EQ(received_symbol, "ETHUSDT");
  EXPECT_DOUBLE_EQ(received_price, 3412.25);
}

TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int later_calls = 0;
  bus.subscribe<tactical::SnapshotEvent>(
      [](const tactical::SnapshotEvent&) {
        throw std::runtime_error("tracker exploded");
      });
  bus.subscribe<tactical::SnapshotEvent>(
      [&later_calls](const tactical::SnapshotEvent&) { ++later_calls; });

  EXPECT_EQ(bus.publish(makeSnapshot("BTCUSDT", 65000.0)), 1u);
  EXPECT_EQ(later_calls, 1);
  EXPECT_EQ(bus.publish(tactical::MonitorTickEvent{0, 1}), 0u);
}

// -----------------------------------------------------------------------------
// EventLoopThread: pushes from the test thread are published on the worker.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnWorkerAndCountsFailures) {
  tactical::EventLoopThread loop("test");
  std::promise<std::thread::id> delivered;
  auto future = delivered.get_future();

  loop.eventBus().subscribe<tactical::MonitorTickEvent>(
      [](const tactical::MonitorTickEvent& e) {
        if (e.sequence_id == 1) {
          throw std::runtime_error("first tick fails");
        }
      });
  loop.eventBus().subscribe<tactical::MonitorTickEvent>(
      [&delivered](const tactical::MonitorTickEvent& e) {
        if (e.sequence_id == 2) {
          delivered.set_value(std::this_thread::get_id());
        }
      });

  loop.start();
  EXPECT_TRUE(loop.isRunning());
  loop.push(tactical::MonitorTickEvent{100, 1});
  loop.push(tactical::MonitorTickEvent{200, 2});

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(loop.failedDispatches(), 1u);
}
