#pragma once

#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event_types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tactical {

class PositionMonitor;

// -----------------------------------------------------------------------------
// SignalTracker — live book of emitted signals
// -----------------------------------------------------------------------------
//
// @brief  Keeps every emitted signal moving through SignalLifecycle and
//         publishes a SignalUpdatedEvent whenever one changes status.
//
// @details
// Subscriptions (risk loop bus):
//   SignalEmittedEvent   -> start tracking (status Active)
//   SnapshotEvent        -> advance unfilled signals on that symbol;
//                           filled signals copy their position's ladder/PnL
//   PositionOpenedEvent  -> Active -> Filled
//   PositionClosedEvent  -> Completed / Stopped / Closed
//
// Must be constructed before ExecutionGate so that, for the same
// SignalEmittedEvent, the signal is tracked before the gate opens its
// position and publishes PositionOpenedEvent.
//
// Signals that reach a terminal status move to a bounded history of the
// most recent kHistoryLimit entries.
//
// Thread model:
//   Callbacks run on the risk loop. active() and recent() take a mutex and
//   may be called from the IPC thread.
// -----------------------------------------------------------------------------
class SignalTracker {
 public:
  static constexpr std::size_t kHistoryLimit = 50;

  SignalTracker(EventBus& bus, const PositionMonitor& monitor,
                const domain::TacticalConfig& config);
  ~SignalTracker();

  SignalTracker(const SignalTracker&) = delete;
  SignalTracker& operator=(const SignalTracker&) = delete;
  SignalTracker(SignalTracker&&) = delete;
  SignalTracker& operator=(SignalTracker&&) = delete;

  std::vector<domain::EnhancedTradeSignal> active() const;
  std::vector<domain::EnhancedTradeSignal> recent() const;

 private:
  void onEmitted(const SignalEmittedEvent& event);
  void onSnapshot(const SnapshotEvent& event);
  void onPositionOpened(const PositionOpenedEvent& event);
  void onPositionClosed(const PositionClosedEvent& event);

  // Moves terminal signals to history; caller holds mutex_.
  void retireTerminal();

  EventBus& bus_;
  const PositionMonitor& monitor_;
  const domain::TacticalConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, domain::EnhancedTradeSignal> signals_;
  std::deque<domain::EnhancedTradeSignal> history_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace tactical
