#pragma once

#include "tactical/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// EventBus — typed publish/subscribe within one event loop
// -----------------------------------------------------------------------------
//
// @brief  Synchronous dispatch of Event values to registered callbacks.
//
// @details
// publish() copies the subscriber list under the lock and invokes callbacks
// without it, so a callback may subscribe, unsubscribe or publish again
// (nested publish runs depth-first). Callbacks run on the publishing thread;
// inside the engine that is always the owning EventLoopThread.
//
// subscribe<T>() wraps a callback so it only sees events holding
// alternative T.
//
// Failure isolation:
//   A callback that throws std::exception is logged with the "[EventBus]"
//   prefix and skipped; the remaining subscribers still receive the event.
//   A failing SignalTracker must not keep PositionMonitor from seeing the
//   same snapshot. publish() returns how many callbacks failed.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace tactical
