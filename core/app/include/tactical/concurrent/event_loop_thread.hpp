#pragma once

#include "tactical/concurrent/thread_safe_queue.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace tactical {

// -----------------------------------------------------------------------------
// EventLoopThread — one worker thread draining a queue into an EventBus
// -----------------------------------------------------------------------------
//
// @brief  Serializes all event handling of one engine domain (signal
//         generation, or risk + position monitoring) onto a single thread.
//
// @details
// Other threads call push(); the worker pops and publishes each event on
// its own bus, so every subscriber of that bus runs on the worker thread
// and needs no locking against its siblings.
//
// A subscriber that throws std::exception does not take the loop down:
// EventBus logs it, the loop counts it in failedDispatches() and moves on to
// the next event. This keeps the monitor loop alive through an
// OperationalFailure.
//
// The worker waits on the queue with pop_for(), so an idle loop sleeps and
// notices stop() within kIdleWaitTimeout.
//
// Thread model:
//   start()/stop() are idempotent and callable from any thread. The
//   destructor calls stop().
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }
  const std::string& name() const { return name_; }

  /// Number of subscriber callbacks that threw.
  std::uint64_t failedDispatches() const { return failed_dispatches_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> failed_dispatches_{0};
  std::thread thread_;
};

}  // namespace tactical
