#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace tactical {

// -----------------------------------------------------------------------------
// PeriodicTimer — fixed-interval callback on a dedicated thread
// -----------------------------------------------------------------------------
//
// @brief  Drives the position monitor: every interval it invokes the
//         callback, which pushes a MonitorTickEvent onto the risk loop.
//
// @details
// The callback should only enqueue work. Ticks that would overlap are not
// queued up; the next tick fires one interval after the previous callback
// returned. stop() interrupts the wait immediately.
//
// Thread model:
//   start()/stop() are idempotent; the destructor calls stop().
// -----------------------------------------------------------------------------
class PeriodicTimer {
 public:
  using Callback = std::function<void(std::uint64_t tick)>;

  PeriodicTimer(std::chrono::milliseconds interval, Callback callback);
  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

  void start();
  void stop();

  std::uint64_t ticks() const { return ticks_.load(); }

 private:
  void run();

  const std::chrono::milliseconds interval_;
  Callback callback_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace tactical
