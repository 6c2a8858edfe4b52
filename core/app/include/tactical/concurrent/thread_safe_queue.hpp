#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tactical {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — unbounded MPMC FIFO used at every thread boundary
// -----------------------------------------------------------------------------
//
// @brief  The only channel between engine threads: the snapshot feed, the
//         monitor timer and the IPC server push; event loops pop.
//
// @details
// pop() blocks until an item arrives. try_pop() never blocks. pop_for()
// waits at most `timeout` and returns std::nullopt on expiry, which lets a
// consumer interleave shutdown checks with waiting.
//
// Thread model:
//   All members are safe from any thread. The mutex is held only while the
//   deque is touched; notification happens after unlocking.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return takeFront();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    return takeFront();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // Caller holds mutex_ and has checked !queue_.empty().
  T takeFront() {
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace tactical
