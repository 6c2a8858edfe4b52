#include "tactical/concurrent/periodic_timer.hpp"

namespace tactical {

PeriodicTimer::PeriodicTimer(std::chrono::milliseconds interval,
                             Callback callback)
    : interval_(interval), callback_(std::move(callback)) {}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicTimer::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();
  thread_.join();
}

void PeriodicTimer::run() {
  std::unique_lock lock(mutex_);
  while (running_.load()) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
      break;
    }
    lock.unlock();
    callback_(ticks_.fetch_add(1) + 1);
    lock.lock();
  }
}

}  // namespace tactical
