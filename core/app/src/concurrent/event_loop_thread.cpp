#include "tactical/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace tactical {

namespace {

// Upper bound on how long an idle worker takes to notice stop().
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  if (const auto pending = queue_.size(); pending > 0) {
    std::cerr << "[EventLoop:" << name_ << "] stopped with " << pending
              << " undelivered event(s).\n";
  }
}

// -----------------------------------------------------------------------------
// run(): wait for the next event and publish it until stop() clears running_
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    auto event = queue_.pop_for(kIdleWaitTimeout);
    if (!event) {
      continue;
    }
    if (const auto failed = bus_.publish(*event); failed > 0) {
      failed_dispatches_.fetch_add(failed);
    }
  }
}

}  // namespace tactical
