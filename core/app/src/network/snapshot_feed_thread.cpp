#include "tactical/network/snapshot_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace tactical {

SnapshotFeedThread::SnapshotFeedThread(EventSink event_sink,
                                       std::string endpoint)
    : event_sink_(std::move(event_sink)), endpoint_(std::move(endpoint)) {}

SnapshotFeedThread::~SnapshotFeedThread() { stop(); }

void SnapshotFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<SnapshotGateway>(event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[SnapshotFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[SnapshotFeedThread] recv loop exited after "
              << gateway_->received() << " snapshots.\n";
  });
}

void SnapshotFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace tactical
