#pragma once

#include "tactical/events/event.hpp"
#include "tactical/gateway/snapshot_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tactical {

// -----------------------------------------------------------------------------
// SnapshotFeedThread — owns the SnapshotGateway and its recv thread
// -----------------------------------------------------------------------------
//
// @details
// start() creates the gateway (and with it the ZMQ context and socket) and
// spawns the thread that runs its blocking recv loop. stop() signals the
// gateway, joins, and destroys it. Both are idempotent; the destructor
// calls stop().
//
// The sink is called on the feed thread. TacticalEngine's sink pushes the
// SnapshotEvent into both event loop queues.
// -----------------------------------------------------------------------------
class SnapshotFeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  SnapshotFeedThread(EventSink event_sink,
                     std::string endpoint = "tcp://127.0.0.1:5555");

  ~SnapshotFeedThread();

  SnapshotFeedThread(const SnapshotFeedThread&) = delete;
  SnapshotFeedThread& operator=(const SnapshotFeedThread&) = delete;
  SnapshotFeedThread(SnapshotFeedThread&&) = delete;
  SnapshotFeedThread& operator=(SnapshotFeedThread&&) = delete;

  void start();

  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<SnapshotGateway> gateway_;
  std::thread thread_;
};

}  // namespace tactical
