#include "tactical/gateway/snapshot_gateway.hpp"
#include "tactical/events/event_types.hpp"
#include "tactical/storage/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tactical {

SnapshotGateway::SnapshotGateway(EventSink event_sink,
                                 const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Bounded recv so run() re-checks the stop flag.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

std::optional<domain::MarketSnapshot> SnapshotGateway::decode(
    const std::string& payload) {
  try {
    auto snapshot = nlohmann::json::parse(payload).get<domain::MarketSnapshot>();
    if (!std::isfinite(snapshot.price) || snapshot.price <= 0.0) {
      std::cerr << "[SnapshotGateway] Rejected snapshot for "
                << snapshot.symbol << ": price " << snapshot.price << "\n";
      return std::nullopt;
    }
    return snapshot;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SnapshotGateway] JSON parse error: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[SnapshotGateway] Decode error: " << e.what() << "\n";
  }
  return std::nullopt;
}

void SnapshotGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // Timeout
    }

    auto snapshot = decode(msg.to_string());
    if (!snapshot) {
      continue;
    }

    SnapshotEvent event;
    event.snapshot = std::move(*snapshot);
    event.sequence_id = ++sequence_;
    event_sink_(std::move(event));
  }
}

void SnapshotGateway::stop() { running_.store(false); }

}  // namespace tactical
