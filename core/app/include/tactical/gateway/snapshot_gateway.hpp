#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// SnapshotGateway — ZeroMQ SUB client decoding JSON market snapshots
// -----------------------------------------------------------------------------
//
// @brief  Receives one JSON-encoded MarketSnapshot per message, decodes it
//         and hands a SnapshotEvent to the sink.
//
// @details
// The core never fetches market data; an external provider (exchange
// adapter, replay script) publishes fully prepared snapshots: candles,
// indicator bundle and optional order flow / macro blocks. Wire format is
// the codec in tactical/storage/json_codec.hpp.
//
// A malformed message (bad JSON, missing symbol or price, unknown enum
// string, non-positive price) is an OperationalFailure: it is logged with
// the "[SnapshotGateway]" prefix and skipped. The next message is processed
// normally.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (SnapshotFeedThread).
//   The SUB socket uses a receive timeout so stop() is honoured within
//   kRecvTimeoutMs. A gateway is single-use: once stopped (even before
//   run() was entered) run() returns immediately.
// -----------------------------------------------------------------------------
class SnapshotGateway {
 public:
  using EventSink = std::function<void(Event)>;

  explicit SnapshotGateway(
      EventSink event_sink,
      const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~SnapshotGateway() = default;

  SnapshotGateway(const SnapshotGateway&) = delete;
  SnapshotGateway& operator=(const SnapshotGateway&) = delete;
  SnapshotGateway(SnapshotGateway&&) = delete;
  SnapshotGateway& operator=(SnapshotGateway&&) = delete;

  void run();

  void stop();

  /// Decodes one payload; std::nullopt (and a log line) on failure.
  static std::optional<domain::MarketSnapshot> decode(
      const std::string& payload);

  std::uint64_t received() const { return sequence_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{true};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace tactical
