#pragma once

#include "tactical/concurrent/thread_safe_queue.hpp"
#include "tactical/events/event.hpp"
#include "tactical/events/event_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tactical {

// -----------------------------------------------------------------------------
// IpcServer — operator command channel and telemetry stream
// -----------------------------------------------------------------------------
//
// @brief  A REP socket answering text commands with JSON, and a PUB socket
//         streaming engine events as JSON.
//
// @details
// Commands (answered by the CommandHandler supplied by TacticalEngine):
//   PING, STATUS, HALT, RESUME, RESET_BREAKER, ADVISORY <json>
// Requests are normalized before dispatch: surrounding whitespace is
// stripped and the verb upper-cased, so "status\n" from a shell client works.
// Anything after the verb (the ADVISORY payload) keeps its case.
// A handler that throws still gets a {"status":"error"} reply, because a
// REP socket that skips a reply cannot receive again.
//
// Telemetry (one JSON object per message, "type" names the event):
//   SIGNAL            SignalEmittedEvent
//   SIGNAL_REJECTED   SignalRejectedEvent
//   SIGNAL_UPDATE     SignalUpdatedEvent
//   POSITION_OPENED   PositionOpenedEvent
//   POSITION_CLOSED   PositionClosedEvent (with journal entry)
//   BREAKER           CircuitBreakerEvent
// Other event types are dropped. Every published line carries "seq", a
// per-server counter starting at 1, so a subscriber can detect gaps after
// a slow-joiner drop.
//
// Thread model:
//   Sockets are created in start() and used only by the server thread,
//   which polls the REP socket with a kPollTimeoutMs timeout and drains the
//   telemetry queue between polls.
//   pushTelemetry() is safe from any thread (ThreadSafeQueue). The command
//   handler runs on the server thread, so it must only touch thread-safe
//   engine state.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();

  void stop();

  void pushTelemetry(Event event);

  /// JSON telemetry line for `event`, or std::nullopt if it is not streamed.
  static std::optional<std::string> formatTelemetry(const Event& event,
                                                    std::uint64_t seq = 0);

  /// Trimmed command text with the leading verb upper-cased.
  static std::string normalizeCommand(const std::string& raw);

  std::uint64_t published() const { return published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void publishPending();

  void answerCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace tactical
