#include "tactical/network/ipc_server.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/storage/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace tactical {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then hand them to the server thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (thread_.joinable()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  // Unsent telemetry is dropped at shutdown instead of blocking the join.
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Commands on " << cmd_endpoint_
            << ", telemetry on " << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (!thread_.joinable()) {
    return;
  }
  thread_.join();

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] Stopped after " << published_.load()
            << " telemetry line(s).\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  while (running_.load()) {
    publishPending();

    int ready = 0;
    try {
      ready = zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (ready > 0 && (items[0].revents & ZMQ_POLLIN)) {
      answerCommand();
    }
  }

  // Events queued before stop() still go out.
  publishPending();
}

void IpcServer::publishPending() {
  while (auto event = telemetry_queue_.try_pop()) {
    const auto line = formatTelemetry(*event, published_.load() + 1);
    if (!line) {
      continue;
    }
    zmq::message_t msg(line->data(), line->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      published_.fetch_add(1);
    } else {
      std::cerr << "[IpcServer] Telemetry dropped: PUB socket would block\n";
    }
  }
}

void IpcServer::answerCommand() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string cmd = normalizeCommand(request.to_string());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Command '" << cmd << "' failed: " << e.what()
              << "\n";
    response =
        nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  if (!cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none)) {
    std::cerr << "[IpcServer] Reply to '" << cmd << "' was not sent\n";
  }
}

std::string IpcServer::normalizeCommand(const std::string& raw) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(raw.begin(), raw.end(), is_space);
  auto end = std::find_if_not(raw.rbegin(), std::string::const_reverse_iterator(begin),
                              is_space)
                 .base();
  std::string cmd(begin, end);
  const auto verb_end = std::find_if(cmd.begin(), cmd.end(), is_space);
  std::transform(cmd.begin(), verb_end, cmd.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return cmd;
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per streamed event type
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event,
                                                      std::uint64_t seq) {
  nlohmann::json j;
  if (auto* e = std::get_if<SignalEmittedEvent>(&event)) {
    j = {{"type", "SIGNAL"},
         {"signal", e->signal},
         {"timestamp_ms", e->timestamp_ms}};
  } else if (auto* e = std::get_if<SignalRejectedEvent>(&event)) {
    j = {{"type", "SIGNAL_REJECTED"},
         {"symbol", e->symbol},
         {"rejection", e->rejection},
         {"timestamp_ms", e->timestamp_ms}};
  } else if (auto* e = std::get_if<SignalUpdatedEvent>(&event)) {
    j = {{"type", "SIGNAL_UPDATE"},
         {"signal_id", e->signal.id},
         {"status", domain::toString(e->signal.status)},
         {"decayed_confidence", e->signal.decayed_confidence},
         {"timestamp_ms", e->timestamp_ms}};
  } else if (auto* e = std::get_if<PositionOpenedEvent>(&event)) {
    j = {{"type", "POSITION_OPENED"},
         {"position", e->position},
         {"timestamp_ms", e->timestamp_ms}};
  } else if (auto* e = std::get_if<PositionClosedEvent>(&event)) {
    j = {{"type", "POSITION_CLOSED"},
         {"position_id", e->position.id},
         {"reason", domain::toString(e->reason)},
         {"journal", e->journal},
         {"realized_r", e->outcome.realized_r},
         {"timestamp_ms", e->timestamp_ms}};
  } else if (auto* e = std::get_if<CircuitBreakerEvent>(&event)) {
    j = {{"type", "BREAKER"},
         {"state", e->state},
         {"reason", e->reason},
         {"timestamp_ms", e->timestamp_ms}};
  } else {
    return std::nullopt;
  }
  j["seq"] = seq;
  return j.dump();
}

}  // namespace tactical
