#pragma once

#include "tactical/domain/journal_entry.hpp"
#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/pattern.hpp"
#include "tactical/domain/position.hpp"
#include "tactical/domain/rejection.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/domain/types.hpp"

#include <cstdint>
#include <string>

namespace tactical {

// Outcome of an execution request. CircuitBreakerTripped is deliberately
// distinct from Rejected: it needs a manual reset, not a retry.
enum class ExecutionStatus {
  Accepted,
  Rejected,
  CircuitBreakerTripped,
};

inline const char* toString(ExecutionStatus s) {
  switch (s) {
    case ExecutionStatus::Accepted:              return "ACCEPTED";
    case ExecutionStatus::Rejected:              return "REJECTED";
    case ExecutionStatus::CircuitBreakerTripped: return "CIRCUIT_BREAKER_TRIPPED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// SnapshotEvent
// -----------------------------------------------------------------------------
// One decoded MarketSnapshot from the feed. Pushed to both loops: the signal
// loop evaluates it, the risk loop uses its price to mark positions.
// -----------------------------------------------------------------------------
struct SnapshotEvent {
  domain::MarketSnapshot snapshot;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SignalEmittedEvent / SignalRejectedEvent
// -----------------------------------------------------------------------------
// Produced by the signal loop after each pipeline pass. Exactly one of the
// two is published per evaluated snapshot.
// -----------------------------------------------------------------------------
struct SignalEmittedEvent {
  domain::EnhancedTradeSignal signal;
  std::int64_t timestamp_ms{0};
};

struct SignalRejectedEvent {
  std::string symbol;
  domain::Rejection rejection;
  std::int64_t timestamp_ms{0};
};

// An externally supplied candidate signal, as raw JSON text. The signal loop
// parses and validates it against the latest snapshot of its symbol.
struct AdvisorySubmittedEvent {
  std::string payload;
  std::int64_t timestamp_ms{0};
};

// A tracked signal changed status (Invalidated, Expired, Filled, Completed).
struct SignalUpdatedEvent {
  domain::EnhancedTradeSignal signal;
  std::int64_t timestamp_ms{0};
};

// Periodic trigger for PositionMonitor::tick() on the risk loop.
struct MonitorTickEvent {
  std::int64_t now_ms{0};
  std::uint64_t sequence_id{0};
};

struct ExecutionResultEvent {
  std::string signal_id;
  ExecutionStatus status{ExecutionStatus::Rejected};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

struct PositionOpenedEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
// Published once per position, after every close side effect has run. The
// outcome is forwarded to the signal loop, which owns the learning state.
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::Position position;
  domain::CloseReason reason{domain::CloseReason::Manual};
  domain::JournalEntry journal;
  domain::TradeOutcome outcome;
  std::int64_t timestamp_ms{0};
};

struct CircuitBreakerEvent {
  domain::CircuitBreakerState state;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  std::int64_t timestamp_ms{0};
};

}  // namespace tactical
