#pragma once

#include "tactical/events/event_types.hpp"

#include <variant>

namespace tactical {

// -----------------------------------------------------------------------------
// Event — the envelope carried by every queue and EventBus in the engine
// -----------------------------------------------------------------------------
// A closed set of value types. Subscribers pick their alternative with
// EventBus::subscribe<T>(); adding an alternative here makes it routable
// everywhere without touching the bus.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SnapshotEvent,
    SignalEmittedEvent,
    SignalRejectedEvent,
    SignalUpdatedEvent,
    AdvisorySubmittedEvent,
    MonitorTickEvent,
    ExecutionResultEvent,
    PositionOpenedEvent,
    PositionClosedEvent,
    CircuitBreakerEvent,
    HeartbeatEvent>;

}  // namespace tactical
