#pragma once

#include "tactical/concurrent/id_generator.hpp"
#include "tactical/domain/position.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event_types.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/time/i_time_provider.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace tactical {

class PositionMonitor;

struct ExecutionResult {
  ExecutionStatus status{ExecutionStatus::Rejected};
  std::string reason;
  std::optional<domain::Position> position;

  bool accepted() const { return status == ExecutionStatus::Accepted; }
};

// -----------------------------------------------------------------------------
// ExecutionGate
// -----------------------------------------------------------------------------
//
// @brief  Turns an approved signal into a monitored Position after the
//         pre-trade checks pass.
//
// @details
// Pre-trade checks (in order, first failure wins):
//
//   1. Circuit breaker tripped  -> CircuitBreakerTripped. Checked before
//      anything else so the caller always sees the specific reason.
//   2. Operator halt (HALT command) -> Rejected.
//   3. approval_status == PendingReview -> Rejected. Advisory and weak
//      consensus signals need a human before they can trade.
//   4. Signal not Active (already filled, invalidated or expired).
//   5. Live price missing, or already beyond the stop.
//   6. Position size <= 0.
//
// Sizing:
//   size = balance x risk% / (|entry - stop| x leverage)
//   liquidation = entry x (1 -/+ buffer / leverage)
//
// With config.auto_execute set, the gate subscribes to SignalEmittedEvent
// and paper-executes every approved signal at its slipped entry price.
// Every request, accepted or not, publishes an ExecutionResultEvent.
//
// Thread model:
//   requestExecution() and the subscription run on the risk loop thread.
//   haltTrading()/resumeTrading()/isHalted() are safe from any thread
//   (atomic), so the IPC server can flip them directly.
//
// Ownership:
//   Holds references to the bus, monitor, breaker, id generator and clock.
//   Unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class ExecutionGate {
 public:
  ExecutionGate(EventBus& bus, PositionMonitor& monitor,
                CircuitBreaker& breaker, IdGenerator& ids,
                const ITimeProvider& clock,
                const domain::TacticalConfig& config);
  ~ExecutionGate();

  ExecutionGate(const ExecutionGate&) = delete;
  ExecutionGate& operator=(const ExecutionGate&) = delete;
  ExecutionGate(ExecutionGate&&) = delete;
  ExecutionGate& operator=(ExecutionGate&&) = delete;

  ExecutionResult requestExecution(const domain::EnhancedTradeSignal& signal,
                                   double live_price);

  void haltTrading();
  void resumeTrading();
  bool isHalted() const;

 private:
  void onSignal(const SignalEmittedEvent& event);

  ExecutionResult reject(const domain::EnhancedTradeSignal& signal,
                         ExecutionStatus status, std::string reason);

  EventBus& bus_;
  PositionMonitor& monitor_;
  CircuitBreaker& breaker_;
  IdGenerator& ids_;
  const ITimeProvider& clock_;
  const domain::TacticalConfig config_;
  std::atomic<bool> halt_trading_{false};
  std::optional<EventBus::SubscriptionId> signal_sub_id_;
};

}  // namespace tactical
