#include "tactical/risk/execution_gate.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/monitor/position_math.hpp"
#include "tactical/monitor/position_monitor.hpp"

#include <cmath>
#include <iostream>

namespace tactical {

ExecutionGate::ExecutionGate(EventBus& bus, PositionMonitor& monitor,
                             CircuitBreaker& breaker, IdGenerator& ids,
                             const ITimeProvider& clock,
                             const domain::TacticalConfig& config)
    : bus_(bus),
      monitor_(monitor),
      breaker_(breaker),
      ids_(ids),
      clock_(clock),
      config_(config) {
  if (config_.auto_execute) {
    signal_sub_id_ = bus_.subscribe<SignalEmittedEvent>(
        [this](const SignalEmittedEvent& e) { onSignal(e); });
  }
}

ExecutionGate::~ExecutionGate() {
  if (signal_sub_id_) {
    bus_.unsubscribe(*signal_sub_id_);
  }
}

void ExecutionGate::haltTrading() {
  halt_trading_ = true;
  std::cerr << "[ExecutionGate] HALTED by operator. New executions blocked.\n";
}

void ExecutionGate::resumeTrading() {
  halt_trading_ = false;
  std::cout << "[ExecutionGate] Trading resumed.\n";
}

bool ExecutionGate::isHalted() const { return halt_trading_.load(); }

void ExecutionGate::onSignal(const SignalEmittedEvent& event) {
  requestExecution(event.signal, event.signal.entry_price);
}

// -----------------------------------------------------------------------------
// requestExecution: pre-trade checks, sizing, open
// -----------------------------------------------------------------------------
ExecutionResult ExecutionGate::requestExecution(
    const domain::EnhancedTradeSignal& signal, double live_price) {
  // --- Account kill switch first ------------------------------------------
  if (breaker_.isTripped()) {
    return reject(signal, ExecutionStatus::CircuitBreakerTripped,
                  "Circuit breaker tripped: daily loss limit reached, "
                  "manual reset required");
  }

  if (halt_trading_) {
    return reject(signal, ExecutionStatus::Rejected,
                  "Trading halted by operator");
  }

  if (signal.approval_status == domain::ApprovalStatus::PendingReview) {
    return reject(signal, ExecutionStatus::Rejected,
                  "Signal is pending review");
  }

  if (signal.status != domain::SignalStatus::Active) {
    return reject(signal, ExecutionStatus::Rejected,
                  std::string("Signal is not active (") +
                      domain::toString(signal.status) + ")");
  }

  if (!std::isfinite(live_price) || live_price <= 0.0) {
    return reject(signal, ExecutionStatus::Rejected, "No valid live price");
  }

  const double stop =
      signal.current_stop > 0.0 ? signal.current_stop : signal.stop_loss;
  const bool beyond_stop = signal.direction == domain::Direction::Long
                               ? live_price <= stop
                               : live_price >= stop;
  if (beyond_stop) {
    return reject(signal, ExecutionStatus::Rejected,
                  "Live price already beyond the stop");
  }

  const double leverage = config_.default_leverage;
  const double size =
      PositionMath::positionSize(monitor_.balance(), config_.risk_per_trade_pct,
                                 live_price, stop, leverage);
  if (!(size > 0.0)) {
    return reject(signal, ExecutionStatus::Rejected,
                  "Computed position size is zero");
  }

  // --- All checks passed: build and open the position ----------------------
  const std::int64_t now = clock_.now_ms();

  domain::Position pos;
  pos.id = ids_.next_tag("pos");
  pos.signal_id = signal.id;
  pos.symbol = signal.symbol;
  pos.direction = signal.direction;
  pos.entry_price = live_price;
  pos.size = size;
  pos.leverage = leverage;
  pos.liquidation_price = PositionMath::liquidationPrice(
      signal.direction, live_price, leverage, config_.liquidation_buffer);
  pos.stop_loss = stop;
  pos.initial_stop = stop;
  pos.take_profit = signal.targets.empty() ? 0.0 : signal.targets.back().price;
  pos.targets = signal.targets;
  pos.break_even_tier = config_.break_even_tier;
  pos.opened_at_ms = now;
  pos.fingerprint = signal.fingerprint;

  if (!monitor_.open(pos)) {
    return reject(signal, ExecutionStatus::Rejected,
                  "Position id collision");
  }

  ExecutionResult result;
  result.status = ExecutionStatus::Accepted;
  result.reason = "Opened " + pos.id;
  result.position = pos;

  PositionOpenedEvent opened;
  opened.position = pos;
  opened.timestamp_ms = now;
  bus_.publish(opened);

  ExecutionResultEvent report;
  report.signal_id = signal.id;
  report.status = result.status;
  report.reason = result.reason;
  report.timestamp_ms = now;
  bus_.publish(report);

  return result;
}

ExecutionResult ExecutionGate::reject(const domain::EnhancedTradeSignal& signal,
                                      ExecutionStatus status,
                                      std::string reason) {
  std::cerr << "[ExecutionGate] " << toString(status) << " " << signal.id
            << ": " << reason << "\n";

  ExecutionResultEvent report;
  report.signal_id = signal.id;
  report.status = status;
  report.reason = reason;
  report.timestamp_ms = clock_.now_ms();
  bus_.publish(report);

  ExecutionResult result;
  result.status = status;
  result.reason = std::move(reason);
  return result;
}

}  // namespace tactical
