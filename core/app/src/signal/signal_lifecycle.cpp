#include "tactical/signal/signal_lifecycle.hpp"

#include <algorithm>

namespace tactical {

bool SignalLifecycle::isTerminal(domain::SignalStatus status) {
  switch (status) {
    case domain::SignalStatus::Completed:
    case domain::SignalStatus::Stopped:
    case domain::SignalStatus::Closed:
    case domain::SignalStatus::Invalidated:
    case domain::SignalStatus::Expired:
      return true;
    default:
      return false;
  }
}

double SignalLifecycle::decayedConfidence(
    const domain::EnhancedTradeSignal& signal, double price,
    std::int64_t now_ms, const domain::TacticalConfig& config) {
  const double minutes =
      std::max<std::int64_t>(0, now_ms - signal.created_at_ms) / 60000.0;
  double drift_pct = 0.0;
  if (signal.entry_price > 0.0) {
    const double move = (price - signal.entry_price) / signal.entry_price * 100.0;
    const double adverse =
        signal.direction == domain::Direction::Long ? -move : move;
    drift_pct = std::max(0.0, adverse);
  }
  const double decayed = signal.confidence -
                         minutes * config.signal_decay_per_minute -
                         drift_pct * config.signal_decay_per_pct_drift;
  return std::max(0.0, decayed);
}

bool SignalLifecycle::advance(domain::EnhancedTradeSignal& signal,
                              double price, std::int64_t now_ms,
                              const domain::TacticalConfig& config) {
  if (signal.status != domain::SignalStatus::Active) {
    return false;
  }

  const double stop =
      signal.current_stop > 0.0 ? signal.current_stop : signal.stop_loss;
  const bool stop_crossed = signal.direction == domain::Direction::Long
                                ? price <= stop
                                : price >= stop;
  if (stop_crossed) {
    signal.status = domain::SignalStatus::Invalidated;
    return true;
  }

  const std::int64_t age_ms = now_ms - signal.created_at_ms;
  if (age_ms > static_cast<std::int64_t>(config.signal_max_age_seconds) * 1000) {
    signal.status = domain::SignalStatus::Expired;
    return true;
  }

  signal.decayed_confidence = decayedConfidence(signal, price, now_ms, config);
  return false;
}

void SignalLifecycle::markFilled(domain::EnhancedTradeSignal& signal) {
  if (signal.status == domain::SignalStatus::Active) {
    signal.status = domain::SignalStatus::Filled;
  }
}

void SignalLifecycle::followPosition(domain::EnhancedTradeSignal& signal,
                                     const domain::Position& position) {
  signal.targets = position.targets;
  signal.current_stop = position.stop_loss;
  signal.remaining_fraction = position.remaining_fraction;
  signal.realized_pnl = position.realized_pnl;
  signal.unrealized_pnl = position.unrealized_pnl;
  if (position.break_even_moved) {
    signal.break_even_price = position.entry_price;
    signal.trailing_stop = true;
  }
}

void SignalLifecycle::onPositionClosed(domain::EnhancedTradeSignal& signal,
                                       const domain::Position& position,
                                       domain::CloseReason reason) {
  if (isTerminal(signal.status)) {
    return;
  }
  followPosition(signal, position);
  signal.unrealized_pnl = 0.0;

  if (!position.targets.empty() &&
      std::none_of(position.targets.begin(), position.targets.end(),
                   [](const auto& t) {
                     return t.status == domain::TargetStatus::Cancelled ||
                            t.status == domain::TargetStatus::Pending;
                   })) {
    signal.status = domain::SignalStatus::Completed;
  } else if (reason == domain::CloseReason::StopLoss) {
    signal.status = domain::SignalStatus::Stopped;
  } else if (reason == domain::CloseReason::TakeProfit) {
    signal.status = domain::SignalStatus::Completed;
  } else {
    signal.status = domain::SignalStatus::Closed;
  }
}

}  // namespace tactical
