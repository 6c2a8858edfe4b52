#include "tactical/signal/signal_tracker.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/monitor/position_monitor.hpp"
#include "tactical/signal/signal_lifecycle.hpp"

#include <iostream>

namespace tactical {

SignalTracker::SignalTracker(EventBus& bus, const PositionMonitor& monitor,
                             const domain::TacticalConfig& config)
    : bus_(bus), monitor_(monitor), config_(config) {
  subscriptions_.push_back(bus_.subscribe<SignalEmittedEvent>(
      [this](const SignalEmittedEvent& e) { onEmitted(e); }));
  subscriptions_.push_back(bus_.subscribe<SnapshotEvent>(
      [this](const SnapshotEvent& e) { onSnapshot(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionOpenedEvent>(
      [this](const PositionOpenedEvent& e) { onPositionOpened(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) { onPositionClosed(e); }));
}

SignalTracker::~SignalTracker() {
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

std::vector<domain::EnhancedTradeSignal> SignalTracker::active() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::EnhancedTradeSignal> out;
  out.reserve(signals_.size());
  for (const auto& [id, signal] : signals_) {
    out.push_back(signal);
  }
  return out;
}

std::vector<domain::EnhancedTradeSignal> SignalTracker::recent() const {
  std::lock_guard lock(mutex_);
  return {history_.begin(), history_.end()};
}

void SignalTracker::onEmitted(const SignalEmittedEvent& event) {
  std::lock_guard lock(mutex_);
  auto signal = event.signal;
  signal.status = domain::SignalStatus::Active;
  signal.decayed_confidence = signal.confidence;
  signals_[signal.id] = std::move(signal);
}

void SignalTracker::onSnapshot(const SnapshotEvent& event) {
  const auto& snap = event.snapshot;
  const auto positions = monitor_.getSnapshots();

  std::vector<domain::EnhancedTradeSignal> changed;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, signal] : signals_) {
      if (signal.symbol != snap.symbol) {
        continue;
      }
      if (signal.status == domain::SignalStatus::Filled) {
        for (const auto& pos : positions) {
          if (pos.signal_id == id) {
            SignalLifecycle::followPosition(signal, pos);
            break;
          }
        }
        continue;
      }
      if (SignalLifecycle::advance(signal, snap.price, snap.timestamp_ms,
                                   config_)) {
        std::cout << "[SignalTracker] " << id << " -> "
                  << domain::toString(signal.status) << "\n";
        changed.push_back(signal);
      }
    }
    retireTerminal();
  }

  for (auto& signal : changed) {
    bus_.publish(SignalUpdatedEvent{std::move(signal), snap.timestamp_ms});
  }
}

void SignalTracker::onPositionOpened(const PositionOpenedEvent& event) {
  domain::EnhancedTradeSignal updated;
  {
    std::lock_guard lock(mutex_);
    auto it = signals_.find(event.position.signal_id);
    if (it == signals_.end()) {
      return;
    }
    SignalLifecycle::markFilled(it->second);
    SignalLifecycle::followPosition(it->second, event.position);
    updated = it->second;
  }
  bus_.publish(SignalUpdatedEvent{std::move(updated), event.timestamp_ms});
}

void SignalTracker::onPositionClosed(const PositionClosedEvent& event) {
  domain::EnhancedTradeSignal updated;
  {
    std::lock_guard lock(mutex_);
    auto it = signals_.find(event.position.signal_id);
    if (it == signals_.end()) {
      return;
    }
    SignalLifecycle::onPositionClosed(it->second, event.position,
                                      event.reason);
    updated = it->second;
    retireTerminal();
  }
  std::cout << "[SignalTracker] " << updated.id << " -> "
            << domain::toString(updated.status) << "\n";
  bus_.publish(SignalUpdatedEvent{std::move(updated), event.timestamp_ms});
}

void SignalTracker::retireTerminal() {
  for (auto it = signals_.begin(); it != signals_.end();) {
    if (SignalLifecycle::isTerminal(it->second.status)) {
      history_.push_back(std::move(it->second));
      it = signals_.erase(it);
    } else {
      ++it;
    }
  }
  while (history_.size() > kHistoryLimit) {
    history_.pop_front();
  }
}

}  // namespace tactical
