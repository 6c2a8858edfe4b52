#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/time/time_utils.hpp"

#include <exception>
#include <iostream>

namespace tactical {

// -----------------------------------------------------------------------------
// Pure transitions
// -----------------------------------------------------------------------------
domain::CircuitBreakerState CircuitBreaker::check(
    domain::CircuitBreakerState state, const std::string& today,
    std::int64_t now_ms) {
  if (state.last_reset_date != today) {
    state.daily_pnl = 0.0;
    state.tripped = false;
    state.tripped_at_ms.reset();
    state.last_reset_date = today;
  }
  if (!state.tripped && state.daily_loss_limit > 0.0 &&
      state.daily_pnl <= -state.daily_loss_limit) {
    state.tripped = true;
    state.tripped_at_ms = now_ms;
  }
  return state;
}

domain::CircuitBreakerState CircuitBreaker::recordRealizedPnl(
    domain::CircuitBreakerState state, double pnl, const std::string& today,
    std::int64_t now_ms) {
  state = check(std::move(state), today, now_ms);
  state.daily_pnl += pnl;
  return check(std::move(state), today, now_ms);
}

domain::CircuitBreakerState CircuitBreaker::acknowledge(
    domain::CircuitBreakerState state, const std::string& today) {
  state.daily_pnl = 0.0;
  state.tripped = false;
  state.tripped_at_ms.reset();
  state.last_reset_date = today;
  return state;
}

// -----------------------------------------------------------------------------
// Stateful holder
// -----------------------------------------------------------------------------
CircuitBreaker::CircuitBreaker(domain::CircuitBreakerState initial,
                               const ITimeProvider& clock)
    : clock_(clock), state_(std::move(initial)) {}

void CircuitBreaker::setChangeHandler(ChangeHandler handler) {
  std::lock_guard lock(mutex_);
  on_change_ = std::move(handler);
}

template <typename Fn>
domain::CircuitBreakerState CircuitBreaker::update(Fn mutate,
                                                   const std::string& reason) {
  domain::CircuitBreakerState before;
  domain::CircuitBreakerState after;
  ChangeHandler handler;
  {
    std::lock_guard lock(mutex_);
    before = state_;
    state_ = mutate(state_);
    after = state_;
    handler = on_change_;
  }
  const bool changed = before.tripped != after.tripped ||
                       before.last_reset_date != after.last_reset_date ||
                       before.daily_pnl != after.daily_pnl;
  if (!before.tripped && after.tripped) {
    std::cerr << "[CircuitBreaker] TRIPPED: daily PnL " << after.daily_pnl
              << " <= -" << after.daily_loss_limit
              << ". Executions blocked until reset.\n";
  }
  if (changed && handler) {
    // The new state is already in effect; a failing observer cannot undo it.
    try {
      handler(after, reason);
    } catch (const std::exception& e) {
      std::cerr << "[CircuitBreaker] Change handler failed (" << reason
                << "): " << e.what() << "\n";
    }
  }
  return after;
}

bool CircuitBreaker::isTripped() {
  const std::int64_t now = clock_.now_ms();
  const std::string today = utc_date_string(now);
  return update(
             [&](const domain::CircuitBreakerState& s) {
               return check(s, today, now);
             },
             "check")
      .tripped;
}

bool CircuitBreaker::record(double pnl) {
  const std::int64_t now = clock_.now_ms();
  const std::string today = utc_date_string(now);
  bool was_tripped = false;
  const auto after = update(
      [&](const domain::CircuitBreakerState& s) {
        const auto rolled = check(s, today, now);
        was_tripped = rolled.tripped;
        return recordRealizedPnl(rolled, pnl, today, now);
      },
      "realized_pnl");
  return !was_tripped && after.tripped;
}

void CircuitBreaker::reset() {
  const std::string today = utc_date_string(clock_.now_ms());
  update(
      [&](const domain::CircuitBreakerState& s) {
        return acknowledge(s, today);
      },
      "manual_reset");
  std::cout << "[CircuitBreaker] Manually reset for " << today << "\n";
}

domain::CircuitBreakerState CircuitBreaker::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

}  // namespace tactical
