#pragma once

#include "tactical/domain/state.hpp"
#include "tactical/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// CircuitBreaker — account-level daily loss kill switch
// -----------------------------------------------------------------------------
//
// @brief  Pure state transitions plus a thread-safe holder of the live
//         state.
//
// @details
// check(state, today):
//   1. last_reset_date != today  ->  daily_pnl = 0, tripped = false,
//                                    last_reset_date = today
//   2. daily_pnl <= -daily_loss_limit  ->  tripped = true (sticky)
//
// recordRealizedPnl() runs check(), adds the PnL, and runs the trip test
// again. Once tripped the breaker stays tripped for the rest of the UTC day
// even if PnL recovers; only a new day or acknowledge() clears it.
//
// The instance methods evaluate against the injected clock and invoke the
// optional change handler (outside the lock) whenever the trip flag or the
// reset date changes, so the owner can persist and broadcast the state.
// A handler that throws is logged; the state change stands, so record()
// either applies the PnL exactly once or throws before touching the state.
//
// Thread model:
//   Instance methods are safe from any thread (risk loop and IPC server).
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  using ChangeHandler = std::function<void(const domain::CircuitBreakerState&,
                                           const std::string& reason)>;

  static domain::CircuitBreakerState check(domain::CircuitBreakerState state,
                                           const std::string& today,
                                           std::int64_t now_ms);

  static domain::CircuitBreakerState recordRealizedPnl(
      domain::CircuitBreakerState state, double pnl, const std::string& today,
      std::int64_t now_ms);

  static domain::CircuitBreakerState acknowledge(
      domain::CircuitBreakerState state, const std::string& today);

  CircuitBreaker(domain::CircuitBreakerState initial,
                 const ITimeProvider& clock);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;
  CircuitBreaker(CircuitBreaker&&) = delete;
  CircuitBreaker& operator=(CircuitBreaker&&) = delete;

  void setChangeHandler(ChangeHandler handler);

  /// Evaluates the day rollover and returns the trip flag.
  bool isTripped();

  /// Returns true when this call tripped the breaker.
  bool record(double pnl);

  /// Manual operator reset.
  void reset();

  domain::CircuitBreakerState state() const;

 private:
  // Runs `mutate` under the lock and notifies if trip flag or date changed.
  template <typename Fn>
  domain::CircuitBreakerState update(Fn mutate, const std::string& reason);

  const ITimeProvider& clock_;
  mutable std::mutex mutex_;
  domain::CircuitBreakerState state_;
  ChangeHandler on_change_;
};

}  // namespace tactical
