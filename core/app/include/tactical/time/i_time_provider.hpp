#pragma once

#include <cstdint>

namespace tactical {

// -----------------------------------------------------------------------------
// ITimeProvider — the single source of "now" for engine components
// -----------------------------------------------------------------------------
//
// @brief  Milliseconds since the Unix epoch (UTC).
//
// @details
// Every time-dependent decision goes through this interface: cooldowns, the
// chop window, order-flow staleness, signal age, the circuit breaker's
// calendar day and journal timestamps. Live runs use LiveTimeProvider;
// tests and the backtest drive SimulationTimeProvider so a replay sees the
// bar time rather than the wall clock.
//
// Thread model:
//   Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tactical
