#pragma once

#include "tactical/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// SignalHistoryState — rolling window of recently issued signals
// -----------------------------------------------------------------------------
//
// @brief  Input to the cooldown and chop gates.
//
// @details
// The pipeline prunes entries older than the chop window on every
// evaluation and, when a signal is emitted, returns a copy with the new
// entry appended. issued_count is monotonically increasing and feeds the
// deterministic signal id.
// -----------------------------------------------------------------------------
struct SignalHistoryEntry {
  std::string signal_id;
  std::int64_t timestamp_ms{0};
  Direction direction{Direction::Long};
  double price{0.0};
};

struct SignalHistoryState {
  std::vector<SignalHistoryEntry> entries;  // Oldest first
  std::int64_t last_signal_ms{0};           // 0 = never
  std::uint64_t issued_count{0};
};

// -----------------------------------------------------------------------------
// CircuitBreakerState — account-level daily loss kill switch
// -----------------------------------------------------------------------------
//
// Sign convention:
//   daily_pnl is signed realized PnL for the current UTC day.
//   daily_loss_limit is a POSITIVE magnitude; the breaker trips when
//   daily_pnl <= -daily_loss_limit.
//
// last_reset_date is "YYYY-MM-DD" (UTC). Empty means never evaluated.
// -----------------------------------------------------------------------------
struct CircuitBreakerState {
  double daily_pnl{0.0};
  double daily_loss_limit{2500.0};
  bool tripped{false};
  std::string last_reset_date;
  std::optional<std::int64_t> tripped_at_ms;
};

}  // namespace domain
}  // namespace tactical
