#pragma once

#include "tactical/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tactical {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  Holds the time of the last replayed bar.
//
// @details
// BacktestSimulator calls advance_time() with each bar's open time before
// evaluating it, so the pipeline, the breaker and the monitor all read the
// same "now". advance_by() lets tests step the clock across cooldowns and
// calendar days without sleeping.
//
// The clock never runs backwards. advance_time() with an earlier timestamp
// (an out-of-order bar in a replay file) is ignored, because a rewind would
// re-open a cooldown that already expired or undo a UTC day roll of the
// circuit breaker. It returns the time the clock holds afterwards.
//
// Thread model:
//   Atomic; one writer (replay or test), any number of readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  std::int64_t advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tactical
