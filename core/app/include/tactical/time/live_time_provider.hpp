#pragma once

#include "tactical/time/i_time_provider.hpp"

#include <chrono>

namespace tactical {

// Wall clock for the live engine. Snapshot timestamps are informational only;
// cooldowns, signal age and the breaker's UTC day all follow this clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace tactical
