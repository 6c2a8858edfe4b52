#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// IdGenerator — process-wide monotonic ids for positions and journal entries
// -----------------------------------------------------------------------------
// Starts at 1 so that 0 can mean "unassigned". next_tag() prefixes the
// number, e.g. next_tag("pos") -> "pos-17".
//
// Thread model: lock-free; safe from any thread.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;
  explicit IdGenerator(std::uint64_t first) : next_id_(first) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next_tag(const std::string& prefix) {
    return prefix + "-" + std::to_string(next_id());
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tactical
