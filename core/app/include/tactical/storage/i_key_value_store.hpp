#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// IKeyValueStore — persistence collaborator for engine state
// -----------------------------------------------------------------------------
//
// @brief  String-keyed, string-valued storage. StateStore layers the
//         versioned JSON documents on top.
//
// @details
// get() returns std::nullopt when the key does not exist. An implementation
// that fails to read an existing key throws std::runtime_error; put()
// reports a failed write the same way. StateStore treats both as an
// OperationalFailure: logged, and the engine keeps running on its
// in-memory state.
//
// Ownership:
//   TacticalEngine does NOT own the store. main() (or a test fixture)
//   creates it and keeps it alive for the engine's lifetime.
//
// Thread model:
//   Implementations must tolerate calls from the signal loop (pattern
//   learning, history) and the risk loop (circuit breaker).
// -----------------------------------------------------------------------------
class IKeyValueStore {
 public:
  virtual ~IKeyValueStore() = default;

  virtual std::optional<std::string> get(const std::string& key) = 0;

  virtual void put(const std::string& key, const std::string& value) = 0;
};

// -----------------------------------------------------------------------------
// InMemoryStore — test and backtest store
// -----------------------------------------------------------------------------
// Keeps every value in a map; nothing survives the process. Used by the
// unit tests and when the engine runs without a state directory.
// -----------------------------------------------------------------------------
class InMemoryStore : public IKeyValueStore {
 public:
  std::optional<std::string> get(const std::string& key) override {
    std::lock_guard lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void put(const std::string& key, const std::string& value) override {
    std::lock_guard lock(mutex_);
    values_[key] = value;
  }

 private:
  std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

}  // namespace tactical
