#pragma once

#include "tactical/domain/pattern.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/storage/i_key_value_store.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// StateStore — versioned JSON persistence of the three engine states
// -----------------------------------------------------------------------------
//
// @brief  Loads and saves PatternLearningState, SignalHistoryState and
//         CircuitBreakerState through an IKeyValueStore.
//
// @details
// Document layout, one per key:
//
//   tactical.pattern_learning   { "version": 2, "data": {...} }
//   tactical.signal_history     { "version": 2, "data": {...} }
//   tactical.circuit_breaker    { "version": 2, "data": {...} }
//
// Migrations run in sequence from the stored version up to kCurrentVersion.
// A document without a "version" field is version 1.
//
//   v1 -> v2
//     circuit breaker:  camelCase keys (dailyPnL, dailyLossLimit,
//                       lastResetDate, isCircuitBreakerTripped) renamed;
//                       a missing loss limit defaults to 2500
//     signal history:   a bare array of {id, timestamp, type, price} is
//                       wrapped into {entries, last_signal_ms, issued_count}
//     pattern learning: a missing outcomes array becomes []; camelCase
//                       outcome keys renamed
//
// Pattern learning aggregates are derived data: load() rebuilds them from
// the outcomes so a stale or hand-edited aggregate can never disagree with
// the history.
//
// Failure policy (OperationalFailure):
//   Missing key, unparseable JSON, a newer version than this build knows,
//   or a decode error all return the default state and log a
//   "[StateStore]" line to std::cerr. save() returns false on a write
//   failure; the in-memory state stays authoritative.
//
// Thread model:
//   Stateless apart from the store reference; thread safety is the
//   IKeyValueStore's.
// -----------------------------------------------------------------------------
class StateStore {
 public:
  static constexpr int kCurrentVersion = 2;

  static constexpr const char* kPatternLearningKey = "tactical.pattern_learning";
  static constexpr const char* kSignalHistoryKey = "tactical.signal_history";
  static constexpr const char* kCircuitBreakerKey = "tactical.circuit_breaker";

  explicit StateStore(IKeyValueStore& store);

  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;

  domain::PatternLearningState loadPatternLearning();
  domain::SignalHistoryState loadSignalHistory();
  domain::CircuitBreakerState loadCircuitBreaker();

  bool savePatternLearning(const domain::PatternLearningState& state);
  bool saveSignalHistory(const domain::SignalHistoryState& state);
  bool saveCircuitBreaker(const domain::CircuitBreakerState& state);

  /// Upgrades a stored document to the current version and returns its
  /// "data" payload, or std::nullopt if it cannot be upgraded.
  static std::optional<nlohmann::json> migrate(const std::string& key,
                                               const nlohmann::json& document);

 private:
  template <typename T>
  T load(const char* key);

  template <typename T>
  bool save(const char* key, const T& value);

  static nlohmann::json migrateV1toV2(const std::string& key,
                                      nlohmann::json data);

  IKeyValueStore& store_;
};

}  // namespace tactical
