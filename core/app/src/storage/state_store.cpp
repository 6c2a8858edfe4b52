#include "tactical/storage/state_store.hpp"
#include "tactical/learning/pattern_learner.hpp"
#include "tactical/storage/json_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace tactical {

namespace {

using nlohmann::json;

void renameKey(json& j, const char* from, const char* to) {
  auto it = j.find(from);
  if (it == j.end()) {
    return;
  }
  if (!j.contains(to)) {
    j[to] = *it;
  }
  j.erase(from);
}

}  // namespace

StateStore::StateStore(IKeyValueStore& store) : store_(store) {}

// -----------------------------------------------------------------------------
// migrate: version detection and sequential upgrade
// -----------------------------------------------------------------------------
std::optional<json> StateStore::migrate(const std::string& key,
                                        const json& document) {
  int version = 1;
  json data = document;
  if (document.is_object() && document.contains("version")) {
    version = document.at("version").get<int>();
    data = document.value("data", json::object());
  }

  if (version > kCurrentVersion) {
    std::cerr << "[StateStore] " << key << " has version " << version
              << ", newer than supported " << kCurrentVersion
              << ". Using defaults.\n";
    return std::nullopt;
  }
  if (version < 1) {
    std::cerr << "[StateStore] " << key << " has invalid version " << version
              << ". Using defaults.\n";
    return std::nullopt;
  }

  for (int v = version + 1; v <= kCurrentVersion; ++v) {
    if (v == 2) {
      data = migrateV1toV2(key, std::move(data));
    }
    std::cout << "[StateStore] Migrated " << key << " to v" << v << "\n";
  }
  return data;
}

json StateStore::migrateV1toV2(const std::string& key, json data) {
  if (key == kCircuitBreakerKey) {
    if (!data.is_object()) {
      data = json::object();
    }
    renameKey(data, "dailyPnL", "daily_pnl");
    renameKey(data, "dailyLossLimit", "daily_loss_limit");
    renameKey(data, "lastResetDate", "last_reset_date");
    renameKey(data, "isCircuitBreakerTripped", "tripped");
    if (!data.contains("daily_loss_limit")) {
      data["daily_loss_limit"] = 2500.0;
    }
    return data;
  }

  if (key == kSignalHistoryKey) {
    if (data.is_array()) {
      json entries = json::array();
      std::int64_t last = 0;
      for (auto e : data) {
        renameKey(e, "id", "signal_id");
        renameKey(e, "timestamp", "timestamp_ms");
        renameKey(e, "type", "direction");
        last = std::max(last, e.value("timestamp_ms", std::int64_t{0}));
        entries.push_back(std::move(e));
      }
      const auto count = entries.size();
      return json{{"entries", std::move(entries)},
                  {"last_signal_ms", last},
                  {"issued_count", count}};
    }
    if (data.is_object()) {
      renameKey(data, "lastSignalTime", "last_signal_ms");
      return data;
    }
    return json::object();
  }

  if (key == kPatternLearningKey) {
    if (!data.is_object()) {
      data = json::object();
    }
    if (!data.contains("outcomes") || !data.at("outcomes").is_array()) {
      data["outcomes"] = json::array();
    }
    for (auto& o : data["outcomes"]) {
      renameKey(o, "signalId", "signal_id");
      renameKey(o, "realizedR", "realized_r");
      renameKey(o, "realizedPnl", "realized_pnl");
      renameKey(o, "entryPrice", "entry_price");
      renameKey(o, "exitPrice", "exit_price");
      renameKey(o, "exitReason", "exit_reason");
    }
    return data;
  }
  return data;
}

// -----------------------------------------------------------------------------
// load / save
// -----------------------------------------------------------------------------
template <typename T>
T StateStore::load(const char* key) {
  try {
    const auto raw = store_.get(key);
    if (!raw) {
      return T{};
    }
    const json document = json::parse(*raw);
    const auto data = migrate(key, document);
    if (!data) {
      return T{};
    }
    return data->get<T>();
  } catch (const json::exception& e) {
    std::cerr << "[StateStore] Corrupt " << key << " (" << e.what()
              << "). Using defaults.\n";
  } catch (const std::exception& e) {
    std::cerr << "[StateStore] Failed to load " << key << " (" << e.what()
              << "). Using defaults.\n";
  }
  return T{};
}

template <typename T>
bool StateStore::save(const char* key, const T& value) {
  try {
    const json document{{"version", kCurrentVersion}, {"data", value}};
    store_.put(key, document.dump());
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[StateStore] Failed to save " << key << ": " << e.what()
              << "\n";
    return false;
  }
}

domain::PatternLearningState StateStore::loadPatternLearning() {
  auto state = load<domain::PatternLearningState>(kPatternLearningKey);
  return PatternLearner::rebuild(std::move(state.outcomes));
}

domain::SignalHistoryState StateStore::loadSignalHistory() {
  return load<domain::SignalHistoryState>(kSignalHistoryKey);
}

domain::CircuitBreakerState StateStore::loadCircuitBreaker() {
  return load<domain::CircuitBreakerState>(kCircuitBreakerKey);
}

bool StateStore::savePatternLearning(const domain::PatternLearningState& state) {
  return save(kPatternLearningKey, state);
}

bool StateStore::saveSignalHistory(const domain::SignalHistoryState& state) {
  return save(kSignalHistoryKey, state);
}

bool StateStore::saveCircuitBreaker(const domain::CircuitBreakerState& state) {
  return save(kCircuitBreakerKey, state);
}

}  // namespace tactical
