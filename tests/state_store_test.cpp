// =============================================================================
// state_store_test.cpp
// =============================================================================
// Unit tests for tactical::StateStore over InMemoryStore and FileStore.
//
// Validates:
//   - Save/load round trip through the {"version", "data"} envelope
//   - v1 documents (no version, camelCase keys) migrate to v2
//   - Corrupt JSON and newer versions fall back to defaults
//   - Pattern learning aggregates are rebuilt from outcomes on load
//   - FileStore persists across instances
// =============================================================================

#include "tactical/domain/pattern.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/storage/file_store.hpp"
#include "tactical/storage/i_key_value_store.hpp"
#include "tactical/storage/state_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

using tactical::InMemoryStore;
using tactical::StateStore;
using nlohmann::json;
namespace dom = tactical::domain;

class StateStoreTest : public ::testing::Test {
 protected:
  InMemoryStore kv;
  StateStore store{kv};

  static dom::TradeOutcome outcome(const std::string& id, double r) {
    dom::TradeOutcome o;
    o.signal_id = id;
    o.symbol = "BTCUSDT";
    o.realized_r = r;
    o.fingerprint.regime = dom::Regime::Normal;
    return o;
  }
};

TEST_F(StateStoreTest, MissingKeysGiveDefaults) {
  const auto breaker = store.loadCircuitBreaker();
  EXPECT_DOUBLE_EQ(breaker.daily_pnl, 0.0);
  EXPECT_FALSE(breaker.tripped);
  EXPECT_TRUE(store.loadSignalHistory().entries.empty());
  EXPECT_TRUE(store.loadPatternLearning().outcomes.empty());
}

TEST_F(StateStoreTest, CircuitBreakerRoundTrip) {
  dom::CircuitBreakerState s;
  s.daily_pnl = -320.5;
  s.daily_loss_limit = 1000.0;
  s.tripped = true;
  s.last_reset_date = "2024-01-10";
  s.tripped_at_ms = 1'704'888'000'000;
  ASSERT_TRUE(store.saveCircuitBreaker(s));

  const auto loaded = store.loadCircuitBreaker();
  EXPECT_DOUBLE_EQ(loaded.daily_pnl, -320.5);
  EXPECT_DOUBLE_EQ(loaded.daily_loss_limit, 1000.0);
  EXPECT_TRUE(loaded.tripped);
  EXPECT_EQ(loaded.last_reset_date, "2024-01-10");
  ASSERT_TRUE(loaded.tripped_at_ms.has_value());
  EXPECT_EQ(*loaded.tripped_at_ms, 1'704'888'000'000);
}

TEST_F(StateStoreTest, SaveWrapsDocumentInVersionEnvelope) {
  dom::SignalHistoryState h;
  h.issued_count = 3;
  ASSERT_TRUE(store.saveSignalHistory(h));

  const auto raw = kv.get(StateStore::kSignalHistoryKey);
  ASSERT_TRUE(raw.has_value());
  const auto doc = json::parse(*raw);
  EXPECT_EQ(doc.at("version").get<int>(), StateStore::kCurrentVersion);
  EXPECT_EQ(doc.at("data").at("issued_count").get<int>(), 3);
}

TEST_F(StateStoreTest, CorruptJsonGivesDefaults) {
  kv.put(StateStore::kCircuitBreakerKey, "{not json");
  const auto s = store.loadCircuitBreaker();
  EXPECT_FALSE(s.tripped);
  EXPECT_DOUBLE_EQ(s.daily_pnl, 0.0);
}

TEST_F(StateStoreTest, NewerVersionGivesDefaults) {
  kv.put(StateStore::kCircuitBreakerKey,
         json{{"version", 3}, {"data", {{"daily_pnl", -50.0}}}}.dump());
  EXPECT_DOUBLE_EQ(store.loadCircuitBreaker().daily_pnl, 0.0);
  EXPECT_FALSE(StateStore::migrate(StateStore::kCircuitBreakerKey,
                                   json{{"version", 3}, {"data", json::object()}})
                   .has_value());
}

TEST_F(StateStoreTest, UnknownEnumGivesDefaults) {
  kv.put(StateStore::kSignalHistoryKey,
         json{{"version", 2},
              {"data",
               {{"entries",
                 json::array({{{"timestamp_ms", 1}, {"direction", "UP"}}})},
                {"issued_count", 1}}}}
             .dump());
  const auto h = store.loadSignalHistory();
  EXPECT_TRUE(h.entries.empty());
  EXPECT_EQ(h.issued_count, 0u);
}

// -----------------------------------------------------------------------------
// v1 migration
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, MigratesV1CircuitBreaker) {
  kv.put(StateStore::kCircuitBreakerKey,
         json{{"dailyPnL", -100.0},
              {"isCircuitBreakerTripped", true},
              {"lastResetDate", "2024-01-09"}}
             .dump());

  const auto s = store.loadCircuitBreaker();
  EXPECT_DOUBLE_EQ(s.daily_pnl, -100.0);
  EXPECT_TRUE(s.tripped);
  EXPECT_EQ(s.last_reset_date, "2024-01-09");
  EXPECT_DOUBLE_EQ(s.daily_loss_limit, 2500.0);
}

TEST_F(StateStoreTest, MigratesV1SignalHistoryArray) {
  kv.put(StateStore::kSignalHistoryKey,
         json::array({{{"id", "a"}, {"timestamp", 1000}, {"type", "LONG"}},
                      {{"id", "b"}, {"timestamp", 3000}, {"type", "SHORT"}},
                      {{"id", "c"}, {"timestamp", 2000}, {"type", "LONG"}}})
             .dump());

  const auto h = store.loadSignalHistory();
  ASSERT_EQ(h.entries.size(), 3u);
  EXPECT_EQ(h.entries[1].signal_id, "b");
  EXPECT_EQ(h.entries[1].direction, dom::Direction::Short);
  EXPECT_EQ(h.last_signal_ms, 3000);
  EXPECT_EQ(h.issued_count, 3u);
}

TEST_F(StateStoreTest, MigratesV1PatternOutcomes) {
  kv.put(StateStore::kPatternLearningKey,
         json{{"outcomes",
               json::array({{{"signalId", "s1"}, {"realizedR", 2.0}},
                            {{"signalId", "s2"}, {"realizedR", -1.0}}})}}
             .dump());

  const auto p = store.loadPatternLearning();
  ASSERT_EQ(p.outcomes.size(), 2u);
  EXPECT_EQ(p.outcomes[0].signal_id, "s1");
  EXPECT_DOUBLE_EQ(p.outcomes[0].realized_r, 2.0);
  EXPECT_EQ(p.overall.total, 2);
  EXPECT_EQ(p.overall.wins, 1);
}

// A hand-edited aggregate never survives a load.
TEST_F(StateStoreTest, PatternAggregatesAreRebuiltOnLoad) {
  dom::PatternLearningState state;
  state.outcomes = {outcome("s1", 2.0), outcome("s2", 2.0),
                    outcome("s3", -1.0)};
  state.overall.total = 99;
  state.overall.win_rate = 0.01;
  ASSERT_TRUE(store.savePatternLearning(state));

  const auto loaded = store.loadPatternLearning();
  EXPECT_EQ(loaded.overall.total, 3);
  EXPECT_EQ(loaded.overall.wins, 2);
  EXPECT_NEAR(loaded.overall.win_rate, 2.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(loaded.overall.profit_factor, 4.0);
  ASSERT_EQ(loaded.by_regime.count("NORMAL"), 1u);
  EXPECT_EQ(loaded.by_regime.at("NORMAL").total, 3);
}

// -----------------------------------------------------------------------------
// FileStore
// -----------------------------------------------------------------------------
TEST(FileStoreTest, PersistsAcrossInstances) {
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir = std::filesystem::temp_directory_path() /
                   ("tactical_state_test_" + std::to_string(stamp));

  {
    tactical::FileStore files(dir);
    StateStore store(files);
    dom::CircuitBreakerState s;
    s.daily_pnl = -42.0;
    s.last_reset_date = "2024-01-10";
    ASSERT_TRUE(store.saveCircuitBreaker(s));
  }
  EXPECT_TRUE(std::filesystem::exists(dir / "tactical.circuit_breaker.json"));
  {
    tactical::FileStore files(dir);
    StateStore store(files);
    EXPECT_DOUBLE_EQ(store.loadCircuitBreaker().daily_pnl, -42.0);
    EXPECT_FALSE(files.get("missing").has_value());
  }
  std::filesystem::remove_all(dir);
}
