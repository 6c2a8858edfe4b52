#pragma once

#include "tactical/domain/journal_entry.hpp"
#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/pattern.hpp"
#include "tactical/domain/position.hpp"
#include "tactical/domain/rejection.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/trade_signal.hpp"

#include <nlohmann/json.hpp>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// nlohmann::json bindings for the domain types
// -----------------------------------------------------------------------------
//
// @brief  ADL-visible to_json / from_json overloads, so callers can write
//         json j = state;  and  j.get<domain::PatternLearningState>().
//
// @details
// Enums travel as their stable strings (tactical/domain/enum_strings.hpp).
//
// Decoding rules:
//   - Missing scalar fields keep the struct default. This is what lets a
//     v1 document decode into the v2 structs after migration.
//   - Fields that a value cannot exist without (snapshot price, outcome
//     realized_r) use json::at() and throw nlohmann::json::out_of_range.
//   - An unknown enum string throws std::invalid_argument.
// Callers at the I/O boundary catch both and fall back to defaults.
//
// Persisted:  PatternLearningState, SignalHistoryState, CircuitBreakerState
// Wire in:    MarketSnapshot (snapshot feed)
// Wire out:   EnhancedTradeSignal, Position, JournalEntry, Rejection
//             (telemetry and STATUS replies)
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Candle& v);
void from_json(const nlohmann::json& j, Candle& v);
void to_json(nlohmann::json& j, const IndicatorBundle& v);
void from_json(const nlohmann::json& j, IndicatorBundle& v);
void to_json(nlohmann::json& j, const OrderFlowBundle& v);
void from_json(const nlohmann::json& j, OrderFlowBundle& v);
void to_json(nlohmann::json& j, const MacroContext& v);
void from_json(const nlohmann::json& j, MacroContext& v);
void to_json(nlohmann::json& j, const MarketSnapshot& v);
void from_json(const nlohmann::json& j, MarketSnapshot& v);

void to_json(nlohmann::json& j, const PatternFingerprint& v);
void from_json(const nlohmann::json& j, PatternFingerprint& v);
void to_json(nlohmann::json& j, const TradeOutcome& v);
void from_json(const nlohmann::json& j, TradeOutcome& v);
void to_json(nlohmann::json& j, const PatternStats& v);
void from_json(const nlohmann::json& j, PatternStats& v);
void to_json(nlohmann::json& j, const PatternLearningState& v);
void from_json(const nlohmann::json& j, PatternLearningState& v);

void to_json(nlohmann::json& j, const SignalHistoryEntry& v);
void from_json(const nlohmann::json& j, SignalHistoryEntry& v);
void to_json(nlohmann::json& j, const SignalHistoryState& v);
void from_json(const nlohmann::json& j, SignalHistoryState& v);

void to_json(nlohmann::json& j, const CircuitBreakerState& v);
void from_json(const nlohmann::json& j, CircuitBreakerState& v);

void to_json(nlohmann::json& j, const TargetLevel& v);
void to_json(nlohmann::json& j, const EnhancedTradeSignal& v);
void to_json(nlohmann::json& j, const Position& v);
void to_json(nlohmann::json& j, const JournalEntry& v);
void to_json(nlohmann::json& j, const Rejection& v);

}  // namespace domain
}  // namespace tactical
