#pragma once

#include "tactical/domain/journal_entry.hpp"
#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/position.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/domain/types.hpp"

#include <optional>
#include <string>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// Enum <-> string conversions
// -----------------------------------------------------------------------------
//
// @brief  Stable wire names for every domain enum. Used by telemetry, the
//         reasoning trail and the JSON persistence codec.
//
// @details
// toString() returns a pointer to a string literal (no allocation).
// The parse functions return std::nullopt for unknown input; callers at the
// JSON boundary decide whether that is a decode error or a default.
// -----------------------------------------------------------------------------
const char* toString(Direction v);
const char* toString(Bias v);
const char* toString(Regime v);
const char* toString(TrendType v);
const char* toString(TrendDirection v);
const char* toString(SignalType v);
const char* toString(CvdTrend v);
const char* toString(CvdDivergence v);
const char* toString(AbsorptionSide v);
const char* toString(LiquidationCascade v);
const char* toString(CloseReason v);
const char* toString(AssetType v);
const char* toString(LevelType v);
const char* toString(LevelSource v);
const char* toString(TargetStatus v);
const char* toString(SignalStatus v);
const char* toString(SignalSource v);
const char* toString(ApprovalStatus v);
const char* toString(PositionState v);
const char* toString(TradeResult v);

std::optional<Direction> parseDirection(const std::string& s);
std::optional<Regime> parseRegime(const std::string& s);
std::optional<TrendType> parseTrendType(const std::string& s);
std::optional<TrendDirection> parseTrendDirection(const std::string& s);
std::optional<SignalType> parseSignalType(const std::string& s);
std::optional<CvdTrend> parseCvdTrend(const std::string& s);
std::optional<CvdDivergence> parseCvdDivergence(const std::string& s);
std::optional<CloseReason> parseCloseReason(const std::string& s);
std::optional<AssetType> parseAssetType(const std::string& s);
std::optional<Bias> parseBias(const std::string& s);
std::optional<SignalSource> parseSignalSource(const std::string& s);

}  // namespace domain
}  // namespace tactical
