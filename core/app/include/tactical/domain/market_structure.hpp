#pragma once

#include "tactical/domain/types.hpp"

#include <optional>
#include <vector>

namespace tactical {
namespace domain {

enum class LevelType {
  Support,
  Resistance,
};

enum class LevelSource {
  Swing,
  RoundNumber,
};

// -----------------------------------------------------------------------------
// StructureLevel — a support or resistance price
// -----------------------------------------------------------------------------
// strength counts how many swing pivots / round numbers were clustered into
// this level (1-5).
// -----------------------------------------------------------------------------
struct StructureLevel {
  double price{0.0};
  LevelType type{LevelType::Support};
  int strength{1};
  LevelSource source{LevelSource::Swing};
};

// -----------------------------------------------------------------------------
// MarketStructure — per-tick view of regime and swing structure
// -----------------------------------------------------------------------------
//
// @brief  Output of StructureAnalyzer. Recomputed on every evaluation; it
//         has no identity and is never persisted on its own (its salient
//         fields are copied into the PatternFingerprint).
//
// @details
// Scores are on a 0-100 scale:
//   structure_score   — quality of the swing structure itself
//   tradability_score — how suitable the market is for taking a trade now
// -----------------------------------------------------------------------------
struct MarketStructure {
  Regime regime{Regime::Normal};
  TrendType trend_type{TrendType::Ranging};
  TrendDirection trend_direction{TrendDirection::Neutral};

  int higher_highs{0};
  int higher_lows{0};
  int lower_highs{0};
  int lower_lows{0};

  bool trend_exhaustion{false};
  bool near_support{false};
  bool near_resistance{false};

  double volatility_percentile{50.0};

  std::vector<StructureLevel> levels;
  std::optional<StructureLevel> nearest_support;
  std::optional<StructureLevel> nearest_resistance;

  double structure_score{35.0};
  double tradability_score{50.0};
};

}  // namespace domain
}  // namespace tactical
