#pragma once

#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/domain/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tactical {

// One tier leaving Pending through a price crossing.
struct TierFill {
  std::size_t index{0};
  domain::TargetStatus status{domain::TargetStatus::Hit};
  double fill_price{0.0};
  double fraction{0.0};  // Share of the original size, 0-1
};

struct LadderUpdate {
  std::vector<TierFill> fills;
  bool break_even_triggered{false};
  double released_fraction{0.0};

  bool empty() const { return fills.empty(); }
};

// -----------------------------------------------------------------------------
// TargetLadder — multi-tier take-profit construction and tracking
// -----------------------------------------------------------------------------
//
// @brief  Builds the R-multiple ladder for a new signal and advances it on
//         each observed price.
//
// @details
// Construction:
//   tier_i.price = entry +/- r_i x |entry - stop|
//   With use_structure_levels, a tier within sr_snap_proximity_pct of a
//   structure level snaps to the strongest such level, provided that keeps
//   the tier on the profit side (within 1%) and keeps the ladder strictly
//   ordered.
//
// Gap policy (applyPrice):
//   Within one price update only the lowest Pending tier that the price has
//   crossed is Hit, filled at its tier price. Every further Pending tier
//   crossed by the same update is Missed and released at the observed
//   price. Release accounting is therefore always in ladder order, and a
//   gap through several tiers still closes their size.
//
//   break_even_triggered is set when the configured tier (1-based) leaves
//   Pending during this update, by Hit or Missed.
//
// cancelPending() marks all Pending tiers Cancelled; used when the stop or
// liquidation closes the remainder.
// -----------------------------------------------------------------------------
class TargetLadder {
 public:
  static std::vector<domain::TargetLevel> build(
      domain::Direction direction, double entry, double stop,
      const domain::MarketStructure& structure,
      const domain::TacticalConfig& config);

  static LadderUpdate applyPrice(std::vector<domain::TargetLevel>& targets,
                                 domain::Direction direction, double price,
                                 std::int64_t now_ms, int break_even_tier);

  static void cancelPending(std::vector<domain::TargetLevel>& targets);

  static double allocationPct(const std::vector<domain::TargetLevel>& targets);

  static bool allReleased(const std::vector<domain::TargetLevel>& targets);

  static bool crossed(domain::Direction direction, double price,
                      double level);
};

}  // namespace tactical
