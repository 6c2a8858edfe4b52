#pragma once

#include "tactical/domain/rejection.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace tactical {

// Market facts the validator checks a candidate against. Never taken from
// the candidate itself.
struct ValidationContext {
  double live_price{0.0};
  double atr{0.0};
  std::int64_t now_ms{0};
};

using ValidationResult =
    std::variant<domain::EnhancedTradeSignal, domain::Rejection>;

// -----------------------------------------------------------------------------
// SignalValidator — final numeric gate for every emitted signal
// -----------------------------------------------------------------------------
//
// @brief  Authoritative check applied to both rule-based and advisory
//         candidates. A failing candidate is discarded; nothing is repaired.
//
// @details
// Rejects (RejectStage::Validation) when:
//   - any price is non-finite or <= 0
//   - the target ladder is empty or does not allocate exactly 100%
//   - price ordering is violated
//       LONG:  stop < entry < t0 < t1 < ...
//       SHORT: stop > entry > t0 > t1 > ...
//   - |entry - live| / live x 100 > max_price_deviation_pct
//   - |entry - stop| / ATR outside [min_atr_stop_multiple,
//     max_atr_stop_multiple] (also when ATR is unknown)
//
// On success the returned copy has:
//   - risk_reward recomputed from absolute distances against the primary
//     target (see primaryTargetIndex); any upstream value is discarded
//   - approval_status forced to PendingReview unless source is Tactical
//   - current_stop initialised to stop_loss when unset
//
// Thread model:
//   Stateless static functions.
// -----------------------------------------------------------------------------
class SignalValidator {
 public:
  static constexpr double kPctSumTolerance = 1e-6;

  static ValidationResult validate(domain::EnhancedTradeSignal candidate,
                                   const ValidationContext& context,
                                   const domain::TacticalConfig& config);

  static bool pricesOrdered(const domain::TradeSignal& signal);

  /// reward / risk with absolute distances. 0 when risk is 0.
  static double riskReward(double entry, double stop, double target);

  /// Tier used for R:R: the second tier when there is one, else the first.
  static std::size_t primaryTargetIndex(std::size_t target_count);

  static double deviationPct(double entry, double live_price);
};

}  // namespace tactical
