#pragma once

#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/rejection.hpp"
#include "tactical/domain/scores.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// GateInput — everything the quality gate looks at for one candidate
// -----------------------------------------------------------------------------
struct GateInput {
  domain::Direction direction{domain::Direction::Long};
  domain::Regime regime{domain::Regime::Normal};
  std::int64_t now_ms{0};
  double price{0.0};
  double ema_200{0.0};
  double adx{0.0};
  double volume_ratio{1.0};
  domain::TechnicalScore technical;
  std::optional<domain::OrderFlowScore> order_flow;
  domain::MarketStructure structure;
};

// -----------------------------------------------------------------------------
// GateResult — outcome of the quality gate
// -----------------------------------------------------------------------------
//
// @details
// rejection is set on the first hard failure; evaluation stops there.
// penalty_multiplier is the product of all soft penalties and is applied to
// confidence later in the pipeline. effective_min_score / effective_min_edge
// are the regime thresholds after ADX modulation.
// -----------------------------------------------------------------------------
struct GateResult {
  std::optional<domain::Rejection> rejection;
  std::vector<std::string> soft_penalties;
  double penalty_multiplier{1.0};
  double adx_factor{1.0};
  double effective_min_score{0.0};
  double effective_min_edge{0.0};
  int signals_in_window{0};

  bool passed() const { return !rejection.has_value(); }
};

// -----------------------------------------------------------------------------
// CombinedScore — technical score merged with aligned order flow
// -----------------------------------------------------------------------------
struct CombinedScore {
  double bull{0.0};
  double bear{0.0};
  double edge{0.0};
  bool order_flow_merged{false};
};

// -----------------------------------------------------------------------------
// QualityGateEvaluator — hard and soft filters ahead of consensus
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a scored candidate is worth sending to consensus.
//
// @details
// evaluate() applies, in order, stopping at the first hard failure:
//
//   1. Cooldown        now - last signal < cooldown(regime bucket)
//   2. Chop            same-direction signals inside the chop window would
//                      exceed max_signals_in_window with this one
//   3. ADX modulation  ADX < chop threshold  -> thresholds x chop multiplier
//                      ADX < weak threshold  -> thresholds x weak multiplier
//   4. Order-flow veto order flow opposes with edge >= veto threshold while
//                      the technical edge is below tech_edge_veto_override.
//                      Any other opposition is a soft penalty.
//   5. Volume ratio, volatility percentile band, tradability (hard)
//   6. Session, weekend, EMA200 overextension (soft, x soft_penalty_factor)
//
// checkScores() runs after the scores are combined and enforces the
// effective min edge, min score and the opposing-score ceiling.
//
// Thread model:
//   Stateless static functions over immutable inputs.
// -----------------------------------------------------------------------------
class QualityGateEvaluator {
 public:
  static GateResult evaluate(const GateInput& input,
                             const domain::SignalHistoryState& history,
                             const domain::TacticalConfig& config);

  /// Merges the order-flow score into the technical score when both point
  /// the same way, weighted by config.order_flow_weight.
  static CombinedScore combine(const domain::TechnicalScore& technical,
                               const std::optional<domain::OrderFlowScore>& of,
                               const domain::TacticalConfig& config);

  static std::optional<domain::Rejection> checkScores(
      const CombinedScore& combined, domain::Direction direction,
      const GateResult& gate, const domain::TacticalConfig& config);

  /// Same-direction history entries newer than now - chop window.
  static int countRecentSignals(const domain::SignalHistoryState& history,
                                domain::Direction direction,
                                std::int64_t now_ms, int window_seconds);
};

}  // namespace tactical
