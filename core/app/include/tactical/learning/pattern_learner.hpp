#pragma once

#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/pattern.hpp"
#include "tactical/domain/scores.hpp"
#include "tactical/domain/tactical_config.hpp"

#include <array>
#include <optional>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// PatternLearner — similarity-based confidence shading from past outcomes
// -----------------------------------------------------------------------------
//
// @brief  Builds fingerprints, matches them against the outcome store and
//         appends new outcomes. Never rejects a signal; it only produces a
//         bounded confidence adjustment.
//
// @details
// Similarity between two fingerprints a and b is a weighted match over the
// fixed-width vector (see PatternFingerprint::toVector):
//
//   categorical slot i:  w_i if a_i == b_i else 0
//   continuous slot i:   w_i x (1 - min(1, |a_i - b_i| x scale_i))
//   similarity        =  sum / sum(w)
//
// Identical fingerprints therefore have similarity exactly 1.0.
//
// Adjustment (once >= min_patterns_for_learning outcomes exist):
//   take outcomes with similarity >= threshold, best first, at most
//   max_pattern_matches; weight each by similarity^2;
//   adj = (matched_win_rate - baseline_win_rate) x 20
//       + matched_avg_r x 5
//   clamped to [-max_confidence_penalty, +max_confidence_boost].
//
// Determinism: matching iterates outcomes in insertion order and sorts with
// a stable sort, so the same history always yields the same adjustment.
//
// Thread model:
//   Stateless static functions. addOutcome() returns a new state instead of
//   mutating, so callers can publish the new copy atomically.
// -----------------------------------------------------------------------------
class PatternLearner {
 public:
  /// Profit factor reported when there are wins but no losses.
  static constexpr double kMaxProfitFactor = 999.0;

  struct FingerprintInput {
    domain::MarketStructure structure;
    domain::TechnicalScore technical;
    std::optional<domain::OrderFlowScore> order_flow;
    domain::SignalType signal_type{domain::SignalType::TrendContinuation};
    double adx{0.0};
    double rsi{50.0};
    double consensus_agreement{0.5};
    double entry_confidence{50.0};
  };

  static domain::PatternFingerprint buildFingerprint(
      const FingerprintInput& input);

  static double similarity(const domain::PatternFingerprint& a,
                           const domain::PatternFingerprint& b);

  static std::vector<domain::PatternMatch> findMatches(
      const domain::PatternFingerprint& fingerprint,
      const domain::PatternLearningState& state,
      const domain::TacticalConfig& config);

  static domain::PatternAnalysis analyze(
      const domain::PatternFingerprint& fingerprint,
      const domain::PatternLearningState& state,
      const domain::TacticalConfig& config);

  static domain::PatternLearningState addOutcome(
      const domain::PatternLearningState& state,
      const domain::TradeOutcome& outcome);

  /// Recomputes every aggregate from scratch (used after loading state).
  static domain::PatternLearningState rebuild(
      std::vector<domain::TradeOutcome> outcomes);

  static domain::PatternStats computeStats(
      const std::vector<const domain::TradeOutcome*>& outcomes);

 private:
  static const std::array<double, domain::PatternFingerprint::kWidth>&
  slotWeights();
};

}  // namespace tactical
