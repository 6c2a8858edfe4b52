#pragma once

#include "tactical/domain/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// PatternFingerprint — market context at signal creation
// -----------------------------------------------------------------------------
//
// @brief  Summary of the conditions under which a signal was issued. Built
//         once by PatternLearner::buildFingerprint and carried unchanged
//         through the signal, the position and the final TradeOutcome.
//
// @details
// toVector() flattens the fingerprint into a fixed-width numeric vector:
//
//   slot  0..8   categorical (enum ordinal or 0/1 flag)
//                regime, trend type, trend direction, signal type,
//                CVD trend, CVD divergence, near support, near resistance,
//                trend exhaustion
//   slot  9..15  continuous, each normalized to [0, 1]
//                trend strength, volatility percentile, RSI, technical edge,
//                order-flow edge, consensus agreement, entry confidence
//
// Similarity is computed on that vector by PatternLearner::similarity.
// -----------------------------------------------------------------------------
struct PatternFingerprint {
  static constexpr std::size_t kCategoricalSlots = 9;
  static constexpr std::size_t kWidth = 16;

  Regime regime{Regime::Normal};
  TrendType trend_type{TrendType::Ranging};
  TrendDirection trend_direction{TrendDirection::Neutral};
  SignalType signal_type{SignalType::TrendContinuation};
  CvdTrend cvd_trend{CvdTrend::Neutral};
  CvdDivergence cvd_divergence{CvdDivergence::None};
  bool near_support{false};
  bool near_resistance{false};
  bool trend_exhaustion{false};

  double trend_strength{0.0};         // ADX / 50
  double volatility_percentile{0.5};  // percentile / 100
  double rsi{0.5};                    // RSI / 100
  double technical_edge{0.0};         // edge / 10
  double order_flow_edge{0.0};        // edge / 10
  double consensus_agreement{0.5};    // agreement score
  double entry_confidence{0.5};       // confidence / 100

  std::array<double, kWidth> toVector() const;
};

// -----------------------------------------------------------------------------
// TradeOutcome — closed trade tied back to its fingerprint
// -----------------------------------------------------------------------------
//
// Append-only record. Once created it is never modified; PatternLearner
// only ever appends outcomes and recomputes aggregates.
// -----------------------------------------------------------------------------
struct TradeOutcome {
  std::string signal_id;
  std::string symbol;
  Direction direction{Direction::Long};
  PatternFingerprint fingerprint;

  double entry_price{0.0};
  double exit_price{0.0};
  std::int64_t entry_time_ms{0};
  std::int64_t exit_time_ms{0};
  CloseReason exit_reason{CloseReason::Manual};

  double realized_r{0.0};
  double realized_pnl{0.0};
  double max_favorable_pct{0.0};
  double max_adverse_pct{0.0};
  std::int64_t duration_ms{0};
  std::vector<int> targets_hit;  // 1-based tier numbers

  bool isWin() const { return realized_r > 0.0; }
};

// -----------------------------------------------------------------------------
// PatternStats — aggregate performance over a set of outcomes
// -----------------------------------------------------------------------------
struct PatternStats {
  int total{0};
  int wins{0};
  int losses{0};
  double win_rate{0.0};  // 0-1
  double avg_win_r{0.0};
  double avg_loss_r{0.0};  // Positive magnitude
  double profit_factor{0.0};
  double expectancy{0.0};  // Mean R per trade
};

// -----------------------------------------------------------------------------
// PatternLearningState — the rolling outcome store
// -----------------------------------------------------------------------------
//
// Thread model:
//   Treated as an immutable value. PatternLearner::addOutcome returns a new
//   copy; concurrent readers holding the old copy never see a partial
//   update.
// -----------------------------------------------------------------------------
struct PatternLearningState {
  std::vector<TradeOutcome> outcomes;
  PatternStats overall;
  PatternStats recent;  // Last kRecentWindow outcomes
  std::map<std::string, PatternStats> by_regime;
  std::map<std::string, PatternStats> by_trend_type;
  std::map<std::string, PatternStats> by_signal_type;
  std::map<std::string, PatternStats> by_cvd_divergence;

  static constexpr std::size_t kRecentWindow = 20;
};

struct PatternMatch {
  std::size_t outcome_index{0};
  double similarity{0.0};
  bool win{false};
  double realized_r{0.0};
};

// -----------------------------------------------------------------------------
// PatternAnalysis — result of matching a new fingerprint against history
// -----------------------------------------------------------------------------
struct PatternAnalysis {
  bool learning_active{false};
  std::vector<PatternMatch> matches;  // Best first
  double matched_win_rate{0.0};
  double baseline_win_rate{0.0};
  double matched_avg_r{0.0};
  double confidence_adjustment{0.0};
  std::string summary;
};

}  // namespace domain
}  // namespace tactical
