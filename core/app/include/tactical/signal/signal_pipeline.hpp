#pragma once

#include "tactical/consensus/consensus_engine.hpp"
#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/pattern.hpp"
#include "tactical/domain/rejection.hpp"
#include "tactical/domain/scores.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/trade_signal.hpp"
#include "tactical/gating/quality_gate.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// SignalEvaluation — everything one pipeline pass produced
// -----------------------------------------------------------------------------
// Exactly one of signal / rejection is set. The intermediate results are
// filled as far as the pass got, so a rejection can still be explained.
// updated_history is the pruned input history, with the new entry appended
// when a signal was emitted; the caller decides whether to publish it.
// -----------------------------------------------------------------------------
struct SignalEvaluation {
  std::optional<domain::EnhancedTradeSignal> signal;
  std::optional<domain::Rejection> rejection;

  domain::MarketStructure structure;
  domain::TechnicalScore technical;
  std::optional<domain::OrderFlowScore> order_flow;
  GateResult gate;
  CombinedScore combined;
  std::optional<ConsensusResult> consensus;
  domain::PatternAnalysis pattern;
  domain::SignalType signal_type{domain::SignalType::TrendContinuation};

  domain::SignalHistoryState updated_history;
  std::vector<std::string> reasoning;

  bool emitted() const { return signal.has_value(); }
};

enum class SlippageOrder {
  Market,
  Stop,
  Limit,
};

// -----------------------------------------------------------------------------
// SignalPipeline — one synchronous signal-generation pass
// -----------------------------------------------------------------------------
//
// @brief  Composes structure analysis, scoring, quality gates, consensus,
//         pattern learning and validation into a single pure function.
//
// @details
// Stage order (first hard failure wins):
//
//   data check -> structure -> technical + order-flow scores -> direction
//   -> quality gates -> combined score checks -> consensus
//   -> entry/stop/targets -> R:R -> pattern adjustment -> validation
//
// Entry is the live price plus market slippage. Stop distance is ATR times
// 2.0 in HIGH_VOL, 1.2 in LOW_VOL and 1.5 otherwise, with stop slippage
// applied on top. Slippage in basis points is the order-type base (market
// 3, stop 5, limit 2) scaled by min(2 x ATR / (2% of price), 3).
//
// Final confidence:
//   round(consensus.final x gate.penalty_multiplier + pattern adjustment)
//   clamped to [min_confidence, max_confidence].
//
// Signal ids are deterministic: "tactical-<now_ms>-<issued_count>".
//
// Thread model:
//   Reads the supplied states, never mutates them. Safe to call from any
//   thread; the backtest calls it with its own private state copies.
// -----------------------------------------------------------------------------
class SignalPipeline {
 public:
  static constexpr std::size_t kMinCandles = 30;
  static constexpr double kRiskRewardEpsilon = 1e-9;

  static SignalEvaluation evaluate(
      const domain::MarketSnapshot& snapshot,
      const domain::SignalHistoryState& history,
      const domain::PatternLearningState& learning,
      const domain::TacticalConfig& config, std::int64_t now_ms);

  static double applySlippage(double price, bool buy, SlippageOrder order,
                              double atr, double reference_price);

  static double stopMultiplier(domain::Regime regime);

  static domain::SignalType classifySignalType(
      domain::Direction direction, const domain::MarketStructure& structure,
      const domain::IndicatorBundle& indicators);

  /// Drops history entries older than the chop window.
  static domain::SignalHistoryState pruneHistory(
      const domain::SignalHistoryState& history, std::int64_t now_ms,
      int window_seconds);
};

}  // namespace tactical
