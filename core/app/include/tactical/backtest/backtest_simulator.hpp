#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/pattern.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tactical {

struct BacktestOptions {
  std::string symbol{"BTCUSDT"};
  std::size_t start_index{200};     // Raised to kMinCandles if lower
  std::size_t snapshot_window{300};  // Candles handed to each evaluation
  bool learning_feedback{true};      // Feed outcomes back into matching
};

struct BacktestTrade {
  std::string signal_id;
  domain::Direction direction{domain::Direction::Long};
  domain::Regime regime{domain::Regime::Normal};
  domain::TrendType trend_type{domain::TrendType::Ranging};
  domain::CvdDivergence cvd_divergence{domain::CvdDivergence::None};
  std::int64_t entry_time_ms{0};
  std::int64_t exit_time_ms{0};
  double entry_price{0.0};
  double exit_price{0.0};
  domain::CloseReason reason{domain::CloseReason::Manual};
  double gross_pnl{0.0};
  double fees{0.0};
  double net_pnl{0.0};
  double realized_r{0.0};
  std::vector<int> targets_hit;
};

struct CategoryStats {
  int count{0};
  int wins{0};
  double win_rate{0.0};  // 0-1
  double avg_r{0.0};
};

struct EquityPoint {
  std::int64_t time_ms{0};
  double equity{0.0};
  double drawdown{0.0};  // Fraction below the running peak
};

// -----------------------------------------------------------------------------
// BacktestResult — aggregate performance of one replay
// -----------------------------------------------------------------------------
struct BacktestResult {
  std::vector<BacktestTrade> trades;
  std::vector<EquityPoint> equity_curve;

  int bars_processed{0};
  int signals_generated{0};
  int signals_skipped{0};

  int wins{0};
  int losses{0};
  double win_rate{0.0};
  double profit_factor{0.0};
  double expectancy_r{0.0};
  double expectancy_dollar{0.0};
  double total_fees{0.0};
  double initial_equity{0.0};
  double final_equity{0.0};
  double total_return_pct{0.0};
  double max_drawdown_pct{0.0};
  double sharpe_ratio{0.0};

  std::map<std::string, CategoryStats> by_regime;
  std::map<std::string, CategoryStats> by_trend_type;
  std::map<std::string, CategoryStats> by_direction;
  std::map<std::string, CategoryStats> by_cvd_divergence;

  domain::PatternLearningState learning;  // State after the replay
};

// -----------------------------------------------------------------------------
// BacktestSimulator — deterministic replay of the live pipeline
// -----------------------------------------------------------------------------
//
// @brief  Walks forward through OHLCV history, builds a snapshot per bar,
//         runs SignalPipeline, executes through ExecutionGate and manages
//         the position with a private PositionMonitor.
//
// @details
// Per bar i (from start_index, at least 200):
//   1. An open position is marked along the intra-bar path
//        close >= open:  open -> low  -> high -> close
//        close <  open:  open -> high -> low  -> close
//      with the monitor in fill_at_trigger_level mode.
//   2. The snapshot for bar i is built from candles [0, i] with
//      tactical::indicators. EMA periods follow the bar's regime:
//        LOW_VOL / CONTRACTION   27 / 72
//        HIGH_VOL / EXPANSION    15 / 39
//        otherwise               21 / 55
//      Order flow is absent, so only the technical vote is cast.
//   3. SignalPipeline::evaluate() with the replay's own history and
//      learning copies; an emitted signal is executed if no position is
//      open and the gate accepts it.
//   4. Equity (realized minus fees plus open PnL) is appended to the curve.
//
// Taker fees are charged on entry and exit notional. A position still open
// after the last bar closes with reason EndOfData.
//
// Statistics: win rate, profit factor (999.99 when there are no losses),
// expectancy in R and dollars, max drawdown, Sharpe on per-bar returns
// annualized by sqrt(252), total return, and breakdowns by regime, trend
// type, direction and CVD divergence.
//
// Determinism:
//   The simulated clock follows bar open times and every id comes from a
//   private generator, so identical input gives identical output. No state
//   is shared with a live engine.
// -----------------------------------------------------------------------------
class BacktestSimulator {
 public:
  static constexpr std::size_t kMinCandles = 200;
  static constexpr double kMaxProfitFactor = 999.99;

  BacktestSimulator(domain::TacticalConfig config, BacktestOptions options);

  /// Throws std::invalid_argument with fewer than kMinCandles candles.
  BacktestResult run(const std::vector<domain::Candle>& candles,
                     domain::PatternLearningState learning = {}) const;

  /// Reads a JSON array of candles (objects or [t, o, h, l, c, v] rows).
  static std::vector<domain::Candle> loadCandles(const std::string& path);

  static std::vector<double> intraBarPath(const domain::Candle& candle);

  static std::string formatReport(const BacktestResult& result);

 private:
  domain::TacticalConfig config_;
  BacktestOptions options_;
};

}  // namespace tactical
