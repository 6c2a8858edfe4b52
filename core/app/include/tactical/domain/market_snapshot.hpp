#pragma once

#include "tactical/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// Candle — one OHLCV bar
// -----------------------------------------------------------------------------
struct Candle {
  std::int64_t open_time_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// -----------------------------------------------------------------------------
// IndicatorBundle — precomputed technical indicator values for one tick
// -----------------------------------------------------------------------------
//
// @brief  Indicator values supplied alongside the candle window. The live
//         path receives them from the external snapshot provider; the
//         backtest computes them with tactical::indicators.
//
// @details
// "prev_" fields hold the value one bar earlier and are used for crossover
// and slope detection. atr_history is the rolling ATR series (oldest first)
// used to rank the current ATR into a volatility percentile; it may be
// empty, in which case the percentile defaults to 50.
// -----------------------------------------------------------------------------
struct IndicatorBundle {
  double rsi{50.0};

  double macd_line{0.0};
  double macd_signal{0.0};
  double macd_histogram{0.0};
  double prev_macd_histogram{0.0};

  double adx{0.0};

  double atr{0.0};
  double atr_sma{0.0};
  double atr_stddev{0.0};
  std::vector<double> atr_history;

  double ema_fast{0.0};
  double ema_slow{0.0};
  double prev_ema_fast{0.0};
  double prev_ema_slow{0.0};
  double ema_200{0.0};

  /// Current bar volume divided by the recent average bar volume.
  double volume_ratio{1.0};
};

// -----------------------------------------------------------------------------
// OrderFlowBundle — aggregated order-flow statistics
// -----------------------------------------------------------------------------
//
// @details
// cvd is the short-term signed volume delta (recent window); cvd_cumulative
// is the running sum. Pressure percentages are 0-100 and describe the share
// of aggressive buy vs sell volume. updated_at_ms lets the scorer discard
// stale order flow.
// -----------------------------------------------------------------------------
struct OrderFlowBundle {
  double cvd{0.0};
  double cvd_cumulative{0.0};
  double buy_pressure_pct{50.0};
  double sell_pressure_pct{50.0};
  int long_liquidations{0};
  int short_liquidations{0};
  double liquidation_volume{0.0};
  int large_trade_count{0};
  double large_trade_volume{0.0};
  double volume_24h{0.0};
  double avg_volume_24h{0.0};
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// MacroContext — optional sentiment and macro backdrop
// -----------------------------------------------------------------------------
struct MacroContext {
  Bias sentiment{Bias::Neutral};
  double sentiment_score{50.0};  // 0-100 confidence of the sentiment read
  double vix{0.0};
  double dxy{0.0};
};

// -----------------------------------------------------------------------------
// MarketSnapshot — immutable per-tick input to the signal pipeline
// -----------------------------------------------------------------------------
//
// @brief  Everything the core needs to evaluate one instrument at one point
//         in time. Produced outside the core (snapshot feed or backtest
//         replay); the core never fetches data itself.
//
// Thread model:
//   Value type. Copied into events and handed between threads by value.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string symbol;
  std::int64_t timestamp_ms{0};
  double price{0.0};
  std::vector<Candle> candles;  // Oldest first
  IndicatorBundle indicators;
  std::optional<OrderFlowBundle> order_flow;
  std::optional<MacroContext> macro;
};

}  // namespace domain
}  // namespace tactical
