#include "tactical/storage/json_codec.hpp"
#include "tactical/domain/enum_strings.hpp"

#include <stdexcept>
#include <string>

namespace tactical {
namespace domain {

namespace {

using nlohmann::json;

// Reads an enum stored as its string form. Missing key keeps `fallback`;
// an unrecognised string is a decode error.
template <typename E, typename Parse>
E enumOr(const json& j, const char* key, Parse parse, E fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  const auto text = it->get<std::string>();
  if (auto v = parse(text)) {
    return *v;
  }
  throw std::invalid_argument(std::string("unknown ") + key + " '" + text +
                              "'");
}

template <typename T>
void assignIf(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Snapshot wire format
// -----------------------------------------------------------------------------
void to_json(json& j, const Candle& v) {
  j = json{{"open_time_ms", v.open_time_ms}, {"open", v.open},
           {"high", v.high},                 {"low", v.low},
           {"close", v.close},               {"volume", v.volume}};
}

void from_json(const json& j, Candle& v) {
  // Compact kline form: [open_time, open, high, low, close, volume]
  if (j.is_array()) {
    v.open_time_ms = j.at(0).get<std::int64_t>();
    v.open = j.at(1).get<double>();
    v.high = j.at(2).get<double>();
    v.low = j.at(3).get<double>();
    v.close = j.at(4).get<double>();
    v.volume = j.size() > 5 ? j.at(5).get<double>() : 0.0;
    return;
  }
  assignIf(j, "open_time_ms", v.open_time_ms);
  v.open = j.at("open").get<double>();
  v.high = j.at("high").get<double>();
  v.low = j.at("low").get<double>();
  v.close = j.at("close").get<double>();
  assignIf(j, "volume", v.volume);
}

void to_json(json& j, const IndicatorBundle& v) {
  j = json{{"rsi", v.rsi},
           {"macd_line", v.macd_line},
           {"macd_signal", v.macd_signal},
           {"macd_histogram", v.macd_histogram},
           {"prev_macd_histogram", v.prev_macd_histogram},
           {"adx", v.adx},
           {"atr", v.atr},
           {"atr_sma", v.atr_sma},
           {"atr_stddev", v.atr_stddev},
           {"atr_history", v.atr_history},
           {"ema_fast", v.ema_fast},
           {"ema_slow", v.ema_slow},
           {"prev_ema_fast", v.prev_ema_fast},
           {"prev_ema_slow", v.prev_ema_slow},
           {"ema_200", v.ema_200},
           {"volume_ratio", v.volume_ratio}};
}

void from_json(const json& j, IndicatorBundle& v) {
  assignIf(j, "rsi", v.rsi);
  assignIf(j, "macd_line", v.macd_line);
  assignIf(j, "macd_signal", v.macd_signal);
  assignIf(j, "macd_histogram", v.macd_histogram);
  assignIf(j, "prev_macd_histogram", v.prev_macd_histogram);
  assignIf(j, "adx", v.adx);
  assignIf(j, "atr", v.atr);
  assignIf(j, "atr_sma", v.atr_sma);
  assignIf(j, "atr_stddev", v.atr_stddev);
  assignIf(j, "atr_history", v.atr_history);
  assignIf(j, "ema_fast", v.ema_fast);
  assignIf(j, "ema_slow", v.ema_slow);
  assignIf(j, "prev_ema_fast", v.prev_ema_fast);
  assignIf(j, "prev_ema_slow", v.prev_ema_slow);
  assignIf(j, "ema_200", v.ema_200);
  assignIf(j, "volume_ratio", v.volume_ratio);
}

void to_json(json& j, const OrderFlowBundle& v) {
  j = json{{"cvd", v.cvd},
           {"cvd_cumulative", v.cvd_cumulative},
           {"buy_pressure_pct", v.buy_pressure_pct},
           {"sell_pressure_pct", v.sell_pressure_pct},
           {"long_liquidations", v.long_liquidations},
           {"short_liquidations", v.short_liquidations},
           {"liquidation_volume", v.liquidation_volume},
           {"large_trade_count", v.large_trade_count},
           {"large_trade_volume", v.large_trade_volume},
           {"volume_24h", v.volume_24h},
           {"avg_volume_24h", v.avg_volume_24h},
           {"updated_at_ms", v.updated_at_ms}};
}

void from_json(const json& j, OrderFlowBundle& v) {
  assignIf(j, "cvd", v.cvd);
  assignIf(j, "cvd_cumulative", v.cvd_cumulative);
  assignIf(j, "buy_pressure_pct", v.buy_pressure_pct);
  assignIf(j, "sell_pressure_pct", v.sell_pressure_pct);
  assignIf(j, "long_liquidations", v.long_liquidations);
  assignIf(j, "short_liquidations", v.short_liquidations);
  assignIf(j, "liquidation_volume", v.liquidation_volume);
  assignIf(j, "large_trade_count", v.large_trade_count);
  assignIf(j, "large_trade_volume", v.large_trade_volume);
  assignIf(j, "volume_24h", v.volume_24h);
  assignIf(j, "avg_volume_24h", v.avg_volume_24h);
  assignIf(j, "updated_at_ms", v.updated_at_ms);
}

void to_json(json& j, const MacroContext& v) {
  j = json{{"sentiment", toString(v.sentiment)},
           {"sentiment_score", v.sentiment_score},
           {"vix", v.vix},
           {"dxy", v.dxy}};
}

void from_json(const json& j, MacroContext& v) {
  v.sentiment = enumOr(j, "sentiment", parseBias, Bias::Neutral);
  assignIf(j, "sentiment_score", v.sentiment_score);
  assignIf(j, "vix", v.vix);
  assignIf(j, "dxy", v.dxy);
}

void to_json(json& j, const MarketSnapshot& v) {
  j = json{{"symbol", v.symbol},
           {"timestamp_ms", v.timestamp_ms},
           {"price", v.price},
           {"candles", v.candles},
           {"indicators", v.indicators}};
  if (v.order_flow) {
    j["order_flow"] = *v.order_flow;
  }
  if (v.macro) {
    j["macro"] = *v.macro;
  }
}

void from_json(const json& j, MarketSnapshot& v) {
  v.symbol = j.at("symbol").get<std::string>();
  v.price = j.at("price").get<double>();
  assignIf(j, "timestamp_ms", v.timestamp_ms);
  assignIf(j, "candles", v.candles);
  assignIf(j, "indicators", v.indicators);
  if (auto it = j.find("order_flow"); it != j.end() && !it->is_null()) {
    v.order_flow = it->get<OrderFlowBundle>();
  }
  if (auto it = j.find("macro"); it != j.end() && !it->is_null()) {
    v.macro = it->get<MacroContext>();
  }
}

// -----------------------------------------------------------------------------
// Pattern learning state
// -----------------------------------------------------------------------------
void to_json(json& j, const PatternFingerprint& v) {
  j = json{{"regime", toString(v.regime)},
           {"trend_type", toString(v.trend_type)},
           {"trend_direction", toString(v.trend_direction)},
           {"signal_type", toString(v.signal_type)},
           {"cvd_trend", toString(v.cvd_trend)},
           {"cvd_divergence", toString(v.cvd_divergence)},
           {"near_support", v.near_support},
           {"near_resistance", v.near_resistance},
           {"trend_exhaustion", v.trend_exhaustion},
           {"trend_strength", v.trend_strength},
           {"volatility_percentile", v.volatility_percentile},
           {"rsi", v.rsi},
           {"technical_edge", v.technical_edge},
           {"order_flow_edge", v.order_flow_edge},
           {"consensus_agreement", v.consensus_agreement},
           {"entry_confidence", v.entry_confidence}};
}

void from_json(const json& j, PatternFingerprint& v) {
  v.regime = enumOr(j, "regime", parseRegime, Regime::Normal);
  v.trend_type = enumOr(j, "trend_type", parseTrendType, TrendType::Ranging);
  v.trend_direction = enumOr(j, "trend_direction", parseTrendDirection,
                             TrendDirection::Neutral);
  v.signal_type = enumOr(j, "signal_type", parseSignalType,
                         SignalType::TrendContinuation);
  v.cvd_trend = enumOr(j, "cvd_trend", parseCvdTrend, CvdTrend::Neutral);
  v.cvd_divergence = enumOr(j, "cvd_divergence", parseCvdDivergence,
                            CvdDivergence::None);
  assignIf(j, "near_support", v.near_support);
  assignIf(j, "near_resistance", v.near_resistance);
  assignIf(j, "trend_exhaustion", v.trend_exhaustion);
  assignIf(j, "trend_strength", v.trend_strength);
  assignIf(j, "volatility_percentile", v.volatility_percentile);
  assignIf(j, "rsi", v.rsi);
  assignIf(j, "technical_edge", v.technical_edge);
  assignIf(j, "order_flow_edge", v.order_flow_edge);
  assignIf(j, "consensus_agreement", v.consensus_agreement);
  assignIf(j, "entry_confidence", v.entry_confidence);
}

void to_json(json& j, const TradeOutcome& v) {
  j = json{{"signal_id", v.signal_id},
           {"symbol", v.symbol},
           {"direction", toString(v.direction)},
           {"fingerprint", v.fingerprint},
           {"entry_price", v.entry_price},
           {"exit_price", v.exit_price},
           {"entry_time_ms", v.entry_time_ms},
           {"exit_time_ms", v.exit_time_ms},
           {"exit_reason", toString(v.exit_reason)},
           {"realized_r", v.realized_r},
           {"realized_pnl", v.realized_pnl},
           {"max_favorable_pct", v.max_favorable_pct},
           {"max_adverse_pct", v.max_adverse_pct},
           {"duration_ms", v.duration_ms},
           {"targets_hit", v.targets_hit}};
}

void from_json(const json& j, TradeOutcome& v) {
  assignIf(j, "signal_id", v.signal_id);
  assignIf(j, "symbol", v.symbol);
  v.direction = enumOr(j, "direction", parseDirection, Direction::Long);
  assignIf(j, "fingerprint", v.fingerprint);
  assignIf(j, "entry_price", v.entry_price);
  assignIf(j, "exit_price", v.exit_price);
  assignIf(j, "entry_time_ms", v.entry_time_ms);
  assignIf(j, "exit_time_ms", v.exit_time_ms);
  v.exit_reason =
      enumOr(j, "exit_reason", parseCloseReason, CloseReason::Manual);
  v.realized_r = j.at("realized_r").get<double>();
  assignIf(j, "realized_pnl", v.realized_pnl);
  assignIf(j, "max_favorable_pct", v.max_favorable_pct);
  assignIf(j, "max_adverse_pct", v.max_adverse_pct);
  assignIf(j, "duration_ms", v.duration_ms);
  assignIf(j, "targets_hit", v.targets_hit);
}

void to_json(json& j, const PatternStats& v) {
  j = json{{"total", v.total},
           {"wins", v.wins},
           {"losses", v.losses},
           {"win_rate", v.win_rate},
           {"avg_win_r", v.avg_win_r},
           {"avg_loss_r", v.avg_loss_r},
           {"profit_factor", v.profit_factor},
           {"expectancy", v.expectancy}};
}

void from_json(const json& j, PatternStats& v) {
  assignIf(j, "total", v.total);
  assignIf(j, "wins", v.wins);
  assignIf(j, "losses", v.losses);
  assignIf(j, "win_rate", v.win_rate);
  assignIf(j, "avg_win_r", v.avg_win_r);
  assignIf(j, "avg_loss_r", v.avg_loss_r);
  assignIf(j, "profit_factor", v.profit_factor);
  assignIf(j, "expectancy", v.expectancy);
}

void to_json(json& j, const PatternLearningState& v) {
  j = json{{"outcomes", v.outcomes},
           {"overall", v.overall},
           {"recent", v.recent},
           {"by_regime", v.by_regime},
           {"by_trend_type", v.by_trend_type},
           {"by_signal_type", v.by_signal_type},
           {"by_cvd_divergence", v.by_cvd_divergence}};
}

void from_json(const json& j, PatternLearningState& v) {
  assignIf(j, "outcomes", v.outcomes);
  assignIf(j, "overall", v.overall);
  assignIf(j, "recent", v.recent);
  assignIf(j, "by_regime", v.by_regime);
  assignIf(j, "by_trend_type", v.by_trend_type);
  assignIf(j, "by_signal_type", v.by_signal_type);
  assignIf(j, "by_cvd_divergence", v.by_cvd_divergence);
}

// -----------------------------------------------------------------------------
// Signal history and circuit breaker
// -----------------------------------------------------------------------------
void to_json(json& j, const SignalHistoryEntry& v) {
  j = json{{"signal_id", v.signal_id},
           {"timestamp_ms", v.timestamp_ms},
           {"direction", toString(v.direction)},
           {"price", v.price}};
}

void from_json(const json& j, SignalHistoryEntry& v) {
  assignIf(j, "signal_id", v.signal_id);
  v.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  v.direction = enumOr(j, "direction", parseDirection, Direction::Long);
  assignIf(j, "price", v.price);
}

void to_json(json& j, const SignalHistoryState& v) {
  j = json{{"entries", v.entries},
           {"last_signal_ms", v.last_signal_ms},
           {"issued_count", v.issued_count}};
}

void from_json(const json& j, SignalHistoryState& v) {
  assignIf(j, "entries", v.entries);
  assignIf(j, "last_signal_ms", v.last_signal_ms);
  assignIf(j, "issued_count", v.issued_count);
}

void to_json(json& j, const CircuitBreakerState& v) {
  j = json{{"daily_pnl", v.daily_pnl},
           {"daily_loss_limit", v.daily_loss_limit},
           {"tripped", v.tripped},
           {"last_reset_date", v.last_reset_date},
           {"tripped_at_ms", nullptr}};
  if (v.tripped_at_ms) {
    j["tripped_at_ms"] = *v.tripped_at_ms;
  }
}

void from_json(const json& j, CircuitBreakerState& v) {
  assignIf(j, "daily_pnl", v.daily_pnl);
  assignIf(j, "daily_loss_limit", v.daily_loss_limit);
  assignIf(j, "tripped", v.tripped);
  assignIf(j, "last_reset_date", v.last_reset_date);
  if (auto it = j.find("tripped_at_ms"); it != j.end() && !it->is_null()) {
    v.tripped_at_ms = it->get<std::int64_t>();
  } else {
    v.tripped_at_ms.reset();
  }
}

// -----------------------------------------------------------------------------
// Telemetry payloads
// -----------------------------------------------------------------------------
void to_json(json& j, const TargetLevel& v) {
  j = json{{"price", v.price},
           {"r_multiple", v.r_multiple},
           {"position_pct", v.position_pct},
           {"status", toString(v.status)},
           {"fill_price", v.fill_price},
           {"filled_at_ms", v.filled_at_ms}};
}

void to_json(json& j, const EnhancedTradeSignal& v) {
  j = json{{"id", v.id},
           {"symbol", v.symbol},
           {"direction", toString(v.direction)},
           {"entry_price", v.entry_price},
           {"entry_zone", {v.entry_zone_low, v.entry_zone_high}},
           {"stop_loss", v.stop_loss},
           {"current_stop", v.current_stop},
           {"trailing_stop", v.trailing_stop},
           {"targets", v.targets},
           {"risk_reward", v.risk_reward},
           {"confidence", v.confidence},
           {"decayed_confidence", v.decayed_confidence},
           {"regime", toString(v.regime)},
           {"status", toString(v.status)},
           {"source", toString(v.source)},
           {"approval_status", toString(v.approval_status)},
           {"created_at_ms", v.created_at_ms},
           {"atr_at_entry", v.atr_at_entry},
           {"suggested_position_size", v.suggested_position_size},
           {"remaining_fraction", v.remaining_fraction},
           {"realized_pnl", v.realized_pnl},
           {"unrealized_pnl", v.unrealized_pnl},
           {"fingerprint", v.fingerprint},
           {"reasoning", v.reasoning}};
  j["break_even_price"] =
      v.break_even_price ? json(*v.break_even_price) : json(nullptr);
}

void to_json(json& j, const Position& v) {
  j = json{{"id", v.id},
           {"signal_id", v.signal_id},
           {"symbol", v.symbol},
           {"direction", toString(v.direction)},
           {"entry_price", v.entry_price},
           {"size", v.size},
           {"leverage", v.leverage},
           {"liquidation_price", v.liquidation_price},
           {"stop_loss", v.stop_loss},
           {"take_profit", v.take_profit},
           {"unrealized_pnl", v.unrealized_pnl},
           {"unrealized_pnl_pct", v.unrealized_pnl_pct},
           {"realized_pnl", v.realized_pnl},
           {"remaining_fraction", v.remaining_fraction},
           {"targets", v.targets},
           {"break_even_moved", v.break_even_moved},
           {"opened_at_ms", v.opened_at_ms},
           {"state", toString(v.state)}};
}

void to_json(json& j, const JournalEntry& v) {
  j = json{{"id", v.id},
           {"position_id", v.position_id},
           {"symbol", v.symbol},
           {"direction", toString(v.direction)},
           {"entry_price", v.entry_price},
           {"exit_price", v.exit_price},
           {"size", v.size},
           {"leverage", v.leverage},
           {"pnl", v.pnl},
           {"pnl_pct", v.pnl_pct},
           {"entry_time_ms", v.entry_time_ms},
           {"exit_time_ms", v.exit_time_ms},
           {"reason", toString(v.reason)},
           {"notes", v.notes},
           {"tags", v.tags},
           {"result", toString(v.result)}};
}

void to_json(json& j, const Rejection& v) {
  j = json{{"stage", toString(v.stage)}, {"reason", v.reason}};
}

}  // namespace domain
}  // namespace tactical
