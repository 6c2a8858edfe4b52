#include "tactical/backtest/backtest_simulator.hpp"
#include "tactical/analysis/indicators.hpp"
#include "tactical/analysis/regime_classifier.hpp"
#include "tactical/concurrent/id_generator.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/learning/pattern_learner.hpp"
#include "tactical/monitor/position_monitor.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/risk/execution_gate.hpp"
#include "tactical/signal/signal_pipeline.hpp"
#include "tactical/storage/json_codec.hpp"
#include "tactical/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tactical {

namespace {

constexpr std::size_t kAtrHistoryBars = 100;
constexpr std::size_t kVolumeAverageBars = 20;

// Full indicator series, computed once per replay. Every function in
// tactical::indicators is causal, so value i only depends on bars [0, i].
struct SeriesSet {
  std::vector<double> closes;
  std::vector<double> ema_fast_low, ema_slow_low;
  std::vector<double> ema_fast_normal, ema_slow_normal;
  std::vector<double> ema_fast_high, ema_slow_high;
  std::vector<double> ema_200;
  std::vector<double> rsi;
  std::vector<double> atr, atr_sma, atr_stddev;
  std::vector<double> adx;
  indicators::MacdSeries macd;
};

SeriesSet computeSeries(const std::vector<domain::Candle>& candles) {
  SeriesSet s;
  s.closes = indicators::closes(candles);
  s.ema_fast_low = indicators::ema(s.closes, 27);
  s.ema_slow_low = indicators::ema(s.closes, 72);
  s.ema_fast_normal = indicators::ema(s.closes, 21);
  s.ema_slow_normal = indicators::ema(s.closes, 55);
  s.ema_fast_high = indicators::ema(s.closes, 15);
  s.ema_slow_high = indicators::ema(s.closes, 39);
  s.ema_200 = indicators::ema(s.closes, 200);
  s.rsi = indicators::rsi(s.closes, 14);
  s.atr = indicators::atr(candles, 14);
  s.atr_sma = indicators::sma(s.atr, 100);
  s.atr_stddev = indicators::rollingStdDev(s.atr, 100);
  s.adx = indicators::adx(candles, 14);
  s.macd = indicators::macd(s.closes);
  return s;
}

domain::MarketSnapshot buildSnapshot(const std::vector<domain::Candle>& candles,
                                     const SeriesSet& s, std::size_t i,
                                     const BacktestOptions& options) {
  domain::MarketSnapshot snap;
  snap.symbol = options.symbol;
  snap.timestamp_ms = candles[i].open_time_ms;
  snap.price = candles[i].close;

  const std::size_t window = std::max<std::size_t>(options.snapshot_window,
                                                   SignalPipeline::kMinCandles);
  const std::size_t begin = i + 1 > window ? i + 1 - window : 0;
  snap.candles.assign(candles.begin() + begin, candles.begin() + i + 1);

  auto& ind = snap.indicators;
  ind.rsi = s.rsi[i];
  ind.macd_line = s.macd.line[i];
  ind.macd_signal = s.macd.signal[i];
  ind.macd_histogram = s.macd.histogram[i];
  ind.prev_macd_histogram = i > 0 ? s.macd.histogram[i - 1] : 0.0;
  ind.adx = s.adx[i];
  ind.atr = s.atr[i];
  ind.atr_sma = s.atr_sma[i];
  ind.atr_stddev = s.atr_stddev[i];
  const std::size_t atr_begin = i + 1 > kAtrHistoryBars ? i + 1 - kAtrHistoryBars : 0;
  ind.atr_history.assign(s.atr.begin() + atr_begin, s.atr.begin() + i + 1);
  ind.ema_200 = s.ema_200[i];

  const auto regime =
      RegimeClassifier::classify(ind.atr, ind.atr_sma, ind.atr_stddev, ind.adx);
  const std::vector<double>* fast = &s.ema_fast_normal;
  const std::vector<double>* slow = &s.ema_slow_normal;
  if (regime == domain::Regime::LowVol ||
      regime == domain::Regime::Contraction) {
    fast = &s.ema_fast_low;
    slow = &s.ema_slow_low;
  } else if (regime == domain::Regime::HighVol ||
             regime == domain::Regime::Expansion) {
    fast = &s.ema_fast_high;
    slow = &s.ema_slow_high;
  }
  ind.ema_fast = (*fast)[i];
  ind.ema_slow = (*slow)[i];
  ind.prev_ema_fast = i > 0 ? (*fast)[i - 1] : ind.ema_fast;
  ind.prev_ema_slow = i > 0 ? (*slow)[i - 1] : ind.ema_slow;

  const std::size_t vol_begin =
      i + 1 > kVolumeAverageBars ? i + 1 - kVolumeAverageBars : 0;
  double vol_sum = 0.0;
  for (std::size_t k = vol_begin; k <= i; ++k) {
    vol_sum += candles[k].volume;
  }
  const double vol_avg = vol_sum / static_cast<double>(i + 1 - vol_begin);
  ind.volume_ratio = vol_avg > 0.0 ? candles[i].volume / vol_avg : 1.0;

  return snap;
}

void accumulate(std::map<std::string, CategoryStats>& stats,
                const std::string& key, const BacktestTrade& trade,
                std::map<std::string, double>& r_sums) {
  auto& c = stats[key];
  ++c.count;
  if (trade.net_pnl > 0.0) {
    ++c.wins;
  }
  r_sums[key] += trade.realized_r;
}

void finalize(std::map<std::string, CategoryStats>& stats,
              const std::map<std::string, double>& r_sums) {
  for (auto& [key, c] : stats) {
    if (c.count == 0) {
      continue;
    }
    c.win_rate = static_cast<double>(c.wins) / c.count;
    c.avg_r = r_sums.at(key) / c.count;
  }
}

}  // namespace

BacktestSimulator::BacktestSimulator(domain::TacticalConfig config,
                                     BacktestOptions options)
    : config_(std::move(config)), options_(std::move(options)) {
  // Executions are driven explicitly, never through the bus.
  config_.auto_execute = false;
}

std::vector<double> BacktestSimulator::intraBarPath(
    const domain::Candle& candle) {
  if (candle.close >= candle.open) {
    return {candle.open, candle.low, candle.high, candle.close};
  }
  return {candle.open, candle.high, candle.low, candle.close};
}

// -----------------------------------------------------------------------------
// run
// -----------------------------------------------------------------------------
BacktestResult BacktestSimulator::run(const std::vector<domain::Candle>& candles,
                                      domain::PatternLearningState learning) const {
  if (candles.size() < kMinCandles) {
    throw std::invalid_argument("backtest needs at least " +
                                std::to_string(kMinCandles) + " candles, got " +
                                std::to_string(candles.size()));
  }

  const SeriesSet series = computeSeries(candles);
  const std::size_t start = std::max(options_.start_index, kMinCandles);

  SimulationTimeProvider clock(candles[std::min(start, candles.size() - 1)].open_time_ms);
  IdGenerator ids;
  EventBus bus;
  domain::CircuitBreakerState breaker_state;
  breaker_state.daily_loss_limit = config_.daily_loss_limit;
  CircuitBreaker breaker(breaker_state, clock);
  PositionMonitor monitor(bus, breaker, config_, ids,
                          PositionMonitor::Options{true});
  ExecutionGate gate(bus, monitor, breaker, ids, clock, config_);

  domain::SignalHistoryState history;

  BacktestResult result;
  result.initial_equity = config_.initial_balance;
  double equity = config_.initial_balance;
  double peak = equity;

  auto record = [&](const std::vector<PositionClosedEvent>& closed) {
    for (const auto& e : closed) {
      BacktestTrade t;
      t.signal_id = e.position.signal_id;
      t.direction = e.position.direction;
      t.regime = e.position.fingerprint.regime;
      t.trend_type = e.position.fingerprint.trend_type;
      t.cvd_divergence = e.position.fingerprint.cvd_divergence;
      t.entry_time_ms = e.journal.entry_time_ms;
      t.exit_time_ms = e.journal.exit_time_ms;
      t.entry_price = e.journal.entry_price;
      t.exit_price = e.journal.exit_price;
      t.reason = e.reason;
      t.gross_pnl = e.journal.pnl;
      const double exposure = e.position.size * e.position.leverage;
      t.fees = (t.entry_price + t.exit_price) * exposure *
               (config_.taker_fee_pct / 100.0);
      t.net_pnl = t.gross_pnl - t.fees;
      t.realized_r = e.outcome.realized_r;
      t.targets_hit = e.outcome.targets_hit;

      equity += t.net_pnl;
      result.total_fees += t.fees;
      if (options_.learning_feedback) {
        learning = PatternLearner::addOutcome(learning, e.outcome);
      }
      result.trades.push_back(std::move(t));
    }
  };

  for (std::size_t i = start; i < candles.size(); ++i) {
    const auto& bar = candles[i];
    const std::int64_t now = bar.open_time_ms;
    clock.advance_time(now);

    // --- 1. Manage the open position along the intra-bar path --------------
    if (monitor.openCount() > 0) {
      for (double price : intraBarPath(bar)) {
        record(monitor.updatePrice(options_.symbol, price, now));
      }
    }

    // --- 2. Evaluate the bar ------------------------------------------------
    const auto snapshot = buildSnapshot(candles, series, i, options_);
    const auto eval =
        SignalPipeline::evaluate(snapshot, history, learning, config_, now);
    history = eval.updated_history;

    // --- 3. Execute -----------------------------------------------------------
    if (eval.signal) {
      ++result.signals_generated;
      if (monitor.openCount() > 0) {
        ++result.signals_skipped;
      } else {
        const auto exec =
            gate.requestExecution(*eval.signal, eval.signal->entry_price);
        if (exec.accepted()) {
          record(monitor.updatePrice(options_.symbol, bar.close, now));
        } else {
          ++result.signals_skipped;
        }
      }
    }

    // --- 4. Equity curve ------------------------------------------------------
    double open_pnl = 0.0;
    for (const auto& pos : monitor.getSnapshots()) {
      open_pnl += pos.realized_pnl + pos.unrealized_pnl;
    }
    const double marked = equity + open_pnl;
    peak = std::max(peak, marked);
    const double drawdown = peak > 0.0 ? (peak - marked) / peak : 0.0;
    result.max_drawdown_pct = std::max(result.max_drawdown_pct, drawdown * 100.0);
    result.equity_curve.push_back(EquityPoint{now, marked, drawdown});
    ++result.bars_processed;
  }

  record(monitor.closeAll(domain::CloseReason::EndOfData,
                          candles.back().open_time_ms));

  // --- Statistics -------------------------------------------------------------
  result.final_equity = equity;
  result.total_return_pct =
      result.initial_equity > 0.0
          ? (equity - result.initial_equity) / result.initial_equity * 100.0
          : 0.0;

  double gross_profit = 0.0;
  double gross_loss = 0.0;
  double sum_r = 0.0;
  double sum_net = 0.0;
  std::map<std::string, double> r_regime, r_trend, r_dir, r_cvd;
  for (const auto& t : result.trades) {
    if (t.net_pnl > 0.0) {
      ++result.wins;
      gross_profit += t.net_pnl;
    } else {
      ++result.losses;
      gross_loss += -t.net_pnl;
    }
    sum_r += t.realized_r;
    sum_net += t.net_pnl;
    accumulate(result.by_regime, domain::toString(t.regime), t, r_regime);
    accumulate(result.by_trend_type, domain::toString(t.trend_type), t, r_trend);
    accumulate(result.by_direction, domain::toString(t.direction), t, r_dir);
    accumulate(result.by_cvd_divergence, domain::toString(t.cvd_divergence), t,
               r_cvd);
  }
  finalize(result.by_regime, r_regime);
  finalize(result.by_trend_type, r_trend);
  finalize(result.by_direction, r_dir);
  finalize(result.by_cvd_divergence, r_cvd);

  const auto n = static_cast<double>(result.trades.size());
  if (n > 0) {
    result.win_rate = result.wins / n;
    result.expectancy_r = sum_r / n;
    result.expectancy_dollar = sum_net / n;
  }
  result.profit_factor = gross_loss > 0.0   ? gross_profit / gross_loss
                         : gross_profit > 0.0 ? kMaxProfitFactor
                                              : 0.0;

  std::vector<double> returns;
  for (std::size_t k = 1; k < result.equity_curve.size(); ++k) {
    const double prev = result.equity_curve[k - 1].equity;
    if (prev > 0.0) {
      returns.push_back((result.equity_curve[k].equity - prev) / prev);
    }
  }
  if (returns.size() > 1) {
    const double mean =
        std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double var = 0.0;
    for (double r : returns) {
      var += (r - mean) * (r - mean);
    }
    const double stddev = std::sqrt(var / (returns.size() - 1));
    result.sharpe_ratio = stddev > 0.0 ? mean / stddev * std::sqrt(252.0) : 0.0;
  }

  result.learning = std::move(learning);
  return result;
}

// -----------------------------------------------------------------------------
// loadCandles
// -----------------------------------------------------------------------------
std::vector<domain::Candle> BacktestSimulator::loadCandles(
    const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open candle file " + path);
  }
  const auto j = nlohmann::json::parse(in);
  const auto& rows = j.is_object() ? j.at("candles") : j;
  auto candles = rows.get<std::vector<domain::Candle>>();
  std::cout << "[Backtest] Loaded " << candles.size() << " candles from "
            << path << "\n";
  return candles;
}

// -----------------------------------------------------------------------------
// formatReport
// -----------------------------------------------------------------------------
std::string BacktestSimulator::formatReport(const BacktestResult& r) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << "=== Backtest report ===\n"
      << "Bars processed:   " << r.bars_processed << "\n"
      << "Signals:          " << r.signals_generated << " generated, "
      << r.signals_skipped << " skipped\n"
      << "Trades:           " << r.trades.size() << " (" << r.wins << "W / "
      << r.losses << "L)\n"
      << "Win rate:         " << r.win_rate * 100.0 << "%\n"
      << "Profit factor:    " << r.profit_factor << "\n"
      << "Expectancy:       " << r.expectancy_r << "R ($"
      << r.expectancy_dollar << ")\n"
      << "Total return:     " << r.total_return_pct << "%\n"
      << "Max drawdown:     " << r.max_drawdown_pct << "%\n"
      << "Sharpe ratio:     " << r.sharpe_ratio << "\n"
      << "Fees paid:        $" << r.total_fees << "\n"
      << "Final equity:     $" << r.final_equity << "\n";

  auto section = [&out](const char* title,
                        const std::map<std::string, CategoryStats>& stats) {
    out << title << ":\n";
    for (const auto& [key, c] : stats) {
      out << "  " << key << ": " << c.count << " trades, "
          << c.win_rate * 100.0 << "% WR, " << c.avg_r << "R avg\n";
    }
  };
  section("By regime", r.by_regime);
  section("By trend type", r.by_trend_type);
  section("By direction", r.by_direction);
  section("By CVD divergence", r.by_cvd_divergence);
  return out.str();
}

}  // namespace tactical
