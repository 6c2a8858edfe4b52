#pragma once

#include "tactical/domain/market_snapshot.hpp"

#include <vector>

namespace tactical {
namespace indicators {

// -----------------------------------------------------------------------------
// Technical indicator series
// -----------------------------------------------------------------------------
//
// @brief  Stateless functions computing full indicator series from price
//         history. Every returned vector has the same length as its input
//         so that index i of the result lines up with bar i.
//
// @details
// The live path receives indicator values from the snapshot provider; these
// functions exist so the backtest (and tests) can derive the exact same
// IndicatorBundle from raw candles.
//
// Warm-up convention: values before an indicator has enough history are
// filled with the best available partial estimate (EMA seeded with the first
// value, Wilder averages seeded with a simple mean) instead of NaN, so
// downstream code never has to test for NaN. Callers that need fully warmed
// values must skip the first `period` bars themselves.
//
// Thread-safety: Pure functions. Safe from any thread.
// -----------------------------------------------------------------------------

std::vector<double> closes(const std::vector<domain::Candle>& candles);

/// Exponential moving average with alpha = 2 / (period + 1).
std::vector<double> ema(const std::vector<double>& values, int period);

/// Simple moving average over a trailing window (partial window at start).
std::vector<double> sma(const std::vector<double>& values, int period);

/// Population standard deviation over a trailing window.
std::vector<double> rollingStdDev(const std::vector<double>& values,
                                  int period);

/// Wilder's running moving average (RMA).
std::vector<double> rma(const std::vector<double>& values, int period);

/// Wilder RSI on closes.
std::vector<double> rsi(const std::vector<double>& closes, int period = 14);

std::vector<double> trueRange(const std::vector<domain::Candle>& candles);

/// ATR = RMA(true range).
std::vector<double> atr(const std::vector<domain::Candle>& candles,
                        int period = 14);

/// Wilder ADX.
std::vector<double> adx(const std::vector<domain::Candle>& candles,
                        int period = 14);

struct MacdSeries {
  std::vector<double> line;
  std::vector<double> signal;
  std::vector<double> histogram;
};

MacdSeries macd(const std::vector<double>& closes, int fast = 12,
                int slow = 26, int signal = 9);

}  // namespace indicators
}  // namespace tactical
