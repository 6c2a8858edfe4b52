#include "tactical/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace tactical {
namespace indicators {

std::vector<double> closes(const std::vector<domain::Candle>& candles) {
  std::vector<double> out;
  out.reserve(candles.size());
  for (const auto& c : candles) {
    out.push_back(c.close);
  }
  return out;
}

std::vector<double> ema(const std::vector<double>& values, int period) {
  std::vector<double> out(values.size(), 0.0);
  if (values.empty() || period <= 0) {
    return out;
  }
  const double alpha = 2.0 / (period + 1.0);
  out[0] = values[0];
  for (std::size_t i = 1; i < values.size(); ++i) {
    out[i] = alpha * values[i] + (1.0 - alpha) * out[i - 1];
  }
  return out;
}

std::vector<double> sma(const std::vector<double>& values, int period) {
  std::vector<double> out(values.size(), 0.0);
  if (period <= 0) {
    return out;
  }
  double window_sum = 0.0;
  for (std::size_t i = 0; i < values.size(); ++i) {
    window_sum += values[i];
    if (i >= static_cast<std::size_t>(period)) {
      window_sum -= values[i - period];
    }
    std::size_t n = std::min<std::size_t>(i + 1, period);
    out[i] = window_sum / static_cast<double>(n);
  }
  return out;
}

std::vector<double> rollingStdDev(const std::vector<double>& values,
                                  int period) {
  std::vector<double> out(values.size(), 0.0);
  if (period <= 0) {
    return out;
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::size_t begin = (i + 1 >= static_cast<std::size_t>(period))
                            ? i + 1 - period
                            : 0;
    std::size_t n = i + 1 - begin;
    double mean = 0.0;
    for (std::size_t j = begin; j <= i; ++j) {
      mean += values[j];
    }
    mean /= static_cast<double>(n);
    double var = 0.0;
    for (std::size_t j = begin; j <= i; ++j) {
      var += (values[j] - mean) * (values[j] - mean);
    }
    out[i] = std::sqrt(var / static_cast<double>(n));
  }
  return out;
}

// Seeded with the simple mean of the first `period` values, then
// rma[i] = (rma[i-1] * (period - 1) + v[i]) / period.
std::vector<double> rma(const std::vector<double>& values, int period) {
  std::vector<double> out(values.size(), 0.0);
  if (values.empty() || period <= 0) {
    return out;
  }
  double seed = 0.0;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i < static_cast<std::size_t>(period)) {
      seed += values[i];
      out[i] = seed / static_cast<double>(i + 1);
      continue;
    }
    out[i] = (out[i - 1] * (period - 1) + values[i]) / period;
  }
  return out;
}

std::vector<double> rsi(const std::vector<double>& closes, int period) {
  std::vector<double> out(closes.size(), 50.0);
  if (closes.size() < 2) {
    return out;
  }
  std::vector<double> gains(closes.size(), 0.0);
  std::vector<double> losses(closes.size(), 0.0);
  for (std::size_t i = 1; i < closes.size(); ++i) {
    double change = closes[i] - closes[i - 1];
    gains[i] = std::max(change, 0.0);
    losses[i] = std::max(-change, 0.0);
  }
  auto avg_gain = rma(gains, period);
  auto avg_loss = rma(losses, period);
  for (std::size_t i = 1; i < closes.size(); ++i) {
    if (avg_loss[i] == 0.0) {
      out[i] = avg_gain[i] == 0.0 ? 50.0 : 100.0;
      continue;
    }
    double rs = avg_gain[i] / avg_loss[i];
    out[i] = 100.0 - 100.0 / (1.0 + rs);
  }
  return out;
}

std::vector<double> trueRange(const std::vector<domain::Candle>& candles) {
  std::vector<double> out(candles.size(), 0.0);
  for (std::size_t i = 0; i < candles.size(); ++i) {
    const auto& c = candles[i];
    if (i == 0) {
      out[i] = c.high - c.low;
      continue;
    }
    double prev_close = candles[i - 1].close;
    out[i] = std::max({c.high - c.low, std::abs(c.high - prev_close),
                       std::abs(c.low - prev_close)});
  }
  return out;
}

std::vector<double> atr(const std::vector<domain::Candle>& candles,
                        int period) {
  return rma(trueRange(candles), period);
}

std::vector<double> adx(const std::vector<domain::Candle>& candles,
                        int period) {
  const std::size_t n = candles.size();
  std::vector<double> plus_dm(n, 0.0);
  std::vector<double> minus_dm(n, 0.0);
  for (std::size_t i = 1; i < n; ++i) {
    double up = candles[i].high - candles[i - 1].high;
    double down = candles[i - 1].low - candles[i].low;
    plus_dm[i] = (up > down && up > 0.0) ? up : 0.0;
    minus_dm[i] = (down > up && down > 0.0) ? down : 0.0;
  }

  auto tr_smooth = rma(trueRange(candles), period);
  auto plus_smooth = rma(plus_dm, period);
  auto minus_smooth = rma(minus_dm, period);

  std::vector<double> dx(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    if (tr_smooth[i] <= 0.0) {
      continue;
    }
    double plus_di = 100.0 * plus_smooth[i] / tr_smooth[i];
    double minus_di = 100.0 * minus_smooth[i] / tr_smooth[i];
    double sum = plus_di + minus_di;
    dx[i] = sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / sum : 0.0;
  }
  return rma(dx, period);
}

MacdSeries macd(const std::vector<double>& closes, int fast, int slow,
                int signal) {
  MacdSeries out;
  auto fast_ema = ema(closes, fast);
  auto slow_ema = ema(closes, slow);
  out.line.resize(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i) {
    out.line[i] = fast_ema[i] - slow_ema[i];
  }
  out.signal = ema(out.line, signal);
  out.histogram.resize(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i) {
    out.histogram[i] = out.line[i] - out.signal[i];
  }
  return out;
}

}  // namespace indicators
}  // namespace tactical
