#include "tactical/analysis/structure_analyzer.hpp"
#include "tactical/analysis/regime_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace tactical {

namespace {

using domain::Candle;

bool isPivotHigh(const std::vector<Candle>& c, std::size_t j) {
  return c[j].high > c[j - 1].high && c[j].high > c[j - 2].high &&
         c[j].high > c[j + 1].high && c[j].high > c[j + 2].high;
}

bool isPivotLow(const std::vector<Candle>& c, std::size_t j) {
  return c[j].low < c[j - 1].low && c[j].low < c[j - 2].low &&
         c[j].low < c[j + 1].low && c[j].low < c[j + 2].low;
}

// Mean (high - low) over candles [begin, end).
double meanRange(const std::vector<Candle>& c, std::size_t begin,
                 std::size_t end) {
  if (end <= begin) {
    return 0.0;
  }
  double sum = 0.0;
  for (std::size_t i = begin; i < end; ++i) {
    sum += c[i].high - c[i].low;
  }
  return sum / static_cast<double>(end - begin);
}

}  // namespace

// -----------------------------------------------------------------------------
// volatilityPercentile
// -----------------------------------------------------------------------------
double StructureAnalyzer::volatilityPercentile(
    const std::vector<double>& history, double current) {
  if (history.empty()) {
    return 50.0;
  }
  // Only the most recent 200 values take part in the ranking.
  const std::size_t n = std::min<std::size_t>(history.size(), 200);
  std::vector<double> sorted(history.end() - n, history.end());
  std::sort(sorted.begin(), sorted.end());
  auto it = std::lower_bound(sorted.begin(), sorted.end(), current);
  auto rank = static_cast<double>(std::distance(sorted.begin(), it));
  return rank / static_cast<double>(sorted.size()) * 100.0;
}

// -----------------------------------------------------------------------------
// detectLevels
// -----------------------------------------------------------------------------
std::vector<domain::StructureLevel> StructureAnalyzer::detectLevels(
    const std::vector<Candle>& candles, double price) {
  std::vector<domain::StructureLevel> raw;
  const std::size_t n = candles.size();

  if (n >= 5) {
    const std::size_t first =
        n > static_cast<std::size_t>(kLevelLookback) ? n - kLevelLookback : 2;
    for (std::size_t j = std::max<std::size_t>(first, 2); j + 2 < n; ++j) {
      if (isPivotHigh(candles, j)) {
        raw.push_back({candles[j].high, domain::LevelType::Resistance, 1,
                       domain::LevelSource::Swing});
      }
      if (isPivotLow(candles, j)) {
        raw.push_back({candles[j].low, domain::LevelType::Support, 1,
                       domain::LevelSource::Swing});
      }
    }
  }

  // Round numbers: pick the step from the recent trading range.
  if (n > 0 && price > 0.0) {
    const std::size_t begin = n > 50 ? n - 50 : 0;
    double hi = candles[begin].high;
    double lo = candles[begin].low;
    for (std::size_t i = begin; i < n; ++i) {
      hi = std::max(hi, candles[i].high);
      lo = std::min(lo, candles[i].low);
    }
    const double range = hi - lo;
    const double step = range > 5000.0   ? 1000.0
                        : range > 1000.0 ? 500.0
                        : range > 100.0  ? 100.0
                                         : 50.0;
    const double nearest = std::round(price / step) * step;
    for (int offset = -3; offset <= 3; ++offset) {
      double level = nearest + offset * step;
      if (level <= 0.0) {
        continue;
      }
      raw.push_back({level,
                     level > price ? domain::LevelType::Resistance
                                   : domain::LevelType::Support,
                     2, domain::LevelSource::RoundNumber});
    }
  }

  std::sort(raw.begin(), raw.end(),
            [](const auto& a, const auto& b) { return a.price < b.price; });

  std::vector<domain::StructureLevel> clustered;
  const double threshold = price * kClusterPct;
  for (const auto& level : raw) {
    auto it = std::find_if(clustered.begin(), clustered.end(),
                           [&](const domain::StructureLevel& c) {
                             return c.type == level.type &&
                                    std::abs(c.price - level.price) <
                                        threshold;
                           });
    if (it != clustered.end()) {
      it->strength = std::min(kMaxLevelStrength, it->strength + 1);
      it->price = (it->price + level.price) / 2.0;
    } else {
      clustered.push_back(level);
    }
  }
  return clustered;
}

// -----------------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------------
domain::MarketStructure StructureAnalyzer::analyze(
    const domain::MarketSnapshot& snap, bool use_structure_levels) {
  domain::MarketStructure ms;
  const auto& candles = snap.candles;
  const auto& ind = snap.indicators;
  const std::size_t n = candles.size();
  const double price = snap.price;

  // --- 1. Swing pivots --------------------------------------------------------
  std::vector<double> swing_highs;
  std::vector<double> swing_lows;
  if (n >= 5) {
    const std::size_t last = n - 1;
    const std::size_t lookback =
        std::min<std::size_t>(kSwingLookback, last >= 4 ? last - 4 : 0);
    const std::size_t first = std::max<std::size_t>(2, last - lookback);
    for (std::size_t j = first; j + 2 <= last; ++j) {
      if (isPivotHigh(candles, j)) {
        swing_highs.push_back(candles[j].high);
      }
      if (isPivotLow(candles, j)) {
        swing_lows.push_back(candles[j].low);
      }
    }
  }
  for (std::size_t j = 1; j < swing_highs.size(); ++j) {
    if (swing_highs[j] > swing_highs[j - 1]) {
      ++ms.higher_highs;
    } else {
      ++ms.lower_highs;
    }
  }
  for (std::size_t j = 1; j < swing_lows.size(); ++j) {
    if (swing_lows[j] > swing_lows[j - 1]) {
      ++ms.higher_lows;
    } else {
      ++ms.lower_lows;
    }
  }

  // --- 2. Ranges, exhaustion and trend ----------------------------------------
  const double recent_range = n >= 5 ? meanRange(candles, n - 5, n) : 0.0;
  const double prev_range = n >= 10 ? meanRange(candles, n - 10, n - 5) : 0.0;
  ms.trend_exhaustion =
      prev_range > 0.0 && recent_range < prev_range * kExhaustionRatio;
  const bool expanding =
      prev_range > 0.0 && recent_range > prev_range * kExpansionRatio;

  if (ms.higher_highs >= 2 && ms.higher_lows >= 2) {
    ms.trend_direction = domain::TrendDirection::Up;
  } else if (ms.lower_highs >= 2 && ms.lower_lows >= 2) {
    ms.trend_direction = domain::TrendDirection::Down;
  }

  double window_high = 0.0;
  double window_low = 0.0;
  if (n > 0) {
    const std::size_t begin = n > kRangeWindow ? n - kRangeWindow : 0;
    window_high = candles[begin].high;
    window_low = candles[begin].low;
    for (std::size_t i = begin; i < n; ++i) {
      window_high = std::max(window_high, candles[i].high);
      window_low = std::min(window_low, candles[i].low);
    }
  }

  if (ms.trend_direction != domain::TrendDirection::Neutral) {
    ms.trend_type = ind.adx >= 25.0 ? domain::TrendType::StrongTrend
                                    : domain::TrendType::WeakTrend;
  } else if (n > kRangeWindow && expanding) {
    // Prior range excludes the last bar so the breakout bar can exceed it.
    const std::size_t begin = n - 1 - kRangeWindow;
    double prior_high = candles[begin].high;
    double prior_low = candles[begin].low;
    for (std::size_t i = begin; i + 1 < n; ++i) {
      prior_high = std::max(prior_high, candles[i].high);
      prior_low = std::min(prior_low, candles[i].low);
    }
    const double last_close = candles[n - 1].close;
    if (last_close > prior_high) {
      ms.trend_type = domain::TrendType::Breakout;
      ms.trend_direction = domain::TrendDirection::Up;
    } else if (last_close < prior_low) {
      ms.trend_type = domain::TrendType::Breakout;
      ms.trend_direction = domain::TrendDirection::Down;
    }
  }

  // --- 3. Proximity to the recent range extremes ------------------------------
  const double window = window_high - window_low;
  if (window > 0.0) {
    ms.near_resistance = (window_high - price) / window < kNearLevelFraction;
    ms.near_support = (price - window_low) / window < kNearLevelFraction;
  }

  // --- 4. Volatility percentile ----------------------------------------------
  ms.volatility_percentile = volatilityPercentile(ind.atr_history, ind.atr);

  // --- 5. Regime --------------------------------------------------------------
  domain::Regime regime =
      RegimeClassifier::classify(ind.atr, ind.atr_sma, ind.atr_stddev, ind.adx);
  if (regime == domain::Regime::Normal) {
    if (ms.volatility_percentile < 20.0) {
      regime = domain::Regime::LowVol;
    } else if (ms.volatility_percentile > 80.0) {
      regime = domain::Regime::HighVol;
    }
  }
  if (regime == domain::Regime::LowVol && ms.trend_exhaustion) {
    regime = domain::Regime::Contraction;
  } else if (regime != domain::Regime::Trending &&
             regime != domain::Regime::LowVol && expanding &&
             ms.volatility_percentile > 60.0) {
    regime = domain::Regime::Expansion;
  }
  ms.regime = regime;

  // --- 6. Structure levels ---------------------------------------------------
  if (use_structure_levels && price > 0.0) {
    ms.levels = detectLevels(candles, price);
    for (const auto& level : ms.levels) {
      if (level.type == domain::LevelType::Support && level.price < price) {
        if (!ms.nearest_support || level.price > ms.nearest_support->price) {
          ms.nearest_support = level;
        }
      }
      if (level.type == domain::LevelType::Resistance && level.price > price) {
        if (!ms.nearest_resistance ||
            level.price < ms.nearest_resistance->price) {
          ms.nearest_resistance = level;
        }
      }
    }
  }

  // --- 7. Scores --------------------------------------------------------------
  switch (ms.trend_type) {
    case domain::TrendType::StrongTrend:
      ms.structure_score = 85.0;
      break;
    case domain::TrendType::WeakTrend:
    case domain::TrendType::Breakout:
      ms.structure_score = 60.0;
      break;
    case domain::TrendType::Ranging:
      ms.structure_score = 35.0;
      break;
  }

  double tradability = 50.0;
  if (ms.trend_type == domain::TrendType::StrongTrend) {
    tradability += 25.0;
  } else if (ms.trend_type == domain::TrendType::WeakTrend ||
             ms.trend_type == domain::TrendType::Breakout) {
    tradability += 10.0;
  } else {
    tradability -= 20.0;
  }
  if (ms.trend_exhaustion) tradability -= 20.0;
  if (ms.volatility_percentile >= 25.0 && ms.volatility_percentile <= 75.0) {
    tradability += 15.0;
  }
  if (ms.near_support || ms.near_resistance) tradability += 8.0;
  if (ms.regime == domain::Regime::Contraction) tradability -= 15.0;
  if (ind.adx >= 25.0) tradability += 10.0;
  ms.tradability_score = std::clamp(tradability, 0.0, 100.0);

  return ms;
}

}  // namespace tactical
