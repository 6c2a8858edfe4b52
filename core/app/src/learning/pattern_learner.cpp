#include "tactical/learning/pattern_learner.hpp"
#include "tactical/domain/enum_strings.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <utility>

namespace tactical {

namespace {

using domain::PatternFingerprint;

// Per-slot difference scale for continuous slots. Technical edge is stored
// as edge / 10, so a full mismatch is reached at a raw edge gap of 3.
constexpr std::array<double, PatternFingerprint::kWidth> kScale = {
    0, 0, 0, 0, 0, 0, 0, 0, 0,  // categorical
    1.0, 1.0, 1.0, 10.0 / 3.0, 1.0, 1.0, 1.0};

std::map<std::string, domain::PatternStats> statsBy(
    const std::vector<domain::TradeOutcome>& outcomes,
    const std::function<std::string(const domain::TradeOutcome&)>& key) {
  std::map<std::string, std::vector<const domain::TradeOutcome*>> groups;
  for (const auto& o : outcomes) {
    groups[key(o)].push_back(&o);
  }
  std::map<std::string, domain::PatternStats> out;
  for (const auto& [name, group] : groups) {
    out[name] = PatternLearner::computeStats(group);
  }
  return out;
}

}  // namespace

const std::array<double, PatternFingerprint::kWidth>&
PatternLearner::slotWeights() {
  // regime, trend type, trend dir, signal type, cvd trend, cvd div,
  // near support, near resistance, exhaustion,
  // trend strength, volatility, rsi, tech edge, of edge, agreement, conf
  static const std::array<double, PatternFingerprint::kWidth> kWeights = {
      3.0, 3.0, 1.0, 4.0, 2.0, 3.0, 1.0, 1.0, 2.0,
      1.5, 1.0, 0.5, 2.0, 0.5, 1.0, 0.5};
  return kWeights;
}

// -----------------------------------------------------------------------------
// buildFingerprint
// -----------------------------------------------------------------------------
domain::PatternFingerprint PatternLearner::buildFingerprint(
    const FingerprintInput& in) {
  PatternFingerprint fp;
  fp.regime = in.structure.regime;
  fp.trend_type = in.structure.trend_type;
  fp.trend_direction = in.structure.trend_direction;
  fp.signal_type = in.signal_type;
  if (in.order_flow) {
    fp.cvd_trend = in.order_flow->components.cvd_trend;
    fp.cvd_divergence = in.order_flow->components.divergence;
    fp.order_flow_edge = std::min(1.0, in.order_flow->edge / 10.0);
  }
  fp.near_support = in.structure.near_support;
  fp.near_resistance = in.structure.near_resistance;
  fp.trend_exhaustion = in.structure.trend_exhaustion;
  fp.trend_strength = std::clamp(in.adx / 50.0, 0.0, 1.0);
  fp.volatility_percentile =
      std::clamp(in.structure.volatility_percentile / 100.0, 0.0, 1.0);
  fp.rsi = std::clamp(in.rsi / 100.0, 0.0, 1.0);
  fp.technical_edge = std::min(1.0, in.technical.edge / 10.0);
  fp.consensus_agreement = std::clamp(in.consensus_agreement, 0.0, 1.0);
  fp.entry_confidence = std::clamp(in.entry_confidence / 100.0, 0.0, 1.0);
  return fp;
}

// -----------------------------------------------------------------------------
// similarity
// -----------------------------------------------------------------------------
double PatternLearner::similarity(const domain::PatternFingerprint& a,
                                  const domain::PatternFingerprint& b) {
  const auto va = a.toVector();
  const auto vb = b.toVector();
  const auto& w = slotWeights();

  double score = 0.0;
  double total = 0.0;
  for (std::size_t i = 0; i < PatternFingerprint::kWidth; ++i) {
    total += w[i];
    if (i < PatternFingerprint::kCategoricalSlots) {
      if (va[i] == vb[i]) {
        score += w[i];
      }
      continue;
    }
    const double diff = std::min(1.0, std::abs(va[i] - vb[i]) * kScale[i]);
    score += w[i] * (1.0 - diff);
  }
  return total > 0.0 ? score / total : 0.0;
}

// -----------------------------------------------------------------------------
// findMatches
// -----------------------------------------------------------------------------
std::vector<domain::PatternMatch> PatternLearner::findMatches(
    const domain::PatternFingerprint& fingerprint,
    const domain::PatternLearningState& state,
    const domain::TacticalConfig& config) {
  std::vector<domain::PatternMatch> matches;
  if (!config.pattern_learning_enabled) {
    return matches;
  }
  if (state.outcomes.size() <
      static_cast<std::size_t>(config.min_patterns_for_learning)) {
    return matches;
  }

  for (std::size_t i = 0; i < state.outcomes.size(); ++i) {
    const auto& outcome = state.outcomes[i];
    const double sim = similarity(fingerprint, outcome.fingerprint);
    if (sim >= config.similarity_threshold) {
      matches.push_back({i, sim, outcome.isWin(), outcome.realized_r});
    }
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const auto& x, const auto& y) {
                     return x.similarity > y.similarity;
                   });
  if (matches.size() > static_cast<std::size_t>(config.max_pattern_matches)) {
    matches.resize(config.max_pattern_matches);
  }
  return matches;
}

// -----------------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------------
domain::PatternAnalysis PatternLearner::analyze(
    const domain::PatternFingerprint& fingerprint,
    const domain::PatternLearningState& state,
    const domain::TacticalConfig& config) {
  domain::PatternAnalysis out;
  out.learning_active =
      config.pattern_learning_enabled &&
      state.outcomes.size() >=
          static_cast<std::size_t>(config.min_patterns_for_learning);
  out.baseline_win_rate = state.overall.win_rate;

  if (!out.learning_active) {
    std::ostringstream os;
    os << "Pattern learning inactive (" << state.outcomes.size() << "/"
       << config.min_patterns_for_learning << " outcomes)";
    out.summary = os.str();
    return out;
  }

  out.matches = findMatches(fingerprint, state, config);
  if (out.matches.empty()) {
    out.summary = "No similar historical patterns";
    return out;
  }

  double total_weight = 0.0;
  double weighted_wins = 0.0;
  double weighted_r = 0.0;
  for (const auto& m : out.matches) {
    const double w = m.similarity * m.similarity;
    total_weight += w;
    weighted_wins += (m.win ? 1.0 : 0.0) * w;
    weighted_r += m.realized_r * w;
  }
  if (total_weight <= 0.0) {
    return out;
  }

  out.matched_win_rate = weighted_wins / total_weight;
  out.matched_avg_r = weighted_r / total_weight;
  const double adj =
      (out.matched_win_rate - out.baseline_win_rate) * 20.0 +
      out.matched_avg_r * 5.0;
  out.confidence_adjustment = std::clamp(adj, -config.max_confidence_penalty,
                                         config.max_confidence_boost);

  std::ostringstream os;
  os << out.matches.size() << " similar patterns, win rate "
     << std::lround(out.matched_win_rate * 100.0) << "% vs baseline "
     << std::lround(out.baseline_win_rate * 100.0) << "%";
  out.summary = os.str();
  return out;
}

// -----------------------------------------------------------------------------
// computeStats
// -----------------------------------------------------------------------------
domain::PatternStats PatternLearner::computeStats(
    const std::vector<const domain::TradeOutcome*>& outcomes) {
  domain::PatternStats s;
  double gross_profit = 0.0;
  double gross_loss = 0.0;
  double sum_r = 0.0;
  for (const auto* o : outcomes) {
    ++s.total;
    sum_r += o->realized_r;
    if (o->isWin()) {
      ++s.wins;
      gross_profit += o->realized_r;
    } else {
      ++s.losses;
      gross_loss += std::abs(o->realized_r);
    }
  }
  if (s.total == 0) {
    return s;
  }
  s.win_rate = static_cast<double>(s.wins) / s.total;
  s.avg_win_r = s.wins > 0 ? gross_profit / s.wins : 0.0;
  s.avg_loss_r = s.losses > 0 ? gross_loss / s.losses : 0.0;
  if (gross_loss > 0.0) {
    s.profit_factor = std::min(kMaxProfitFactor, gross_profit / gross_loss);
  } else {
    s.profit_factor = gross_profit > 0.0 ? kMaxProfitFactor : 0.0;
  }
  s.expectancy = sum_r / s.total;
  return s;
}

// -----------------------------------------------------------------------------
// addOutcome: append and recompute every aggregate
// -----------------------------------------------------------------------------
domain::PatternLearningState PatternLearner::addOutcome(
    const domain::PatternLearningState& state,
    const domain::TradeOutcome& outcome) {
  std::vector<domain::TradeOutcome> outcomes = state.outcomes;
  outcomes.push_back(outcome);
  return rebuild(std::move(outcomes));
}

domain::PatternLearningState PatternLearner::rebuild(
    std::vector<domain::TradeOutcome> outcomes) {
  domain::PatternLearningState next;
  next.outcomes = std::move(outcomes);

  std::vector<const domain::TradeOutcome*> all;
  all.reserve(next.outcomes.size());
  for (const auto& o : next.outcomes) {
    all.push_back(&o);
  }
  next.overall = computeStats(all);

  const std::size_t recent_n =
      std::min(domain::PatternLearningState::kRecentWindow, all.size());
  std::vector<const domain::TradeOutcome*> recent(all.end() - recent_n,
                                                  all.end());
  next.recent = computeStats(recent);

  next.by_regime = statsBy(next.outcomes, [](const domain::TradeOutcome& o) {
    return std::string(domain::toString(o.fingerprint.regime));
  });
  next.by_trend_type =
      statsBy(next.outcomes, [](const domain::TradeOutcome& o) {
        return std::string(domain::toString(o.fingerprint.trend_type));
      });
  next.by_signal_type =
      statsBy(next.outcomes, [](const domain::TradeOutcome& o) {
        return std::string(domain::toString(o.fingerprint.signal_type));
      });
  next.by_cvd_divergence =
      statsBy(next.outcomes, [](const domain::TradeOutcome& o) {
        return std::string(domain::toString(o.fingerprint.cvd_divergence));
      });
  return next;
}

}  // namespace tactical
