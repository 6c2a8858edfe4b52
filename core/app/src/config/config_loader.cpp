#include "tactical/config/config_loader.hpp"
#include "tactical/domain/enum_strings.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tactical {

namespace {

using nlohmann::json;

template <typename T>
void overlay(const json& j, const char* key, T& field) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    field = it->get<T>();
  }
}

void overlayThresholds(const json& j, const char* key,
                       domain::RegimeThresholds& t) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) {
    return;
  }
  overlay(*it, "min_score", t.min_score);
  overlay(*it, "min_edge", t.min_edge);
  overlay(*it, "cooldown_seconds", t.cooldown_seconds);
}

}  // namespace

domain::TacticalConfig ConfigLoader::fromJson(
    const json& j, const domain::TacticalConfig& base) {
  domain::TacticalConfig c = base;
  if (!j.is_object()) {
    throw std::invalid_argument("config root must be a JSON object");
  }

  overlayThresholds(j, "low_vol", c.low_vol);
  overlayThresholds(j, "normal", c.normal);
  overlayThresholds(j, "high_vol", c.high_vol);

  overlay(j, "chop_window_seconds", c.chop_window_seconds);
  overlay(j, "max_signals_in_window", c.max_signals_in_window);

  overlay(j, "use_order_flow", c.use_order_flow);
  overlay(j, "order_flow_weight", c.order_flow_weight);
  overlay(j, "order_flow_veto_threshold", c.order_flow_veto_threshold);
  overlay(j, "tech_edge_veto_override", c.tech_edge_veto_override);
  overlay(j, "order_flow_opposition_penalty",
          c.order_flow_opposition_penalty);
  overlay(j, "order_flow_stale_seconds", c.order_flow_stale_seconds);

  overlay(j, "score_tie_tolerance", c.score_tie_tolerance);
  overlay(j, "max_opposing_score", c.max_opposing_score);
  overlay(j, "min_risk_reward", c.min_risk_reward);

  overlay(j, "adx_chop_threshold", c.adx_chop_threshold);
  overlay(j, "adx_weak_threshold", c.adx_weak_threshold);
  overlay(j, "adx_chop_multiplier", c.adx_chop_multiplier);
  overlay(j, "adx_weak_multiplier", c.adx_weak_multiplier);

  overlay(j, "min_volume_ratio", c.min_volume_ratio);
  overlay(j, "min_volatility_percentile", c.min_volatility_percentile);
  overlay(j, "max_volatility_percentile", c.max_volatility_percentile);
  overlay(j, "min_tradability", c.min_tradability);
  overlay(j, "soft_penalty_factor", c.soft_penalty_factor);
  overlay(j, "max_ema200_extension_pct", c.max_ema200_extension_pct);
  if (auto it = j.find("asset_type"); it != j.end()) {
    const auto text = it->get<std::string>();
    const auto parsed = domain::parseAssetType(text);
    if (!parsed) {
      throw std::invalid_argument("unknown asset_type '" + text + "'");
    }
    c.asset_type = *parsed;
  }
  overlay(j, "disable_weekend_penalty", c.disable_weekend_penalty);
  overlay(j, "disable_session_penalty", c.disable_session_penalty);

  overlay(j, "target_r_multiples", c.target_r_multiples);
  overlay(j, "target_position_pcts", c.target_position_pcts);
  overlay(j, "break_even_tier", c.break_even_tier);
  overlay(j, "use_structure_levels", c.use_structure_levels);
  overlay(j, "sr_snap_proximity_pct", c.sr_snap_proximity_pct);

  overlay(j, "pattern_learning_enabled", c.pattern_learning_enabled);
  overlay(j, "min_patterns_for_learning", c.min_patterns_for_learning);
  overlay(j, "similarity_threshold", c.similarity_threshold);
  overlay(j, "max_confidence_boost", c.max_confidence_boost);
  overlay(j, "max_confidence_penalty", c.max_confidence_penalty);
  overlay(j, "max_pattern_matches", c.max_pattern_matches);

  overlay(j, "weak_consensus_floor", c.weak_consensus_floor);
  overlay(j, "weak_consensus_min_support", c.weak_consensus_min_support);
  overlay(j, "weak_consensus_confidence_cap", c.weak_consensus_confidence_cap);
  overlay(j, "veto_vote_confidence", c.veto_vote_confidence);
  overlay(j, "max_vote_adjustment", c.max_vote_adjustment);
  overlay(j, "max_consensus_adjustment", c.max_consensus_adjustment);

  overlay(j, "min_confidence", c.min_confidence);
  overlay(j, "max_confidence", c.max_confidence);

  overlay(j, "max_price_deviation_pct", c.max_price_deviation_pct);
  overlay(j, "min_atr_stop_multiple", c.min_atr_stop_multiple);
  overlay(j, "max_atr_stop_multiple", c.max_atr_stop_multiple);

  overlay(j, "signal_decay_per_minute", c.signal_decay_per_minute);
  overlay(j, "signal_decay_per_pct_drift", c.signal_decay_per_pct_drift);
  overlay(j, "signal_max_age_seconds", c.signal_max_age_seconds);

  overlay(j, "daily_loss_limit", c.daily_loss_limit);
  overlay(j, "default_leverage", c.default_leverage);
  overlay(j, "risk_per_trade_pct", c.risk_per_trade_pct);
  overlay(j, "liquidation_buffer", c.liquidation_buffer);
  overlay(j, "initial_balance", c.initial_balance);
  overlay(j, "monitor_interval_ms", c.monitor_interval_ms);
  overlay(j, "auto_execute", c.auto_execute);
  overlay(j, "taker_fee_pct", c.taker_fee_pct);

  validate(c);
  return c;
}

domain::TacticalConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file " + path);
  }
  const json j = json::parse(in);
  auto config = fromJson(j);
  std::cout << "[ConfigLoader] Loaded " << path << "\n";
  return config;
}

void ConfigLoader::validate(const domain::TacticalConfig& c) {
  if (c.target_r_multiples.empty() ||
      c.target_r_multiples.size() != c.target_position_pcts.size()) {
    throw std::invalid_argument(
        "target_r_multiples and target_position_pcts must be non-empty and "
        "the same length");
  }
  double pct_sum = 0.0;
  double prev_r = 0.0;
  for (std::size_t i = 0; i < c.target_r_multiples.size(); ++i) {
    if (c.target_r_multiples[i] <= prev_r) {
      throw std::invalid_argument(
          "target_r_multiples must be positive and strictly increasing");
    }
    prev_r = c.target_r_multiples[i];
    pct_sum += c.target_position_pcts[i];
  }
  if (std::abs(pct_sum - 100.0) > 1e-6) {
    throw std::invalid_argument("target_position_pcts must sum to 100");
  }
  if (c.break_even_tier < 1 ||
      c.break_even_tier > static_cast<int>(c.target_r_multiples.size())) {
    throw std::invalid_argument("break_even_tier out of range");
  }
  if (c.default_leverage <= 0.0) {
    throw std::invalid_argument("default_leverage must be positive");
  }
  if (c.daily_loss_limit < 0.0) {
    throw std::invalid_argument(
        "daily_loss_limit is a magnitude and must not be negative");
  }
  if (c.min_confidence > c.max_confidence) {
    throw std::invalid_argument("min_confidence exceeds max_confidence");
  }
  if (c.monitor_interval_ms <= 0) {
    throw std::invalid_argument("monitor_interval_ms must be positive");
  }
}

}  // namespace tactical
