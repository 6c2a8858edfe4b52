#pragma once

#include "tactical/domain/types.hpp"

#include <vector>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// RegimeThresholds — adaptive entry thresholds for one regime bucket
// -----------------------------------------------------------------------------
struct RegimeThresholds {
  double min_score{4.5};
  double min_edge{2.2};
  int cooldown_seconds{480};
};

// -----------------------------------------------------------------------------
// TacticalConfig — every tunable of the signal pipeline and risk layer
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct with value semantics. Defaults are the
//         production values; ConfigLoader overlays a JSON file on top.
//
// @details
// Components receive the config by const reference (or copy it at
// construction) and never mutate it. Changing configuration means building
// a new TacticalConfig and a new engine.
//
// Sign conventions:
//   daily_loss_limit is a positive dollar magnitude.
//   Percentages are expressed 0-100 unless the name says "fraction".
//
// Thread model:
//   Value type. Copied into components at construction time, so there is
//   no shared mutable configuration state.
// -----------------------------------------------------------------------------
struct TacticalConfig {
  // --- Regime-adaptive thresholds -------------------------------------------
  RegimeThresholds low_vol{5.5, 2.0, 900};
  RegimeThresholds normal{4.5, 2.2, 480};
  RegimeThresholds high_vol{4.0, 2.5, 180};

  // --- Chop filter ----------------------------------------------------------
  int chop_window_seconds{1800};
  int max_signals_in_window{3};

  // --- Order flow -----------------------------------------------------------
  bool use_order_flow{true};
  double order_flow_weight{0.3};
  double order_flow_veto_threshold{2.0};
  /// Technical edge at or above which strong order-flow opposition only
  /// costs a soft penalty instead of a veto.
  double tech_edge_veto_override{3.0};
  double order_flow_opposition_penalty{0.85};
  int order_flow_stale_seconds{30};

  // --- Score checks ---------------------------------------------------------
  double score_tie_tolerance{0.1};
  double max_opposing_score{2.5};
  double min_risk_reward{2.0};

  // --- ADX modulation -------------------------------------------------------
  double adx_chop_threshold{15.0};
  double adx_weak_threshold{20.0};
  double adx_chop_multiplier{1.5};
  double adx_weak_multiplier{1.2};

  // --- Additional quality gates ---------------------------------------------
  double min_volume_ratio{0.6};
  double min_volatility_percentile{10.0};
  double max_volatility_percentile{92.0};
  double min_tradability{30.0};
  double soft_penalty_factor{0.88};
  double max_ema200_extension_pct{12.0};
  AssetType asset_type{AssetType::Crypto};
  bool disable_weekend_penalty{true};
  bool disable_session_penalty{true};

  // --- Targets --------------------------------------------------------------
  std::vector<double> target_r_multiples{1.0, 2.0, 3.0, 5.0};
  std::vector<double> target_position_pcts{25.0, 35.0, 25.0, 15.0};
  int break_even_tier{1};  // 1-based
  bool use_structure_levels{true};
  double sr_snap_proximity_pct{0.3};

  // --- Pattern learning -----------------------------------------------------
  bool pattern_learning_enabled{true};
  int min_patterns_for_learning{20};
  double similarity_threshold{0.7};
  double max_confidence_boost{15.0};
  double max_confidence_penalty{20.0};
  int max_pattern_matches{10};

  // --- Consensus ------------------------------------------------------------
  double weak_consensus_floor{0.6};
  double weak_consensus_min_support{8.0};
  double weak_consensus_confidence_cap{60.0};
  double veto_vote_confidence{70.0};
  double max_vote_adjustment{5.0};
  double max_consensus_adjustment{15.0};

  // --- Final confidence clamp -----------------------------------------------
  double min_confidence{25.0};
  double max_confidence{95.0};

  // --- Validation -----------------------------------------------------------
  double max_price_deviation_pct{5.0};
  double min_atr_stop_multiple{0.5};
  double max_atr_stop_multiple{3.0};

  // --- Signal lifecycle -----------------------------------------------------
  double signal_decay_per_minute{0.8};
  double signal_decay_per_pct_drift{5.0};
  int signal_max_age_seconds{3600};

  // --- Risk -----------------------------------------------------------------
  double daily_loss_limit{2500.0};
  double default_leverage{1.0};
  double risk_per_trade_pct{1.0};
  double liquidation_buffer{0.9};
  double initial_balance{10000.0};
  int monitor_interval_ms{1000};
  bool auto_execute{true};  // Paper-execute every approved signal
  double taker_fee_pct{0.04};  // Backtest only, charged on entry and exit

  // -------------------------------------------------------------------------
  // thresholdsFor(regime)
  // -------------------------------------------------------------------------
  // Maps every regime onto one of the three threshold buckets:
  //   LowVol, Contraction     -> low_vol
  //   HighVol, Expansion      -> high_vol
  //   Normal, Trending        -> normal
  // -------------------------------------------------------------------------
  const RegimeThresholds& thresholdsFor(Regime regime) const {
    switch (regime) {
      case Regime::LowVol:
      case Regime::Contraction:
        return low_vol;
      case Regime::HighVol:
      case Regime::Expansion:
        return high_vol;
      case Regime::Normal:
      case Regime::Trending:
        break;
    }
    return normal;
  }
};

}  // namespace domain
}  // namespace tactical
