#include "tactical/gating/quality_gate.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/time/time_utils.hpp"

#include <cmath>
#include <sstream>

namespace tactical {

namespace {

domain::Rejection reject(domain::RejectStage stage, const std::string& why) {
  return domain::Rejection{stage, why};
}

bool opposes(domain::Bias of_direction, domain::Direction direction) {
  return (direction == domain::Direction::Long &&
          of_direction == domain::Bias::Bearish) ||
         (direction == domain::Direction::Short &&
          of_direction == domain::Bias::Bullish);
}

}  // namespace

int QualityGateEvaluator::countRecentSignals(
    const domain::SignalHistoryState& history, domain::Direction direction,
    std::int64_t now_ms, int window_seconds) {
  const std::int64_t cutoff =
      now_ms - static_cast<std::int64_t>(window_seconds) * 1000;
  int count = 0;
  for (const auto& entry : history.entries) {
    if (entry.direction == direction && entry.timestamp_ms > cutoff) {
      ++count;
    }
  }
  return count;
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
GateResult QualityGateEvaluator::evaluate(
    const GateInput& input, const domain::SignalHistoryState& history,
    const domain::TacticalConfig& config) {
  GateResult result;
  const domain::RegimeThresholds& thresholds =
      config.thresholdsFor(input.regime);
  result.effective_min_score = thresholds.min_score;
  result.effective_min_edge = thresholds.min_edge;

  // --- 1. Cooldown ------------------------------------------------------------
  if (history.last_signal_ms > 0) {
    const std::int64_t elapsed_s = (input.now_ms - history.last_signal_ms) / 1000;
    if (elapsed_s < thresholds.cooldown_seconds) {
      std::ostringstream os;
      os << "Cooldown active: " << elapsed_s << "s since last signal, "
         << thresholds.cooldown_seconds << "s required in "
         << domain::toString(input.regime);
      result.rejection = reject(domain::RejectStage::Cooldown, os.str());
      return result;
    }
  }

  // --- 2. Chop filter ---------------------------------------------------------
  result.signals_in_window = countRecentSignals(
      history, input.direction, input.now_ms, config.chop_window_seconds);
  if (result.signals_in_window >= config.max_signals_in_window) {
    std::ostringstream os;
    os << "Chop detected: " << result.signals_in_window << " "
       << domain::toString(input.direction) << " signals in the last "
       << config.chop_window_seconds / 60 << " min";
    result.rejection = reject(domain::RejectStage::ChopDetected, os.str());
    return result;
  }

  // --- 3. ADX modulation ------------------------------------------------------
  if (input.adx < config.adx_chop_threshold) {
    result.adx_factor = config.adx_chop_multiplier;
  } else if (input.adx < config.adx_weak_threshold) {
    result.adx_factor = config.adx_weak_multiplier;
  }
  result.effective_min_score *= result.adx_factor;
  result.effective_min_edge *= result.adx_factor;

  // --- 4. Order-flow veto -----------------------------------------------------
  if (input.order_flow && opposes(input.order_flow->direction, input.direction)) {
    const double of_edge = input.order_flow->edge;
    if (of_edge >= config.order_flow_veto_threshold &&
        input.technical.edge < config.tech_edge_veto_override) {
      std::ostringstream os;
      os << "Order flow opposes " << domain::toString(input.direction)
         << " with edge " << of_edge << " while technical edge is only "
         << input.technical.edge;
      result.rejection = reject(domain::RejectStage::OrderFlowVeto, os.str());
      return result;
    }
    result.penalty_multiplier *= config.order_flow_opposition_penalty;
    std::ostringstream os;
    os << "Order flow opposition (edge " << of_edge << ")";
    result.soft_penalties.push_back(os.str());
  }

  // --- 5. Market condition hard gates -----------------------------------------
  if (input.volume_ratio < config.min_volume_ratio) {
    result.rejection = reject(domain::RejectStage::LowVolume,
                              "Volume ratio below minimum");
    return result;
  }
  const double pct = input.structure.volatility_percentile;
  if (pct < config.min_volatility_percentile ||
      pct > config.max_volatility_percentile) {
    std::ostringstream os;
    os << "Volatility percentile " << pct << " outside ["
       << config.min_volatility_percentile << ", "
       << config.max_volatility_percentile << "]";
    result.rejection =
        reject(domain::RejectStage::VolatilityExtreme, os.str());
    return result;
  }
  if (input.structure.tradability_score < config.min_tradability) {
    result.rejection = reject(domain::RejectStage::LowTradability,
                              "Tradability score below minimum");
    return result;
  }

  // --- 6. Soft gates ----------------------------------------------------------
  const bool crypto = config.asset_type == domain::AssetType::Crypto;
  if (!(crypto && config.disable_session_penalty)) {
    const int hour = utc_hour(input.now_ms);
    if (hour < 7 || hour >= 21) {
      result.soft_penalties.push_back("Off-session hours");
      result.penalty_multiplier *= config.soft_penalty_factor;
    }
  }
  if (!(crypto && config.disable_weekend_penalty)) {
    const int weekday = utc_weekday(input.now_ms);
    if (weekday == 0 || weekday == 6) {
      result.soft_penalties.push_back("Weekend liquidity");
      result.penalty_multiplier *= config.soft_penalty_factor;
    }
  }
  if (input.ema_200 > 0.0) {
    const double extension =
        std::abs(input.price - input.ema_200) / input.ema_200 * 100.0;
    if (extension > config.max_ema200_extension_pct) {
      std::ostringstream os;
      os << "Overextended " << extension << "% from EMA200";
      result.soft_penalties.push_back(os.str());
      result.penalty_multiplier *= config.soft_penalty_factor;
    }
  }

  return result;
}

// -----------------------------------------------------------------------------
// combine
// -----------------------------------------------------------------------------
CombinedScore QualityGateEvaluator::combine(
    const domain::TechnicalScore& technical,
    const std::optional<domain::OrderFlowScore>& of,
    const domain::TacticalConfig& config) {
  CombinedScore out;
  out.bull = technical.bull_score;
  out.bear = technical.bear_score;
  if (of && of->direction != domain::Bias::Neutral &&
      of->direction == technical.direction) {
    out.bull += of->bull_score * config.order_flow_weight;
    out.bear += of->bear_score * config.order_flow_weight;
    out.order_flow_merged = true;
  }
  out.edge = std::abs(out.bull - out.bear);
  return out;
}

// -----------------------------------------------------------------------------
// checkScores
// -----------------------------------------------------------------------------
std::optional<domain::Rejection> QualityGateEvaluator::checkScores(
    const CombinedScore& combined, domain::Direction direction,
    const GateResult& gate, const domain::TacticalConfig& config) {
  const bool is_long = direction == domain::Direction::Long;
  const double dominant = is_long ? combined.bull : combined.bear;
  const double opposite = is_long ? combined.bear : combined.bull;

  if (combined.edge < gate.effective_min_edge) {
    std::ostringstream os;
    os << "Edge " << combined.edge << " below required "
       << gate.effective_min_edge;
    return reject(domain::RejectStage::EdgeInsufficient, os.str());
  }
  if (dominant < gate.effective_min_score) {
    std::ostringstream os;
    os << "Score " << dominant << " below required "
       << gate.effective_min_score;
    return reject(domain::RejectStage::ScoreInsufficient, os.str());
  }
  if (opposite >= config.max_opposing_score) {
    std::ostringstream os;
    os << "Opposing score " << opposite << " too strong";
    return reject(domain::RejectStage::OpposingScore, os.str());
  }
  return std::nullopt;
}

}  // namespace tactical
