#include "tactical/signal/signal_pipeline.hpp"
#include "tactical/analysis/structure_analyzer.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/learning/pattern_learner.hpp"
#include "tactical/scoring/order_flow_scorer.hpp"
#include "tactical/scoring/technical_scorer.hpp"
#include "tactical/signal/target_ladder.hpp"
#include "tactical/validation/signal_validator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tactical {

namespace {

SignalEvaluation rejected(SignalEvaluation eval, domain::RejectStage stage,
                          const std::string& reason) {
  eval.reasoning.push_back(std::string("Rejected [") +
                           domain::toString(stage) + "]: " + reason);
  eval.rejection = domain::Rejection{stage, reason};
  return eval;
}

bool withTrend(domain::Direction direction, domain::TrendDirection trend) {
  return (direction == domain::Direction::Long &&
          trend == domain::TrendDirection::Up) ||
         (direction == domain::Direction::Short &&
          trend == domain::TrendDirection::Down);
}

bool againstTrend(domain::Direction direction, domain::TrendDirection trend) {
  return (direction == domain::Direction::Long &&
          trend == domain::TrendDirection::Down) ||
         (direction == domain::Direction::Short &&
          trend == domain::TrendDirection::Up);
}

}  // namespace

double SignalPipeline::applySlippage(double price, bool buy,
                                     SlippageOrder order, double atr,
                                     double reference_price) {
  double base_bps = 3.0;
  if (order == SlippageOrder::Stop) {
    base_bps = 5.0;
  } else if (order == SlippageOrder::Limit) {
    base_bps = 2.0;
  }
  const double vol_ratio =
      reference_price > 0.0 ? atr / (reference_price * 0.02) : 1.0;
  const double bps = base_bps * std::min(vol_ratio * 2.0, 3.0);
  const double slip = price * bps / 10000.0;
  return buy ? price + slip : price - slip;
}

double SignalPipeline::stopMultiplier(domain::Regime regime) {
  switch (regime) {
    case domain::Regime::HighVol: return 2.0;
    case domain::Regime::LowVol:  return 1.2;
    default:                      return 1.5;
  }
}

domain::SignalType SignalPipeline::classifySignalType(
    domain::Direction direction, const domain::MarketStructure& structure,
    const domain::IndicatorBundle& indicators) {
  if (TechnicalScorer::hasCrossover(indicators)) {
    return domain::SignalType::Crossover;
  }
  if (structure.trend_exhaustion &&
      againstTrend(direction, structure.trend_direction)) {
    return domain::SignalType::Reversal;
  }
  const bool at_level = direction == domain::Direction::Long
                            ? structure.near_support
                            : structure.near_resistance;
  if (withTrend(direction, structure.trend_direction) && at_level) {
    return domain::SignalType::Pullback;
  }
  return domain::SignalType::TrendContinuation;
}

domain::SignalHistoryState SignalPipeline::pruneHistory(
    const domain::SignalHistoryState& history, std::int64_t now_ms,
    int window_seconds) {
  domain::SignalHistoryState out;
  out.last_signal_ms = history.last_signal_ms;
  out.issued_count = history.issued_count;
  const std::int64_t cutoff =
      now_ms - static_cast<std::int64_t>(window_seconds) * 1000;
  for (const auto& e : history.entries) {
    if (e.timestamp_ms > cutoff) {
      out.entries.push_back(e);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
SignalEvaluation SignalPipeline::evaluate(
    const domain::MarketSnapshot& snapshot,
    const domain::SignalHistoryState& history,
    const domain::PatternLearningState& learning,
    const domain::TacticalConfig& config, std::int64_t now_ms) {
  SignalEvaluation eval;
  eval.updated_history =
      pruneHistory(history, now_ms, config.chop_window_seconds);

  const auto& ind = snapshot.indicators;
  if (snapshot.price <= 0.0 || !std::isfinite(snapshot.price) ||
      snapshot.candles.size() < kMinCandles || ind.atr <= 0.0) {
    std::ostringstream os;
    os << "Need a positive price, ATR and at least " << kMinCandles
       << " candles (have " << snapshot.candles.size() << ")";
    return rejected(std::move(eval), domain::RejectStage::InsufficientData,
                    os.str());
  }

  // --- Structure and scores ---------------------------------------------------
  eval.structure =
      StructureAnalyzer::analyze(snapshot, config.use_structure_levels);
  eval.technical =
      TechnicalScorer::score(ind, snapshot.price, config.score_tie_tolerance);
  if (config.use_order_flow) {
    eval.order_flow = OrderFlowScorer::score(
        snapshot, now_ms,
        static_cast<std::int64_t>(config.order_flow_stale_seconds) * 1000,
        config.score_tie_tolerance);
  }

  {
    std::ostringstream os;
    os << "Regime " << domain::toString(eval.structure.regime) << " | "
       << domain::toString(eval.structure.trend_type) << " "
       << domain::toString(eval.structure.trend_direction)
       << " | Tradability " << eval.structure.tradability_score;
    eval.reasoning.push_back(os.str());
  }
  {
    std::ostringstream os;
    os << "Technical bull " << eval.technical.bull_score << " / bear "
       << eval.technical.bear_score;
    if (eval.order_flow) {
      os << " | Order flow bull " << eval.order_flow->bull_score << " / bear "
         << eval.order_flow->bear_score;
    } else {
      os << " | Order flow unavailable";
    }
    eval.reasoning.push_back(os.str());
  }

  if (eval.technical.direction == domain::Bias::Neutral) {
    return rejected(std::move(eval), domain::RejectStage::NoDirection,
                    "Technical scores within tie tolerance");
  }
  const domain::Direction direction =
      eval.technical.direction == domain::Bias::Bullish
          ? domain::Direction::Long
          : domain::Direction::Short;

  // --- Quality gates ----------------------------------------------------------
  GateInput gate_input;
  gate_input.direction = direction;
  gate_input.regime = eval.structure.regime;
  gate_input.now_ms = now_ms;
  gate_input.price = snapshot.price;
  gate_input.ema_200 = ind.ema_200;
  gate_input.adx = ind.adx;
  gate_input.volume_ratio = ind.volume_ratio;
  gate_input.technical = eval.technical;
  gate_input.order_flow = eval.order_flow;
  gate_input.structure = eval.structure;

  eval.gate =
      QualityGateEvaluator::evaluate(gate_input, eval.updated_history, config);
  if (!eval.gate.passed()) {
    const auto rejection = *eval.gate.rejection;
    return rejected(std::move(eval), rejection.stage, rejection.reason);
  }
  for (const auto& penalty : eval.gate.soft_penalties) {
    eval.reasoning.push_back("Penalty: " + penalty);
  }

  eval.combined =
      QualityGateEvaluator::combine(eval.technical, eval.order_flow, config);
  if (auto score_reject = QualityGateEvaluator::checkScores(
          eval.combined, direction, eval.gate, config)) {
    return rejected(std::move(eval), score_reject->stage,
                    score_reject->reason);
  }

  // --- Consensus --------------------------------------------------------------
  auto votes = ConsensusEngine::collectVotes(eval.technical, eval.order_flow,
                                             eval.structure, snapshot.macro);
  eval.consensus = ConsensusEngine::evaluate(std::move(votes), direction,
                                             eval.combined.edge, config);
  {
    std::ostringstream os;
    os << "Consensus " << toString(eval.consensus->decision) << " | support "
       << eval.consensus->support_weight << " | agreement "
       << std::lround(eval.consensus->agreement_score * 100.0) << "%";
    eval.reasoning.push_back(os.str());
  }
  if (eval.consensus->decision == ConsensusDecision::Veto) {
    const std::string reason = eval.consensus->veto_reason;
    return rejected(std::move(eval), domain::RejectStage::ConsensusVeto,
                    reason);
  }

  // --- Entry, stop and targets ------------------------------------------------
  const bool is_long = direction == domain::Direction::Long;
  const double atr = ind.atr;
  const double stop_distance = atr * stopMultiplier(eval.structure.regime);
  const double entry = applySlippage(snapshot.price, is_long,
                                     SlippageOrder::Market, atr,
                                     snapshot.price);
  const double raw_stop = is_long ? snapshot.price - stop_distance
                                  : snapshot.price + stop_distance;
  const double stop = applySlippage(raw_stop, !is_long, SlippageOrder::Stop,
                                    atr, snapshot.price);

  auto targets =
      TargetLadder::build(direction, entry, stop, eval.structure, config);
  if (targets.empty()) {
    return rejected(std::move(eval), domain::RejectStage::Validation,
                    "No target tiers configured");
  }

  const double rr = SignalValidator::riskReward(
      entry, stop,
      targets[SignalValidator::primaryTargetIndex(targets.size())].price);
  if (!std::isfinite(rr) ||
      rr + kRiskRewardEpsilon < config.min_risk_reward) {
    std::ostringstream os;
    os << "R:R " << rr << " below " << config.min_risk_reward;
    return rejected(std::move(eval), domain::RejectStage::RiskReward,
                    os.str());
  }

  // --- Pattern learning -------------------------------------------------------
  eval.signal_type = classifySignalType(direction, eval.structure, ind);
  PatternLearner::FingerprintInput fp_input;
  fp_input.structure = eval.structure;
  fp_input.technical = eval.technical;
  fp_input.order_flow = eval.order_flow;
  fp_input.signal_type = eval.signal_type;
  fp_input.adx = ind.adx;
  fp_input.rsi = ind.rsi;
  fp_input.consensus_agreement = eval.consensus->agreement_score;
  fp_input.entry_confidence = eval.consensus->final_confidence;
  const auto fingerprint = PatternLearner::buildFingerprint(fp_input);

  eval.pattern = PatternLearner::analyze(fingerprint, learning, config);
  eval.reasoning.push_back("Pattern: " + eval.pattern.summary);

  const double confidence = std::clamp(
      std::round(eval.consensus->final_confidence *
                     eval.gate.penalty_multiplier +
                 eval.pattern.confidence_adjustment),
      config.min_confidence, config.max_confidence);

  // --- Assemble and validate --------------------------------------------------
  domain::EnhancedTradeSignal candidate;
  candidate.id = "tactical-" + std::to_string(now_ms) + "-" +
                 std::to_string(eval.updated_history.issued_count + 1);
  candidate.symbol = snapshot.symbol;
  candidate.direction = direction;
  candidate.entry_price = entry;
  candidate.entry_zone_low = std::min(entry, snapshot.price);
  candidate.entry_zone_high = std::max(entry, snapshot.price);
  candidate.stop_loss = stop;
  candidate.current_stop = stop;
  candidate.targets = std::move(targets);
  candidate.risk_reward = rr;
  candidate.confidence = confidence;
  candidate.decayed_confidence = confidence;
  candidate.regime = eval.structure.regime;
  candidate.status = domain::SignalStatus::Active;
  candidate.source = domain::SignalSource::Tactical;
  candidate.approval_status =
      eval.consensus->decision == ConsensusDecision::WeakConsensus
          ? domain::ApprovalStatus::PendingReview
          : domain::ApprovalStatus::Active;
  candidate.created_at_ms = now_ms;
  candidate.atr_at_entry = atr;
  candidate.suggested_position_size = 100.0;  // Percent of the planned size
  candidate.fingerprint = fingerprint;

  {
    std::ostringstream os;
    os << domain::toString(direction) << " @ " << entry << " | SL " << stop
       << " | " << candidate.targets.size() << " targets | Conf "
       << confidence;
    eval.reasoning.push_back(os.str());
  }
  candidate.reasoning = eval.reasoning;

  ValidationContext context{snapshot.price, atr, now_ms};
  auto validated = SignalValidator::validate(std::move(candidate), context,
                                             config);
  if (auto* rejection = std::get_if<domain::Rejection>(&validated)) {
    const auto copy = *rejection;
    return rejected(std::move(eval), copy.stage, copy.reason);
  }

  eval.signal = std::get<domain::EnhancedTradeSignal>(std::move(validated));

  domain::SignalHistoryEntry entry_record;
  entry_record.signal_id = eval.signal->id;
  entry_record.timestamp_ms = now_ms;
  entry_record.direction = direction;
  entry_record.price = eval.signal->entry_price;
  eval.updated_history.entries.push_back(entry_record);
  eval.updated_history.last_signal_ms = now_ms;
  ++eval.updated_history.issued_count;
  return eval;
}

}  // namespace tactical
