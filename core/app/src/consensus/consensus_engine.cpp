#include "tactical/consensus/consensus_engine.hpp"
#include "tactical/domain/enum_strings.hpp"

#include <algorithm>
#include <sstream>

namespace tactical {

namespace {

constexpr double kTechnicalWeight = 10.0;
constexpr double kTrendWeight = 5.0;
constexpr double kSentimentWeight = 7.0;
constexpr double kOrderFlowWeight = 8.0;
constexpr double kMacroWeight = 3.0;
constexpr double kStructureWeight = 6.0;

domain::Bias fromTrend(domain::TrendDirection d) {
  switch (d) {
    case domain::TrendDirection::Up:   return domain::Bias::Bullish;
    case domain::TrendDirection::Down: return domain::Bias::Bearish;
    case domain::TrendDirection::Neutral: break;
  }
  return domain::Bias::Neutral;
}

domain::Bias opposite(domain::Bias b) {
  switch (b) {
    case domain::Bias::Bullish: return domain::Bias::Bearish;
    case domain::Bias::Bearish: return domain::Bias::Bullish;
    case domain::Bias::Neutral: break;
  }
  return domain::Bias::Neutral;
}

}  // namespace

const char* toString(ConsensusDecision d) {
  switch (d) {
    case ConsensusDecision::Approved:      return "APPROVED";
    case ConsensusDecision::WeakConsensus: return "WEAK_CONSENSUS";
    case ConsensusDecision::Veto:          return "VETO";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// collectVotes
// -----------------------------------------------------------------------------
std::vector<AgentVote> ConsensusEngine::collectVotes(
    const domain::TechnicalScore& technical,
    const std::optional<domain::OrderFlowScore>& order_flow,
    const domain::MarketStructure& structure,
    const std::optional<domain::MacroContext>& macro) {
  std::vector<AgentVote> votes;

  {
    std::ostringstream os;
    os << "Technical edge " << technical.edge;
    votes.push_back({"technical", technical.direction,
                     std::min(100.0, technical.edge * 18.0), kTechnicalWeight,
                     os.str()});
  }

  if (structure.trend_type == domain::TrendType::StrongTrend) {
    votes.push_back({"trend", fromTrend(structure.trend_direction),
                     structure.tradability_score, kTrendWeight,
                     "Strong trend"});
  } else {
    votes.push_back({"trend", domain::Bias::Neutral, 50.0, kTrendWeight,
                     "No strong trend"});
  }

  if (macro) {
    votes.push_back({"sentiment", macro->sentiment, macro->sentiment_score,
                     kSentimentWeight, "Market sentiment"});
  }

  if (order_flow) {
    if (order_flow->direction != domain::Bias::Neutral) {
      votes.push_back({"order_flow", order_flow->direction,
                       order_flow->signal_strength, kOrderFlowWeight,
                       "Order flow bias"});
    } else {
      votes.push_back({"order_flow", domain::Bias::Neutral, 50.0,
                       kOrderFlowWeight, "Order flow balanced"});
    }
  }

  if (macro && macro->vix > 0.0 && macro->dxy > 0.0) {
    if (macro->vix < 18.0 && macro->dxy < 103.0) {
      votes.push_back({"macro", domain::Bias::Bullish, 70.0, kMacroWeight,
                       "Risk-on backdrop"});
    } else if (macro->vix > 25.0 || macro->dxy > 107.0) {
      votes.push_back({"macro", domain::Bias::Bearish, 70.0, kMacroWeight,
                       "Risk-off backdrop"});
    } else {
      votes.push_back({"macro", domain::Bias::Neutral, 50.0, kMacroWeight,
                       "Mixed macro"});
    }
  }

  domain::Bias structure_vote = domain::Bias::Neutral;
  std::string structure_reason = "Ranging structure";
  if (structure.trend_exhaustion &&
      structure.trend_direction != domain::TrendDirection::Neutral) {
    structure_vote = opposite(fromTrend(structure.trend_direction));
    structure_reason = "Trend exhaustion";
  } else if (structure.trend_type != domain::TrendType::Ranging) {
    structure_vote = fromTrend(structure.trend_direction);
    structure_reason = domain::toString(structure.trend_type);
  }
  votes.push_back({"structure", structure_vote, structure.structure_score,
                   kStructureWeight, structure_reason});

  return votes;
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
ConsensusResult ConsensusEngine::evaluate(std::vector<AgentVote> votes,
                                          domain::Direction direction,
                                          double edge,
                                          const domain::TacticalConfig& config) {
  ConsensusResult result;
  const domain::Bias side = domain::toBias(direction);
  const domain::Bias against = opposite(side);

  double adjustment = 0.0;
  for (const auto& v : votes) {
    const double effective = v.weight * v.confidence / 100.0;
    double contribution = 0.0;
    if (v.vote == side) {
      result.support_weight += effective;
      contribution = effective * 0.5;
    } else if (v.vote == against) {
      result.oppose_weight += effective;
      contribution = -effective * 0.5;
    }
    adjustment += std::clamp(contribution, -config.max_vote_adjustment,
                             config.max_vote_adjustment);
  }

  const double total = result.support_weight + result.oppose_weight;
  result.agreement_score =
      total > 0.0 ? std::max(result.support_weight, result.oppose_weight) /
                        total
                  : 0.5;

  // Conflicts: every high-confidence pair on opposite sides.
  for (const auto& a : votes) {
    if (a.vote != side || a.confidence < config.veto_vote_confidence) {
      continue;
    }
    for (const auto& b : votes) {
      if (b.vote == against && b.confidence >= config.veto_vote_confidence) {
        result.conflicts.emplace_back(a.agent_name, b.agent_name);
      }
    }
  }

  result.adjustment = std::clamp(adjustment, -config.max_consensus_adjustment,
                                 config.max_consensus_adjustment);
  result.base_confidence = std::min(95.0, edge * 15.0 + 40.0);

  if (!result.conflicts.empty()) {
    const auto& [first, second] = result.conflicts.front();
    result.decision = ConsensusDecision::Veto;
    result.veto_reason = "High-confidence contradiction: " + first + " vs " +
                         second;
    result.final_confidence = 0.0;
    result.votes = std::move(votes);
    return result;
  }

  if (result.agreement_score < config.weak_consensus_floor ||
      result.support_weight < config.weak_consensus_min_support ||
      result.oppose_weight > result.support_weight) {
    result.decision = ConsensusDecision::WeakConsensus;
  }

  double confidence =
      std::clamp(result.base_confidence + result.adjustment, 0.0, 99.0);
  if (result.decision == ConsensusDecision::WeakConsensus) {
    confidence = std::min(confidence, config.weak_consensus_confidence_cap);
  }
  result.final_confidence = confidence;
  result.votes = std::move(votes);
  return result;
}

}  // namespace tactical
