#pragma once

#include "tactical/domain/market_snapshot.hpp"
#include "tactical/domain/market_structure.hpp"
#include "tactical/domain/scores.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/domain/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// AgentVote — one scorer's opinion on the candidate direction
// -----------------------------------------------------------------------------
struct AgentVote {
  std::string agent_name;
  domain::Bias vote{domain::Bias::Neutral};
  double confidence{50.0};  // 0-100
  double weight{1.0};       // Static importance of this agent
  std::string reason;
};

enum class ConsensusDecision {
  Approved,
  WeakConsensus,
  Veto,
};

const char* toString(ConsensusDecision d);

// -----------------------------------------------------------------------------
// ConsensusResult
// -----------------------------------------------------------------------------
//
// @details
// support_weight / oppose_weight are sums of weight x confidence/100 over
// votes that agree / disagree with the candidate direction. Neutral votes
// count toward neither.
//
//   agreement_score = max(support, oppose) / (support + oppose)
//                     (0.5 when both are zero)
//
// final_confidence already includes the bounded adjustment and, for weak
// consensus, the confidence cap. It is 0 on Veto.
// -----------------------------------------------------------------------------
struct ConsensusResult {
  std::vector<AgentVote> votes;
  double support_weight{0.0};
  double oppose_weight{0.0};
  double agreement_score{0.5};
  ConsensusDecision decision{ConsensusDecision::Approved};
  double base_confidence{0.0};
  double adjustment{0.0};
  double final_confidence{0.0};
  std::vector<std::pair<std::string, std::string>> conflicts;
  std::string veto_reason;
};

// -----------------------------------------------------------------------------
// ConsensusEngine — weighted vote across independent scorers
// -----------------------------------------------------------------------------
//
// @brief  Turns scorer outputs into AgentVotes and aggregates them.
//
// @details
// Agents and static weights (only contributing agents vote):
//
//   technical    10  technical score direction, conf = min(100, edge x 18)
//   trend         5  strong-trend direction, conf = tradability
//   sentiment     7  macro.sentiment (only with MacroContext)
//   order_flow    8  order-flow direction, conf = signal strength
//                    (only when order flow is present)
//   macro         3  VIX/DXY risk appetite (only with MacroContext)
//   structure     6  swing structure (exhaustion -> reversal side)
//
// Decision:
//   Veto           a vote on the candidate side and an opposing vote both
//                  with confidence >= veto_vote_confidence
//   WeakConsensus  agreement < floor, support < min support weight, or
//                  oppose > support
//   Approved       otherwise
//
// Adjustment: each vote contributes +/- weight x confidence/100 x 0.5
// capped at max_vote_adjustment, the sum capped at
// max_consensus_adjustment. base = min(95, edge x 15 + 40).
//
// Thread model:
//   Stateless static functions.
// -----------------------------------------------------------------------------
class ConsensusEngine {
 public:
  static std::vector<AgentVote> collectVotes(
      const domain::TechnicalScore& technical,
      const std::optional<domain::OrderFlowScore>& order_flow,
      const domain::MarketStructure& structure,
      const std::optional<domain::MacroContext>& macro);

  static ConsensusResult evaluate(std::vector<AgentVote> votes,
                                  domain::Direction direction, double edge,
                                  const domain::TacticalConfig& config);
};

}  // namespace tactical
