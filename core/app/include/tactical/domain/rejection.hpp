#pragma once

#include <string>

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// RejectStage — where in the pipeline a candidate signal was discarded
// -----------------------------------------------------------------------------
//
// Every stage here is a HardReject: the candidate is dropped for this cycle
// and never retried automatically. Soft penalties do not produce a
// Rejection; they are recorded in the signal's reasoning trail instead.
// -----------------------------------------------------------------------------
enum class RejectStage {
  InsufficientData,
  NoDirection,
  Cooldown,
  ChopDetected,
  OrderFlowVeto,
  LowVolume,
  VolatilityExtreme,
  LowTradability,
  EdgeInsufficient,
  ScoreInsufficient,
  OpposingScore,
  ConsensusVeto,
  RiskReward,
  Validation,
};

struct Rejection {
  RejectStage stage{RejectStage::Validation};
  std::string reason;
};

inline const char* toString(RejectStage s) {
  switch (s) {
    case RejectStage::InsufficientData:  return "INSUFFICIENT_DATA";
    case RejectStage::NoDirection:       return "NO_DIRECTION";
    case RejectStage::Cooldown:          return "COOLDOWN";
    case RejectStage::ChopDetected:      return "CHOP_DETECTED";
    case RejectStage::OrderFlowVeto:     return "ORDER_FLOW_VETO";
    case RejectStage::LowVolume:         return "LOW_VOLUME";
    case RejectStage::VolatilityExtreme: return "VOLATILITY_EXTREME";
    case RejectStage::LowTradability:    return "LOW_TRADABILITY";
    case RejectStage::EdgeInsufficient:  return "EDGE_INSUFFICIENT";
    case RejectStage::ScoreInsufficient: return "SCORE_INSUFFICIENT";
    case RejectStage::OpposingScore:     return "OPPOSING_SCORE";
    case RejectStage::ConsensusVeto:     return "CONSENSUS_VETO";
    case RejectStage::RiskReward:        return "RISK_REWARD";
    case RejectStage::Validation:        return "VALIDATION";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tactical
