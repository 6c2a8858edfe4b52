#pragma once

#include "tactical/domain/pattern.hpp"
#include "tactical/domain/state.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event_types.hpp"
#include "tactical/storage/state_store.hpp"
#include "tactical/time/i_time_provider.hpp"
#include "tactical/validation/signal_validator.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// SignalGenerator
// -----------------------------------------------------------------------------
//
// @brief  Signal-loop component: turns SnapshotEvents into
//         SignalEmittedEvent / SignalRejectedEvent and feeds closed trades
//         back into pattern learning.
//
// @details
// Owns the signal history and the pattern learning state of the live
// engine. Both are plain values mutated only from bus callbacks, so they
// are confined to the thread that publishes on `bus` (the signal loop).
//
//   SnapshotEvent        -> SignalPipeline::evaluate()
//                           publish Emitted or Rejected
//                           persist history when a signal was emitted
//   AdvisorySubmittedEvent
//                        -> parseAdvisorySignal() against the last snapshot
//                           of the payload's symbol; publish Emitted (pending
//                           review) when valid, log and drop otherwise
//   PositionClosedEvent  -> PatternLearner::addOutcome(), persist learning
//
// `store` may be null, in which case nothing is persisted.
//
// Thread model:
//   Callbacks run on the loop thread. Accessors are for tests and must be
//   called after the loop has been stopped or drained.
// -----------------------------------------------------------------------------
class SignalGenerator {
 public:
  SignalGenerator(EventBus& bus, const domain::TacticalConfig& config,
                  const ITimeProvider& clock, StateStore* store,
                  domain::SignalHistoryState history,
                  domain::PatternLearningState learning);
  ~SignalGenerator();

  SignalGenerator(const SignalGenerator&) = delete;
  SignalGenerator& operator=(const SignalGenerator&) = delete;
  SignalGenerator(SignalGenerator&&) = delete;
  SignalGenerator& operator=(SignalGenerator&&) = delete;

  const domain::SignalHistoryState& history() const { return history_; }
  const domain::PatternLearningState& learning() const { return learning_; }
  std::uint64_t evaluated() const { return evaluated_; }

 private:
  void onSnapshot(const SnapshotEvent& event);
  void onAdvisory(const AdvisorySubmittedEvent& event);
  void onPositionClosed(const PositionClosedEvent& event);

  EventBus& bus_;
  const domain::TacticalConfig& config_;
  const ITimeProvider& clock_;
  StateStore* store_;

  domain::SignalHistoryState history_;
  domain::PatternLearningState learning_;
  std::uint64_t evaluated_{0};

  // Live price and ATR of the last snapshot seen per symbol.
  std::unordered_map<std::string, ValidationContext> markets_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace tactical
