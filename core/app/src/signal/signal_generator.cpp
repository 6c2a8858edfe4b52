#include "tactical/signal/signal_generator.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/learning/pattern_learner.hpp"
#include "tactical/signal/signal_pipeline.hpp"
#include "tactical/validation/advisory_signal.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>
#include <variant>

namespace tactical {

SignalGenerator::SignalGenerator(EventBus& bus,
                                 const domain::TacticalConfig& config,
                                 const ITimeProvider& clock, StateStore* store,
                                 domain::SignalHistoryState history,
                                 domain::PatternLearningState learning)
    : bus_(bus),
      config_(config),
      clock_(clock),
      store_(store),
      history_(std::move(history)),
      learning_(std::move(learning)) {
  subscriptions_.push_back(bus_.subscribe<SnapshotEvent>(
      [this](const SnapshotEvent& e) { onSnapshot(e); }));
  subscriptions_.push_back(bus_.subscribe<AdvisorySubmittedEvent>(
      [this](const AdvisorySubmittedEvent& e) { onAdvisory(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) { onPositionClosed(e); }));
}

SignalGenerator::~SignalGenerator() {
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

void SignalGenerator::onSnapshot(const SnapshotEvent& event) {
  const std::int64_t now = clock_.now_ms();
  markets_[event.snapshot.symbol] = ValidationContext{
      event.snapshot.price, event.snapshot.indicators.atr, now};

  auto eval =
      SignalPipeline::evaluate(event.snapshot, history_, learning_, config_, now);
  ++evaluated_;
  history_ = std::move(eval.updated_history);

  if (!eval.signal) {
    domain::Rejection rejection =
        eval.rejection ? *eval.rejection : domain::Rejection{};
    bus_.publish(SignalRejectedEvent{event.snapshot.symbol,
                                     std::move(rejection), now});
    return;
  }

  const auto& signal = *eval.signal;
  std::cout << "[SignalGenerator] " << domain::toString(signal.direction)
            << " " << signal.symbol << " @ " << signal.entry_price
            << " confidence " << signal.confidence << " (" << signal.id
            << ")\n";

  if (store_ != nullptr && !store_->saveSignalHistory(history_)) {
    std::cerr << "[SignalGenerator] Signal history not persisted.\n";
  }
  bus_.publish(SignalEmittedEvent{signal, now});
}

// -----------------------------------------------------------------------------
// onAdvisory(): external candidates share the emission path but never the
// signal history, and stay pending review
// -----------------------------------------------------------------------------
void SignalGenerator::onAdvisory(const AdvisorySubmittedEvent& event) {
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(event.payload);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SignalGenerator] Advisory dropped, bad JSON: " << e.what()
              << "\n";
    return;
  }
  if (!payload.is_object()) {
    std::cerr << "[SignalGenerator] Advisory dropped: not a JSON object\n";
    return;
  }

  std::string symbol = "BTCUSDT";
  const auto sym = payload.find("symbol");
  if (sym != payload.end() && sym->is_string()) {
    symbol = sym->get<std::string>();
  }
  const auto market = markets_.find(symbol);
  if (market == markets_.end()) {
    std::cerr << "[SignalGenerator] Advisory dropped: no snapshot for "
              << symbol << " yet\n";
    return;
  }

  const std::int64_t now = clock_.now_ms();
  ValidationContext context = market->second;
  context.now_ms = now;

  const auto parsed = parseAdvisorySignal(payload, context, config_);
  if (const auto* invalid = std::get_if<InvalidAdvisorySignal>(&parsed)) {
    std::cout << "[SignalGenerator] Advisory for " << symbol
              << " dropped: " << invalid->reason << "\n";
    return;
  }

  const auto& signal = std::get<ValidAdvisorySignal>(parsed).signal;
  std::cout << "[SignalGenerator] Advisory " << domain::toString(signal.direction)
            << " " << signal.symbol << " @ " << signal.entry_price
            << " pending review (" << signal.id << ")\n";
  bus_.publish(SignalEmittedEvent{signal, now});
}

void SignalGenerator::onPositionClosed(const PositionClosedEvent& event) {
  learning_ = PatternLearner::addOutcome(learning_, event.outcome);
  if (store_ != nullptr && !store_->savePatternLearning(learning_)) {
    std::cerr << "[SignalGenerator] Pattern learning not persisted.\n";
  }
}

}  // namespace tactical
