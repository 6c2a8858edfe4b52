#include "tactical/engine/tactical_engine.hpp"
#include "tactical/storage/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace tactical {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TacticalEngine::TacticalEngine(domain::TacticalConfig config,
                               const ITimeProvider& clock,
                               IKeyValueStore* store,
                               std::string snapshot_endpoint,
                               std::string ipc_cmd_endpoint,
                               std::string ipc_pub_endpoint)
    : config_(std::move(config)),
      clock_(clock),
      store_(store),
      snapshot_endpoint_(std::move(snapshot_endpoint)),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)) {
  if (store_ != nullptr) {
    state_store_ = std::make_unique<StateStore>(*store_);
  }
}

TacticalEngine::~TacticalEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TacticalEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Load persisted state ---------------------------------------------
  domain::PatternLearningState learning;
  domain::SignalHistoryState history;
  domain::CircuitBreakerState breaker_state;
  if (state_store_) {
    learning = state_store_->loadPatternLearning();
    history = state_store_->loadSignalHistory();
    breaker_state = state_store_->loadCircuitBreaker();
    std::cout << "[TacticalEngine] State loaded: "
              << learning.outcomes.size() << " outcome(s), "
              << history.entries.size() << " history entr(ies), breaker "
              << (breaker_state.tripped ? "TRIPPED" : "armed") << ".\n";
  }
  // The configured limit always wins over the persisted one.
  breaker_state.daily_loss_limit = config_.daily_loss_limit;

  // ---  2) Risk-loop components ---------------------------------------------
  // SignalTracker subscribes before ExecutionGate so it has stored a signal
  // by the time the gate publishes PositionOpenedEvent for it.
  breaker_ = std::make_unique<CircuitBreaker>(breaker_state, clock_);
  monitor_ = std::make_unique<PositionMonitor>(risk_loop_.eventBus(), *breaker_,
                                               config_, ids_);
  // Marks run before SignalTracker sees the same snapshot.
  bridge<SnapshotEvent>(risk_loop_.eventBus(), [this](const SnapshotEvent& e) {
    monitor_->updatePrice(e.snapshot.symbol, e.snapshot.price, clock_.now_ms());
  });
  bridge<MonitorTickEvent>(risk_loop_.eventBus(),
                           [this](const MonitorTickEvent& e) {
                             monitor_->tick(e.now_ms);
                           });
  tracker_ = std::make_unique<SignalTracker>(risk_loop_.eventBus(), *monitor_,
                                             config_);
  gate_ = std::make_unique<ExecutionGate>(risk_loop_.eventBus(), *monitor_,
                                          *breaker_, ids_, clock_, config_);

  // ---  3) Signal-loop component --------------------------------------------
  generator_ = std::make_unique<SignalGenerator>(
      signal_loop_.eventBus(), config_, clock_, state_store_.get(),
      std::move(history), std::move(learning));

  // ---  4) Start the loops and wire the bridges -----------------------------
  signal_loop_.start();
  risk_loop_.start();

  bridge<SignalEmittedEvent>(signal_loop_.eventBus(),
                             [this](const SignalEmittedEvent& e) {
                               risk_loop_.push(e);
                             });
  bridge<PositionClosedEvent>(risk_loop_.eventBus(),
                              [this](const PositionClosedEvent& e) {
                                signal_loop_.push(e);
                              });

  // ---  5) IPC server and telemetry -----------------------------------------
  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);
    ipc_server_->start();

    bridge<SignalEmittedEvent>(signal_loop_.eventBus(),
                               [this](const SignalEmittedEvent& e) {
                                 ipc_server_->pushTelemetry(e);
                               });
    bridge<SignalRejectedEvent>(signal_loop_.eventBus(),
                                [this](const SignalRejectedEvent& e) {
                                  ipc_server_->pushTelemetry(e);
                                });
    bridge<SignalUpdatedEvent>(risk_loop_.eventBus(),
                               [this](const SignalUpdatedEvent& e) {
                                 ipc_server_->pushTelemetry(e);
                               });
    bridge<PositionOpenedEvent>(risk_loop_.eventBus(),
                                [this](const PositionOpenedEvent& e) {
                                  ipc_server_->pushTelemetry(e);
                                });
    bridge<PositionClosedEvent>(risk_loop_.eventBus(),
                                [this](const PositionClosedEvent& e) {
                                  ipc_server_->pushTelemetry(e);
                                });
  }

  breaker_->setChangeHandler(
      [this](const domain::CircuitBreakerState& state,
             const std::string& reason) { onBreakerChange(state, reason); });

  // ---  6) Monitor timer -----------------------------------------------------
  monitor_timer_ = std::make_unique<PeriodicTimer>(
      std::chrono::milliseconds(config_.monitor_interval_ms),
      [this](std::uint64_t tick) {
        risk_loop_.push(MonitorTickEvent{clock_.now_ms(), tick});
      });
  monitor_timer_->start();

  // ---  7) Snapshot feed LAST -----------------------------------------------
  if (!snapshot_endpoint_.empty()) {
    feed_thread_ = std::make_unique<SnapshotFeedThread>(
        [this](Event event) {
          signal_loop_.push(event);
          risk_loop_.push(std::move(event));
        },
        snapshot_endpoint_);
    feed_thread_->start();
  }

  running_ = true;
  std::cout << "[TacticalEngine] started. Threads: signal, risk, monitor"
            << (ipc_server_ ? ", ipc" : "")
            << (feed_thread_ ? ", snapshot_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TacticalEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new input -------------------------------------------------------
  feed_thread_.reset();
  monitor_timer_.reset();

  // ---  2) Join the loops ------------------------------------------------------
  signal_loop_.stop();
  risk_loop_.stop();
  for (const auto& [bus, id] : bridges_) {
    bus->unsubscribe(id);
  }
  bridges_.clear();

  // ---  3) IPC (commands touch the components below) -------------------------
  breaker_->setChangeHandler(nullptr);
  ipc_server_.reset();

  // ---  4) Components, reverse creation order --------------------------------
  generator_.reset();
  gate_.reset();
  tracker_.reset();
  monitor_.reset();
  breaker_.reset();

  running_ = false;
  std::cout << "[TacticalEngine] stopped. All threads joined.\n";
}

void TacticalEngine::pushSnapshot(domain::MarketSnapshot snapshot) {
  SnapshotEvent event{std::move(snapshot), ++snapshot_seq_};
  signal_loop_.push(event);
  risk_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// onBreakerChange(): persist + telemetry
// -----------------------------------------------------------------------------
void TacticalEngine::onBreakerChange(const domain::CircuitBreakerState& state,
                                     const std::string& reason) {
  if (state_store_ && !state_store_->saveCircuitBreaker(state)) {
    std::cerr << "[TacticalEngine] Circuit breaker state not persisted.\n";
  }
  if (ipc_server_) {
    ipc_server_->pushTelemetry(
        CircuitBreakerEvent{state, reason, clock_.now_ms()});
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TacticalEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["halted"] = gate_ ? gate_->isHalted() : false;
    if (breaker_) {
      response["breaker"] = breaker_->state();
    }
    response["balance"] = monitor_ ? monitor_->balance() : config_.initial_balance;
    response["positions"] =
        monitor_ ? monitor_->getSnapshots() : std::vector<domain::Position>{};
    response["signals"] =
        tracker_ ? tracker_->active()
                 : std::vector<domain::EnhancedTradeSignal>{};
  } else if (cmd == "HALT") {
    if (gate_) {
      gate_->haltTrading();
    }
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "RESUME") {
    if (gate_) {
      gate_->resumeTrading();
    }
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else if (cmd == "RESET_BREAKER") {
    if (breaker_) {
      breaker_->reset();
    }
    response["status"] = "ok";
    response["response"] = "Circuit breaker reset";
  } else if (cmd == "ADVISORY" || cmd.rfind("ADVISORY ", 0) == 0) {
    response = submitAdvisory(cmd.substr(8));
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// submitAdvisory(): syntax check here, validation on the signal loop
// -----------------------------------------------------------------------------
nlohmann::json TacticalEngine::submitAdvisory(const std::string& payload) {
  nlohmann::json response;
  if (!running_) {
    response["status"] = "error";
    response["response"] = "Engine not running";
  } else if (!nlohmann::json::accept(payload)) {
    response["status"] = "error";
    response["response"] = "Advisory payload is not valid JSON";
  } else {
    signal_loop_.push(AdvisorySubmittedEvent{payload, clock_.now_ms()});
    response["status"] = "ok";
    response["response"] = "Advisory queued";
  }
  return response;
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
EventBus& TacticalEngine::signalEventBus() { return signal_loop_.eventBus(); }

EventBus& TacticalEngine::riskEventBus() { return risk_loop_.eventBus(); }

std::vector<domain::Position> TacticalEngine::positions() const {
  return monitor_ ? monitor_->getSnapshots() : std::vector<domain::Position>{};
}

domain::CircuitBreakerState TacticalEngine::breakerState() const {
  return breaker_ ? breaker_->state() : domain::CircuitBreakerState{};
}

}  // namespace tactical
