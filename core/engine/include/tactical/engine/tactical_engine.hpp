#pragma once

#include "tactical/concurrent/event_loop_thread.hpp"
#include "tactical/concurrent/id_generator.hpp"
#include "tactical/concurrent/periodic_timer.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/monitor/position_monitor.hpp"
#include "tactical/network/ipc_server.hpp"
#include "tactical/network/snapshot_feed_thread.hpp"
#include "tactical/risk/circuit_breaker.hpp"
#include "tactical/risk/execution_gate.hpp"
#include "tactical/signal/signal_generator.hpp"
#include "tactical/signal/signal_tracker.hpp"
#include "tactical/storage/i_key_value_store.hpp"
#include "tactical/storage/state_store.hpp"
#include "tactical/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// TacticalEngine
// -----------------------------------------------------------------------------
//
// @brief  Live runtime root: owns the event loops, the monitor timer, the
//         snapshot feed, the IPC server and every stateful component.
//
// @details
// Thread layout:
//
//   signal_loop thread   -> SignalGenerator (pipeline + pattern learning)
//   risk_loop thread     -> PositionMonitor + SignalTracker + ExecutionGate
//   monitor timer        -> posts MonitorTickEvent every monitor_interval_ms
//   snapshot feed        -> SnapshotGateway ZMQ SUB recv loop
//   ipc server           -> REP commands + PUB telemetry
//
//   main thread          -> engine.start(), wait for shutdown, engine.stop()
//
// Cross-thread bridges (wired in start()):
//   1. snapshot feed  ->  signal_loop + risk_loop:  SnapshotEvent
//   2. signal_loop    ->  risk_loop:                SignalEmittedEvent
//   3. risk_loop      ->  signal_loop:              PositionClosedEvent
//   4. timer          ->  risk_loop:                MonitorTickEvent
//   5. both loops     ->  ipc server:               telemetry events
//
// The risk loop is the single writer of positions. The circuit breaker is
// shared (mutex inside); its change handler persists the new state and
// streams a BREAKER telemetry line.
//
// State:
//   With a key-value store, pattern learning, signal history and the
//   breaker are loaded in start() and written back on every change.
//   Without one the engine starts from empty states and persists nothing.
//
// Ownership:
//   Components are heap-allocated so stop() controls destruction order.
//   The event loops are value members and outlive every component.
// -----------------------------------------------------------------------------
class TacticalEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config             Engine configuration, copied.
  // @param  clock              Time source for signals and monitor ticks.
  //                            Must outlive the engine.
  // @param  store              Optional persistence backend. Must outlive
  //                            the engine when given.
  // @param  snapshot_endpoint  ZMQ SUB endpoint. Empty disables the feed
  //                            (tests push snapshots via pushSnapshot()).
  // @param  ipc_cmd_endpoint / ipc_pub_endpoint
  //                            IPC sockets. Either empty disables IPC.
  //
  // No threads are spawned and no sockets are opened here.
  // -------------------------------------------------------------------------
  TacticalEngine(domain::TacticalConfig config, const ITimeProvider& clock,
                 IKeyValueStore* store = nullptr,
                 std::string snapshot_endpoint = "tcp://127.0.0.1:5555",
                 std::string ipc_cmd_endpoint = "tcp://127.0.0.1:5556",
                 std::string ipc_pub_endpoint = "tcp://127.0.0.1:5557");

  ~TacticalEngine();

  TacticalEngine(const TacticalEngine&) = delete;
  TacticalEngine& operator=(const TacticalEngine&) = delete;
  TacticalEngine(TacticalEngine&&) = delete;
  TacticalEngine& operator=(TacticalEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // Startup sequence:
  //   1. Load persisted state.
  //   2. Create the circuit breaker and the risk-loop components.
  //   3. Create the SignalGenerator on the signal loop.
  //   4. Start both event loops and wire the bridges.
  //   5. Start the IPC server and its telemetry bridges.
  //   6. Start the monitor timer.
  //   7. Start the snapshot feed LAST.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // Shutdown sequence:
  //   1. Stop the snapshot feed and the monitor timer (no new input).
  //   2. Stop both event loops (joins their threads).
  //   3. Stop the IPC server (its commands query the components).
  //   4. Destroy the components.
  //
  // Idempotent. start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_; }

  /// Enqueues a snapshot into both loops, as the feed would.
  void pushSnapshot(domain::MarketSnapshot snapshot);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @return JSON response string.
  //
  //   "PING"          -> {"status":"ok","response":"PONG"}
  //   "STATUS"        -> {"status":"ok","halted":bool,"breaker":{...},
  //                       "balance":x,"positions":[...],"signals":[...]}
  //   "HALT"          -> halts execution (emission continues)
  //   "RESUME"        -> lifts the halt
  //   "RESET_BREAKER" -> clears a tripped breaker for today
  //   "ADVISORY <json>"
  //                   -> queues an external candidate signal on the signal
  //                      loop; a valid one is emitted pending review
  //   other           -> {"status":"error","response":"Unknown command: ..."}
  //
  // Thread model: runs on the IPC thread; every component it touches is
  // thread-safe (shared_mutex, mutex or atomics).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& signalEventBus();
  EventBus& riskEventBus();

  std::vector<domain::Position> positions() const;
  domain::CircuitBreakerState breakerState() const;

 private:
  void onBreakerChange(const domain::CircuitBreakerState& state,
                       const std::string& reason);
  nlohmann::json submitAdvisory(const std::string& payload);

  template <typename EventType, typename Fn>
  void bridge(EventBus& bus, Fn&& fn) {
    bridges_.emplace_back(
        &bus, bus.subscribe<EventType>(std::forward<Fn>(fn)));
  }

  domain::TacticalConfig config_;
  const ITimeProvider& clock_;
  IKeyValueStore* store_;

  std::string snapshot_endpoint_;
  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  IdGenerator ids_;
  std::unique_ptr<StateStore> state_store_;

  // --- Core event loops (value members, destroyed last) ---------------------
  EventLoopThread signal_loop_{"signal"};
  EventLoopThread risk_loop_{"risk"};

  // --- I/O threads -----------------------------------------------------------
  std::unique_ptr<SnapshotFeedThread> feed_thread_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<PeriodicTimer> monitor_timer_;

  // --- Logic components ------------------------------------------------------
  std::unique_ptr<CircuitBreaker> breaker_;
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<SignalTracker> tracker_;
  std::unique_ptr<ExecutionGate> gate_;
  std::unique_ptr<SignalGenerator> generator_;

  std::vector<std::pair<EventBus*, EventBus::SubscriptionId>> bridges_;
  std::uint64_t snapshot_seq_{0};
  std::atomic<bool> running_{false};
};

}  // namespace tactical
