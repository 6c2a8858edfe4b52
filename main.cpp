// -----------------------------------------------------------------------------
// tactical_engine — single executable entry point.
//
// Live mode (default):
//   1) Load the configuration (defaults, optionally overlaid by --config).
//   2) Open the state directory and create the TacticalEngine on the wall
//      clock. The engine loads pattern learning, signal history and the
//      circuit breaker from it.
//   3) start(): event loops, monitor timer, IPC server, snapshot feed.
//   4) Idle on the main thread until Ctrl-C, then stop() and exit.
//
// Backtest mode (--backtest <candles.json>):
//   Replays the candles through BacktestSimulator and prints the report.
//   Learning from --state-dir seeds the replay but is never written back.
//
// Usage:
//   tactical_engine [--config <file>] [--state-dir <dir>]
//                   [--backtest <candles.json>] [--symbol <name>]
// -----------------------------------------------------------------------------

#include "tactical/backtest/backtest_simulator.hpp"
#include "tactical/config/config_loader.hpp"
#include "tactical/engine/tactical_engine.hpp"
#include "tactical/storage/file_store.hpp"
#include "tactical/storage/state_store.hpp"
#include "tactical/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

// Set from the SIGINT handler, polled by the main thread.
volatile std::sig_atomic_t g_stop_requested = 0;

void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

struct Options {
  std::string config_path;
  std::string state_dir{"state"};
  std::string backtest_path;
  std::string symbol{"BTCUSDT"};
};

Options parseArgs(int argc, char** argv) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };
    if (arg == "--config") {
      opts.config_path = value();
    } else if (arg == "--state-dir") {
      opts.state_dir = value();
    } else if (arg == "--backtest") {
      opts.backtest_path = value();
    } else if (arg == "--symbol") {
      opts.symbol = value();
    } else {
      throw std::invalid_argument("unknown argument " + arg);
    }
  }
  return opts;
}

int runBacktest(const Options& opts, const tactical::domain::TacticalConfig& config) {
  tactical::domain::PatternLearningState learning;
  if (!opts.state_dir.empty()) {
    tactical::FileStore files(opts.state_dir);
    tactical::StateStore state(files);
    learning = state.loadPatternLearning();
  }

  tactical::BacktestOptions bt_opts;
  bt_opts.symbol = opts.symbol;
  tactical::BacktestSimulator simulator(config, bt_opts);

  const auto candles = tactical::BacktestSimulator::loadCandles(opts.backtest_path);
  const auto result = simulator.run(candles, std::move(learning));
  std::cout << tactical::BacktestSimulator::formatReport(result);
  return 0;
}

int runLive(const Options& opts, const tactical::domain::TacticalConfig& config) {
  tactical::LiveTimeProvider clock;
  tactical::FileStore files(opts.state_dir);
  tactical::TacticalEngine engine(config, clock, &files);

  std::signal(SIGINT, sigint_handler);
  engine.start();

  std::cout << "[main] Listening for snapshots on tcp://127.0.0.1:5555\n"
            << "[main] Commands on tcp://127.0.0.1:5556, telemetry on "
               "tcp://127.0.0.1:5557\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const Options opts = parseArgs(argc, argv);

    tactical::domain::TacticalConfig config;
    if (!opts.config_path.empty()) {
      config = tactical::ConfigLoader::loadFile(opts.config_path);
    }
    tactical::ConfigLoader::validate(config);

    if (!opts.backtest_path.empty()) {
      return runBacktest(opts, config);
    }
    return runLive(opts, config);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] Invalid JSON input: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
  }
  return 1;
}
