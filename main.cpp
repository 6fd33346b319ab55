// -----------------------------------------------------------------------------
// condor_engine: single executable entry point.
//
//   condor_engine --config <file> [--mode live|backtest]
//                 [--index NIFTY|SENSEX] [--ticks <file>]
//
// Backtest mode replays a JSON-lines tick file through the decision
// pipeline against the simulated broker and prints a summary.
//
// Live mode connects the ZeroMQ feed and broker collaborators, hydrates
// state from the persistence directory, and trades until Ctrl-C or a fatal
// condition.
//
// Exit codes:
//   0  normal shutdown
//   1  feed unavailable (reconnect budget exhausted)
//   2  invalid configuration or command line
//   3  broker session expired
//   4  initial feed connection failed
// -----------------------------------------------------------------------------

#include "condor/config/engine_config.hpp"
#include "condor/domain/errors.hpp"
#include "condor/engine/backtest_engine.hpp"
#include "condor/engine/tick_file_reader.hpp"
#include "condor/engine/trading_engine.hpp"
#include "condor/execution/zmq_broker_client.hpp"
#include "condor/feed/zmq_feed_transport.hpp"
#include "condor/persistence/journal_reconciler.hpp"
#include "condor/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigInvalid = 2;
constexpr int kExitConnectionError = 4;

// Set by the signal handler, polled by main(). Lock-free atomic stores are
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

struct CliOptions {
  std::string config_path;
  std::optional<std::string> mode;
  std::optional<std::string> index;
  std::optional<std::string> ticks;
};

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " --config <file> [--mode live|backtest]"
               " [--index NIFTY|SENSEX] [--ticks <file>]\n";
}

// Returns nullopt (after printing why) on a malformed command line.
std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    }
    if (i + 1 >= argc) {
      std::cerr << "[main] missing value for " << arg << "\n";
      return std::nullopt;
    }
    const std::string value = argv[++i];
    if (arg == "--config") {
      options.config_path = value;
    } else if (arg == "--mode") {
      options.mode = value;
    } else if (arg == "--index") {
      options.index = value;
    } else if (arg == "--ticks") {
      options.ticks = value;
    } else {
      std::cerr << "[main] unknown option " << arg << "\n";
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) {
    std::cerr << "[main] --config is required\n";
    return std::nullopt;
  }
  return options;
}

// Command-line overrides win over the file; the result is validated again.
void applyOverrides(const CliOptions& options, condor::EngineConfig& config) {
  if (options.mode) {
    auto mode = condor::parseRunMode(*options.mode);
    if (!mode) {
      throw condor::ConfigInvalid("--mode must be live or backtest");
    }
    config.mode = *mode;
  }
  if (options.index) {
    auto index = condor::domain::parseIndex(*options.index);
    if (!index) {
      throw condor::ConfigInvalid("--index must be NIFTY or SENSEX");
    }
    config.index = *index;
  }
  if (options.ticks) {
    config.backtest.tick_file = *options.ticks;
  }
  condor::validateConfig(config);
}

int runBacktest(const condor::EngineConfig& config,
                const condor::InstrumentMaster& master) {
  if (config.backtest.tick_file.empty()) {
    std::cerr << "[main] backtest mode needs --ticks or backtest.tick_file\n";
    return kExitConfigInvalid;
  }

  std::vector<condor::domain::Tick> ticks;
  try {
    ticks = condor::readTickFile(config.backtest.tick_file);
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return kExitConfigInvalid;
  }

  condor::BacktestEngine engine(config, master);
  const condor::BacktestResult result = engine.run(ticks);

  std::cout << "[main] Backtest summary: positions closed="
            << result.closed_positions.size()
            << " realized_pnl=" << result.realized_pnl
            << " fills=" << result.fills << " conflicts=" << result.conflicts
            << " position updates=" << result.trajectory.size() << "\n";
  for (const auto& p : result.closed_positions) {
    std::cout << "[main]   " << p.id << " exit="
              << (p.exit_reason ? condor::domain::toString(*p.exit_reason)
                                : "-")
              << " realized_pnl=" << p.realized_pnl << "\n";
  }
  return kExitOk;
}

int runLive(const condor::EngineConfig& config,
            const condor::InstrumentMaster& master) {
  condor::LiveTimeProvider wall_clock;

  auto transport = std::make_unique<condor::ZmqFeedTransport>(
      config.feed_endpoints, config.session_token);
  auto broker = std::make_unique<condor::ZmqBrokerClient>(
      config.broker_endpoints, config.session_token);

  condor::TradingEngine engine(config, master, wall_clock,
                               std::move(transport), std::move(broker));

  std::unique_ptr<condor::JournalReconciler> reconciler;
  if (config.persistence.enabled) {
    reconciler = std::make_unique<condor::JournalReconciler>(
        config.persistence.directory,
        condor::orderLogPath(config.persistence));
  }

  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  try {
    engine.start(reconciler.get());
  } catch (const condor::ConnectionError& e) {
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return kExitConnectionError;
  } catch (const std::runtime_error& e) {
    // Persistence directory or order log could not be opened.
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return kExitConfigInvalid;
  }

  std::cout << "[main] Trading " << condor::domain::toString(config.index)
            << ". Press Ctrl-C to shut down.\n";

  std::optional<int> code;
  while (!code) {
    code = engine.waitForExit(std::chrono::milliseconds(200));
    if (!code && g_shutdown_requested.load()) {
      std::cout << "\n[main] Shutdown requested.\n";
      engine.requestShutdown();
      code = engine.exitCode();
    }
  }

  engine.stop();
  std::cout << "[main] exit code " << *code << "\n";
  return *code;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<CliOptions> options = parseArgs(argc, argv);
  if (!options) {
    printUsage(argv[0]);
    return kExitConfigInvalid;
  }

  condor::EngineConfig config;
  std::optional<condor::InstrumentMaster> master;
  try {
    config = condor::loadConfig(options->config_path);
    applyOverrides(*options, config);
    master.emplace(condor::buildInstrumentMaster(config));
  } catch (const condor::ConfigInvalid& e) {
    std::cerr << "[main] FATAL: invalid configuration: " << e.what() << "\n";
    return kExitConfigInvalid;
  }

  std::cout << "[main] " << condor::toString(config.mode) << " mode, index "
            << condor::domain::toString(config.index) << ", "
            << master->optionCount() << " option(s) listed.\n";

  if (config.mode == condor::RunMode::Backtest) {
    return runBacktest(config, *master);
  }
  return runLive(config, *master);
}
