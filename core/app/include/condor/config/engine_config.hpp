#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/domain/risk_limits.hpp"
#include "condor/execution/execution_manager.hpp"
#include "condor/execution/simulated_broker.hpp"
#include "condor/execution/zmq_broker_client.hpp"
#include "condor/feed/feed_adapter.hpp"
#include "condor/feed/zmq_feed_transport.hpp"
#include "condor/market/instrument_master.hpp"
#include "condor/market/option_chain.hpp"
#include "condor/strategy/iron_condor_strategy.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace condor {

enum class RunMode { Live, Backtest };

const char* toString(RunMode mode);
std::optional<RunMode> parseRunMode(const std::string& text);

struct OptionListing {
  domain::Strike strike{0};
  domain::OptionType type{domain::OptionType::Call};
  std::string trading_symbol;
};

// The subscribable chain: an explicit option list, or every strike within
// strikes_each_side steps of center_strike.
struct InstrumentConfig {
  std::int64_t expiry_ms{0};
  domain::Strike center_strike{0};
  int strikes_each_side{0};
  std::int64_t lot_size{0};  // 0 = the index default
  std::vector<OptionListing> options;
};

struct PersistenceConfig {
  bool enabled{true};
  std::string directory{"state"};
};

struct BacktestConfig {
  std::string tick_file;
  SimBrokerParams broker;
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Everything the engine reads at startup. Loaded once from a JSON file,
// validated, then read-only. See config/example_config.json for the layout.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::IndexId index{domain::IndexId::Nifty};
  RunMode mode{RunMode::Backtest};
  std::string session_token;

  domain::RiskLimits risk_limits;
  IronCondorParams strategy;
  ExecutionParams execution;
  FeedParams feed;
  FeedEndpoints feed_endpoints;
  BrokerEndpoints broker_endpoints;
  PricingParams pricing;
  InstrumentConfig instruments;
  PersistenceConfig persistence;
  BacktestConfig backtest;

  // Scheduler tick cadence in live mode; 0 disables the timer thread.
  std::int64_t timer_interval_ms{250};
};

// Reads and validates a config file. Throws ConfigInvalid.
EngineConfig loadConfig(const std::string& path);

// Parses and validates an already-loaded document. Missing keys keep their
// defaults; ill-typed keys and violated constraints throw ConfigInvalid.
EngineConfig parseConfig(const nlohmann::json& document);

// Throws ConfigInvalid naming the first violated constraint.
void validateConfig(const EngineConfig& config);

// Builds the InstrumentMaster the configuration describes.
InstrumentMaster buildInstrumentMaster(const EngineConfig& config);

// <persistence.directory>/order_events.jsonl
std::string orderLogPath(const PersistenceConfig& persistence);

// "HH:MM" to minutes since midnight; throws ConfigInvalid.
int parseClockMinutes(const std::string& text);

}  // namespace condor
