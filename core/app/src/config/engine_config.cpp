#include "condor/config/engine_config.hpp"
#include "condor/domain/errors.hpp"
#include "condor/persistence/json_codec.hpp"
#include "condor/time/time_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace condor {

using nlohmann::json;

namespace {

// Reads section[key] into `out` when present. Type mismatches become
// ConfigInvalid naming the offending key.
template <typename T>
void read(const json& section, const char* section_name, const char* key,
          T& out) {
  if (!section.contains(key)) {
    return;
  }
  try {
    out = section.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigInvalid(std::string(section_name) + "." + key + ": " +
                        e.what());
  }
}

const json& sectionOf(const json& document, const char* name) {
  static const json kEmpty = json::object();
  if (!document.contains(name)) {
    return kEmpty;
  }
  const json& s = document.at(name);
  if (!s.is_object()) {
    throw ConfigInvalid(std::string(name) + " must be an object");
  }
  return s;
}

void require(bool ok, const std::string& what) {
  if (!ok) {
    throw ConfigInvalid(what);
  }
}

// "YYYY-MM-DD" -> 15:30 IST of that day (NSE/BSE options expire at close).
std::int64_t parseExpiryDate(const std::string& text) {
  int y = 0;
  int m = 0;
  int d = 0;
  char trailing = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &trailing) != 3 ||
      m < 1 || m > 12 || d < 1 || d > 31) {
    throw ConfigInvalid("instruments.expiry: expected YYYY-MM-DD, got '" +
                        text + "'");
  }
  return istToEpochMs(y, m, d, 15, 30);
}

}  // namespace

const char* toString(RunMode mode) {
  return mode == RunMode::Live ? "live" : "backtest";
}

std::optional<RunMode> parseRunMode(const std::string& text) {
  if (text == "live") return RunMode::Live;
  if (text == "backtest") return RunMode::Backtest;
  return std::nullopt;
}

int parseClockMinutes(const std::string& text) {
  int h = 0;
  int m = 0;
  char trailing = 0;
  if (std::sscanf(text.c_str(), "%2d:%2d%c", &h, &m, &trailing) != 2 ||
      h < 0 || h > 23 || m < 0 || m > 59) {
    throw ConfigInvalid("expected HH:MM, got '" + text + "'");
  }
  return h * 60 + m;
}

std::string orderLogPath(const PersistenceConfig& persistence) {
  return (std::filesystem::path(persistence.directory) / "order_events.jsonl")
      .string();
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigInvalid("cannot open config file " + path);
  }
  json document;
  try {
    in >> document;
  } catch (const json::exception& e) {
    throw ConfigInvalid("config file " + path + " is not valid JSON: " +
                        e.what());
  }
  EngineConfig config = parseConfig(document);
  std::cout << "[Config] loaded " << path << " (index="
            << domain::toString(config.index)
            << " mode=" << toString(config.mode) << ")\n";
  return config;
}

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& document) {
  if (!document.is_object()) {
    throw ConfigInvalid("config root must be an object");
  }
  EngineConfig c;

  // --- Top level ---------------------------------------------------------------
  if (document.contains("index")) {
    std::string index;
    read(document, "config", "index", index);
    auto parsed = domain::parseIndex(index);
    require(parsed.has_value(), "index must be NIFTY or SENSEX, got '" +
                                    index + "'");
    c.index = *parsed;
  }
  if (document.contains("mode")) {
    std::string mode;
    read(document, "config", "mode", mode);
    auto parsed = parseRunMode(mode);
    require(parsed.has_value(),
            "mode must be live or backtest, got '" + mode + "'");
    c.mode = *parsed;
  }
  read(document, "config", "session_token", c.session_token);

  // --- risk_limits -------------------------------------------------------------
  const json& risk = sectionOf(document, "risk_limits");
  read(risk, "risk_limits", "max_loss_per_position",
       c.risk_limits.max_loss_per_position);
  read(risk, "risk_limits", "max_positions", c.risk_limits.max_positions);
  read(risk, "risk_limits", "stop_loss_pct", c.risk_limits.stop_loss_pct);
  read(risk, "risk_limits", "hedge_trigger_delta",
       c.risk_limits.hedge_trigger_delta);
  read(risk, "risk_limits", "short_premium_stop_multiple",
       c.risk_limits.short_premium_stop_multiple);

  // --- strategy ----------------------------------------------------------------
  const json& st = sectionOf(document, "strategy");
  IronCondorParams& sp = c.strategy;
  read(st, "strategy", "name", sp.name);
  read(st, "strategy", "min_iv_rank", sp.min_iv_rank);
  if (st.contains("entry_start")) {
    std::string s;
    read(st, "strategy", "entry_start", s);
    sp.entry_start_minute = parseClockMinutes(s);
  }
  if (st.contains("entry_end")) {
    std::string s;
    read(st, "strategy", "entry_end", s);
    sp.entry_end_minute = parseClockMinutes(s);
  }
  read(st, "strategy", "min_days_to_expiry", sp.min_days_to_expiry);
  read(st, "strategy", "max_days_to_expiry", sp.max_days_to_expiry);
  read(st, "strategy", "max_entries_per_day", sp.max_entries_per_day);
  read(st, "strategy", "reentry_cooldown_ms", sp.reentry_cooldown_ms);
  if (st.contains("selection")) {
    std::string mode;
    read(st, "strategy", "selection", mode);
    if (mode == "delta") {
      sp.selection.mode = StrikeSelectionMode::Delta;
    } else if (mode == "offset") {
      sp.selection.mode = StrikeSelectionMode::Offset;
    } else {
      throw ConfigInvalid("strategy.selection must be delta or offset, got '" +
                          mode + "'");
    }
  }
  read(st, "strategy", "target_short_delta", sp.selection.target_short_delta);
  read(st, "strategy", "delta_band", sp.selection.delta_band);
  read(st, "strategy", "short_offset", sp.selection.short_offset);
  read(st, "strategy", "wing_width", sp.selection.wing_width);
  read(st, "strategy", "min_roll_distance", sp.selection.min_roll_distance);
  read(st, "strategy", "lots", sp.lots);
  read(st, "strategy", "exit_before_expiry_minutes",
       sp.exit_before_expiry_minutes);
  if (st.contains("eod_exit")) {
    if (st.at("eod_exit").is_null()) {
      sp.eod_exit_minute = -1;
    } else {
      std::string s;
      read(st, "strategy", "eod_exit", s);
      sp.eod_exit_minute = parseClockMinutes(s);
    }
  }
  read(st, "strategy", "take_profit", sp.take_profit);
  read(st, "strategy", "max_exit_attempts", sp.max_exit_attempts);
  read(st, "strategy", "roll_timeout_ms", sp.roll_timeout_ms);

  // --- execution ---------------------------------------------------------------
  const json& ex = sectionOf(document, "execution");
  read(ex, "execution", "max_retries", c.execution.max_retries);
  read(ex, "execution", "retry_base_ms", c.execution.retry_base_ms);
  read(ex, "execution", "retry_cap_ms", c.execution.retry_cap_ms);
  read(ex, "execution", "ack_timeout_ms", c.execution.ack_timeout_ms);
  read(ex, "execution", "reconcile_interval_ms",
       c.execution.reconcile_interval_ms);

  // --- feed --------------------------------------------------------------------
  const json& fd = sectionOf(document, "feed");
  read(fd, "feed", "data_endpoint", c.feed_endpoints.data_endpoint);
  read(fd, "feed", "control_endpoint", c.feed_endpoints.control_endpoint);
  read(fd, "feed", "control_timeout_ms", c.feed_endpoints.control_timeout_ms);
  read(fd, "feed", "heartbeat_timeout_ms", c.feed.heartbeat_timeout_ms);
  read(fd, "feed", "reconnect_base_ms", c.feed.reconnect_base_ms);
  read(fd, "feed", "reconnect_cap_ms", c.feed.reconnect_cap_ms);
  read(fd, "feed", "max_reconnect_attempts", c.feed.max_reconnect_attempts);
  read(fd, "feed", "stale_after_ms", c.feed.stale_after_ms);
  read(fd, "feed", "receive_timeout_ms", c.feed.receive_timeout_ms);

  // --- broker ------------------------------------------------------------------
  const json& br = sectionOf(document, "broker");
  read(br, "broker", "request_endpoint", c.broker_endpoints.request_endpoint);
  read(br, "broker", "report_endpoint", c.broker_endpoints.report_endpoint);
  read(br, "broker", "request_timeout_ms",
       c.broker_endpoints.request_timeout_ms);

  // --- pricing -----------------------------------------------------------------
  const json& pr = sectionOf(document, "pricing");
  read(pr, "pricing", "risk_free_rate", c.pricing.risk_free_rate);
  read(pr, "pricing", "dividend_yield", c.pricing.dividend_yield);
  read(pr, "pricing", "fallback_volatility", c.pricing.fallback_volatility);
  read(pr, "pricing", "iv_history", c.pricing.iv_history);
  read(pr, "pricing", "iv_history_window", c.pricing.iv_history_window);

  // --- instruments -------------------------------------------------------------
  const json& in = sectionOf(document, "instruments");
  read(in, "instruments", "expiry_ms", c.instruments.expiry_ms);
  if (in.contains("expiry")) {
    std::string date;
    read(in, "instruments", "expiry", date);
    c.instruments.expiry_ms = parseExpiryDate(date);
  }
  read(in, "instruments", "center_strike", c.instruments.center_strike);
  read(in, "instruments", "strikes_each_side",
       c.instruments.strikes_each_side);
  read(in, "instruments", "lot_size", c.instruments.lot_size);
  if (in.contains("options")) {
    try {
      for (const auto& o : in.at("options")) {
        OptionListing listing;
        o.at("strike").get_to(listing.strike);
        o.at("type").get_to(listing.type);
        listing.trading_symbol = o.value("trading_symbol", std::string{});
        c.instruments.options.push_back(std::move(listing));
      }
    } catch (const json::exception& e) {
      throw ConfigInvalid(std::string("instruments.options: ") + e.what());
    }
  }

  // --- persistence / backtest / engine ---------------------------------------
  const json& ps = sectionOf(document, "persistence");
  read(ps, "persistence", "enabled", c.persistence.enabled);
  read(ps, "persistence", "directory", c.persistence.directory);

  const json& bt = sectionOf(document, "backtest");
  read(bt, "backtest", "tick_file", c.backtest.tick_file);
  read(bt, "backtest", "slippage", c.backtest.broker.slippage);
  read(bt, "backtest", "latency_ms", c.backtest.broker.latency_ms);
  read(bt, "backtest", "push_fills", c.backtest.broker.push_fills);

  const json& en = sectionOf(document, "engine");
  read(en, "engine", "timer_interval_ms", c.timer_interval_ms);

  validateConfig(c);
  return c;
}

// -----------------------------------------------------------------------------
// validateConfig()
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& c) {
  const domain::IndexSpec& spec = domain::indexSpec(c.index);

  const auto& r = c.risk_limits;
  require(r.max_loss_per_position > 0.0,
          "risk_limits.max_loss_per_position must be > 0");
  require(r.max_positions >= 1, "risk_limits.max_positions must be >= 1");
  require(r.stop_loss_pct > 0.0 && r.stop_loss_pct <= 1.0,
          "risk_limits.stop_loss_pct must be in (0, 1]");
  require(r.hedge_trigger_delta > 0.0 && r.hedge_trigger_delta < 1.0,
          "risk_limits.hedge_trigger_delta must be in (0, 1)");
  require(r.short_premium_stop_multiple == 0.0 ||
              r.short_premium_stop_multiple > 1.0,
          "risk_limits.short_premium_stop_multiple must be 0 or > 1");

  const auto& s = c.strategy;
  require(!s.name.empty(), "strategy.name must not be empty");
  require(s.min_iv_rank >= 0.0 && s.min_iv_rank <= 1.0,
          "strategy.min_iv_rank must be in [0, 1]");
  require(s.entry_start_minute < s.entry_end_minute,
          "strategy.entry_start must be before strategy.entry_end");
  require(s.min_days_to_expiry >= 0.0 &&
              s.min_days_to_expiry <= s.max_days_to_expiry,
          "strategy days-to-expiry range is empty");
  require(s.selection.target_short_delta > 0.0 &&
              s.selection.target_short_delta < 1.0,
          "strategy.target_short_delta must be in (0, 1)");
  require(s.selection.target_short_delta < r.hedge_trigger_delta,
          "strategy.target_short_delta must be below "
          "risk_limits.hedge_trigger_delta");
  require(s.selection.delta_band >= 0.0, "strategy.delta_band must be >= 0");
  require(s.selection.wing_width > 0 &&
              s.selection.wing_width % spec.strike_step == 0,
          "strategy.wing_width must be a positive multiple of the strike "
          "step (" + std::to_string(spec.strike_step) + ")");
  require(s.selection.short_offset >= 0 &&
              s.selection.short_offset % spec.strike_step == 0,
          "strategy.short_offset must be a non-negative multiple of the "
          "strike step");
  require(s.selection.min_roll_distance >= 0,
          "strategy.min_roll_distance must be >= 0");
  require(s.lots >= 1, "strategy.lots must be >= 1");
  require(s.max_entries_per_day >= 0,
          "strategy.max_entries_per_day must be >= 0");
  require(s.reentry_cooldown_ms >= 0,
          "strategy.reentry_cooldown_ms must be >= 0");
  require(s.exit_before_expiry_minutes >= 0,
          "strategy.exit_before_expiry_minutes must be >= 0");
  require(s.take_profit >= 0.0, "strategy.take_profit must be >= 0");
  require(s.max_exit_attempts >= 1, "strategy.max_exit_attempts must be >= 1");
  require(s.roll_timeout_ms >= 0, "strategy.roll_timeout_ms must be >= 0");

  const auto& e = c.execution;
  require(e.max_retries >= 0, "execution.max_retries must be >= 0");
  require(e.retry_base_ms > 0 && e.retry_cap_ms >= e.retry_base_ms,
          "execution retry backoff needs 0 < retry_base_ms <= retry_cap_ms");
  require(e.ack_timeout_ms > 0, "execution.ack_timeout_ms must be > 0");
  require(e.reconcile_interval_ms >= 0,
          "execution.reconcile_interval_ms must be >= 0");

  const auto& f = c.feed;
  require(f.reconnect_base_ms > 0 && f.reconnect_cap_ms >= f.reconnect_base_ms,
          "feed reconnect backoff needs 0 < reconnect_base_ms <= "
          "reconnect_cap_ms");
  require(f.max_reconnect_attempts >= 1,
          "feed.max_reconnect_attempts must be >= 1");
  require(f.heartbeat_timeout_ms >= 0, "feed.heartbeat_timeout_ms must be >= 0");
  require(f.stale_after_ms >= 0, "feed.stale_after_ms must be >= 0");
  require(f.receive_timeout_ms > 0, "feed.receive_timeout_ms must be > 0");

  const auto& p = c.pricing;
  require(p.fallback_volatility > 0.0, "pricing.fallback_volatility must be > 0");
  require(p.iv_history_window >= 1, "pricing.iv_history_window must be >= 1");
  for (double iv : p.iv_history) {
    require(iv > 0.0, "pricing.iv_history values must be > 0");
  }

  const auto& in = c.instruments;
  require(in.expiry_ms > 0, "instruments.expiry (or expiry_ms) is required");
  require(in.lot_size >= 0, "instruments.lot_size must be >= 0");
  if (in.options.empty()) {
    require(in.strikes_each_side >= 1,
            "instruments needs an options list or strikes_each_side >= 1");
    require(in.center_strike > 0 && in.center_strike % spec.strike_step == 0,
            "instruments.center_strike must be a positive multiple of the "
            "strike step");
  }

  if (c.mode == RunMode::Live) {
    require(!c.session_token.empty(), "session_token is required in live mode");
  }
  require(c.backtest.broker.slippage >= 0.0, "backtest.slippage must be >= 0");
  require(c.backtest.broker.latency_ms >= 0, "backtest.latency_ms must be >= 0");
  require(c.timer_interval_ms >= 0, "engine.timer_interval_ms must be >= 0");
}

// -----------------------------------------------------------------------------
// buildInstrumentMaster()
// -----------------------------------------------------------------------------
InstrumentMaster buildInstrumentMaster(const EngineConfig& config) {
  const auto& in = config.instruments;
  const std::int64_t lot_size =
      in.lot_size > 0 ? in.lot_size : domain::indexSpec(config.index).lot_size;

  if (in.options.empty()) {
    return InstrumentMaster::generate(config.index, in.expiry_ms,
                                      in.center_strike, in.strikes_each_side,
                                      lot_size);
  }
  InstrumentMaster master(config.index, in.expiry_ms, lot_size);
  for (const auto& o : in.options) {
    master.addOption(o.strike, o.type, o.trading_symbol);
  }
  return master;
}

}  // namespace condor
