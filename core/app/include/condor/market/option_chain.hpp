#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/domain/tick.hpp"
#include "condor/market/instrument_master.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace condor {

struct PricingParams {
  double risk_free_rate{0.065};
  double dividend_yield{0.0};
  // Volatility used when a price admits no implied-vol solution.
  double fallback_volatility{0.15};
  // Seed for the IV-rank history (oldest first), one value per trading day.
  std::vector<double> iv_history;
  std::size_t iv_history_window{252};
};

// -----------------------------------------------------------------------------
// ChainEntry
// -----------------------------------------------------------------------------
// Pricing state of one (strike, type). has_greeks is false until the
// underlying has printed at least once; iv_fallback marks entries priced
// with the fallback volatility. Once expired, nothing in the entry changes.
//
// price_time is the timestamp of the option tick behind `price`;
// last_update_time is when the Greeks were last computed, which an
// underlying tick can move past price_time.
// -----------------------------------------------------------------------------
struct ChainEntry {
  double price{0.0};
  double implied_volatility{0.0};
  double delta{0.0};
  double gamma{0.0};
  double theta{0.0};
  double vega{0.0};
  std::int64_t price_time{0};
  std::int64_t last_update_time{0};
  bool expired{false};
  bool has_greeks{false};
  bool iv_fallback{false};
};

using ChainKey = std::pair<domain::Strike, domain::OptionType>;

// -----------------------------------------------------------------------------
// OptionChainSnapshot
// -----------------------------------------------------------------------------
// Read view of the chain. An absent key means "no tick yet" and must never
// be read as a zero price or zero delta.
// -----------------------------------------------------------------------------
class OptionChainSnapshot {
 public:
  const ChainEntry* find(domain::Strike strike, domain::OptionType type) const;

  std::optional<double> spot() const { return spot_; }
  std::int64_t spotTime() const { return spot_time_; }
  std::size_t size() const { return entries_.size(); }
  const std::map<ChainKey, ChainEntry>& entries() const { return entries_; }

 private:
  friend class OptionChainModel;

  std::map<ChainKey, ChainEntry> entries_;
  std::optional<double> spot_;
  std::int64_t spot_time_{0};
};

// -----------------------------------------------------------------------------
// OptionChainModel
// -----------------------------------------------------------------------------
//
// @brief  Maintains strike-level prices, implied vols and Greeks from ticks.
//
// @details
// applyTick() is the only mutator and is called only from the decision loop,
// which makes the model single-writer.
//
// Per-key monotonicity: an option tick older than the entry's price_time is
// rejected (counted in staleTicksRejected()) and leaves the entry untouched.
// Equal timestamps are accepted. Index and option streams are ordered only
// per instrument, so an option tick may be older than the last spot tick;
// it is still applied and priced at the later of the two times.
//
// Underlying ticks move the spot and refresh the Greeks of every live entry
// at its current implied vol (sticky strike); the refreshed entry's
// last_update_time becomes max(entry time, spot time), so the refresh never
// moves an entry's time backwards.
//
// At or after expiry an entry is marked expired and frozen at its last
// computed values.
// -----------------------------------------------------------------------------
class OptionChainModel {
 public:
  OptionChainModel(const InstrumentMaster& master, PricingParams params);

  // Returns the updated entry. std::nullopt when the tick was ignored
  // (unknown instrument, no usable price, stale timestamp) or when it was an
  // underlying tick.
  std::optional<ChainEntry> applyTick(const domain::Tick& tick);

  const OptionChainSnapshot& snapshot() const { return snapshot_; }

  const ChainEntry* find(domain::Strike strike, domain::OptionType type) const {
    return snapshot_.find(strike, type);
  }

  std::optional<double> spot() const { return snapshot_.spot(); }

  // Listed strike nearest the spot (ties go to the lower strike).
  std::optional<domain::Strike> atmStrike() const;

  // Mean IV of the ATM call and put; std::nullopt until both have Greeks.
  std::optional<double> atmImpliedVol() const;

  // Fractional days from now to expiry (negative after expiry).
  double daysToExpiry(std::int64_t now_ms) const;

  const InstrumentMaster& master() const { return master_; }
  const PricingParams& params() const { return params_; }

  std::uint64_t staleTicksRejected() const { return stale_rejected_; }
  std::uint64_t ticksApplied() const { return applied_; }

 private:
  void reprice(ChainEntry& entry, domain::Strike strike,
               domain::OptionType type, std::int64_t at_ms, bool solve_iv);

  const InstrumentMaster& master_;
  PricingParams params_;
  OptionChainSnapshot snapshot_;
  std::uint64_t stale_rejected_{0};
  std::uint64_t applied_{0};
};

// -----------------------------------------------------------------------------
// IvRankTracker
// -----------------------------------------------------------------------------
// IV rank = fraction of the history strictly below the current ATM IV.
// History is seeded from configuration and grows by one sample per IST
// trading day (the last ATM IV observed that day), bounded by `window`.
// -----------------------------------------------------------------------------
class IvRankTracker {
 public:
  IvRankTracker(std::vector<double> history, std::size_t window);

  void observe(std::int64_t now_ms, double atm_iv);

  std::optional<double> rank(double current_iv) const;

  std::size_t historySize() const { return history_.size(); }

 private:
  std::vector<double> history_;
  std::size_t window_;
  std::optional<std::int64_t> current_day_;
  double day_last_iv_{0.0};
};

}  // namespace condor
