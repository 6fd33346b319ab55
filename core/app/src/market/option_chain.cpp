#include "condor/market/option_chain.hpp"
#include "condor/market/black_scholes.hpp"
#include "condor/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace condor {

const ChainEntry* OptionChainSnapshot::find(domain::Strike strike,
                                            domain::OptionType type) const {
  auto it = entries_.find(ChainKey{strike, type});
  return it == entries_.end() ? nullptr : &it->second;
}

OptionChainModel::OptionChainModel(const InstrumentMaster& master,
                                   PricingParams params)
    : master_(master), params_(std::move(params)) {}

// -----------------------------------------------------------------------------
// applyTick
// -----------------------------------------------------------------------------
std::optional<ChainEntry> OptionChainModel::applyTick(
    const domain::Tick& tick) {
  const domain::InstrumentSpec* spec = master_.find(tick.instrument_id);
  if (spec == nullptr) {
    return std::nullopt;
  }
  const double mark = tick.markPrice();
  if (mark <= 0.0) {
    return std::nullopt;
  }

  // --- Underlying: move spot, refresh Greeks of live entries ---------------
  if (spec->kind == domain::InstrumentKind::Underlying) {
    if (snapshot_.spot_ && tick.timestamp_ms < snapshot_.spot_time_) {
      ++stale_rejected_;
      return std::nullopt;
    }
    snapshot_.spot_ = mark;
    snapshot_.spot_time_ = tick.timestamp_ms;
    ++applied_;

    for (auto& [key, entry] : snapshot_.entries_) {
      if (entry.expired) {
        continue;
      }
      const std::int64_t at =
          std::max(entry.last_update_time, tick.timestamp_ms);
      reprice(entry, key.first, key.second, at, !entry.has_greeks);
    }
    return std::nullopt;
  }

  // --- Option ----------------------------------------------------------------
  const ChainKey key{spec->strike, spec->option_type};
  auto it = snapshot_.entries_.find(key);
  if (it != snapshot_.entries_.end()) {
    ChainEntry& existing = it->second;
    if (tick.timestamp_ms < existing.price_time) {
      ++stale_rejected_;
      return std::nullopt;
    }
    if (existing.expired) {
      return existing;
    }
  } else {
    it = snapshot_.entries_.emplace(key, ChainEntry{}).first;
  }

  ChainEntry& entry = it->second;
  entry.price = mark;
  entry.price_time = tick.timestamp_ms;
  ++applied_;
  reprice(entry, key.first, key.second,
          std::max(entry.last_update_time, tick.timestamp_ms), true);
  return entry;
}

// -----------------------------------------------------------------------------
// reprice: recompute IV (when asked) and Greeks at time at_ms. Without a spot
// the price is stored but the entry carries no Greeks yet.
// -----------------------------------------------------------------------------
void OptionChainModel::reprice(ChainEntry& entry, domain::Strike strike,
                               domain::OptionType type, std::int64_t at_ms,
                               bool solve_iv) {
  entry.last_update_time = at_ms;

  if (at_ms >= master_.expiryMs()) {
    entry.expired = true;
    return;
  }
  if (!snapshot_.spot_) {
    return;
  }

  pricing::ModelInputs in;
  in.spot = *snapshot_.spot_;
  in.strike = static_cast<double>(strike);
  in.time_years =
      static_cast<double>(master_.expiryMs() - at_ms) / kMsPerYear;
  in.rate = params_.risk_free_rate;
  in.dividend_yield = params_.dividend_yield;

  if (solve_iv || !entry.has_greeks) {
    std::optional<double> iv = pricing::impliedVolatility(type, in, entry.price);
    entry.iv_fallback = !iv.has_value();
    entry.implied_volatility = iv.value_or(params_.fallback_volatility);
  }

  const pricing::Greeks g =
      pricing::blackScholes(type, in, entry.implied_volatility);
  entry.delta = g.delta;
  entry.gamma = g.gamma;
  entry.theta = g.theta;
  entry.vega = g.vega;
  entry.has_greeks = true;
}

std::optional<domain::Strike> OptionChainModel::atmStrike() const {
  if (!snapshot_.spot_) {
    return std::nullopt;
  }
  const double spot = *snapshot_.spot_;
  std::optional<domain::Strike> best;
  double best_distance = 0.0;
  for (domain::Strike strike : master_.strikes(domain::OptionType::Call)) {
    const double distance = std::fabs(static_cast<double>(strike) - spot);
    if (!best || distance < best_distance) {
      best = strike;
      best_distance = distance;
    }
  }
  return best;
}

std::optional<double> OptionChainModel::atmImpliedVol() const {
  std::optional<domain::Strike> atm = atmStrike();
  if (!atm) {
    return std::nullopt;
  }
  const ChainEntry* call = snapshot_.find(*atm, domain::OptionType::Call);
  const ChainEntry* put = snapshot_.find(*atm, domain::OptionType::Put);
  if (call == nullptr || put == nullptr || !call->has_greeks ||
      !put->has_greeks) {
    return std::nullopt;
  }
  return 0.5 * (call->implied_volatility + put->implied_volatility);
}

double OptionChainModel::daysToExpiry(std::int64_t now_ms) const {
  return static_cast<double>(master_.expiryMs() - now_ms) /
         static_cast<double>(kMsPerDay);
}

// -----------------------------------------------------------------------------
// IvRankTracker
// -----------------------------------------------------------------------------
IvRankTracker::IvRankTracker(std::vector<double> history, std::size_t window)
    : history_(std::move(history)), window_(window == 0 ? 1 : window) {
  if (history_.size() > window_) {
    history_.erase(history_.begin(),
                   history_.begin() +
                       static_cast<std::ptrdiff_t>(history_.size() - window_));
  }
}

void IvRankTracker::observe(std::int64_t now_ms, double atm_iv) {
  const std::int64_t day = istDayIndex(now_ms);
  if (current_day_ && *current_day_ != day) {
    history_.push_back(day_last_iv_);
    if (history_.size() > window_) {
      history_.erase(history_.begin());
    }
  }
  current_day_ = day;
  day_last_iv_ = atm_iv;
}

std::optional<double> IvRankTracker::rank(double current_iv) const {
  if (history_.empty()) {
    return std::nullopt;
  }
  std::size_t below = 0;
  for (double iv : history_) {
    if (iv < current_iv) {
      ++below;
    }
  }
  return static_cast<double>(below) / static_cast<double>(history_.size());
}

}  // namespace condor
