#include "condor/strategy/strike_selector.hpp"

#include <cmath>
#include <limits>

namespace condor {

using domain::OptionType;
using domain::Strike;

namespace {

// Entry usable for selection.
const ChainEntry* usable(const OptionChainModel& chain, Strike strike,
                         OptionType type) {
  const ChainEntry* e = chain.find(strike, type);
  if (e == nullptr || !e->has_greeks || e->expired) {
    return nullptr;
  }
  return e;
}

// Further out of the money.
bool furtherOut(OptionType type, Strike a, Strike b) {
  return type == OptionType::Call ? a > b : a < b;
}

std::optional<Strike> nearestDelta(const OptionChainModel& chain,
                                   OptionType type, double spot,
                                   double target, double band) {
  std::optional<Strike> best;
  double best_gap = std::numeric_limits<double>::infinity();

  for (Strike k : chain.master().strikes(type)) {
    const bool otm = type == OptionType::Call ? static_cast<double>(k) > spot
                                              : static_cast<double>(k) < spot;
    if (!otm) {
      continue;
    }
    const ChainEntry* e = usable(chain, k, type);
    if (e == nullptr) {
      continue;
    }
    const double gap = std::fabs(std::fabs(e->delta) - target);
    if (gap > band) {
      continue;
    }
    if (!best || gap < best_gap ||
        (gap == best_gap && furtherOut(type, k, *best))) {
      best = k;
      best_gap = gap;
    }
  }
  return best;
}

std::optional<CondorStrikes> withWings(const OptionChainModel& chain,
                                       Strike short_call, Strike short_put,
                                       Strike wing_width) {
  CondorStrikes s;
  s.short_call = short_call;
  s.short_put = short_put;
  s.long_call = short_call + wing_width;
  s.long_put = short_put - wing_width;

  if (s.short_put >= s.short_call || wing_width <= 0) {
    return std::nullopt;
  }
  if (usable(chain, s.short_call, OptionType::Call) == nullptr ||
      usable(chain, s.long_call, OptionType::Call) == nullptr ||
      usable(chain, s.short_put, OptionType::Put) == nullptr ||
      usable(chain, s.long_put, OptionType::Put) == nullptr) {
    return std::nullopt;
  }
  return s;
}

}  // namespace

std::optional<CondorStrikes> selectCondorStrikes(
    const OptionChainModel& chain, const StrikeSelectionParams& params) {
  const auto spot = chain.spot();
  if (!spot) {
    return std::nullopt;
  }

  if (params.mode == StrikeSelectionMode::Offset) {
    const Strike step = chain.master().strikeStep();
    const double steps = *spot / static_cast<double>(step);
    const Strike up = static_cast<Strike>(std::ceil(steps)) * step;
    const Strike down = static_cast<Strike>(std::floor(steps)) * step;
    return withWings(chain, up + params.short_offset,
                     down - params.short_offset, params.wing_width);
  }

  auto call = nearestDelta(chain, OptionType::Call, *spot,
                           params.target_short_delta, params.delta_band);
  auto put = nearestDelta(chain, OptionType::Put, *spot,
                          params.target_short_delta, params.delta_band);
  if (!call || !put) {
    return std::nullopt;
  }
  return withWings(chain, *call, *put, params.wing_width);
}

std::optional<Strike> selectRollStrike(const OptionChainModel& chain,
                                       OptionType type, Strike current,
                                       double max_abs_delta,
                                       const StrikeSelectionParams& params) {
  const Strike distance = params.min_roll_distance > 0
                              ? params.min_roll_distance
                              : chain.master().strikeStep();
  const Strike floor = type == OptionType::Call ? current + distance
                                                : current - distance;

  std::optional<Strike> best;
  double best_gap = std::numeric_limits<double>::infinity();
  for (Strike k : chain.master().strikes(type)) {
    if (k != floor && !furtherOut(type, k, floor)) {
      continue;
    }
    const ChainEntry* e = usable(chain, k, type);
    if (e == nullptr || std::fabs(e->delta) >= max_abs_delta) {
      continue;
    }
    const double gap = std::fabs(std::fabs(e->delta) - params.target_short_delta);
    if (!best || gap < best_gap) {
      best = k;
      best_gap = gap;
    }
  }
  return best;
}

}  // namespace condor
