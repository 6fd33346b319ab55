#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/market/option_chain.hpp"

#include <optional>

namespace condor {

enum class StrikeSelectionMode {
  Delta,   // shorts nearest the target delta inside the band
  Offset,  // shorts a fixed distance from the spot, rounded to the step
};

struct StrikeSelectionParams {
  StrikeSelectionMode mode{StrikeSelectionMode::Delta};
  double target_short_delta{0.20};
  double delta_band{0.10};
  domain::Strike short_offset{300};
  domain::Strike wing_width{200};
  // Minimum distance a rolled short moves out; 0 means one strike step.
  domain::Strike min_roll_distance{0};
};

struct CondorStrikes {
  domain::Strike short_call{0};
  domain::Strike long_call{0};
  domain::Strike short_put{0};
  domain::Strike long_put{0};
};

// -----------------------------------------------------------------------------
// Strike selection
// -----------------------------------------------------------------------------
// Pure functions of the chain. A strike is eligible only when its chain
// entry exists, carries Greeks and is not expired; every leg of the result
// is listed in the chain's InstrumentMaster.
//
// Delta mode: among out-of-the-money strikes whose |delta| lies within
// target +/- band, the one nearest the target wins; on a tie, the one
// further out of the money. Hedges sit wing_width beyond the shorts.
//
// Offset mode: short call = spot rounded up to the step + offset, short put
// = spot rounded down to the step - offset.
// -----------------------------------------------------------------------------
std::optional<CondorStrikes> selectCondorStrikes(
    const OptionChainModel& chain, const StrikeSelectionParams& params);

// New strike for a breached short leg: strictly further out of the money
// (by at least min_roll_distance), |delta| below max_abs_delta, nearest the
// target delta.
std::optional<domain::Strike> selectRollStrike(
    const OptionChainModel& chain, domain::OptionType type,
    domain::Strike current, double max_abs_delta,
    const StrikeSelectionParams& params);

}  // namespace condor
