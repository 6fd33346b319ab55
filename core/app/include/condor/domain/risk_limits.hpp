#pragma once

#include <cstddef>

namespace condor {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits
// -----------------------------------------------------------------------------
// Read-only limits consumed by the RiskManager. Loaded once from
// configuration and never mutated at runtime.
//
// Money amounts are in rupees (index points x units).
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_loss_per_position{20000.0};
  std::size_t max_positions{1};

  // Stop loss fires when unrealized_pnl <= -stop_loss_pct * max_loss.
  double stop_loss_pct{0.5};

  // |delta| of a short leg at or beyond which the leg is rolled.
  double hedge_trigger_delta{0.30};

  // Short leg mark >= entry * multiple forces an exit. 0 disables the check.
  double short_premium_stop_multiple{0.0};
};

}  // namespace domain
}  // namespace condor
