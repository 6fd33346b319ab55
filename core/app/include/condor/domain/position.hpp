#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/domain/option_leg.hpp"
#include "condor/domain/order.hpp"
#include "condor/domain/risk_decision.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace condor {
namespace domain {

// -----------------------------------------------------------------------------
// PositionState
// -----------------------------------------------------------------------------
// Strategy state machine:
//
//   Idle -> Evaluating -> (orders submitted) Adjusting -> Entered
//   Entered -> Adjusting (roll) -> Entered
//   Entered/Adjusting -> Exiting -> Closed
//
// A Position exists from the moment entry orders are submitted. Idle and
// Evaluating describe the strategy when it holds no Position.
// -----------------------------------------------------------------------------
enum class PositionState {
  Idle,
  Evaluating,
  Entered,
  Adjusting,
  Exiting,
  Closed,
};

const char* toString(PositionState state);

// -----------------------------------------------------------------------------
// LegReplacement / RollPlan
// -----------------------------------------------------------------------------
// A roll replaces legs[leg_index] with `replacement`. The old leg is closed
// by a RollClose order and the replacement opened by a RollOpen order; the
// swap is applied only once both are complete. Keeping the replacement out
// of Position::legs preserves the four-leg invariant while the roll is in
// flight.
// -----------------------------------------------------------------------------
// Order::leg_index values at or above this offset address the roll
// replacement of leg (leg_index - kReplacementLegOffset).
constexpr int kReplacementLegOffset = 4;

struct LegReplacement {
  int leg_index{0};
  OptionLeg replacement;
};

struct RollPlan {
  std::vector<LegReplacement> replacements;
  double breach_delta{0.0};
  std::int64_t started_ms{0};
};

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
// @brief  A four-leg Iron Condor and its running PnL.
//
// @details
// Leg order is fixed: [0] short call, [1] long call (hedge), [2] short put,
// [3] long put (hedge). `legs` is either empty or holds all four.
//
// Exclusively owned and mutated by the strategy on the decision loop; other
// components see copies carried in PositionUpdateEvent.
//
// last_rejection records a permanent order rejection against this Position.
// The RiskManager turns it into ForceExit(OrderRejected).
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string strategy_name;
  IndexId index{IndexId::Nifty};
  std::vector<OptionLeg> legs;
  PositionState state{PositionState::Idle};
  std::int64_t entry_time_ms{0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};

  std::optional<RollPlan> roll;
  std::optional<RejectCode> last_rejection;
  std::optional<ExitReason> exit_reason;
  std::int64_t closed_time_ms{0};
  int exit_attempts{0};

  double totalPnl() const { return realized_pnl + unrealized_pnl; }

  bool isFlat() const {
    for (const auto& leg : legs) {
      if (leg.open_quantity != 0) {
        return false;
      }
    }
    if (roll) {
      for (const auto& r : roll->replacements) {
        if (r.replacement.open_quantity != 0) {
          return false;
        }
      }
    }
    return true;
  }
};

}  // namespace domain
}  // namespace condor
