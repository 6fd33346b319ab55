#pragma once

#include "condor/domain/position.hpp"
#include "condor/domain/risk_decision.hpp"
#include "condor/domain/risk_limits.hpp"
#include "condor/market/option_chain.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace condor {

// Inputs to a risk decision that are not part of the Position or the chain.
struct RiskContext {
  bool feed_stale{false};
  std::size_t open_positions{0};
  std::int64_t now_ms{0};
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Stateless evaluation of a Position against RiskLimits.
//
// @details
// evaluate() checks, in order, and returns the first that applies:
//
//   1. feed stale                        -> ForceExit(FeedStale)
//   2. permanent order rejection         -> ForceExit(OrderRejected)
//   3. unrealized <= -stop_loss_pct*max  -> ForceExit(StopLossBreached)
//   4. realized+unrealized <= -max       -> ForceExit(MaxLossBreached)
//   5. short mark >= entry*multiple      -> ForceExit(PremiumStop)
//   6. short |delta| >= hedge trigger    -> Hedge(leg with largest breach)
//   7.                                   -> Continue
//
// FeedStale comes first because no other action is tradable without a live
// market. Checks 3-5 are skipped while any open leg has no chain entry:
// an unknown mark is never treated as zero. Hedge is only proposed for a
// fully entered Position with no roll in flight, so at most one leg is ever
// being adjusted.
//
// No hidden state: the same (Position, snapshot, context) always yields the
// same decision, in backtest and live alike.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  explicit RiskManager(const domain::RiskLimits& limits) : limits_(limits) {}

  domain::RiskDecision evaluate(const domain::Position& position,
                                const OptionChainSnapshot& chain,
                                const RiskContext& context) const;

  // Admission check for a new Position: MaxPositionsExceeded or FeedStale
  // when entry is blocked, Continue otherwise.
  domain::RiskDecision evaluateEntry(const RiskContext& context) const;

  // Unrealized PnL of every open quantity (legs and in-flight roll
  // replacements) at chain prices; std::nullopt if any mark is unknown.
  static std::optional<double> markToMarket(const domain::Position& position,
                                            const OptionChainSnapshot& chain);

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  domain::RiskLimits limits_;
};

}  // namespace condor
