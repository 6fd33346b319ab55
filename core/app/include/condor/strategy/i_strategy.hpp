#pragma once

#include "condor/domain/order.hpp"
#include "condor/domain/position.hpp"
#include "condor/domain/risk_decision.hpp"
#include "condor/events/order_update_event.hpp"
#include "condor/market/option_chain.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace condor {

// What the pipeline knows at evaluation time besides the chain.
struct StrategyContext {
  std::int64_t now_ms{0};
  bool feed_stale{false};
  std::optional<double> iv_rank;
  std::size_t open_positions{0};
};

// -----------------------------------------------------------------------------
// IStrategy
// -----------------------------------------------------------------------------
// A strategy is two capabilities: evaluate the current market (with the
// RiskManager's verdict for its Position) and absorb order feedback. It
// owns its Position outright; nobody else mutates it.
//
// `decision` is RiskManager::evaluate() for the open Position, or
// RiskManager::evaluateEntry() when there is none. A ForceExit that closes
// positions must be obeyed.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual const std::string& name() const = 0;

  virtual void evaluate(const OptionChainModel& chain,
                        const domain::RiskDecision& decision,
                        const StrategyContext& context) = 0;

  virtual void onOrderUpdate(const OrderUpdateEvent& update) = 0;

  // The open Position, if any.
  virtual const std::optional<domain::Position>& position() const = 0;

  virtual domain::PositionState state() const = 0;

  // Crash recovery.
  virtual void hydrate(const domain::Position& position) = 0;
  virtual void hydrateOrder(const domain::Order& order) = 0;
};

}  // namespace condor
