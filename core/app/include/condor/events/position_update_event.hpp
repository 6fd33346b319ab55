#pragma once

#include "condor/domain/position.hpp"

#include <cstdint>
#include <string>

namespace condor {

// Snapshot of a Position after a mutation. The ordered stream of these events
// is the position trajectory compared between backtest and live runs.
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// Strategy state machine transition.
struct StrategyStateEvent {
  std::string strategy_name;
  std::string position_id;
  domain::PositionState from{domain::PositionState::Idle};
  domain::PositionState to{domain::PositionState::Idle};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

}  // namespace condor
