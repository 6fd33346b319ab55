#pragma once

#include "condor/domain/order.hpp"
#include "condor/domain/position.hpp"
#include "condor/execution/execution_manager.hpp"

#include <cstdint>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// IReconciler
// -----------------------------------------------------------------------------
//
// @brief  Source of the state the engine must resume from after a restart.
//
// @details
// On startup the engine does not know which Positions were open or which
// orders were still working when the previous process stopped. An
// IReconciler answers from an authoritative source (the local journal, or a
// venue order book) with plain domain values that the decision pipeline
// ingests before the first tick.
//
// Calling convention:
//   Called exactly once, synchronously, on the main thread inside
//   TradingEngine::start() before any thread is spawned. Implementations
//   must return promptly.
//
// Ownership:
//   The engine does not own the reconciler; it uses the pointer only during
//   start().
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  // Positions that were open (legs not yet flat).
  virtual std::vector<domain::Position> reconcilePositions() = 0;

  // Orders whose last known status is non-terminal.
  virtual std::vector<domain::Order> reconcileOrders() = 0;

  // Fill keys already applied, so a venue replay is not applied twice.
  virtual std::vector<FillKey> reconcileFillKeys() = 0;

  // Highest client order id ever issued (0 if none).
  virtual std::uint64_t maxOrderId() = 0;
};

}  // namespace condor
