#pragma once

#include <cstdint>

namespace condor {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
// Every component reads time through this interface and never calls a clock
// directly. Live runs use LiveTimeProvider; backtests and deterministic tests
// use SimulationTimeProvider, which only moves when told to.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds (UTC). Thread-safe, no side effects.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace condor
