#pragma once

#include "condor/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace condor {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// @brief  Clock that holds whatever time it was last set to.
//
// @details
// Advanced by the backtest replay loop (or the feed adapter in a mocked live
// run) to each tick's timestamp, and by tests to step retry and reconnect
// deadlines deterministically.
//
// advance_time() sets the clock; advance_by() moves it forward by a delta.
// Neither enforces monotonicity.
//
// Thread-safety: lock-free atomic, safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace condor
