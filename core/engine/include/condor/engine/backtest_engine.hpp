#pragma once

#include "condor/concurrent/order_id_generator.hpp"
#include "condor/config/engine_config.hpp"
#include "condor/domain/position.hpp"
#include "condor/domain/tick.hpp"
#include "condor/engine/decision_pipeline.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/event.hpp"
#include "condor/execution/order_router.hpp"
#include "condor/execution/simulated_broker.hpp"
#include "condor/feed/feed_health.hpp"
#include "condor/market/instrument_master.hpp"
#include "condor/time/simulation_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace condor {

struct BacktestResult {
  std::vector<PositionUpdateEvent> trajectory;
  std::vector<domain::Position> closed_positions;
  double realized_pnl{0.0};
  std::size_t fills{0};
  std::size_t conflicts{0};
  std::size_t ticks{0};
  std::size_t ticks_dropped{0};
};

// -----------------------------------------------------------------------------
// BacktestEngine
// -----------------------------------------------------------------------------
//
// @brief  Replays time-ordered ticks through the same DecisionPipeline the
//         live engine runs, against a SimulatedBroker, on the calling thread.
//
// @details
// The live engine's two loops become two synchronous buses plus a FIFO:
// anything the live engine would push() onto the decision loop is appended
// to the FIFO and dispatched in order once the current event finishes;
// routing-side work runs synchronously inside the publish that requested
// it. The resulting event order matches a lockstep live run, which is what
// makes the two trajectories comparable.
//
// Time is the SimulationTimeProvider, advanced to each tick's timestamp
// before the tick is dispatched. Per-instrument ordering is enforced the
// same way the FeedAdapter enforces it: an older tick is dropped.
//
// Not thread-safe. One run() at a time.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  BacktestEngine(const EngineConfig& config, const InstrumentMaster& master);
  ~BacktestEngine();

  BacktestEngine(const BacktestEngine&) = delete;
  BacktestEngine& operator=(const BacktestEngine&) = delete;
  BacktestEngine(BacktestEngine&&) = delete;
  BacktestEngine& operator=(BacktestEngine&&) = delete;

  BacktestResult run(const std::vector<domain::Tick>& ticks);
  BacktestResult runFile(const std::string& path);

  // Dispatches one tick and everything it causes.
  void step(const domain::Tick& tick);

  // Dispatches a TimerEvent at `now_ms` (advancing the clock first).
  void advanceTo(std::int64_t now_ms);

  // Result accumulated so far.
  BacktestResult result() const;

  SimulatedBroker& broker() { return broker_; }
  EventBus& decisionEventBus() { return decision_bus_; }
  const DecisionPipeline& pipeline() const { return *pipeline_; }
  const SimulationTimeProvider& clock() const { return clock_; }

 private:
  void drain();

  SimulationTimeProvider clock_;
  FeedHealth health_;
  OrderIdGenerator order_id_gen_;

  EventBus decision_bus_;
  EventBus routing_bus_;
  std::deque<Event> pending_;

  SimulatedBroker broker_;

  std::vector<EventBus::SubscriptionId> decision_subs_;
  std::vector<EventBus::SubscriptionId> routing_subs_;

  std::unique_ptr<DecisionPipeline> pipeline_;
  std::unique_ptr<OrderRouter> router_;

  std::unordered_map<std::string, std::int64_t> last_tick_ts_;
  bool draining_{false};

  std::vector<PositionUpdateEvent> trajectory_;
  std::vector<domain::Position> closed_;
  double realized_pnl_{0.0};
  std::size_t ticks_{0};
  std::size_t ticks_dropped_{0};
};

}  // namespace condor
