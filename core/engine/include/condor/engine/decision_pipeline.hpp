#pragma once

#include "condor/concurrent/order_id_generator.hpp"
#include "condor/config/engine_config.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/event.hpp"
#include "condor/execution/execution_manager.hpp"
#include "condor/feed/feed_health.hpp"
#include "condor/market/instrument_master.hpp"
#include "condor/market/option_chain.hpp"
#include "condor/persistence/i_reconciler.hpp"
#include "condor/persistence/order_event_log.hpp"
#include "condor/persistence/position_archive.hpp"
#include "condor/risk/risk_manager.hpp"
#include "condor/strategy/iron_condor_strategy.hpp"
#include "condor/strategy/position_book.hpp"
#include "condor/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>

namespace condor {

// -----------------------------------------------------------------------------
// DecisionPipeline
// -----------------------------------------------------------------------------
//
// @brief  The serialized decision stream: Chain -> Risk -> Strategy ->
//         Execution bookkeeping, driven by the events on one EventBus.
//
// @details
// Live trading and backtesting both run exactly this object; only the thread
// that drains the bus and the clock behind it differ. Every handler below
// runs on the bus's dispatching thread, which makes the pipeline the single
// writer of the Option Chain and of the Position.
//
// Subscriptions, in publish order:
//   BrokerReportEvent / OrderStatusSnapshotEvent
//       -> ExecutionManager (publishes OrderUpdateEvent -> strategy)
//       -> evaluate()
//   TickEvent        -> chain, IV rank, execution timers, evaluate()
//   TimerEvent       -> execution timers, evaluate()
//   FeedStatusEvent  -> evaluate(); Unavailable publishes EngineFatalEvent
//   PositionUpdateEvent -> archive on Closed, open-position snapshot
//
// Construction order of the members is the subscription order, so the
// ExecutionManager always sees a broker report before the pipeline reacts
// to it.
//
// Ownership:
//   Owns the ExecutionManager, RiskManager, OptionChainModel, IvRankTracker,
//   PositionBook and IronCondorStrategy. Borrows the bus, the instrument
//   master, the clock, the feed health handle and the persistence sinks;
//   all of them must outlive the pipeline.
// -----------------------------------------------------------------------------
class DecisionPipeline {
 public:
  DecisionPipeline(EventBus& bus, const EngineConfig& config,
                   const InstrumentMaster& master, const ITimeProvider& clock,
                   const FeedHealth& health, OrderIdGenerator& id_gen,
                   OrderEventLog* order_log = nullptr,
                   PositionArchive* archive = nullptr);
  ~DecisionPipeline();

  DecisionPipeline(const DecisionPipeline&) = delete;
  DecisionPipeline& operator=(const DecisionPipeline&) = delete;
  DecisionPipeline(DecisionPipeline&&) = delete;
  DecisionPipeline& operator=(DecisionPipeline&&) = delete;

  // Crash-recovery gate. Must run before the first event is dispatched.
  void hydrate(IReconciler& reconciler);

  // Flushes the order log and rewrites the open-position snapshot.
  void flush();

  // One decision at the clock's current time.
  void evaluate();

  bool feedStale() const;
  std::optional<double> ivRank() const;

  const ExecutionManager& execution() const { return execution_; }
  ExecutionManager& execution() { return execution_; }
  const IronCondorStrategy& strategy() const { return strategy_; }
  const OptionChainModel& chain() const { return chain_; }
  const RiskManager& risk() const { return risk_; }
  const PositionBook& book() const { return book_; }

 private:
  void onTick(const TickEvent& event);
  void onTimer(const TimerEvent& event);
  void onFeedStatus(const FeedStatusEvent& event);
  void onPositionUpdate(const PositionUpdateEvent& event);

  EventBus& bus_;
  const ITimeProvider& clock_;
  const FeedHealth& health_;
  std::int64_t stale_after_ms_;
  OrderEventLog* order_log_;
  PositionArchive* archive_;

  ExecutionManager execution_;
  RiskManager risk_;
  OptionChainModel chain_;
  IvRankTracker iv_rank_;
  PositionBook book_;
  IronCondorStrategy strategy_;

  EventBus::SubscriptionId report_sub_id_{0};
  EventBus::SubscriptionId snapshot_sub_id_{0};
  EventBus::SubscriptionId tick_sub_id_{0};
  EventBus::SubscriptionId timer_sub_id_{0};
  EventBus::SubscriptionId feed_sub_id_{0};
  EventBus::SubscriptionId position_sub_id_{0};

  bool fatal_published_{false};
};

}  // namespace condor
