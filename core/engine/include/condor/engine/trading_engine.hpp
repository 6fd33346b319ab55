#pragma once

#include "condor/concurrent/event_loop_thread.hpp"
#include "condor/concurrent/order_id_generator.hpp"
#include "condor/config/engine_config.hpp"
#include "condor/engine/decision_pipeline.hpp"
#include "condor/execution/i_broker_client.hpp"
#include "condor/execution/order_router.hpp"
#include "condor/feed/feed_health.hpp"
#include "condor/feed/i_feed_transport.hpp"
#include "condor/market/instrument_master.hpp"
#include "condor/network/market_data_thread.hpp"
#include "condor/network/timer_thread.hpp"
#include "condor/persistence/i_reconciler.hpp"
#include "condor/persistence/order_event_log.hpp"
#include "condor/persistence/position_archive.hpp"
#include "condor/time/i_time_provider.hpp"
#include "condor/time/simulation_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace condor {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Live orchestrator: owns the threads, wires the cross-thread bridges
//         and runs the DecisionPipeline on the decision loop.
//
// @details
// Thread layout after start():
//
//   market_data thread ──TickEvent/FeedStatusEvent──▶ decision loop
//   timer thread ────────TimerEvent──────────────────▶ decision loop
//                        TimerEvent──────────────────▶ routing loop
//
//   decision loop                          routing loop
//   ─────────────                          ────────────
//   TickEvent ───────── bridge ──push()──▶ OrderRouter (quote -> broker)
//   DecisionPipeline
//     ExecutionManager
//       BrokerRequestEvent ─ bridge ─push()─▶ OrderRouter -> IBrokerClient
//                                                 │
//   ◀──push()── bridge ── BrokerReportEvent ──────┤
//   ◀──push()── bridge ── OrderStatusSnapshotEvent┘
//
// The TickEvent bridge is registered before the pipeline subscribes, so the
// routing loop always holds the quote before any order placed on that tick.
//
// The decision clock is the market clock when one is supplied (the feed
// advances it to each tick's timestamp) and the wall clock otherwise.
//
// Fatal conditions arrive as EngineFatalEvent on the decision bus and set
// the exit code: 1 for FeedUnavailable, 3 for AuthExpired.
//
// Ownership:
//   Owns both EventLoopThreads, the broker client, the feed transport (until
//   start() hands it to the FeedAdapter), the pipeline, the router, the
//   market data and timer threads, and the persistence sinks when enabled.
//   Borrows the config, instrument master and clocks.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  static constexpr int kExitFeedUnavailable = 1;
  static constexpr int kExitAuthExpired = 3;

  TradingEngine(const EngineConfig& config, const InstrumentMaster& master,
                const ITimeProvider& wall_clock,
                std::unique_ptr<IFeedTransport> transport,
                std::unique_ptr<IBrokerClient> broker,
                SimulationTimeProvider* market_clock = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the pipeline, runs the recovery gate, starts every thread
  //         and performs the feed handshake.
  //
  // @param  reconciler  Optional. When non-null its positions, open orders
  //                     and fill keys are hydrated before any event flows.
  //
  // @throws ConnectionError  Initial feed handshake failed. The engine is
  //                          stopped again before the exception leaves.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // Stops feed and timer first, then both loops, then flushes persistence.
  // Idempotent.
  void stop();

  // Enqueues an event on the decision loop.
  void pushEvent(Event event);

  // True once both loops have been idle on two consecutive checks.
  bool waitUntilIdle(std::chrono::milliseconds timeout);

  // Blocks until a fatal event or requestShutdown(), or until timeout.
  // Returns the exit code once one is set.
  std::optional<int> waitForExit(std::chrono::milliseconds timeout);

  // Sets exit code 0 unless a fatal code is already recorded.
  void requestShutdown();

  std::optional<int> exitCode() const;

  EventBus& decisionEventBus() { return decision_loop_.eventBus(); }
  EventBus& routingEventBus() { return routing_loop_.eventBus(); }

  const FeedHealth& feedHealth() const { return health_; }
  const DecisionPipeline* pipeline() const { return pipeline_.get(); }
  const MarketDataThread* marketDataThread() const {
    return market_data_thread_.get();
  }
  bool running() const { return running_; }

 private:
  void recordExit(int code);

  const EngineConfig& config_;
  const InstrumentMaster& master_;
  const ITimeProvider& wall_clock_;
  SimulationTimeProvider* market_clock_;
  const ITimeProvider& decision_clock_;

  FeedHealth health_;
  OrderIdGenerator order_id_gen_;

  std::unique_ptr<IFeedTransport> transport_;
  std::unique_ptr<IBrokerClient> broker_;

  std::unique_ptr<PositionArchive> archive_;
  std::unique_ptr<OrderEventLog> order_log_;

  EventLoopThread decision_loop_{"decision_loop"};
  EventLoopThread routing_loop_{"routing_loop"};

  std::unique_ptr<DecisionPipeline> pipeline_;
  std::unique_ptr<OrderRouter> router_;
  std::unique_ptr<TimerThread> timer_thread_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  EventBus::SubscriptionId tick_bridge_id_{0};
  EventBus::SubscriptionId request_bridge_id_{0};
  EventBus::SubscriptionId report_bridge_id_{0};
  EventBus::SubscriptionId snapshot_bridge_id_{0};
  EventBus::SubscriptionId fatal_sub_id_{0};

  mutable std::mutex exit_mutex_;
  std::condition_variable exit_cv_;
  std::optional<int> exit_code_;

  bool running_{false};
};

}  // namespace condor
