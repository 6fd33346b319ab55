#include "condor/engine/trading_engine.hpp"
#include "condor/domain/errors.hpp"
#include "condor/feed/feed_adapter.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace condor {

namespace {

constexpr auto kIdlePollInterval = std::chrono::milliseconds(2);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(const EngineConfig& config,
                             const InstrumentMaster& master,
                             const ITimeProvider& wall_clock,
                             std::unique_ptr<IFeedTransport> transport,
                             std::unique_ptr<IBrokerClient> broker,
                             SimulationTimeProvider* market_clock)
    : config_(config),
      master_(master),
      wall_clock_(wall_clock),
      market_clock_(market_clock),
      decision_clock_(market_clock != nullptr
                          ? static_cast<const ITimeProvider&>(*market_clock)
                          : wall_clock),
      transport_(std::move(transport)),
      broker_(std::move(broker)) {}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start(IReconciler* reconciler) {
  if (running_) {
    return;
  }

  // ---  1) Persistence sinks --------------------------------------------------
  if (config_.persistence.enabled) {
    archive_ = std::make_unique<PositionArchive>(config_.persistence.directory);
    order_log_ =
        std::make_unique<OrderEventLog>(orderLogPath(config_.persistence));
  }

  // ---  2) Decision -> routing bridges, BEFORE the pipeline subscribes ------
  EventBus& decision_bus = decision_loop_.eventBus();
  EventBus& routing_bus = routing_loop_.eventBus();

  tick_bridge_id_ = decision_bus.subscribe<TickEvent>(
      [this](const TickEvent& e) { routing_loop_.push(e); });
  request_bridge_id_ = decision_bus.subscribe<BrokerRequestEvent>(
      [this](const BrokerRequestEvent& e) { routing_loop_.push(e); });

  // ---  3) Stateful components, then the recovery gate ----------------------
  pipeline_ = std::make_unique<DecisionPipeline>(
      decision_bus, config_, master_, decision_clock_, health_, order_id_gen_,
      order_log_.get(), archive_.get());

  if (reconciler != nullptr) {
    pipeline_->hydrate(*reconciler);
  }

  router_ = std::make_unique<OrderRouter>(routing_bus, *broker_,
                                          decision_clock_);

  // ---  4) Routing -> decision bridges ----------------------------------------
  report_bridge_id_ = routing_bus.subscribe<BrokerReportEvent>(
      [this](const BrokerReportEvent& e) { decision_loop_.push(e); });
  snapshot_bridge_id_ = routing_bus.subscribe<OrderStatusSnapshotEvent>(
      [this](const OrderStatusSnapshotEvent& e) { decision_loop_.push(e); });

  fatal_sub_id_ = decision_bus.subscribe<EngineFatalEvent>(
      [this](const EngineFatalEvent& e) {
        std::cerr << "[TradingEngine] FATAL: "
                  << (e.reason == FatalReason::AuthExpired ? "auth expired"
                                                           : "feed unavailable")
                  << (e.detail.empty() ? "" : " (" + e.detail + ")") << "\n";
        recordExit(e.reason == FatalReason::AuthExpired ? kExitAuthExpired
                                                        : kExitFeedUnavailable);
      });

  // ---  5) Event loops ---------------------------------------------------------
  decision_loop_.start();
  routing_loop_.start();
  running_ = true;

  // ---  6) Scheduler tick ------------------------------------------------------
  timer_thread_ = std::make_unique<TimerThread>(decision_clock_,
                                                config_.timer_interval_ms);
  timer_thread_->addSink([this](Event e) { decision_loop_.push(e); });
  timer_thread_->addSink([this](Event e) { routing_loop_.push(std::move(e)); });
  timer_thread_->start();

  // ---  7) Market data LAST (ticks begin flowing) ----------------------------
  auto adapter = std::make_unique<FeedAdapter>(
      std::move(transport_), config_.feed, master_.instrumentIds(),
      wall_clock_, health_,
      [this](Event event) { decision_loop_.push(std::move(event)); },
      market_clock_);
  market_data_thread_ = std::make_unique<MarketDataThread>(std::move(adapter));
  try {
    market_data_thread_->start();
  } catch (const ConnectionError& e) {
    std::cerr << "[TradingEngine] ERROR: initial feed connect failed: "
              << e.what() << "\n";
    stop();
    throw;
  }

  std::cout << "[TradingEngine] started. Threads: decision, routing, "
               "market_data"
            << (timer_thread_->running() ? ", timer" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inflow first ---------------------------------------------------
  if (market_data_thread_) {
    market_data_thread_->stop();
  }
  if (timer_thread_) {
    timer_thread_->stop();
  }
  health_.teardown();

  // ---  2) Join both loops so nothing dispatches into the components --------
  decision_loop_.stop();
  routing_loop_.stop();

  // ---  3) Flush, then destroy components (they unsubscribe) ----------------
  if (pipeline_) {
    pipeline_->flush();
  }

  EventBus& decision_bus = decision_loop_.eventBus();
  EventBus& routing_bus = routing_loop_.eventBus();
  decision_bus.unsubscribe(tick_bridge_id_);
  decision_bus.unsubscribe(request_bridge_id_);
  decision_bus.unsubscribe(fatal_sub_id_);
  routing_bus.unsubscribe(report_bridge_id_);
  routing_bus.unsubscribe(snapshot_bridge_id_);

  market_data_thread_.reset();
  timer_thread_.reset();
  router_.reset();
  pipeline_.reset();
  order_log_.reset();
  archive_.reset();

  running_ = false;
  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::pushEvent(Event event) {
  decision_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// waitUntilIdle(): a report pushed by the routing loop after the decision
// loop went idle makes it busy again, hence two consecutive idle checks.
// -----------------------------------------------------------------------------
bool TradingEngine::waitUntilIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int idle_checks = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    if (decision_loop_.isIdle() && routing_loop_.isIdle()) {
      if (++idle_checks >= 2) {
        return true;
      }
    } else {
      idle_checks = 0;
    }
    std::this_thread::sleep_for(kIdlePollInterval);
  }
  return false;
}

// -----------------------------------------------------------------------------
// Exit handling
// -----------------------------------------------------------------------------
std::optional<int> TradingEngine::waitForExit(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(exit_mutex_);
  exit_cv_.wait_for(lock, timeout, [this] { return exit_code_.has_value(); });
  return exit_code_;
}

void TradingEngine::requestShutdown() { recordExit(0); }

std::optional<int> TradingEngine::exitCode() const {
  std::lock_guard<std::mutex> lock(exit_mutex_);
  return exit_code_;
}

void TradingEngine::recordExit(int code) {
  {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    if (exit_code_ && *exit_code_ != 0) {
      return;
    }
    exit_code_ = code;
  }
  exit_cv_.notify_all();
}

}  // namespace condor
