#include "condor/engine/decision_pipeline.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
DecisionPipeline::DecisionPipeline(EventBus& bus, const EngineConfig& config,
                                   const InstrumentMaster& master,
                                   const ITimeProvider& clock,
                                   const FeedHealth& health,
                                   OrderIdGenerator& id_gen,
                                   OrderEventLog* order_log,
                                   PositionArchive* archive)
    : bus_(bus),
      clock_(clock),
      health_(health),
      stale_after_ms_(config.feed.stale_after_ms),
      order_log_(order_log),
      archive_(archive),
      execution_(bus, config.execution, id_gen, clock, order_log),
      risk_(config.risk_limits),
      chain_(master, config.pricing),
      iv_rank_(config.pricing.iv_history, config.pricing.iv_history_window),
      strategy_(bus, execution_, master, book_, config.strategy,
                config.risk_limits) {
  // Registered after the ExecutionManager's own subscriptions: by the time
  // these run, the report has been applied and the strategy has seen the
  // resulting OrderUpdateEvent.
  report_sub_id_ = bus_.subscribe<BrokerReportEvent>(
      [this](const BrokerReportEvent&) { evaluate(); });
  snapshot_sub_id_ = bus_.subscribe<OrderStatusSnapshotEvent>(
      [this](const OrderStatusSnapshotEvent&) { evaluate(); });

  tick_sub_id_ = bus_.subscribe<TickEvent>(
      [this](const TickEvent& e) { onTick(e); });
  timer_sub_id_ = bus_.subscribe<TimerEvent>(
      [this](const TimerEvent& e) { onTimer(e); });
  feed_sub_id_ = bus_.subscribe<FeedStatusEvent>(
      [this](const FeedStatusEvent& e) { onFeedStatus(e); });
  position_sub_id_ = bus_.subscribe<PositionUpdateEvent>(
      [this](const PositionUpdateEvent& e) { onPositionUpdate(e); });
}

DecisionPipeline::~DecisionPipeline() {
  bus_.unsubscribe(report_sub_id_);
  bus_.unsubscribe(snapshot_sub_id_);
  bus_.unsubscribe(tick_sub_id_);
  bus_.unsubscribe(timer_sub_id_);
  bus_.unsubscribe(feed_sub_id_);
  bus_.unsubscribe(position_sub_id_);
}

// -----------------------------------------------------------------------------
// hydrate(): crash-recovery gate
// -----------------------------------------------------------------------------
void DecisionPipeline::hydrate(IReconciler& reconciler) {
  const std::uint64_t max_id = reconciler.maxOrderId();
  std::vector<domain::Position> positions = reconciler.reconcilePositions();
  std::vector<domain::Order> orders = reconciler.reconcileOrders();
  std::vector<FillKey> fill_keys = reconciler.reconcileFillKeys();

  execution_.hydrateFillKeys(fill_keys);

  // The strategy owns at most one position at a time.
  if (!positions.empty()) {
    strategy_.hydrate(positions.front());
    for (std::size_t i = 1; i < positions.size(); ++i) {
      std::cerr << "[DecisionPipeline] WARNING: ignoring extra open position "
                << positions[i].id << " during recovery.\n";
    }
  }

  for (const auto& order : orders) {
    execution_.hydrateOrder(order);
    strategy_.hydrateOrder(order);
  }

  std::cout << "[DecisionPipeline] Reconciliation complete: "
            << (positions.empty() ? 0 : 1) << " position(s), "
            << orders.size() << " open order(s), " << fill_keys.size()
            << " fill key(s) hydrated (max order id " << max_id << ").\n";
}

void DecisionPipeline::flush() {
  if (order_log_ != nullptr) {
    order_log_->flush();
  }
  if (archive_ != nullptr) {
    std::vector<domain::Position> open;
    if (strategy_.position()) {
      open.push_back(*strategy_.position());
    }
    try {
      archive_->writeOpenSnapshot(open);
    } catch (const std::exception& e) {
      std::cerr << "[DecisionPipeline] WARNING: open-position snapshot "
                   "failed: "
                << e.what() << "\n";
    }
  }
}

bool DecisionPipeline::feedStale() const {
  return health_.isStale(clock_.now_ms(), stale_after_ms_);
}

std::optional<double> DecisionPipeline::ivRank() const {
  std::optional<double> atm = chain_.atmImpliedVol();
  if (!atm) {
    return std::nullopt;
  }
  return iv_rank_.rank(*atm);
}

// -----------------------------------------------------------------------------
// evaluate(): Risk -> Strategy at the current instant
// -----------------------------------------------------------------------------
void DecisionPipeline::evaluate() {
  const std::int64_t now = clock_.now_ms();

  RiskContext risk_ctx;
  risk_ctx.feed_stale = health_.isStale(now, stale_after_ms_);
  risk_ctx.open_positions = book_.openCount();
  risk_ctx.now_ms = now;

  const auto& position = strategy_.position();
  const domain::RiskDecision decision =
      position ? risk_.evaluate(*position, chain_.snapshot(), risk_ctx)
               : risk_.evaluateEntry(risk_ctx);

  StrategyContext ctx;
  ctx.now_ms = now;
  ctx.feed_stale = risk_ctx.feed_stale;
  ctx.iv_rank = ivRank();
  ctx.open_positions = risk_ctx.open_positions;

  strategy_.evaluate(chain_, decision, ctx);
}

// -----------------------------------------------------------------------------
// Event handlers
// -----------------------------------------------------------------------------
void DecisionPipeline::onTick(const TickEvent& event) {
  chain_.applyTick(event.tick);
  if (std::optional<double> atm = chain_.atmImpliedVol()) {
    iv_rank_.observe(event.tick.timestamp_ms, *atm);
  }
  execution_.onTimer(clock_.now_ms());
  evaluate();
}

void DecisionPipeline::onTimer(const TimerEvent& event) {
  execution_.onTimer(event.now_ms);
  evaluate();
}

void DecisionPipeline::onFeedStatus(const FeedStatusEvent& event) {
  std::cout << "[DecisionPipeline] feed " << toString(event.status);
  if (!event.detail.empty()) {
    std::cout << " (" << event.detail << ")";
  }
  std::cout << "\n";

  if (event.status == FeedStatus::Unavailable) {
    flush();
    if (!fatal_published_) {
      fatal_published_ = true;
      bus_.publish(EngineFatalEvent{FatalReason::FeedUnavailable,
                                    event.detail, clock_.now_ms()});
    }
    return;
  }
  evaluate();
}

void DecisionPipeline::onPositionUpdate(const PositionUpdateEvent& event) {
  const domain::Position& p = event.position;
  if (p.state == domain::PositionState::Closed) {
    execution_.forgetPosition(p.id);
  }
  if (archive_ == nullptr) {
    return;
  }
  try {
    if (p.state == domain::PositionState::Closed) {
      archive_->archive(p);
      archive_->writeOpenSnapshot({});
    } else {
      archive_->writeOpenSnapshot({p});
    }
  } catch (const std::exception& e) {
    std::cerr << "[DecisionPipeline] WARNING: position persistence failed for "
              << p.id << ": " << e.what() << "\n";
  }
}

}  // namespace condor
