#include "condor/engine/backtest_engine.hpp"
#include "condor/engine/tick_file_reader.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace condor {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
BacktestEngine::BacktestEngine(const EngineConfig& config,
                               const InstrumentMaster& master)
    : broker_(clock_, config.backtest.broker) {
  // Decision -> routing, synchronously. The tick bridge goes first so the
  // broker sees the quote before any order placed on it.
  decision_subs_.push_back(decision_bus_.subscribe<TickEvent>(
      [this](const TickEvent& e) { routing_bus_.publish(e); }));
  decision_subs_.push_back(decision_bus_.subscribe<BrokerRequestEvent>(
      [this](const BrokerRequestEvent& e) { routing_bus_.publish(e); }));

  pipeline_ = std::make_unique<DecisionPipeline>(
      decision_bus_, config, master, clock_, health_, order_id_gen_);
  router_ = std::make_unique<OrderRouter>(routing_bus_, broker_, clock_);

  // Routing -> decision, deferred.
  routing_subs_.push_back(routing_bus_.subscribe<BrokerReportEvent>(
      [this](const BrokerReportEvent& e) { pending_.push_back(e); }));
  routing_subs_.push_back(routing_bus_.subscribe<OrderStatusSnapshotEvent>(
      [this](const OrderStatusSnapshotEvent& e) { pending_.push_back(e); }));

  decision_subs_.push_back(decision_bus_.subscribe<PositionUpdateEvent>(
      [this](const PositionUpdateEvent& e) {
        trajectory_.push_back(e);
        if (e.position.state == domain::PositionState::Closed) {
          closed_.push_back(e.position);
          realized_pnl_ += e.position.realized_pnl;
        }
      }));

  health_.init(0);
}

BacktestEngine::~BacktestEngine() {
  router_.reset();
  pipeline_.reset();
  for (auto id : decision_subs_) {
    decision_bus_.unsubscribe(id);
  }
  for (auto id : routing_subs_) {
    routing_bus_.unsubscribe(id);
  }
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
BacktestResult BacktestEngine::run(const std::vector<domain::Tick>& ticks) {
  std::cout << "[BacktestEngine] replaying " << ticks.size() << " tick(s).\n";
  for (const auto& tick : ticks) {
    step(tick);
  }
  BacktestResult r = result();
  std::cout << "[BacktestEngine] done: ticks=" << r.ticks
            << " dropped=" << r.ticks_dropped << " fills=" << r.fills
            << " closed=" << r.closed_positions.size()
            << " realized_pnl=" << r.realized_pnl
            << " conflicts=" << r.conflicts << "\n";
  return r;
}

BacktestResult BacktestEngine::runFile(const std::string& path) {
  return run(readTickFile(path));
}

void BacktestEngine::step(const domain::Tick& tick) {
  auto it = last_tick_ts_.find(tick.instrument_id);
  if (it != last_tick_ts_.end() && tick.timestamp_ms < it->second) {
    ++ticks_dropped_;
    std::cerr << "[BacktestEngine] out-of-order tick for "
              << tick.instrument_id << " (" << tick.timestamp_ms << " < "
              << it->second << "). Dropped.\n";
    return;
  }
  last_tick_ts_[tick.instrument_id] = tick.timestamp_ms;

  if (tick.timestamp_ms > clock_.now_ms()) {
    clock_.advance_time(tick.timestamp_ms);
  }
  health_.recordTick(tick.timestamp_ms);
  ++ticks_;

  pending_.push_back(TickEvent{tick});
  drain();
}

void BacktestEngine::advanceTo(std::int64_t now_ms) {
  if (now_ms > clock_.now_ms()) {
    clock_.advance_time(now_ms);
  }
  const TimerEvent timer{clock_.now_ms()};
  routing_bus_.publish(timer);
  pending_.push_back(timer);
  drain();
}

// -----------------------------------------------------------------------------
// drain(): dispatch FIFO events until quiescent
// -----------------------------------------------------------------------------
void BacktestEngine::drain() {
  if (draining_) {
    return;
  }
  draining_ = true;
  while (!pending_.empty()) {
    Event event = std::move(pending_.front());
    pending_.pop_front();
    try {
      decision_bus_.publish(event);
    } catch (const std::exception& e) {
      // Same containment as the live decision loop.
      std::cerr << "[BacktestEngine] ERROR: subscriber threw: " << e.what()
                << "\n";
    }
  }
  draining_ = false;
}

BacktestResult BacktestEngine::result() const {
  BacktestResult r;
  r.trajectory = trajectory_;
  r.closed_positions = closed_;
  r.realized_pnl = realized_pnl_;
  r.fills = pipeline_->execution().fillCount();
  r.conflicts = pipeline_->execution().conflictCount();
  r.ticks = ticks_;
  r.ticks_dropped = ticks_dropped_;
  return r;
}

}  // namespace condor
