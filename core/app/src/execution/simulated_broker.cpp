#include "condor/execution/simulated_broker.hpp"
#include "condor/domain/errors.hpp"

#include <algorithm>
#include <iostream>

namespace condor {

SimulatedBroker::SimulatedBroker(const ITimeProvider& clock,
                                 SimBrokerParams params)
    : clock_(clock), params_(params) {}

// -----------------------------------------------------------------------------
// place()
// -----------------------------------------------------------------------------
std::string SimulatedBroker::place(const domain::Order& order) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++place_calls_;

  auto existing = by_client_id_.find(order.id);
  if (existing != by_client_id_.end()) {
    return existing->second;
  }

  auto scripted = scripted_.find(order.instrument_id);
  if (scripted != scripted_.end() && scripted->second.remaining > 0) {
    const domain::RejectCode code = scripted->second.code;
    if (--scripted->second.remaining == 0) {
      scripted_.erase(scripted);
    }
    throw BrokerError(code, "simulated reject for " + order.instrument_id);
  }

  auto quote = quotes_.find(order.instrument_id);
  if (quote == quotes_.end() || quote->second.markPrice() <= 0.0) {
    throw BrokerError(domain::RejectCode::InvalidInstrument,
                      "no quote for " + order.instrument_id);
  }
  if (order.quantity <= 0) {
    throw BrokerError(domain::RejectCode::InvalidOrder,
                      "non-positive quantity");
  }

  SimOrder sim;
  sim.order = order;
  sim.broker_order_id = "SIM-" + std::to_string(next_broker_id_++);
  sim.placed_ms = clock_.now_ms();

  const std::string id = sim.broker_order_id;
  by_client_id_[order.id] = id;
  orders_.emplace(id, std::move(sim));

  if (params_.latency_ms == 0) {
    releaseDue(clock_.now_ms());
  }
  return id;
}

// -----------------------------------------------------------------------------
// cancel() / modify()
// -----------------------------------------------------------------------------
void SimulatedBroker::cancel(const std::string& broker_order_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = orders_.find(broker_order_id);
  if (it == orders_.end()) {
    throw BrokerError(domain::RejectCode::InvalidOrder,
                      "unknown order " + broker_order_id);
  }
  SimOrder& sim = it->second;
  if (sim.state != VenueOrderState::Open) {
    return;
  }
  sim.state = VenueOrderState::Cancelled;

  if (params_.push_fills) {
    BrokerReportEvent report;
    report.kind = BrokerReportEvent::Kind::Cancelled;
    report.client_order_id = sim.order.id;
    report.broker_order_id = sim.broker_order_id;
    report.timestamp_ms = clock_.now_ms();
    outbox_.push_back(report);
  }
}

void SimulatedBroker::modify(const std::string& broker_order_id,
                             std::int64_t new_quantity, double new_price) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = orders_.find(broker_order_id);
  if (it == orders_.end() || it->second.state != VenueOrderState::Open) {
    throw BrokerError(domain::RejectCode::InvalidOrder,
                      "cannot modify " + broker_order_id);
  }
  it->second.order.quantity = new_quantity;
  it->second.order.limit_price = new_price;
}

// -----------------------------------------------------------------------------
// fetchOrderStatus(): the polling fallback
// -----------------------------------------------------------------------------
std::vector<BrokerOrderStatus> SimulatedBroker::fetchOrderStatus(
    const std::vector<domain::Order>& orders) {
  std::lock_guard<std::mutex> lock(mutex_);
  releaseDue(clock_.now_ms());

  std::vector<BrokerOrderStatus> rows;
  rows.reserve(orders.size());
  for (const auto& order : orders) {
    std::string broker_id = order.broker_order_id;
    if (broker_id.empty()) {
      auto c = by_client_id_.find(order.id);
      if (c != by_client_id_.end()) {
        broker_id = c->second;
      }
    }
    auto it = orders_.find(broker_id);
    if (it == orders_.end()) {
      BrokerOrderStatus missing;
      missing.client_order_id = order.id;
      missing.state = VenueOrderState::NotFound;
      rows.push_back(missing);
      continue;
    }
    rows.push_back(statusOf(it->second));
  }
  return rows;
}

// -----------------------------------------------------------------------------
// poll(): pushed reports
// -----------------------------------------------------------------------------
std::vector<BrokerReportEvent> SimulatedBroker::poll() {
  std::lock_guard<std::mutex> lock(mutex_);
  releaseDue(clock_.now_ms());

  std::vector<BrokerReportEvent> reports(outbox_.begin(), outbox_.end());
  outbox_.clear();
  return reports;
}

void SimulatedBroker::onQuote(const domain::Tick& tick) {
  std::lock_guard<std::mutex> lock(mutex_);
  quotes_[tick.instrument_id] = tick;
}

void SimulatedBroker::rejectNext(const std::string& instrument_id,
                                 domain::RejectCode code, int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  scripted_[instrument_id] = ScriptedReject{code, count};
}

void SimulatedBroker::setPushFills(bool push_fills) {
  std::lock_guard<std::mutex> lock(mutex_);
  params_.push_fills = push_fills;
}

std::size_t SimulatedBroker::ordersPlaced() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return orders_.size();
}

std::size_t SimulatedBroker::placeCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return place_calls_;
}

// -----------------------------------------------------------------------------
// Internals (mutex held)
// -----------------------------------------------------------------------------
void SimulatedBroker::releaseDue(std::int64_t now_ms) {
  for (auto& [id, sim] : orders_) {
    if (sim.state != VenueOrderState::Open ||
        now_ms < sim.placed_ms + params_.latency_ms) {
      continue;
    }
    const double price = fillPrice(sim.order);
    if (price <= 0.0) {
      continue;
    }
    sim.state = VenueOrderState::Filled;
    sim.fills.push_back(BrokerFill{1, sim.order.quantity, price});

    if (params_.push_fills && !sim.fill_pushed) {
      sim.fill_pushed = true;
      BrokerReportEvent report;
      report.kind = BrokerReportEvent::Kind::Fill;
      report.client_order_id = sim.order.id;
      report.broker_order_id = sim.broker_order_id;
      report.fill_seq = 1;
      report.fill_quantity = sim.order.quantity;
      report.fill_price = price;
      report.timestamp_ms = now_ms;
      outbox_.push_back(report);
    }
  }
}

double SimulatedBroker::fillPrice(const domain::Order& order) const {
  auto it = quotes_.find(order.instrument_id);
  if (it == quotes_.end()) {
    return 0.0;
  }
  const domain::Tick& q = it->second;
  if (order.side == domain::Side::Buy) {
    const double base = q.ask > 0.0 ? q.ask : q.markPrice();
    return base + params_.slippage;
  }
  const double base = q.bid > 0.0 ? q.bid : q.markPrice();
  return std::max(base - params_.slippage, 0.05);
}

BrokerOrderStatus SimulatedBroker::statusOf(const SimOrder& sim) const {
  BrokerOrderStatus row;
  row.client_order_id = sim.order.id;
  row.broker_order_id = sim.broker_order_id;
  row.state = sim.state;
  row.fills = sim.fills;
  return row;
}

}  // namespace condor
