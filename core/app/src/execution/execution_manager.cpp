#include "condor/execution/execution_manager.hpp"
#include "condor/events/event_types.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace condor {

using domain::Order;
using domain::OrderStatus;

// -----------------------------------------------------------------------------
// Constructor / destructor: subscribe to inbound broker traffic
// -----------------------------------------------------------------------------
ExecutionManager::ExecutionManager(EventBus& bus, ExecutionParams params,
                                   OrderIdGenerator& id_gen,
                                   const ITimeProvider& clock,
                                   OrderEventLog* log)
    : bus_(bus),
      params_(params),
      id_gen_(id_gen),
      clock_(clock),
      log_(log) {
  report_sub_id_ = bus_.subscribe<BrokerReportEvent>(
      [this](const BrokerReportEvent& e) { onBrokerReport(e); });
  snapshot_sub_id_ = bus_.subscribe<OrderStatusSnapshotEvent>(
      [this](const OrderStatusSnapshotEvent& e) { reconcile(e); });
}

ExecutionManager::~ExecutionManager() {
  bus_.unsubscribe(snapshot_sub_id_);
  bus_.unsubscribe(report_sub_id_);
}

// -----------------------------------------------------------------------------
// transitionStatus
// -----------------------------------------------------------------------------
bool ExecutionManager::transitionStatus(OrderStatus current,
                                        OrderStatus next) {
  using S = OrderStatus;
  switch (current) {
    case S::Pending:
      return next == S::Pending || next == S::Placed ||
             next == S::PartiallyFilled || next == S::Filled ||
             next == S::Rejected || next == S::Cancelled;
    case S::Placed:
      return next == S::Pending || next == S::PartiallyFilled ||
             next == S::Filled || next == S::Rejected ||
             next == S::Cancelled;
    case S::PartiallyFilled:
      return next == S::PartiallyFilled || next == S::Filled ||
             next == S::Rejected || next == S::Cancelled;
    case S::Filled:
    case S::Rejected:
    case S::Cancelled:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// submit / cancel / modify
// -----------------------------------------------------------------------------
Order ExecutionManager::submit(const LegAction& action) {
  const std::int64_t now = clock_.now_ms();

  Order order;
  order.id = id_gen_.next_id();
  order.position_id = action.position_id;
  order.leg_index = action.leg_index;
  order.purpose = action.purpose;
  order.instrument_id = action.instrument_id;
  order.side = action.side;
  order.quantity = action.quantity;
  order.order_type = action.order_type;
  order.limit_price = action.limit_price;
  order.status = OrderStatus::Pending;
  order.created_ms = now;
  order.ack_deadline_ms = now + params_.ack_timeout_ms;

  auto [it, inserted] = orders_.emplace(order.id, order);
  if (log_ != nullptr) {
    log_->append("submit", it->second, now);
  }

  std::cout << "[ExecutionManager] submit order_id=" << order.id << " "
            << domain::toString(order.purpose) << " "
            << domain::toString(order.side) << " " << order.quantity << " "
            << order.instrument_id << " position=" << order.position_id
            << "\n";

  sendRequest(BrokerRequestEvent::Kind::Place, it->second);
  return it->second;
}

bool ExecutionManager::cancel(domain::OrderId id) {
  auto it = orders_.find(id);
  if (it == orders_.end() || domain::isTerminal(it->second.status)) {
    return false;
  }
  Order& order = it->second;
  if (order.cancel_requested) {
    return true;
  }
  order.cancel_requested = true;
  if (log_ != nullptr) {
    log_->append("cancel_requested", order, clock_.now_ms());
  }

  if (!order.broker_order_id.empty()) {
    sendRequest(BrokerRequestEvent::Kind::Cancel, order);
  } else if (order.next_retry_ms > 0) {
    // Waiting out a backoff: nothing is live at the venue. Make the retry
    // due so the next scheduler tick retires it as Cancelled.
    order.next_retry_ms = clock_.now_ms();
  }
  return true;
}

bool ExecutionManager::modify(domain::OrderId id, std::int64_t new_quantity,
                              double new_price) {
  auto it = orders_.find(id);
  if (it == orders_.end() || domain::isTerminal(it->second.status)) {
    return false;
  }
  Order& order = it->second;
  if (order.broker_order_id.empty() || order.cancel_requested ||
      new_quantity < order.filled_quantity || new_quantity <= 0) {
    return false;
  }

  order.quantity = new_quantity;
  order.limit_price = new_price;
  if (log_ != nullptr) {
    log_->append("modify", order, clock_.now_ms());
  }

  BrokerRequestEvent request;
  request.kind = BrokerRequestEvent::Kind::Modify;
  request.order = order;
  request.new_quantity = new_quantity;
  request.new_price = new_price;
  request.timestamp_ms = clock_.now_ms();
  bus_.publish(request);

  if (order.filled_quantity == order.quantity) {
    transition(order, OrderStatus::Filled, "modify_filled");
  }
  return true;
}

// -----------------------------------------------------------------------------
// onTimer: scheduler tick
// -----------------------------------------------------------------------------
void ExecutionManager::onTimer(std::int64_t now_ms) {
  pruneRetired();

  // Handlers of the updates published below may submit new orders, so walk
  // a copy of the ids rather than the map itself.
  std::vector<domain::OrderId> ids;
  ids.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    if (!domain::isTerminal(order.status)) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());

  for (domain::OrderId id : ids) {
    auto it = orders_.find(id);
    if (it == orders_.end()) {
      continue;
    }
    Order& order = it->second;
    if (order.status != OrderStatus::Pending) {
      continue;
    }

    if (order.next_retry_ms > 0 && now_ms >= order.next_retry_ms) {
      order.next_retry_ms = 0;
      if (order.cancel_requested) {
        transition(order, OrderStatus::Cancelled, "cancelled");
        continue;
      }
      order.ack_deadline_ms = now_ms + params_.ack_timeout_ms;
      if (log_ != nullptr) {
        log_->append("resend", order, now_ms);
      }
      std::cout << "[ExecutionManager] retry " << order.retries << "/"
                << params_.max_retries << " order_id=" << order.id << "\n";
      sendRequest(BrokerRequestEvent::Kind::Place, order);
      continue;
    }

    if (order.ack_deadline_ms > 0 && now_ms >= order.ack_deadline_ms) {
      order.ack_deadline_ms = 0;
      std::cerr << "[ExecutionManager] WARNING: no ack for order_id="
                << order.id << " within " << params_.ack_timeout_ms
                << " ms.\n";
      applyReject(order, domain::RejectCode::Timeout, "ack timeout");
    }
  }

  // --- Polling fallback ---------------------------------------------------------
  if (params_.reconcile_interval_ms > 0 &&
      now_ms - last_poll_ms_ >= params_.reconcile_interval_ms) {
    std::vector<Order> open = openOrders();
    if (!open.empty()) {
      last_poll_ms_ = now_ms;
      BrokerRequestEvent request;
      request.kind = BrokerRequestEvent::Kind::QueryStatus;
      request.orders = std::move(open);
      request.timestamp_ms = now_ms;
      bus_.publish(request);
    }
  }
}

// -----------------------------------------------------------------------------
// Push reports
// -----------------------------------------------------------------------------
void ExecutionManager::onBrokerReport(const BrokerReportEvent& report) {
  Order* order = lookup(report.client_order_id, report.broker_order_id);
  if (order == nullptr) {
    conflict(std::string("report ") + toString(report.kind) +
             " for unknown order client_id=" +
             std::to_string(report.client_order_id) +
             " broker_id=" + report.broker_order_id);
    return;
  }

  switch (report.kind) {
    case BrokerReportEvent::Kind::Ack:
      applyAck(*order, report.broker_order_id);
      break;
    case BrokerReportEvent::Kind::Fill:
      applyFill(*order, report.broker_order_id, report.fill_seq,
                report.fill_quantity, report.fill_price);
      break;
    case BrokerReportEvent::Kind::Reject:
      applyReject(*order, report.code, report.reason);
      break;
    case BrokerReportEvent::Kind::Cancelled:
      applyCancelled(*order);
      break;
  }
}

// -----------------------------------------------------------------------------
// reconcile: polling snapshot
// -----------------------------------------------------------------------------
std::vector<OrderUpdateEvent> ExecutionManager::reconcile(
    const OrderStatusSnapshotEvent& snapshot) {
  std::vector<OrderUpdateEvent> produced;
  capture_ = &produced;

  for (const BrokerOrderStatus& row : snapshot.orders) {
    Order* order = lookup(row.client_order_id, row.broker_order_id);
    if (order == nullptr) {
      conflict("order book row for unknown order client_id=" +
               std::to_string(row.client_order_id) +
               " broker_id=" + row.broker_order_id);
      continue;
    }
    if (row.state == VenueOrderState::NotFound) {
      continue;
    }
    if (!row.broker_order_id.empty() && order->broker_order_id.empty()) {
      applyAck(*order, row.broker_order_id);
    }
    for (const BrokerFill& fill : row.fills) {
      applyFill(*order, row.broker_order_id, fill.fill_seq, fill.quantity,
                fill.price);
    }
    if (row.state == VenueOrderState::Rejected) {
      applyReject(*order, row.code, row.reason);
    } else if (row.state == VenueOrderState::Cancelled) {
      applyCancelled(*order);
    }
  }

  capture_ = nullptr;
  return produced;
}

// -----------------------------------------------------------------------------
// Report application
// -----------------------------------------------------------------------------
void ExecutionManager::applyAck(Order& order,
                                const std::string& broker_order_id) {
  const bool first_ack =
      order.broker_order_id.empty() && !broker_order_id.empty();
  if (first_ack) {
    adoptBrokerId(order, broker_order_id);
  }

  if (domain::isTerminal(order.status)) {
    // Late ack for an order we already gave up on: make sure nothing stays
    // live at the venue.
    if (first_ack && order.status == OrderStatus::Cancelled) {
      sendRequest(BrokerRequestEvent::Kind::Cancel, order);
    }
    return;
  }

  order.ack_deadline_ms = 0;
  if (order.cancel_requested && first_ack) {
    sendRequest(BrokerRequestEvent::Kind::Cancel, order);
  }
  if (order.status == OrderStatus::Pending) {
    order.next_retry_ms = 0;
    transition(order, OrderStatus::Placed, "placed");
  }
}

void ExecutionManager::applyFill(Order& order,
                                 const std::string& broker_order_id,
                                 std::uint64_t fill_seq,
                                 std::int64_t quantity, double price) {
  if (order.broker_order_id.empty() && !broker_order_id.empty()) {
    adoptBrokerId(order, broker_order_id);
  }
  const std::string venue_id = order.broker_order_id.empty()
                                   ? provisionalVenueId(order.id)
                                   : order.broker_order_id;
  const FillKey key{venue_id, fill_seq};

  if (seen_fills_.count(key) != 0) {
    ++duplicate_fills_;
    std::cout << "[ExecutionManager] duplicate fill ignored order_id="
              << order.id << " broker_id=" << venue_id
              << " seq=" << fill_seq << "\n";
    return;
  }
  if (order.status == OrderStatus::Rejected ||
      order.status == OrderStatus::Cancelled) {
    conflict("fill for " + std::string(domain::toString(order.status)) +
             " order_id=" + std::to_string(order.id));
    return;
  }
  if (quantity <= 0 || order.filled_quantity + quantity > order.quantity) {
    conflict("fill of " + std::to_string(quantity) + " overfills order_id=" +
             std::to_string(order.id) + " (" +
             std::to_string(order.filled_quantity) + "/" +
             std::to_string(order.quantity) + ")");
    return;
  }

  seen_fills_.insert(key);
  ++fills_;

  const double notional =
      order.avg_fill_price * static_cast<double>(order.filled_quantity) +
      price * static_cast<double>(quantity);
  order.filled_quantity += quantity;
  order.avg_fill_price = notional / static_cast<double>(order.filled_quantity);
  order.ack_deadline_ms = 0;
  order.next_retry_ms = 0;

  const OrderStatus next = order.filled_quantity == order.quantity
                               ? OrderStatus::Filled
                               : OrderStatus::PartiallyFilled;
  transition(order, next, "fill", FillDetail{quantity, price, fill_seq});
}

void ExecutionManager::applyReject(Order& order, domain::RejectCode code,
                                   const std::string& reason) {
  if (domain::isTerminal(order.status)) {
    return;
  }

  if (domain::isTransient(code)) {
    if (order.cancel_requested) {
      transition(order, OrderStatus::Cancelled, "cancelled");
      return;
    }
    if (order.retries < params_.max_retries &&
        order.status != OrderStatus::PartiallyFilled) {
      ++order.retries;
      order.next_retry_ms = clock_.now_ms() + backoffMs(order.retries);
      order.ack_deadline_ms = 0;
      order.reject_code = code;
      order.reject_reason = reason;
      std::cerr << "[ExecutionManager] transient reject ("
                << domain::toString(code) << ") order_id=" << order.id
                << "; retry " << order.retries << " at "
                << order.next_retry_ms << "\n";
      transition(order, OrderStatus::Pending, "retry_scheduled");
      return;
    }
  }

  order.reject_code = code;
  order.reject_reason = reason;
  order.next_retry_ms = 0;
  order.ack_deadline_ms = 0;
  std::cerr << "[ExecutionManager] order_id=" << order.id << " REJECTED ("
            << domain::toString(code) << ") after " << order.retries
            << " retries: " << reason << "\n";
  transition(order, OrderStatus::Rejected, "rejected");

  if (code == domain::RejectCode::AuthExpired) {
    EngineFatalEvent fatal;
    fatal.reason = FatalReason::AuthExpired;
    fatal.detail = "broker session expired: " + reason;
    fatal.timestamp_ms = clock_.now_ms();
    bus_.publish(fatal);
  }
}

void ExecutionManager::applyCancelled(Order& order) {
  if (domain::isTerminal(order.status)) {
    return;
  }
  order.next_retry_ms = 0;
  order.ack_deadline_ms = 0;
  transition(order, OrderStatus::Cancelled, "cancelled");
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
std::string ExecutionManager::provisionalVenueId(domain::OrderId id) {
  return "client-" + std::to_string(id);
}

void ExecutionManager::adoptBrokerId(Order& order,
                                     const std::string& broker_order_id) {
  order.broker_order_id = broker_order_id;
  by_broker_id_[broker_order_id] = order.id;

  // Fills applied before the venue id was known move under it, so the same
  // fill replayed later with the venue id is still recognised.
  const std::string provisional = provisionalVenueId(order.id);
  auto it = seen_fills_.lower_bound(FillKey{provisional, 0});
  while (it != seen_fills_.end() && it->first == provisional) {
    seen_fills_.insert(FillKey{broker_order_id, it->second});
    it = seen_fills_.erase(it);
  }
}

void ExecutionManager::transition(Order& order, OrderStatus next,
                                  const std::string& kind,
                                  const std::optional<FillDetail>& fill) {
  const OrderStatus previous = order.status;
  if (!transitionStatus(previous, next)) {
    std::cerr << "[ExecutionManager] WARNING: illegal transition order_id="
              << order.id << " " << domain::toString(previous) << " -> "
              << domain::toString(next) << ". Skipping.\n";
    return;
  }
  order.status = next;

  const std::int64_t now = clock_.now_ms();
  if (log_ != nullptr) {
    log_->append(kind, order, now, fill);
  }

  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.fill = fill;
  update.timestamp_ms = now;

  if (capture_ != nullptr) {
    capture_->push_back(update);
  }
  bus_.publish(update);
}

void ExecutionManager::sendRequest(BrokerRequestEvent::Kind kind,
                                   const Order& order) {
  BrokerRequestEvent request;
  request.kind = kind;
  request.order = order;
  request.timestamp_ms = clock_.now_ms();
  bus_.publish(request);
}

Order* ExecutionManager::lookup(domain::OrderId client_id,
                                const std::string& broker_order_id) {
  if (client_id != 0) {
    auto it = orders_.find(client_id);
    if (it != orders_.end()) {
      return &it->second;
    }
  }
  if (!broker_order_id.empty()) {
    auto b = by_broker_id_.find(broker_order_id);
    if (b != by_broker_id_.end()) {
      auto it = orders_.find(b->second);
      if (it != orders_.end()) {
        return &it->second;
      }
    }
  }
  return nullptr;
}

void ExecutionManager::conflict(const std::string& what) {
  ++conflicts_;
  std::cerr << "[ExecutionManager] ReconciliationConflict: " << what
            << ". Dropped.\n";
}

std::int64_t ExecutionManager::backoffMs(int retry) const {
  std::int64_t delay = params_.retry_base_ms;
  for (int i = 1; i < retry && delay < params_.retry_cap_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, params_.retry_cap_ms);
}

// -----------------------------------------------------------------------------
// Recovery and inspection
// -----------------------------------------------------------------------------
void ExecutionManager::hydrateOrder(const Order& order) {
  Order copy = order;
  if (copy.status == OrderStatus::Pending && copy.broker_order_id.empty()) {
    copy.ack_deadline_ms = clock_.now_ms() + params_.ack_timeout_ms;
  }
  if (!copy.broker_order_id.empty()) {
    by_broker_id_[copy.broker_order_id] = copy.id;
  }
  id_gen_.seed(copy.id);
  orders_[copy.id] = std::move(copy);
}

void ExecutionManager::forgetPosition(const std::string& position_id) {
  retired_positions_.insert(position_id);
}

void ExecutionManager::pruneRetired() {
  if (retired_positions_.empty()) {
    return;
  }
  std::size_t pruned = 0;
  std::set<std::string> still_open;
  for (auto it = orders_.begin(); it != orders_.end();) {
    const Order& order = it->second;
    if (retired_positions_.count(order.position_id) == 0) {
      ++it;
      continue;
    }
    if (!domain::isTerminal(order.status)) {
      still_open.insert(order.position_id);
      ++it;
      continue;
    }
    const std::string venue_id = order.broker_order_id.empty()
                                     ? provisionalVenueId(order.id)
                                     : order.broker_order_id;
    auto key = seen_fills_.lower_bound(FillKey{venue_id, 0});
    while (key != seen_fills_.end() && key->first == venue_id) {
      key = seen_fills_.erase(key);
    }
    if (!order.broker_order_id.empty()) {
      by_broker_id_.erase(order.broker_order_id);
    }
    it = orders_.erase(it);
    ++pruned;
  }
  if (pruned > 0) {
    std::cout << "[ExecutionManager] pruned " << pruned
              << " terminal order(s) of closed position(s)\n";
  }
  retired_positions_ = std::move(still_open);
}

void ExecutionManager::hydrateFillKeys(const std::vector<FillKey>& keys) {
  seen_fills_.insert(keys.begin(), keys.end());
}

const Order* ExecutionManager::order(domain::OrderId id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

std::vector<Order> ExecutionManager::openOrders() const {
  std::vector<Order> open;
  for (const auto& [id, order] : orders_) {
    if (!domain::isTerminal(order.status)) {
      open.push_back(order);
    }
  }
  std::sort(open.begin(), open.end(),
            [](const Order& a, const Order& b) { return a.id < b.id; });
  return open;
}

std::size_t ExecutionManager::openOrderCount() const {
  return static_cast<std::size_t>(
      std::count_if(orders_.begin(), orders_.end(), [](const auto& kv) {
        return !domain::isTerminal(kv.second.status);
      }));
}

}  // namespace condor
