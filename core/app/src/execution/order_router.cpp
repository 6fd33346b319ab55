#include "condor/execution/order_router.hpp"
#include "condor/domain/errors.hpp"

#include <iostream>
#include <stdexcept>

namespace condor {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
OrderRouter::OrderRouter(EventBus& bus, IBrokerClient& client,
                         const ITimeProvider& clock)
    : bus_(bus), client_(client), clock_(clock) {
  request_sub_id_ = bus_.subscribe<BrokerRequestEvent>(
      [this](const BrokerRequestEvent& e) { onRequest(e); });
  tick_sub_id_ =
      bus_.subscribe<TickEvent>([this](const TickEvent& e) { onTick(e); });
  timer_sub_id_ =
      bus_.subscribe<TimerEvent>([this](const TimerEvent& e) { onTimer(e); });
}

OrderRouter::~OrderRouter() {
  bus_.unsubscribe(timer_sub_id_);
  bus_.unsubscribe(tick_sub_id_);
  bus_.unsubscribe(request_sub_id_);
}

// -----------------------------------------------------------------------------
// onRequest(): one broker call per request
// -----------------------------------------------------------------------------
void OrderRouter::onRequest(const BrokerRequestEvent& request) {
  ++requests_;

  switch (request.kind) {
    case BrokerRequestEvent::Kind::Place:
      place(request.order);
      break;

    case BrokerRequestEvent::Kind::Cancel:
      try {
        client_.cancel(request.order.broker_order_id);
      } catch (const BrokerError& e) {
        ++errors_;
        std::cerr << "[OrderRouter] cancel " << request.order.broker_order_id
                  << " failed (" << domain::toString(e.code())
                  << "): " << e.what() << "\n";
      }
      break;

    case BrokerRequestEvent::Kind::Modify:
      try {
        client_.modify(request.order.broker_order_id, request.new_quantity,
                       request.new_price);
      } catch (const BrokerError& e) {
        ++errors_;
        std::cerr << "[OrderRouter] modify " << request.order.broker_order_id
                  << " failed (" << domain::toString(e.code())
                  << "): " << e.what() << "\n";
      }
      break;

    case BrokerRequestEvent::Kind::QueryStatus:
      try {
        OrderStatusSnapshotEvent snapshot;
        snapshot.orders = client_.fetchOrderStatus(request.orders);
        snapshot.timestamp_ms = clock_.now_ms();
        bus_.publish(snapshot);
      } catch (const BrokerError& e) {
        ++errors_;
        std::cerr << "[OrderRouter] order-book poll failed ("
                  << domain::toString(e.code()) << "): " << e.what() << "\n";
      }
      break;
  }

  drainPushReports();
}

void OrderRouter::onTick(const TickEvent& event) {
  client_.onQuote(event.tick);
  drainPushReports();
}

void OrderRouter::onTimer(const TimerEvent& /*event*/) { drainPushReports(); }

// -----------------------------------------------------------------------------
// place(): ack or reject
// -----------------------------------------------------------------------------
void OrderRouter::place(const domain::Order& order) {
  try {
    std::string broker_id = client_.place(order);

    BrokerReportEvent ack;
    ack.kind = BrokerReportEvent::Kind::Ack;
    ack.client_order_id = order.id;
    ack.broker_order_id = std::move(broker_id);
    ack.timestamp_ms = clock_.now_ms();
    bus_.publish(ack);
  } catch (const BrokerError& e) {
    ++errors_;
    publishReject(order, e.code(), e.what());
  } catch (const std::runtime_error& e) {
    ++errors_;
    publishReject(order, domain::RejectCode::NetworkError, e.what());
  }
}

void OrderRouter::publishReject(const domain::Order& order,
                                domain::RejectCode code,
                                const std::string& reason) {
  std::cerr << "[OrderRouter] place order_id=" << order.id << " failed ("
            << domain::toString(code) << "): " << reason << "\n";

  BrokerReportEvent reject;
  reject.kind = BrokerReportEvent::Kind::Reject;
  reject.client_order_id = order.id;
  reject.broker_order_id = order.broker_order_id;
  reject.code = code;
  reject.reason = reason;
  reject.timestamp_ms = clock_.now_ms();
  bus_.publish(reject);
}

void OrderRouter::drainPushReports() {
  std::vector<BrokerReportEvent> reports;
  try {
    reports = client_.poll();
  } catch (const BrokerError& e) {
    ++errors_;
    std::cerr << "[OrderRouter] report stream error ("
              << domain::toString(e.code()) << "): " << e.what() << "\n";
    return;
  }
  for (auto& report : reports) {
    bus_.publish(report);
  }
}

}  // namespace condor
