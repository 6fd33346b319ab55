#pragma once

#include "condor/eventbus/event_bus.hpp"
#include "condor/events/broker_events.hpp"
#include "condor/events/event_types.hpp"
#include "condor/execution/i_broker_client.hpp"
#include "condor/time/i_time_provider.hpp"

#include <cstddef>

namespace condor {

// -----------------------------------------------------------------------------
// OrderRouter
// -----------------------------------------------------------------------------
//
// @brief  Executes BrokerRequestEvents against an IBrokerClient and publishes
//         what the venue answers.
//
// @details
// Subscribes on the routing bus. The engine forwards the ExecutionManager's
// BrokerRequestEvents into that bus and forwards everything this router
// publishes (BrokerReportEvent, OrderStatusSnapshotEvent) back to the
// decision loop:
//
//   decision loop                      order routing loop
//   -------------                      ------------------
//   ExecutionManager
//     publish BrokerRequestEvent
//         |
//         +--- bridge ---push()------> OrderRouter::onRequest()
//                                         IBrokerClient::place()/cancel()/...
//                                         publish BrokerReportEvent
//         <--- bridge ---push()-----------+
//   ExecutionManager::onBrokerReport()
//
// A successful place() is published as an Ack report. BrokerError becomes a
// Reject report with its code, so broker failures never escape the routing
// thread. Cancel/Modify failures are logged; the polling fallback picks up
// the venue's real state.
//
// After every event the router drains IBrokerClient::poll() so pushed
// execution reports flow with the same cadence as requests, ticks and timer
// events.
//
// Thread model: routing thread only (or the single backtest thread).
// -----------------------------------------------------------------------------
class OrderRouter {
 public:
  OrderRouter(EventBus& bus, IBrokerClient& client,
              const ITimeProvider& clock);
  ~OrderRouter();

  OrderRouter(const OrderRouter&) = delete;
  OrderRouter& operator=(const OrderRouter&) = delete;
  OrderRouter(OrderRouter&&) = delete;
  OrderRouter& operator=(OrderRouter&&) = delete;

  std::size_t requestsHandled() const { return requests_; }
  std::size_t brokerErrors() const { return errors_; }

 private:
  void onRequest(const BrokerRequestEvent& request);
  void onTick(const TickEvent& event);
  void onTimer(const TimerEvent& event);

  void place(const domain::Order& order);
  void publishReject(const domain::Order& order, domain::RejectCode code,
                     const std::string& reason);
  void drainPushReports();

  EventBus& bus_;
  IBrokerClient& client_;
  const ITimeProvider& clock_;

  EventBus::SubscriptionId request_sub_id_{0};
  EventBus::SubscriptionId tick_sub_id_{0};
  EventBus::SubscriptionId timer_sub_id_{0};

  std::size_t requests_{0};
  std::size_t errors_{0};
};

}  // namespace condor
