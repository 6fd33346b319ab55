#pragma once

#include "condor/domain/order.hpp"
#include "condor/domain/tick.hpp"
#include "condor/events/broker_events.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// IBrokerClient
// -----------------------------------------------------------------------------
//
// @brief  The brokerage venue as seen from the order routing thread.
//
// @details
// Implementations: ZmqBrokerClient (live venue over ZeroMQ) and
// SimulatedBroker (backtest and tests).
//
// Every call may block on I/O and is only ever made from the routing thread.
// Failures are reported by throwing BrokerError with a RejectCode; the
// OrderRouter turns them into reject reports for the ExecutionManager.
//
// place() is keyed by the engine's client order id: placing the same id
// again must not create a second order at the venue, it returns the
// existing broker order id instead.
// -----------------------------------------------------------------------------
class IBrokerClient {
 public:
  virtual ~IBrokerClient() = default;

  // Returns the venue's order id (the acknowledgement).
  virtual std::string place(const domain::Order& order) = 0;

  virtual void cancel(const std::string& broker_order_id) = 0;

  virtual void modify(const std::string& broker_order_id,
                      std::int64_t new_quantity, double new_price) = 0;

  // Order-book status for the polling fallback. Orders the venue does not
  // know come back as VenueOrderState::NotFound.
  virtual std::vector<BrokerOrderStatus> fetchOrderStatus(
      const std::vector<domain::Order>& orders) = 0;

  // Drains pushed execution reports received since the last call.
  virtual std::vector<BrokerReportEvent> poll() = 0;

  // Market quotes, for venues that need them (the simulator fills at them).
  virtual void onQuote(const domain::Tick& /*tick*/) {}
};

}  // namespace condor
