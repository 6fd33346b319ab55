#pragma once

#include "condor/execution/i_broker_client.hpp"
#include "condor/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace condor {

struct SimBrokerParams {
  // Points added to buys and subtracted from sells.
  double slippage{0.0};
  // Simulated time between placement and fill.
  std::int64_t latency_ms{0};
  // false: fills are never pushed, only the order-book poll reveals them.
  bool push_fills{true};
};

// -----------------------------------------------------------------------------
// SimulatedBroker
// -----------------------------------------------------------------------------
//
// @brief  In-process venue that fills market orders at the quoted price.
//
// @details
// Quotes arrive through onQuote(). An order placed for an instrument with
// no usable quote is refused with InvalidInstrument.
//
// Fill price: ask for buys and bid for sells, the last price when that side
// of the quote is missing, then moved against the order by `slippage`
// points. The fill is priced from the quote current at release time, which
// is the first poll()/fetchOrderStatus() at or after placement + latency.
// Each order fills in full, as fill sequence 1.
//
// Broker order ids are "SIM-<n>". Placement is idempotent on the client
// order id.
//
// Scripted failures (tests): rejectNext() makes the next `count`
// placements for an instrument throw BrokerError with the given code.
//
// Thread-safety: all methods lock an internal mutex.
// -----------------------------------------------------------------------------
class SimulatedBroker : public IBrokerClient {
 public:
  SimulatedBroker(const ITimeProvider& clock, SimBrokerParams params);

  std::string place(const domain::Order& order) override;
  void cancel(const std::string& broker_order_id) override;
  void modify(const std::string& broker_order_id, std::int64_t new_quantity,
              double new_price) override;
  std::vector<BrokerOrderStatus> fetchOrderStatus(
      const std::vector<domain::Order>& orders) override;
  std::vector<BrokerReportEvent> poll() override;
  void onQuote(const domain::Tick& tick) override;

  void rejectNext(const std::string& instrument_id, domain::RejectCode code,
                  int count = 1);

  void setPushFills(bool push_fills);

  std::size_t ordersPlaced() const;
  std::size_t placeCalls() const;

 private:
  struct SimOrder {
    domain::Order order;
    std::string broker_order_id;
    std::int64_t placed_ms{0};
    VenueOrderState state{VenueOrderState::Open};
    std::vector<BrokerFill> fills;
    bool fill_pushed{false};
  };

  struct ScriptedReject {
    domain::RejectCode code;
    int remaining;
  };

  void releaseDue(std::int64_t now_ms);
  double fillPrice(const domain::Order& order) const;
  BrokerOrderStatus statusOf(const SimOrder& sim) const;

  const ITimeProvider& clock_;
  SimBrokerParams params_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, domain::Tick> quotes_;
  std::map<std::string, SimOrder> orders_;  // by broker order id
  std::unordered_map<domain::OrderId, std::string> by_client_id_;
  std::unordered_map<std::string, ScriptedReject> scripted_;
  std::deque<BrokerReportEvent> outbox_;
  std::uint64_t next_broker_id_{1};
  std::size_t place_calls_{0};
};

}  // namespace condor
