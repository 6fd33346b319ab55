#pragma once

#include "condor/concurrent/order_id_generator.hpp"
#include "condor/domain/order.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/broker_events.hpp"
#include "condor/events/order_update_event.hpp"
#include "condor/execution/i_order_gateway.hpp"
#include "condor/persistence/order_event_log.hpp"
#include "condor/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace condor {

struct ExecutionParams {
  int max_retries{3};
  std::int64_t retry_base_ms{500};
  std::int64_t retry_cap_ms{8000};
  std::int64_t ack_timeout_ms{3000};
  // Polling fallback cadence; 0 disables polling.
  std::int64_t reconcile_interval_ms{5000};
};

// (broker_order_id, fill_seq)
using FillKey = std::pair<std::string, std::uint64_t>;

// -----------------------------------------------------------------------------
// ExecutionManager
// -----------------------------------------------------------------------------
//
// @brief  Owns every Order: turns strategy leg actions into broker requests,
//         applies broker reports, retries transient failures, and publishes
//         an OrderUpdateEvent for every state change.
//
// @details
// Lives on the decision loop. It never performs I/O: outbound requests are
// published as BrokerRequestEvent, which the orchestrator forwards to the
// OrderRouter; reports come back as BrokerReportEvent and
// OrderStatusSnapshotEvent on the same bus.
//
// Retry model: each Order carries its own retry state (retries,
// next_retry_ms, ack_deadline_ms). onTimer(now) is the scheduler tick that
// resends due retries and converts missed acks into transient Timeout
// rejections. Backoff for the n-th retry is
// min(retry_base_ms * 2^(n-1), retry_cap_ms). After max_retries retries, or
// on any permanent reject code, the order becomes Rejected.
//
// Idempotence: fills are keyed by (broker_order_id, fill_seq); a replayed
// key is counted and ignored. A fill seen before the venue id is known is
// keyed by the client id and re-keyed once the venue id arrives. Reports for unknown orders, and fills that
// would overfill an order or land on a rejected/cancelled one, are
// ReconciliationConflicts: logged, counted, never applied.
//
// Cancel: an order not yet acknowledged is only flagged; the venue cancel is
// sent when the ack arrives, and the order becomes Cancelled on the venue's
// confirmation or when its ack window lapses.
//
// Retention: once a Position closes, forgetPosition() marks it and the next
// scheduler tick drops its terminal orders, their venue ids and fill keys.
// Reports arriving for them afterwards are ReconciliationConflicts.
//
// Thread model: decision loop only. Not thread-safe.
// -----------------------------------------------------------------------------
class ExecutionManager : public IOrderGateway {
 public:
  ExecutionManager(EventBus& bus, ExecutionParams params,
                   OrderIdGenerator& id_gen, const ITimeProvider& clock,
                   OrderEventLog* log = nullptr);
  ~ExecutionManager() override;

  ExecutionManager(const ExecutionManager&) = delete;
  ExecutionManager& operator=(const ExecutionManager&) = delete;
  ExecutionManager(ExecutionManager&&) = delete;
  ExecutionManager& operator=(ExecutionManager&&) = delete;

  domain::Order submit(const LegAction& action) override;
  bool cancel(domain::OrderId id) override;
  bool modify(domain::OrderId id, std::int64_t new_quantity,
              double new_price) override;

  // Scheduler tick: due retries, ack timeouts, reconciliation polling.
  void onTimer(std::int64_t now_ms);

  // Applies a venue order-book snapshot through the same deduplicated path
  // as push reports. Returns the updates it produced (also published).
  std::vector<OrderUpdateEvent> reconcile(
      const OrderStatusSnapshotEvent& snapshot);

  // Drops the position's terminal orders on the next onTimer().
  void forgetPosition(const std::string& position_id);

  // Crash recovery, before the loops start.
  void hydrateOrder(const domain::Order& order);
  void hydrateFillKeys(const std::vector<FillKey>& keys);

  const domain::Order* order(domain::OrderId id) const;
  std::vector<domain::Order> openOrders() const;
  std::size_t openOrderCount() const;

  std::size_t conflictCount() const { return conflicts_; }
  std::size_t duplicateFillCount() const { return duplicate_fills_; }
  std::size_t fillCount() const { return fills_; }
  std::size_t orderCount() const { return orders_.size(); }

  const ExecutionParams& params() const { return params_; }

  // Legal order lifecycle transitions (see order_status.hpp).
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

 private:
  void onBrokerReport(const BrokerReportEvent& report);

  domain::Order* lookup(domain::OrderId client_id,
                        const std::string& broker_order_id);

  static std::string provisionalVenueId(domain::OrderId id);
  void adoptBrokerId(domain::Order& order, const std::string& broker_order_id);
  void pruneRetired();

  void applyAck(domain::Order& order, const std::string& broker_order_id);
  void applyFill(domain::Order& order, const std::string& broker_order_id,
                 std::uint64_t fill_seq, std::int64_t quantity, double price);
  void applyReject(domain::Order& order, domain::RejectCode code,
                   const std::string& reason);
  void applyCancelled(domain::Order& order);

  void transition(domain::Order& order, domain::OrderStatus next,
                  const std::string& kind,
                  const std::optional<FillDetail>& fill = std::nullopt);
  void sendRequest(BrokerRequestEvent::Kind kind, const domain::Order& order);
  void conflict(const std::string& what);
  std::int64_t backoffMs(int retry) const;

  EventBus& bus_;
  ExecutionParams params_;
  OrderIdGenerator& id_gen_;
  const ITimeProvider& clock_;
  OrderEventLog* log_;

  EventBus::SubscriptionId report_sub_id_{0};
  EventBus::SubscriptionId snapshot_sub_id_{0};

  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<std::string, domain::OrderId> by_broker_id_;
  std::set<FillKey> seen_fills_;
  std::set<std::string> retired_positions_;

  std::int64_t last_poll_ms_{0};
  std::size_t conflicts_{0};
  std::size_t duplicate_fills_{0};
  std::size_t fills_{0};

  // Set while reconcile() runs so the updates it causes can be returned.
  std::vector<OrderUpdateEvent>* capture_{nullptr};
};

}  // namespace condor
