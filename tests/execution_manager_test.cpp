// =============================================================================
// execution_manager_test.cpp
// =============================================================================
// Unit tests for condor::ExecutionManager on a bare EventBus and a
// SimulationTimeProvider: no router, no broker, every report hand-built.
//
// Validates:
//   - submit() publishes a Place request for a Pending order
//   - Ack / partial fill / fill transitions and the average fill price
//   - Fill idempotence on (broker_order_id, fill_seq); conflicts counted
//   - Transient rejects retried with exponential backoff, then Rejected
//   - Ack timeouts become transient Timeout rejections
//   - Permanent rejects are final; AuthExpired raises EngineFatalEvent
//   - Cancel before ack, cancel during backoff
//   - Order-book polling cadence and reconcile() of a snapshot
//   - hydrateOrder() re-seeds ids and the broker-id index
//   - A fill seen before the ack is not double counted once the venue id
//     is known
//   - Terminal orders of a closed Position are pruned
// =============================================================================

#include "condor/concurrent/order_id_generator.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/event.hpp"
#include "condor/execution/execution_manager.hpp"
#include "condor/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using condor::BrokerReportEvent;
using condor::BrokerRequestEvent;
using condor::ExecutionManager;
using condor::OrderUpdateEvent;
using condor::domain::OrderId;
using condor::domain::OrderStatus;
using condor::domain::RejectCode;

class ExecutionManagerTest : public ::testing::Test {
 protected:
  ExecutionManagerTest() : clock(1000) {
    params.reconcile_interval_ms = 0;
    bus.subscribe<BrokerRequestEvent>(
        [this](const BrokerRequestEvent& e) { requests.push_back(e); });
    bus.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { updates.push_back(e); });
    bus.subscribe<condor::EngineFatalEvent>(
        [this](const condor::EngineFatalEvent& e) { fatals.push_back(e); });
  }

  ExecutionManager& manager() {
    if (!manager_) {
      manager_ = std::make_unique<ExecutionManager>(bus, params, ids, clock);
    }
    return *manager_;
  }

  condor::domain::Order submit(std::int64_t quantity = 75) {
    condor::LegAction action;
    action.position_id = "NIFTY-IC-1";
    action.leg_index = 0;
    action.purpose = condor::domain::OrderPurpose::Entry;
    action.instrument_id = "NIFTY-22300-CE";
    action.side = condor::domain::Side::Sell;
    action.quantity = quantity;
    return manager().submit(action);
  }

  void ack(OrderId id, const std::string& broker_id) {
    BrokerReportEvent e;
    e.kind = BrokerReportEvent::Kind::Ack;
    e.client_order_id = id;
    e.broker_order_id = broker_id;
    bus.publish(e);
  }

  void fill(OrderId id, const std::string& broker_id, std::uint64_t seq,
            std::int64_t qty, double price) {
    BrokerReportEvent e;
    e.kind = BrokerReportEvent::Kind::Fill;
    e.client_order_id = id;
    e.broker_order_id = broker_id;
    e.fill_seq = seq;
    e.fill_quantity = qty;
    e.fill_price = price;
    bus.publish(e);
  }

  void reject(OrderId id, RejectCode code) {
    BrokerReportEvent e;
    e.kind = BrokerReportEvent::Kind::Reject;
    e.client_order_id = id;
    e.code = code;
    e.reason = "scripted";
    bus.publish(e);
  }

  void tick(std::int64_t now) {
    clock.advance_time(now);
    manager().onTimer(now);
  }

  std::size_t requestsOf(BrokerRequestEvent::Kind kind) const {
    std::size_t n = 0;
    for (const auto& r : requests) {
      if (r.kind == kind) {
        ++n;
      }
    }
    return n;
  }

  condor::EventBus bus;
  condor::SimulationTimeProvider clock;
  condor::OrderIdGenerator ids;
  condor::ExecutionParams params;

  std::vector<BrokerRequestEvent> requests;
  std::vector<OrderUpdateEvent> updates;
  std::vector<condor::EngineFatalEvent> fatals;

 private:
  std::unique_ptr<ExecutionManager> manager_;
};

// -----------------------------------------------------------------------------
// 1. submit() creates a Pending order and asks the router to place it.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, SubmitPublishesPlaceRequest) {
  const auto order = submit();

  EXPECT_EQ(order.id, 1u);
  EXPECT_EQ(order.status, OrderStatus::Pending);
  EXPECT_EQ(order.ack_deadline_ms, 1000 + params.ack_timeout_ms);
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].kind, BrokerRequestEvent::Kind::Place);
  EXPECT_EQ(requests[0].order.instrument_id, "NIFTY-22300-CE");
  EXPECT_EQ(manager().openOrderCount(), 1u);
  EXPECT_TRUE(updates.empty());
}

// -----------------------------------------------------------------------------
// 2. Ack, partial fill, final fill; average price is volume weighted.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, AckAndFillsUpdateOrder) {
  const auto id = submit().id;
  ack(id, "B1");
  fill(id, "B1", 1, 50, 100.0);
  fill(id, "B1", 2, 25, 106.0);

  ASSERT_EQ(updates.size(), 3u);
  EXPECT_EQ(updates[0].order.status, OrderStatus::Placed);
  EXPECT_EQ(updates[1].order.status, OrderStatus::PartiallyFilled);
  ASSERT_TRUE(updates[1].fill.has_value());
  EXPECT_EQ(updates[1].fill->quantity, 50);
  EXPECT_EQ(updates[2].order.status, OrderStatus::Filled);
  EXPECT_EQ(updates[2].previous_status, OrderStatus::PartiallyFilled);

  const auto* order = manager().order(id);
  ASSERT_NE(order, nullptr);
  EXPECT_EQ(order->filled_quantity, 75);
  EXPECT_DOUBLE_EQ(order->avg_fill_price, 102.0);
  EXPECT_EQ(order->broker_order_id, "B1");
  EXPECT_EQ(manager().openOrderCount(), 0u);
  EXPECT_EQ(manager().fillCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. A replayed fill key changes nothing.
// Why: the venue may push a fill and also return it from the order-book
//      poll; applying both would double the leg.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, DuplicateFillIgnored) {
  const auto id = submit().id;
  ack(id, "B1");
  fill(id, "B1", 1, 50, 100.0);
  fill(id, "B1", 1, 50, 100.0);

  EXPECT_EQ(manager().order(id)->filled_quantity, 50);
  EXPECT_EQ(manager().duplicateFillCount(), 1u);
  EXPECT_EQ(updates.size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Overfills, unknown orders and fills on rejected orders are conflicts.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, ConflictsCountedNotApplied) {
  const auto id = submit().id;
  ack(id, "B1");
  fill(id, "B1", 1, 100, 100.0);
  EXPECT_EQ(manager().order(id)->filled_quantity, 0);

  fill(999, "B999", 1, 10, 100.0);

  const auto other = submit().id;
  reject(other, RejectCode::InvalidOrder);
  fill(other, "B2", 1, 10, 100.0);

  EXPECT_EQ(manager().conflictCount(), 3u);
  EXPECT_EQ(manager().order(other)->filled_quantity, 0);
}

// -----------------------------------------------------------------------------
// 5. Transient rejects back off 500, 1000, 2000 ms; the fourth reject is
//    final.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, TransientRejectBacksOffThenGivesUp) {
  const auto id = submit().id;

  reject(id, RejectCode::Timeout);
  EXPECT_EQ(manager().order(id)->status, OrderStatus::Pending);
  EXPECT_EQ(manager().order(id)->retries, 1);
  EXPECT_EQ(manager().order(id)->next_retry_ms, 1500);

  tick(1499);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Place), 1u);
  tick(1500);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Place), 2u);

  reject(id, RejectCode::RateLimited);
  EXPECT_EQ(manager().order(id)->next_retry_ms, 2500);
  tick(2500);

  reject(id, RejectCode::NetworkError);
  EXPECT_EQ(manager().order(id)->next_retry_ms, 4500);
  tick(4500);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Place), 4u);

  reject(id, RejectCode::Timeout);
  const auto* order = manager().order(id);
  EXPECT_EQ(order->status, OrderStatus::Rejected);
  EXPECT_EQ(order->retries, params.max_retries);
  ASSERT_TRUE(order->reject_code.has_value());
  EXPECT_EQ(*order->reject_code, RejectCode::Timeout);
}

// -----------------------------------------------------------------------------
// 6. A missing ack is treated as a Timeout rejection.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, AckTimeoutSchedulesRetry) {
  const auto id = submit().id;

  tick(1000 + params.ack_timeout_ms - 1);
  EXPECT_EQ(manager().order(id)->retries, 0);

  tick(1000 + params.ack_timeout_ms);
  const auto* order = manager().order(id);
  EXPECT_EQ(order->status, OrderStatus::Pending);
  EXPECT_EQ(order->retries, 1);
  EXPECT_EQ(order->next_retry_ms, 1000 + params.ack_timeout_ms + 500);
}

// -----------------------------------------------------------------------------
// 7. Permanent codes are final; AuthExpired is also fatal to the engine.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, PermanentRejectIsFinal) {
  const auto margin = submit().id;
  reject(margin, RejectCode::InsufficientMargin);
  EXPECT_EQ(manager().order(margin)->status, OrderStatus::Rejected);
  EXPECT_EQ(manager().order(margin)->retries, 0);
  EXPECT_TRUE(fatals.empty());

  const auto auth = submit().id;
  reject(auth, RejectCode::AuthExpired);
  EXPECT_EQ(manager().order(auth)->status, OrderStatus::Rejected);
  ASSERT_EQ(fatals.size(), 1u);
  EXPECT_EQ(fatals[0].reason, condor::FatalReason::AuthExpired);
}

// -----------------------------------------------------------------------------
// 8. Cancel before the ack: the venue cancel goes out with the ack.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, CancelBeforeAckSentOnAck) {
  const auto id = submit().id;
  EXPECT_TRUE(manager().cancel(id));
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Cancel), 0u);
  EXPECT_TRUE(manager().cancel(id));  // already flagged

  ack(id, "B1");
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Cancel), 1u);

  BrokerReportEvent cancelled;
  cancelled.kind = BrokerReportEvent::Kind::Cancelled;
  cancelled.broker_order_id = "B1";
  bus.publish(cancelled);

  EXPECT_EQ(manager().order(id)->status, OrderStatus::Cancelled);
  EXPECT_FALSE(manager().cancel(id));
  EXPECT_FALSE(manager().cancel(12345));
}

// -----------------------------------------------------------------------------
// 9. Cancel while a retry is pending retires the order on the next tick.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, CancelDuringBackoff) {
  const auto id = submit().id;
  reject(id, RejectCode::RateLimited);

  EXPECT_TRUE(manager().cancel(id));
  tick(1000);

  EXPECT_EQ(manager().order(id)->status, OrderStatus::Cancelled);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::Place), 1u);
}

// -----------------------------------------------------------------------------
// 10. The order book is polled every reconcile interval while orders are
//     open, and not at all otherwise.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, PollsOrderBookOnInterval) {
  params.reconcile_interval_ms = 5000;
  tick(5000);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::QueryStatus), 0u);

  const auto id = submit().id;
  ack(id, "B1");

  tick(6000);
  ASSERT_EQ(requestsOf(BrokerRequestEvent::Kind::QueryStatus), 1u);
  EXPECT_EQ(requests.back().orders.size(), 1u);
  EXPECT_EQ(requests.back().orders[0].id, id);

  tick(10999);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::QueryStatus), 1u);
  tick(11000);
  EXPECT_EQ(requestsOf(BrokerRequestEvent::Kind::QueryStatus), 2u);
}

// -----------------------------------------------------------------------------
// 11. reconcile() applies a snapshot through the same path as push reports.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, ReconcileAppliesOrderBook) {
  const auto id = submit().id;
  const auto missing = submit().id;

  condor::OrderStatusSnapshotEvent snapshot;
  condor::BrokerOrderStatus row;
  row.client_order_id = id;
  row.broker_order_id = "B1";
  row.state = condor::VenueOrderState::Filled;
  row.fills.push_back(condor::BrokerFill{1, 75, 98.5});
  snapshot.orders.push_back(row);

  condor::BrokerOrderStatus gone;
  gone.client_order_id = missing;
  gone.state = condor::VenueOrderState::NotFound;
  snapshot.orders.push_back(gone);

  condor::BrokerOrderStatus stranger;
  stranger.client_order_id = 777;
  snapshot.orders.push_back(stranger);

  const auto produced = manager().reconcile(snapshot);
  ASSERT_EQ(produced.size(), 2u);
  EXPECT_EQ(produced[0].order.status, OrderStatus::Placed);
  EXPECT_EQ(produced[1].order.status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(manager().order(id)->avg_fill_price, 98.5);
  EXPECT_EQ(manager().order(missing)->status, OrderStatus::Pending);
  EXPECT_EQ(manager().conflictCount(), 1u);

  // The same fill pushed later is a duplicate.
  fill(id, "B1", 1, 75, 98.5);
  EXPECT_EQ(manager().duplicateFillCount(), 1u);
}

// -----------------------------------------------------------------------------
// 12. modify() needs a venue id and cannot shrink below the filled quantity.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, ModifyRules) {
  const auto id = submit().id;
  EXPECT_FALSE(manager().modify(id, 50, 0.0));

  ack(id, "B1");
  fill(id, "B1", 1, 25, 100.0);
  EXPECT_FALSE(manager().modify(id, 20, 0.0));

  EXPECT_TRUE(manager().modify(id, 50, 101.0));
  ASSERT_EQ(requestsOf(BrokerRequestEvent::Kind::Modify), 1u);
  EXPECT_EQ(requests.back().new_quantity, 50);
  EXPECT_EQ(manager().order(id)->quantity, 50);

  // Shrinking to the filled quantity completes the order.
  EXPECT_TRUE(manager().modify(id, 25, 101.0));
  EXPECT_EQ(manager().order(id)->status, OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 13. Recovered orders keep their ids, and reports find them by venue id.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, HydrateOrderSeedsIdsAndIndex) {
  condor::domain::Order recovered;
  recovered.id = 41;
  recovered.position_id = "NIFTY-IC-3";
  recovered.instrument_id = "NIFTY-22300-CE";
  recovered.quantity = 75;
  recovered.status = OrderStatus::Placed;
  recovered.broker_order_id = "B41";
  manager().hydrateOrder(recovered);
  manager().hydrateFillKeys({condor::FillKey{"B41", 1}});

  EXPECT_EQ(submit().id, 42u);

  fill(0, "B41", 1, 75, 100.0);
  EXPECT_EQ(manager().duplicateFillCount(), 1u);
  fill(0, "B41", 2, 75, 100.0);
  EXPECT_EQ(manager().order(41)->status, OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 14. A partial fill pushed before the ack has no venue id. The same fill
//     returned later by the order-book poll, and pushed again after the
//     ack, is recognised rather than counted twice.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, FillBeforeAckNotCountedTwice) {
  const auto id = submit().id;
  fill(id, "", 1, 25, 100.0);
  ASSERT_EQ(manager().order(id)->filled_quantity, 25);

  condor::OrderStatusSnapshotEvent snapshot;
  condor::BrokerOrderStatus row;
  row.client_order_id = id;
  row.broker_order_id = "B1";
  row.state = condor::VenueOrderState::Open;
  row.fills.push_back(condor::BrokerFill{1, 25, 100.0});
  snapshot.orders.push_back(row);
  manager().reconcile(snapshot);

  EXPECT_EQ(manager().order(id)->filled_quantity, 25);
  EXPECT_EQ(manager().order(id)->status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(manager().order(id)->broker_order_id, "B1");
  EXPECT_EQ(manager().duplicateFillCount(), 1u);
  EXPECT_EQ(manager().conflictCount(), 0u);

  // Push path: the fill first, the ack after it, then the fill replayed.
  const auto other = submit().id;
  fill(other, "", 1, 75, 99.0);
  ack(other, "B2");
  fill(other, "B2", 1, 75, 99.0);
  EXPECT_EQ(manager().order(other)->filled_quantity, 75);
  EXPECT_EQ(manager().duplicateFillCount(), 2u);
  EXPECT_EQ(manager().fillCount(), 2u);
}

// -----------------------------------------------------------------------------
// 15. Once a Position is forgotten, the next scheduler tick drops its
//     terminal orders; orders of other positions and working orders stay.
// -----------------------------------------------------------------------------
TEST_F(ExecutionManagerTest, ForgottenPositionOrdersPruned) {
  const auto done = submit().id;
  ack(done, "B1");
  fill(done, "B1", 1, 75, 100.0);
  const auto working = submit().id;

  condor::LegAction action;
  action.position_id = "NIFTY-IC-2";
  action.leg_index = 1;
  action.instrument_id = "NIFTY-22500-CE";
  action.side = condor::domain::Side::Buy;
  action.quantity = 75;
  const auto unrelated = manager().submit(action).id;
  reject(unrelated, RejectCode::InvalidOrder);

  manager().forgetPosition("NIFTY-IC-1");
  EXPECT_NE(manager().order(done), nullptr);

  tick(1000);
  EXPECT_EQ(manager().order(done), nullptr);
  EXPECT_NE(manager().order(working), nullptr);
  EXPECT_NE(manager().order(unrelated), nullptr);
  EXPECT_EQ(manager().orderCount(), 2u);

  // The working order is pruned once it is terminal.
  reject(working, RejectCode::InvalidOrder);
  tick(1001);
  EXPECT_EQ(manager().order(working), nullptr);
  EXPECT_EQ(manager().orderCount(), 1u);

  // A late replay for a pruned order is unknown, never applied.
  fill(0, "B1", 1, 75, 100.0);
  EXPECT_EQ(manager().conflictCount(), 1u);
  EXPECT_EQ(manager().fillCount(), 1u);
}

// -----------------------------------------------------------------------------
// 16. Terminal states never move.
// -----------------------------------------------------------------------------
TEST(OrderTransitionTest, LegalTransitions) {
  using S = OrderStatus;
  EXPECT_TRUE(ExecutionManager::transitionStatus(S::Pending, S::Placed));
  EXPECT_TRUE(ExecutionManager::transitionStatus(S::Pending, S::Filled));
  EXPECT_TRUE(ExecutionManager::transitionStatus(S::Placed, S::Pending));
  EXPECT_FALSE(
      ExecutionManager::transitionStatus(S::PartiallyFilled, S::Placed));
  for (S terminal : {S::Filled, S::Rejected, S::Cancelled}) {
    for (S next : {S::Pending, S::Placed, S::PartiallyFilled, S::Filled,
                   S::Rejected, S::Cancelled}) {
      EXPECT_FALSE(ExecutionManager::transitionStatus(terminal, next));
    }
  }
}
