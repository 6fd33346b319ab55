// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for condor::EventBus, condor::EventLoopThread and
// condor::OrderIdGenerator.
//
// Validates:
//   - Generic subscription receives every event alternative
//   - Typed subscription receives only its alternative, with payload intact
//   - Delivery in subscription order; unsubscribe stops delivery
//   - Re-entrant publish from inside a callback does not deadlock
//   - EventLoopThread dispatches pushed events in FIFO order on its worker
//     and reports idle only once everything pushed has been handled
//   - OrderIdGenerator ids are unique across threads and seed() skips ahead
// =============================================================================

#include "condor/concurrent/event_loop_thread.hpp"
#include "condor/concurrent/order_id_generator.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/event.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

condor::TickEvent makeTick(const std::string& id, double price,
                           std::int64_t ts = 0) {
  condor::TickEvent e;
  e.tick.instrument_id = id;
  e.tick.last_price = price;
  e.tick.timestamp_ms = ts;
  return e;
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  condor::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative of the Event variant.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const condor::Event&) { ++call_count; });

  bus.publish(makeTick("NIFTY", 22000.0));
  bus.publish(condor::TimerEvent{1000});
  bus.publish(condor::FeedStatusEvent{});
  bus.publish(condor::PositionUpdateEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own event type.
// Why: the pipeline subscribes to TickEvent and TimerEvent separately; a
//      timer must never be applied to the chain as a tick.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int ticks = 0;
  bus.subscribe<condor::TickEvent>(
      [&ticks](const condor::TickEvent&) { ++ticks; });

  bus.publish(makeTick("NIFTY", 22000.0));
  bus.publish(condor::TimerEvent{1000});

  EXPECT_EQ(ticks, 1);
}

// -----------------------------------------------------------------------------
// 3. Subscribers run in subscription order.
// Why: the ExecutionManager must see a broker report before the pipeline
//      re-evaluates on it; both rely on registration order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscribersRunInSubscriptionOrder) {
  std::vector<std::string> order;
  bus.subscribe<condor::TimerEvent>(
      [&order](const condor::TimerEvent&) { order.push_back("execution"); });
  bus.subscribe<condor::TimerEvent>(
      [&order](const condor::TimerEvent&) { order.push_back("strategy"); });
  bus.subscribe([&order](const condor::Event&) { order.push_back("log"); });

  bus.publish(condor::TimerEvent{1});

  EXPECT_EQ(order,
            (std::vector<std::string>{"execution", "strategy", "log"}));
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. unsubscribe() stops delivery; unknown ids are ignored.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<condor::TickEvent>(
      [&calls](const condor::TickEvent&) { ++calls; });

  bus.publish(makeTick("NIFTY", 22000.0));
  bus.unsubscribe(id);
  bus.publish(makeTick("NIFTY", 22001.0));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(condor::TimerEvent{2}));
}

// -----------------------------------------------------------------------------
// 5. A callback may publish on the same bus.
// Why: the ExecutionManager publishes OrderUpdateEvent from inside its
//      BrokerReportEvent handler. Holding the lock across callbacks would
//      hang here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<condor::domain::OrderId> updated;

  bus.subscribe<condor::OrderUpdateEvent>(
      [&updated](const condor::OrderUpdateEvent& e) {
        updated.push_back(e.order.id);
      });
  bus.subscribe<condor::BrokerReportEvent>(
      [this](const condor::BrokerReportEvent& report) {
        condor::OrderUpdateEvent update;
        update.order.id = report.client_order_id;
        update.order.status = condor::domain::OrderStatus::Placed;
        bus.publish(update);
      });

  condor::BrokerReportEvent ack;
  ack.kind = condor::BrokerReportEvent::Kind::Ack;
  ack.client_order_id = 17;
  bus.publish(ack);

  EXPECT_EQ(updated, (std::vector<condor::domain::OrderId>{17}));
}

// -----------------------------------------------------------------------------
// 6. Payload survives the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  condor::domain::Tick received;
  bus.subscribe<condor::TickEvent>(
      [&received](const condor::TickEvent& e) { received = e.tick; });

  condor::TickEvent e = makeTick("NIFTY-22300-CE", 101.25, 1700000000000);
  e.tick.bid = 101.0;
  e.tick.ask = 101.5;
  e.tick.sequence_id = 42;
  bus.publish(e);

  EXPECT_EQ(received.instrument_id, "NIFTY-22300-CE");
  EXPECT_DOUBLE_EQ(received.last_price, 101.25);
  EXPECT_DOUBLE_EQ(received.bid, 101.0);
  EXPECT_DOUBLE_EQ(received.ask, 101.5);
  EXPECT_EQ(received.timestamp_ms, 1700000000000);
  EXPECT_EQ(received.sequence_id, 42u);
}

// =============================================================================
// EventLoopThread
// =============================================================================

// -----------------------------------------------------------------------------
// 7. Pushed events are dispatched in FIFO order on the worker thread.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesInFifoOrderOnWorker) {
  condor::EventLoopThread loop("test_loop");
  std::mutex mutex;
  std::vector<std::int64_t> seen;
  std::thread::id worker;

  loop.eventBus().subscribe<condor::TimerEvent>(
      [&](const condor::TimerEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(e.now_ms);
        worker = std::this_thread::get_id();
      });

  loop.start();
  for (std::int64_t i = 1; i <= 100; ++i) {
    loop.push(condor::TimerEvent{i});
  }

  ASSERT_TRUE(condor::test::waitFor([&] {
    std::lock_guard<std::mutex> lock(mutex);
    return seen.size() == 100;
  }));
  loop.stop();

  for (std::int64_t i = 0; i < 100; ++i) {
    EXPECT_EQ(seen[static_cast<std::size_t>(i)], i + 1);
  }
  EXPECT_NE(worker, std::this_thread::get_id());
  EXPECT_EQ(loop.name(), "test_loop");
}

// -----------------------------------------------------------------------------
// 8. isIdle() stays false while a handler is still running.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, NotIdleWhileDispatching) {
  condor::EventLoopThread loop;
  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();

  loop.eventBus().subscribe<condor::TimerEvent>(
      [&entered, release_future](const condor::TimerEvent&) {
        entered.set_value();
        release_future.wait();
      });

  loop.start();
  EXPECT_TRUE(loop.isIdle());
  loop.push(condor::TimerEvent{1});

  ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_FALSE(loop.isIdle());

  release.set_value();
  EXPECT_TRUE(condor::test::waitFor([&] { return loop.isIdle(); }));
  loop.stop();
}

// -----------------------------------------------------------------------------
// 9. start() and stop() are idempotent; stop() joins the worker.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, IdempotentStartStop) {
  condor::EventLoopThread loop;
  EXPECT_NO_FATAL_FAILURE(loop.stop());

  loop.start();
  loop.start();
  EXPECT_TRUE(loop.running());

  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.running());
}

// =============================================================================
// OrderIdGenerator
// =============================================================================

// -----------------------------------------------------------------------------
// 10. Ids start at 1 and never repeat across threads.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  condor::OrderIdGenerator gen;
  EXPECT_EQ(gen.next_id(), 1u);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;
  std::vector<std::vector<std::uint64_t>> ids(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&gen, &ids, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ids[static_cast<std::size_t>(t)].push_back(gen.next_id());
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  std::set<std::uint64_t> all;
  for (const auto& v : ids) {
    all.insert(v.begin(), v.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*all.begin(), 2u);
}

// -----------------------------------------------------------------------------
// 11. seed() moves past recovered ids and never moves backwards.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, SeedSkipsRecoveredIds) {
  condor::OrderIdGenerator gen;
  gen.seed(41);
  EXPECT_EQ(gen.next_id(), 42u);

  gen.seed(10);
  EXPECT_EQ(gen.next_id(), 43u);
}
