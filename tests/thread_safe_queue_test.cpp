// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for condor::ThreadSafeQueue<T>, the hand-off between the feed
// thread, the timer thread and the two event loops.
//
// Validates:
//   - FIFO order for plain values and for Event variants
//   - try_pop() on empty and non-empty queues
//   - Blocking pop() wakes when a producer pushes
//   - No loss or duplication under several producers and consumers
//   - Move-only payloads
// =============================================================================

#include "condor/concurrent/thread_safe_queue.hpp"
#include "condor/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  condor::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty; size() follows pushes and pops.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, SizeTracksPushAndPop) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);

  queue.push(1);
  queue.push(2);
  EXPECT_EQ(queue.size(), 2u);

  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_FALSE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks: nullopt when empty, the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(10);
  queue.push(20);
  auto first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 10);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Events come out in the order they went in, alternatives intact.
// Why: the decision loop relies on queue order for tick ordering per
//      instrument and for reports arriving after the requests that caused
//      them.
// -----------------------------------------------------------------------------
TEST(ThreadSafeEventQueueTest, EventsKeepOrderAndType) {
  condor::ThreadSafeQueue<condor::Event> events;

  condor::TickEvent tick;
  tick.tick.instrument_id = "NIFTY";
  tick.tick.timestamp_ms = 1;
  events.push(tick);
  events.push(condor::TimerEvent{2});
  condor::BrokerReportEvent report;
  report.client_order_id = 3;
  events.push(report);

  condor::Event a = events.pop();
  condor::Event b = events.pop();
  condor::Event c = events.pop();

  ASSERT_TRUE(std::holds_alternative<condor::TickEvent>(a));
  EXPECT_EQ(std::get<condor::TickEvent>(a).tick.instrument_id, "NIFTY");
  ASSERT_TRUE(std::holds_alternative<condor::TimerEvent>(b));
  EXPECT_EQ(std::get<condor::TimerEvent>(b).now_ms, 2);
  ASSERT_TRUE(std::holds_alternative<condor::BrokerReportEvent>(c));
  EXPECT_EQ(std::get<condor::BrokerReportEvent>(c).client_order_id, 3u);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 4. pop() blocks until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 5. Several producers, several consumers: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 3;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 2000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.try_pop()) {
          per_consumer[static_cast<std::size_t>(c)].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kPerProducer; i < (p + 1) * kPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());
  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    ASSERT_EQ(all[static_cast<std::size_t>(i)], i);
  }
}

// -----------------------------------------------------------------------------
// 6. Move-only payloads pass through without copies.
// -----------------------------------------------------------------------------
TEST(ThreadSafeMoveOnlyQueueTest, AcceptsMoveOnlyTypes) {
  condor::ThreadSafeQueue<std::unique_ptr<int>> q;
  q.push(std::make_unique<int>(5));

  auto item = q.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 5);
}
