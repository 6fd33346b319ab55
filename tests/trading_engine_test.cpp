// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Integration tests for condor::TradingEngine: real threads, a scripted feed
// transport and the SimulatedBroker running on the market clock.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent start and stop
//   - A lockstep live run publishes the same trajectory as a backtest
//   - A feed drop during an exit: the order-book poll still closes the
//     Position, and nothing new is opened while the feed is down
//   - Exit codes: feed unavailable (1), auth expired (3), shutdown (0)
//   - A failed initial handshake surfaces as ConnectionError
//
// Design: each test builds its own engine. Ticks are fed one at a time and
// the test waits for both loops to go idle before sending the next, which
// makes the live event order deterministic.
// =============================================================================

#include "condor/domain/errors.hpp"
#include "condor/engine/backtest_engine.hpp"
#include "condor/engine/trading_engine.hpp"
#include "condor/events/position_update_event.hpp"
#include "condor/execution/simulated_broker.hpp"
#include "condor/persistence/json_codec.hpp"
#include "condor/time/live_time_provider.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using condor::TradingEngine;
using condor::domain::ExitReason;
using condor::domain::OptionType;
using condor::domain::PositionState;
using condor::domain::Tick;

namespace test = condor::test;

class TradingEngineTest : public ::testing::Test {
 protected:
  TradingEngineTest()
      : config(test::scenarioConfig()),
        master(condor::buildInstrumentMaster(config)),
        t0(test::sessionStart()),
        market_clock(t0) {
    config.feed.receive_timeout_ms = 5;
  }

  void build() {
    auto transport = std::make_unique<test::ScriptedFeedTransport>();
    feed = transport.get();
    auto sim = std::make_unique<condor::SimulatedBroker>(
        market_clock, config.backtest.broker);
    broker = sim.get();
    engine = std::make_unique<TradingEngine>(config, master, wall_clock,
                                             std::move(transport),
                                             std::move(sim), &market_clock);

    condor::EventBus& bus = engine->decisionEventBus();
    bus.subscribe<condor::TickEvent>(
        [this](const condor::TickEvent&) { ticks_seen.fetch_add(1); });
    bus.subscribe<condor::PositionUpdateEvent>(
        [this](const condor::PositionUpdateEvent& e) {
          std::lock_guard<std::mutex> lock(updates_mutex);
          updates.push_back(e);
        });
  }

  // Sends one tick and waits until everything it caused has settled.
  void send(const Tick& tick) {
    const int before = ticks_seen.load();
    feed->push(tick);
    ASSERT_TRUE(test::waitFor([&] { return ticks_seen.load() > before; }))
        << "tick for " << tick.instrument_id << " never reached the loop";
    ASSERT_TRUE(engine->waitUntilIdle(std::chrono::seconds(2)));
  }

  void sendAll(const std::vector<Tick>& ticks) {
    for (const auto& tick : ticks) {
      send(tick);
    }
  }

  std::vector<condor::PositionUpdateEvent> updatesSoFar() {
    std::lock_guard<std::mutex> lock(updates_mutex);
    return updates;
  }

  bool lastStateIs(PositionState state) {
    std::lock_guard<std::mutex> lock(updates_mutex);
    return !updates.empty() && updates.back().position.state == state;
  }

  Tick stopLossTick() const {
    Tick spike =
        test::optionTick(master, 22300, OptionType::Call, test::kScenarioSpot, t0);
    spike.last_price += 150.0;
    spike.timestamp_ms = t0 + 60000;
    return spike;
  }

  condor::EngineConfig config;
  condor::InstrumentMaster master;
  std::int64_t t0;
  condor::LiveTimeProvider wall_clock;
  condor::SimulationTimeProvider market_clock;

  test::ScriptedFeedTransport* feed{nullptr};
  condor::SimulatedBroker* broker{nullptr};

  std::atomic<int> ticks_seen{0};
  std::mutex updates_mutex;
  std::vector<condor::PositionUpdateEvent> updates;

  std::unique_ptr<TradingEngine> engine;
};

// -----------------------------------------------------------------------------
// 1. Lifecycle: start() connects the feed and runs; stop() joins everything.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, StartAndStop) {
  build();
  engine->start();

  EXPECT_TRUE(engine->running());
  EXPECT_TRUE(feed->connected());
  EXPECT_EQ(feed->subscribedCount(), master.instrumentIds().size());
  EXPECT_TRUE(engine->feedHealth().connected());
  ASSERT_NE(engine->pipeline(), nullptr);

  engine->stop();
  EXPECT_FALSE(engine->running());
  EXPECT_FALSE(engine->feedHealth().active());
  EXPECT_EQ(engine->pipeline(), nullptr);
}

// -----------------------------------------------------------------------------
// 2. Idempotent start and stop.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, IdempotentStartAndStop) {
  build();
  EXPECT_NO_FATAL_FAILURE(engine->stop());

  engine->start();
  EXPECT_NO_FATAL_FAILURE(engine->start());
  EXPECT_EQ(feed->openCalls(), 1);

  EXPECT_NO_FATAL_FAILURE(engine->stop());
  EXPECT_NO_FATAL_FAILURE(engine->stop());
}

// -----------------------------------------------------------------------------
// 3. RAII: destroying a running engine stops its threads. A missing join
//    shows up as a hang or std::terminate.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, DestructorStopsThreads) {
  build();
  engine->start();
  feed->push(test::underlyingTick(master, test::kScenarioSpot, t0));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  engine.reset();
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 4. Entry, roll and stop loss in lockstep produce the same trajectory as a
//    BacktestEngine fed the same ticks.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, LockstepRunMatchesBacktest) {
  std::vector<Tick> ticks = test::openingTicks(master, test::kScenarioSpot, t0);
  ticks.push_back(test::underlyingTick(master, 22150.0, t0 + 60000));

  // The rolled-to short call spikes 150 points above its entry price.
  Tick spike = test::optionTick(master, 22450, OptionType::Call,
                                test::kScenarioSpot, t0);
  spike.last_price += 150.0;
  spike.timestamp_ms = t0 + 120000;
  ticks.push_back(spike);

  build();
  engine->start();
  sendAll(ticks);
  engine->stop();

  condor::BacktestEngine backtest(config, master);
  const auto expected = backtest.run(ticks);

  auto render = [](const std::vector<condor::PositionUpdateEvent>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) {
      out.push_back(std::to_string(e.timestamp_ms) + " " +
                    nlohmann::json(e.position).dump());
    }
    return out;
  };

  const auto live = updatesSoFar();
  ASSERT_FALSE(live.empty());
  EXPECT_EQ(render(live), render(expected.trajectory));

  ASSERT_EQ(expected.closed_positions.size(), 1u);
  EXPECT_EQ(*expected.closed_positions[0].exit_reason,
            ExitReason::StopLossBreached);
}

// -----------------------------------------------------------------------------
// 5. The feed drops while the exit orders are working and fills are not
//    pushed. The scheduler tick polls the order book, the Position closes,
//    and no new condor is opened while the feed is down.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, FeedDropDuringExitStillCloses) {
  config.feed.reconnect_base_ms = 60000;
  config.feed.reconnect_cap_ms = 60000;

  build();
  engine->start();
  sendAll(test::openingTicks(master, test::kScenarioSpot, t0));
  ASSERT_TRUE(lastStateIs(PositionState::Entered));

  broker->setPushFills(false);
  send(stopLossTick());
  ASSERT_TRUE(lastStateIs(PositionState::Exiting));

  feed->dropStream();
  ASSERT_TRUE(test::waitFor([&] { return !engine->feedHealth().connected(); }));
  ASSERT_TRUE(engine->waitUntilIdle(std::chrono::seconds(2)));

  engine->pushEvent(condor::TimerEvent{t0 + 61000});
  ASSERT_TRUE(test::waitFor([&] { return lastStateIs(PositionState::Closed); }))
      << "order-book poll did not close the position";
  ASSERT_TRUE(engine->waitUntilIdle(std::chrono::seconds(2)));

  const auto closed = updatesSoFar().back().position;
  ASSERT_TRUE(closed.exit_reason.has_value());
  EXPECT_EQ(*closed.exit_reason, ExitReason::StopLossBreached);
  EXPECT_NEAR(closed.realized_pnl, -11250.0, 1e-6);

  // Four entry orders and four closing orders; no re-entry the same day.
  EXPECT_EQ(broker->placeCalls(), 8u);
  EXPECT_FALSE(engine->exitCode().has_value());
  engine->stop();
}

// -----------------------------------------------------------------------------
// 6. Reconnect budget exhausted: the engine reports exit code 1.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, FeedUnavailableExitsWithCodeOne) {
  config.feed.reconnect_base_ms = 1;
  config.feed.reconnect_cap_ms = 1;
  config.feed.max_reconnect_attempts = 2;

  build();
  engine->start();
  feed->failOpens(100);
  feed->dropStream();

  const auto code = engine->waitForExit(std::chrono::seconds(2));
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, TradingEngine::kExitFeedUnavailable);
  EXPECT_EQ(feed->openCalls(), 3);  // handshake + two reconnect attempts
  EXPECT_FALSE(engine->feedHealth().active());
  engine->stop();
}

// -----------------------------------------------------------------------------
// 7. A broker AuthExpired rejection is fatal: exit code 3.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, AuthExpiredExitsWithCodeThree) {
  build();
  broker->rejectNext("NIFTY-22300-CE", condor::domain::RejectCode::AuthExpired);
  engine->start();
  sendAll(test::openingTicks(master, test::kScenarioSpot, t0));

  const auto code = engine->waitForExit(std::chrono::seconds(2));
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, TradingEngine::kExitAuthExpired);

  // A later shutdown request does not mask the fatal code.
  engine->requestShutdown();
  EXPECT_EQ(engine->exitCode(), TradingEngine::kExitAuthExpired);
  engine->stop();
}

// -----------------------------------------------------------------------------
// 8. requestShutdown() releases waitForExit() with code 0.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, RequestShutdownExitsWithZero) {
  build();
  engine->start();
  EXPECT_FALSE(engine->waitForExit(std::chrono::milliseconds(10)).has_value());

  engine->requestShutdown();
  const auto code = engine->waitForExit(std::chrono::milliseconds(100));
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 0);
  engine->stop();
}

// -----------------------------------------------------------------------------
// 9. A failed handshake propagates and leaves nothing running.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, InitialConnectFailureThrows) {
  build();
  feed->failOpens(1);

  EXPECT_THROW(engine->start(), condor::ConnectionError);
  EXPECT_FALSE(engine->running());
  EXPECT_EQ(engine->pipeline(), nullptr);
}
