// =============================================================================
// option_chain_test.cpp
// =============================================================================
// Unit tests for condor::OptionChainModel and condor::IvRankTracker.
//
// Validates:
//   - Option ticks are priced, and get Greeks once the underlying prints
//   - Underlying ticks reprice live entries at their implied vol
//   - Per-key monotonicity: older ticks are rejected and counted; an option
//     quote behind the last spot tick is still applied
//   - Ticks with no usable price or an unknown id are ignored
//   - Entries freeze at expiry
//   - ATM strike selection (ties to the lower strike) and ATM implied vol
//   - IV rank over the seeded history, daily roll-over and window bound
// =============================================================================

#include "condor/config/engine_config.hpp"
#include "condor/market/option_chain.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using condor::ChainEntry;
using condor::IvRankTracker;
using condor::OptionChainModel;
using condor::domain::OptionType;
using condor::domain::Tick;

namespace test = condor::test;

class OptionChainTest : public ::testing::Test {
 protected:
  OptionChainTest()
      : config(test::scenarioConfig()),
        master(condor::buildInstrumentMaster(config)),
        t0(test::sessionStart()),
        chain(master, config.pricing) {}

  Tick call(condor::domain::Strike k, std::int64_t at,
            double spot = test::kScenarioSpot) const {
    return test::optionTick(master, k, OptionType::Call, spot, at);
  }

  condor::EngineConfig config;
  condor::InstrumentMaster master;
  std::int64_t t0;
  OptionChainModel chain;
};

// -----------------------------------------------------------------------------
// 1. Before the underlying prints, an option tick stores its price only.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, OptionBeforeUnderlyingHasNoGreeks) {
  auto entry = chain.applyTick(call(22300, t0));

  ASSERT_TRUE(entry.has_value());
  EXPECT_GT(entry->price, 0.0);
  EXPECT_FALSE(entry->has_greeks);
  EXPECT_FALSE(chain.spot().has_value());
  EXPECT_EQ(chain.find(22500, OptionType::Call), nullptr);
}

// -----------------------------------------------------------------------------
// 2. The first underlying tick solves the vol of entries already priced.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, UnderlyingTickSolvesPendingEntries) {
  chain.applyTick(call(22300, t0));
  EXPECT_FALSE(
      chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0))
          .has_value());

  const ChainEntry* entry = chain.find(22300, OptionType::Call);
  ASSERT_NE(entry, nullptr);
  EXPECT_TRUE(entry->has_greeks);
  EXPECT_FALSE(entry->iv_fallback);
  EXPECT_NEAR(entry->implied_volatility, test::kScenarioVol, 1e-6);
  EXPECT_NEAR(entry->delta, 0.297, 0.005);
  EXPECT_GT(entry->gamma, 0.0);
  EXPECT_LT(entry->theta, 0.0);
  ASSERT_TRUE(chain.spot().has_value());
  EXPECT_DOUBLE_EQ(*chain.spot(), test::kScenarioSpot);
}

// -----------------------------------------------------------------------------
// 3. A spot move reprices at the stored vol and moves the entry's time up.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, SpotMoveRepricesAtStickyStrikeVol) {
  chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0));
  chain.applyTick(call(22300, t0));
  const double delta_before = chain.find(22300, OptionType::Call)->delta;

  chain.applyTick(test::underlyingTick(master, 22150.0, t0 + 1000));

  const ChainEntry* entry = chain.find(22300, OptionType::Call);
  EXPECT_GT(entry->delta, delta_before);
  EXPECT_NEAR(entry->implied_volatility, test::kScenarioVol, 1e-6);
  EXPECT_EQ(entry->last_update_time, t0 + 1000);
  EXPECT_EQ(chain.snapshot().spotTime(), t0 + 1000);
}

// -----------------------------------------------------------------------------
// 4. Older ticks are rejected per key and per underlying; equal timestamps
//    are accepted.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, StaleTicksRejected) {
  chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0 + 10));
  chain.applyTick(call(22300, t0 + 10));
  const double price = chain.find(22300, OptionType::Call)->price;

  Tick late = call(22300, t0 + 5);
  late.last_price = price + 40.0;
  EXPECT_FALSE(chain.applyTick(late).has_value());
  EXPECT_DOUBLE_EQ(chain.find(22300, OptionType::Call)->price, price);

  EXPECT_FALSE(
      chain.applyTick(test::underlyingTick(master, 23000.0, t0 + 5))
          .has_value());
  EXPECT_DOUBLE_EQ(*chain.spot(), test::kScenarioSpot);
  EXPECT_EQ(chain.staleTicksRejected(), 2u);

  Tick same_time = call(22300, t0 + 10);
  same_time.last_price = price + 1.0;
  auto accepted = chain.applyTick(same_time);
  ASSERT_TRUE(accepted.has_value());
  EXPECT_DOUBLE_EQ(accepted->price, price + 1.0);
}

// -----------------------------------------------------------------------------
// 5. An option quote older than the last spot tick but newer than the
//    option's own last quote is applied; the Greeks stay at the spot time.
// Why: index and option streams interleave freely across instruments.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, OptionQuoteBehindSpotStillApplies) {
  chain.applyTick(call(22300, t0 + 100));
  chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0 + 300));
  const double price = chain.find(22300, OptionType::Call)->price;

  Tick newer = call(22300, t0 + 200);
  newer.last_price = price + 40.0;
  auto entry = chain.applyTick(newer);

  ASSERT_TRUE(entry.has_value());
  EXPECT_DOUBLE_EQ(entry->price, price + 40.0);
  EXPECT_EQ(entry->price_time, t0 + 200);
  EXPECT_EQ(entry->last_update_time, t0 + 300);
  EXPECT_GT(entry->implied_volatility, test::kScenarioVol);
  EXPECT_EQ(chain.staleTicksRejected(), 0u);

  // Its own ordering still holds.
  Tick older = call(22300, t0 + 150);
  EXPECT_FALSE(chain.applyTick(older).has_value());
  EXPECT_DOUBLE_EQ(chain.find(22300, OptionType::Call)->price, price + 40.0);
  EXPECT_EQ(chain.staleTicksRejected(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Unknown ids and ticks without a usable price change nothing; a quote
//    mid stands in for a missing last price.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, UnusableTicksIgnored) {
  Tick unknown;
  unknown.instrument_id = "BANKNIFTY";
  unknown.last_price = 48000.0;
  unknown.timestamp_ms = t0;
  EXPECT_FALSE(chain.applyTick(unknown).has_value());

  Tick empty = call(22300, t0);
  empty.last_price = 0.0;
  EXPECT_FALSE(chain.applyTick(empty).has_value());
  EXPECT_EQ(chain.snapshot().size(), 0u);
  EXPECT_EQ(chain.ticksApplied(), 0u);

  Tick quoted = call(22300, t0);
  quoted.last_price = 0.0;
  quoted.bid = 100.0;
  quoted.ask = 102.0;
  auto entry = chain.applyTick(quoted);
  ASSERT_TRUE(entry.has_value());
  EXPECT_DOUBLE_EQ(entry->price, 101.0);
}

// -----------------------------------------------------------------------------
// 7. At expiry the entry is marked expired and stops changing.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, EntriesFreezeAtExpiry) {
  const std::int64_t expiry = master.expiryMs();
  chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0));
  chain.applyTick(call(22300, t0));

  Tick at_expiry = call(22300, t0);
  at_expiry.last_price = 3.0;
  at_expiry.timestamp_ms = expiry;
  auto frozen = chain.applyTick(at_expiry);
  ASSERT_TRUE(frozen.has_value());
  EXPECT_TRUE(frozen->expired);
  const double delta = frozen->delta;

  Tick after = at_expiry;
  after.last_price = 50.0;
  after.timestamp_ms = expiry + 1000;
  auto unchanged = chain.applyTick(after);
  ASSERT_TRUE(unchanged.has_value());
  EXPECT_DOUBLE_EQ(unchanged->price, 3.0);

  chain.applyTick(test::underlyingTick(master, 22400.0, expiry + 2000));
  EXPECT_DOUBLE_EQ(chain.find(22300, OptionType::Call)->delta, delta);
  EXPECT_LT(chain.daysToExpiry(expiry + 2000), 0.0);
}

// -----------------------------------------------------------------------------
// 8. ATM strike is the nearest listed strike, ties resolved downwards.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, AtmStrikeTiesGoToLowerStrike) {
  EXPECT_FALSE(chain.atmStrike().has_value());

  chain.applyTick(test::underlyingTick(master, 22025.0, t0));
  ASSERT_TRUE(chain.atmStrike().has_value());
  EXPECT_EQ(*chain.atmStrike(), 22000);

  chain.applyTick(test::underlyingTick(master, 22026.0, t0 + 1));
  EXPECT_EQ(*chain.atmStrike(), 22050);
}

// -----------------------------------------------------------------------------
// 9. ATM implied vol needs both legs of the ATM pair.
// -----------------------------------------------------------------------------
TEST_F(OptionChainTest, AtmImpliedVolIsMeanOfPair) {
  chain.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0));
  chain.applyTick(call(22000, t0));
  EXPECT_FALSE(chain.atmImpliedVol().has_value());

  chain.applyTick(test::optionTick(master, 22000, OptionType::Put,
                                   test::kScenarioSpot, t0));
  ASSERT_TRUE(chain.atmImpliedVol().has_value());
  EXPECT_NEAR(*chain.atmImpliedVol(), test::kScenarioVol, 1e-6);
  EXPECT_NEAR(chain.daysToExpiry(t0), 10.0, 1e-9);
}

// =============================================================================
// IvRankTracker
// =============================================================================

// -----------------------------------------------------------------------------
// 10. Rank is the fraction of history strictly below the current IV.
// -----------------------------------------------------------------------------
TEST(IvRankTrackerTest, FractionStrictlyBelow) {
  const auto config = test::scenarioConfig();
  IvRankTracker tracker(config.pricing.iv_history, 252);

  EXPECT_DOUBLE_EQ(*tracker.rank(0.15), 0.85);
  EXPECT_DOUBLE_EQ(*tracker.rank(0.10), 0.0);
  EXPECT_DOUBLE_EQ(*tracker.rank(0.25), 1.0);

  IvRankTracker empty({}, 252);
  EXPECT_FALSE(empty.rank(0.15).has_value());
}

// -----------------------------------------------------------------------------
// 11. The last IV of each day joins the history when the next day starts.
// -----------------------------------------------------------------------------
TEST(IvRankTrackerTest, DayRolloverAppendsLastObservation) {
  const std::int64_t day1 = test::sessionStart();
  const std::int64_t day2 = day1 + condor::kMsPerDay;
  IvRankTracker tracker(test::scenarioConfig().pricing.iv_history, 252);

  tracker.observe(day1, 0.30);
  tracker.observe(day1 + 60000, 0.25);
  EXPECT_EQ(tracker.historySize(), 20u);

  tracker.observe(day2, 0.12);
  EXPECT_EQ(tracker.historySize(), 21u);
  EXPECT_DOUBLE_EQ(*tracker.rank(0.22), 20.0 / 21.0);
}

// -----------------------------------------------------------------------------
// 12. The history never grows past the window; the oldest sample leaves.
// -----------------------------------------------------------------------------
TEST(IvRankTrackerTest, WindowBoundsHistory) {
  const std::int64_t day1 = test::sessionStart();
  IvRankTracker tracker(test::scenarioConfig().pricing.iv_history, 20);

  tracker.observe(day1, 0.25);
  tracker.observe(day1 + condor::kMsPerDay, 0.25);
  EXPECT_EQ(tracker.historySize(), 20u);
  EXPECT_DOUBLE_EQ(*tracker.rank(0.15), 16.0 / 20.0);

  IvRankTracker tiny({0.10, 0.20, 0.30}, 0);
  EXPECT_EQ(tiny.historySize(), 1u);
  EXPECT_DOUBLE_EQ(*tiny.rank(0.25), 0.0);
}
