// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for condor::RiskManager.
//
// Validates:
//   - Check order: feed stale, rejection, stop loss, max loss, premium stop,
//     delta breach, continue
//   - PnL checks are skipped while any open leg has no mark
//   - Hedge only for an entered Position with no roll in flight, on the leg
//     with the largest breach
//   - Roll replacements count towards mark-to-market
//   - Entry admission: feed stale and max positions
// =============================================================================

#include "condor/config/engine_config.hpp"
#include "condor/market/option_chain.hpp"
#include "condor/risk/risk_manager.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <variant>

using condor::OptionChainModel;
using condor::RiskContext;
using condor::RiskManager;
using condor::domain::ExitReason;
using condor::domain::ForceExit;
using condor::domain::Hedge;
using condor::domain::LegRole;
using condor::domain::OptionLeg;
using condor::domain::OptionType;
using condor::domain::Position;
using condor::domain::PositionState;
using condor::domain::RiskDecision;
using condor::domain::Side;

namespace test = condor::test;

class RiskManagerTest : public ::testing::Test {
 protected:
  RiskManagerTest()
      : config(test::scenarioConfig()),
        master(condor::buildInstrumentMaster(config)),
        t0(test::sessionStart()),
        chain(master, config.pricing) {
    for (const auto& tick : test::openingTicks(master, test::kScenarioSpot,
                                               t0)) {
      chain.applyTick(tick);
    }
    position = enteredCondor();
  }

  OptionLeg leg(LegRole role, condor::domain::Strike strike, OptionType type,
                Side side) const {
    OptionLeg l;
    l.role = role;
    l.strike = strike;
    l.option_type = type;
    l.side = side;
    l.expiry_ms = master.expiryMs();
    l.instrument_id = condor::InstrumentMaster::optionId(master.index(),
                                                         strike, type);
    l.quantity = master.lotSize();
    l.open_quantity = master.lotSize();
    const condor::ChainEntry* e = chain.find(strike, type);
    l.entry_price = e != nullptr ? e->price : 0.0;
    return l;
  }

  Position enteredCondor() const {
    Position p;
    p.id = "NIFTY-IC-1";
    p.state = PositionState::Entered;
    p.legs = {leg(LegRole::ShortCall, 22300, OptionType::Call, Side::Sell),
              leg(LegRole::LongCall, 22500, OptionType::Call, Side::Buy),
              leg(LegRole::ShortPut, 21700, OptionType::Put, Side::Sell),
              leg(LegRole::LongPut, 21500, OptionType::Put, Side::Buy)};
    return p;
  }

  // Re-marks one strike `bump` points away from its model price.
  void mark(condor::domain::Strike strike, OptionType type, double bump) {
    chain.applyTick(test::optionTick(master, strike, type,
                                     test::kScenarioSpot, t0, bump));
  }

  RiskDecision evaluate(const RiskContext& ctx = RiskContext{}) const {
    RiskManager risk(config.risk_limits);
    return risk.evaluate(position, chain.snapshot(), ctx);
  }

  condor::EngineConfig config;
  condor::InstrumentMaster master;
  std::int64_t t0;
  OptionChainModel chain;
  Position position;
};

// -----------------------------------------------------------------------------
// 1. A fresh condor at its entry prices is inside every limit.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ContinueInsideLimits) {
  EXPECT_TRUE(std::holds_alternative<condor::domain::Continue>(evaluate()));

  auto mtm = RiskManager::markToMarket(position, chain.snapshot());
  ASSERT_TRUE(mtm.has_value());
  EXPECT_NEAR(*mtm, 0.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A stale feed outranks everything, including a recorded rejection.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, FeedStaleComesFirst) {
  position.last_rejection = condor::domain::RejectCode::InsufficientMargin;
  RiskContext ctx;
  ctx.feed_stale = true;

  auto decision = evaluate(ctx);
  ASSERT_TRUE(std::holds_alternative<ForceExit>(decision));
  EXPECT_EQ(std::get<ForceExit>(decision).reason, ExitReason::FeedStale);
}

// -----------------------------------------------------------------------------
// 3. A permanent rejection forces the exit ahead of the PnL checks.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, RejectionForcesExit) {
  position.last_rejection = condor::domain::RejectCode::InsufficientMargin;
  mark(22300, OptionType::Call, 150.0);

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<ForceExit>(decision));
  EXPECT_EQ(std::get<ForceExit>(decision).reason, ExitReason::OrderRejected);
}

// -----------------------------------------------------------------------------
// 4. Unrealized -11250 is past the -10000 stop (50% of 20000).
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, StopLossOnUnrealized) {
  mark(22300, OptionType::Call, 150.0);

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<ForceExit>(decision));
  const auto exit = std::get<ForceExit>(decision);
  EXPECT_EQ(exit.reason, ExitReason::StopLossBreached);
  EXPECT_NEAR(exit.observed, -11250.0, 1e-6);
  EXPECT_DOUBLE_EQ(exit.limit, -10000.0);
}

// -----------------------------------------------------------------------------
// 5. Realized losses count towards the max-loss limit.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, MaxLossIncludesRealized) {
  position.realized_pnl = -15000.0;
  mark(22300, OptionType::Call, 80.0);  // unrealized -6000

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<ForceExit>(decision));
  const auto exit = std::get<ForceExit>(decision);
  EXPECT_EQ(exit.reason, ExitReason::MaxLossBreached);
  EXPECT_NEAR(exit.observed, -21000.0, 1e-6);
  EXPECT_DOUBLE_EQ(exit.limit, -20000.0);
}

// -----------------------------------------------------------------------------
// 6. Premium stop: the short mark doubles while total loss is still small.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, PremiumStopOnShortLeg) {
  config.risk_limits.short_premium_stop_multiple = 2.0;
  const double entry = position.legs[0].entry_price;
  mark(22300, OptionType::Call, entry + 1.0);

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<ForceExit>(decision));
  const auto exit = std::get<ForceExit>(decision);
  EXPECT_EQ(exit.reason, ExitReason::PremiumStop);
  EXPECT_NEAR(exit.observed, 2.0 * entry + 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(exit.limit, 2.0 * entry);

  config.risk_limits.short_premium_stop_multiple = 0.0;
  EXPECT_FALSE(std::holds_alternative<ForceExit>(evaluate()));
}

// -----------------------------------------------------------------------------
// 7. Both shorts breach: the larger breach is hedged.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, HedgeLargestBreach) {
  config.risk_limits.hedge_trigger_delta = 0.28;

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<Hedge>(decision));
  const auto hedge = std::get<Hedge>(decision);
  const double call_delta = chain.find(22300, OptionType::Call)->delta;
  EXPECT_EQ(hedge.leg_index, 0);
  EXPECT_DOUBLE_EQ(hedge.delta, call_delta);
  EXPECT_NEAR(hedge.breach, call_delta - 0.28, 1e-12);
}

// -----------------------------------------------------------------------------
// 8. A falling market breaches the short put.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, HedgeShortPutOnDownMove) {
  chain.applyTick(test::underlyingTick(master, 21850.0, t0 + 60000));
  config.risk_limits.hedge_trigger_delta = 0.30;

  auto decision = evaluate();
  ASSERT_TRUE(std::holds_alternative<Hedge>(decision));
  EXPECT_EQ(std::get<Hedge>(decision).leg_index, 2);
  EXPECT_LT(std::get<Hedge>(decision).delta, -0.30);
}

// -----------------------------------------------------------------------------
// 9. No hedge unless fully entered with no roll in flight.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, NoHedgeWhileAdjusting) {
  config.risk_limits.hedge_trigger_delta = 0.28;

  position.state = PositionState::Adjusting;
  EXPECT_TRUE(std::holds_alternative<condor::domain::Continue>(evaluate()));

  position.state = PositionState::Entered;
  position.roll = condor::domain::RollPlan{};
  EXPECT_TRUE(std::holds_alternative<condor::domain::Continue>(evaluate()));
}

// -----------------------------------------------------------------------------
// 10. An unknown mark is never read as zero: PnL checks are skipped.
// Why: a missing 21500PE quote would otherwise book the whole premium of
//      that leg as profit or loss.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, UnknownMarkSkipsPnlChecks) {
  OptionChainModel partial(master, config.pricing);
  partial.applyTick(test::underlyingTick(master, test::kScenarioSpot, t0));
  for (auto k : {22300, 22500}) {
    partial.applyTick(test::optionTick(master, k, OptionType::Call,
                                       test::kScenarioSpot, t0, 150.0));
  }
  partial.applyTick(test::optionTick(master, 21700, OptionType::Put,
                                     test::kScenarioSpot, t0));

  EXPECT_FALSE(
      RiskManager::markToMarket(position, partial.snapshot()).has_value());

  RiskManager risk(config.risk_limits);
  auto decision = risk.evaluate(position, partial.snapshot(), RiskContext{});
  EXPECT_FALSE(std::holds_alternative<ForceExit>(decision));
}

// -----------------------------------------------------------------------------
// 11. Open roll replacements are marked with the legs.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, MarkToMarketIncludesReplacements) {
  condor::domain::LegReplacement r;
  r.leg_index = 0;
  r.replacement = leg(LegRole::ShortCall, 22450, OptionType::Call, Side::Sell);
  r.replacement.entry_price -= 10.0;  // sold 10 points under the mark
  position.roll = condor::domain::RollPlan{};
  position.roll->replacements.push_back(r);

  auto mtm = RiskManager::markToMarket(position, chain.snapshot());
  ASSERT_TRUE(mtm.has_value());
  EXPECT_NEAR(*mtm, -750.0, 1e-9);

  // Flat legs contribute nothing even without a mark.
  position.roll->replacements[0].replacement.open_quantity = 0;
  position.roll->replacements[0].replacement.strike = 99999;
  mtm = RiskManager::markToMarket(position, chain.snapshot());
  ASSERT_TRUE(mtm.has_value());
  EXPECT_NEAR(*mtm, 0.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 12. Entry admission.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, EvaluateEntry) {
  RiskManager risk(config.risk_limits);
  RiskContext ctx;
  EXPECT_TRUE(std::holds_alternative<condor::domain::Continue>(
      risk.evaluateEntry(ctx)));

  ctx.open_positions = 1;
  auto blocked = risk.evaluateEntry(ctx);
  ASSERT_TRUE(std::holds_alternative<ForceExit>(blocked));
  EXPECT_EQ(std::get<ForceExit>(blocked).reason,
            ExitReason::MaxPositionsExceeded);
  EXPECT_FALSE(condor::domain::closesPosition(
      ExitReason::MaxPositionsExceeded));

  ctx.feed_stale = true;
  auto stale = risk.evaluateEntry(ctx);
  ASSERT_TRUE(std::holds_alternative<ForceExit>(stale));
  EXPECT_EQ(std::get<ForceExit>(stale).reason, ExitReason::FeedStale);
}
