#pragma once

#include "condor/domain/risk_limits.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/execution/i_order_gateway.hpp"
#include "condor/market/instrument_master.hpp"
#include "condor/strategy/i_strategy.hpp"
#include "condor/strategy/position_book.hpp"
#include "condor/strategy/strike_selector.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace condor {

struct IronCondorParams {
  std::string name{"iron_condor"};

  // --- Entry preconditions -----------------------------------------------------
  double min_iv_rank{0.5};
  int entry_start_minute{9 * 60 + 20};  // IST minutes of day, inclusive
  int entry_end_minute{14 * 60 + 30};   // exclusive
  double min_days_to_expiry{2.0};
  double max_days_to_expiry{45.0};

  // Entries opened per IST trading day; 0 lifts the limit.
  int max_entries_per_day{1};
  // Minimum time between a Position closing and the next entry.
  std::int64_t reentry_cooldown_ms{0};

  StrikeSelectionParams selection;
  int lots{1};

  // --- Exits --------------------------------------------------------------------
  std::int64_t exit_before_expiry_minutes{60};
  int eod_exit_minute{14 * 60 + 50};  // -1 disables the daily square-off
  double take_profit{0.0};            // 0 disables
  int max_exit_attempts{5};
  std::int64_t roll_timeout_ms{0};    // 0 disables
};

// -----------------------------------------------------------------------------
// IronCondorStrategy
// -----------------------------------------------------------------------------
//
// @brief  State machine for one Iron Condor on one index:
//         Idle -> Evaluating -> Adjusting -> Entered -> Adjusting (roll)
//         -> Entered -> Exiting -> Closed.
//
// @details
// Entry: when IV rank, the IST entry window and days-to-expiry all allow it,
// and the day's entry allowance and the re-entry cooldown are not used up,
// strikes are selected. The two long wings are bought first; the two shorts
// are sold only once both wings are completely filled, so the book is never
// short an uncovered option. The Position is Adjusting until every leg is
// completely filled; only then is it Entered. A permanent rejection of any
// leg is recorded on the Position, no further short is sent, and the
// RiskManager then forces it out (OrderRejected), closing whatever filled.
//
// Adjustment: a Hedge decision rolls the breached short to a further strike
// (RollClose the old leg, RollOpen the new one, and the same for the hedge
// when the new short would reach it). The swap into Position::legs happens
// only after every roll order is filled. A roll with no eligible strike, a
// rejected roll order or a roll that outlives roll_timeout_ms becomes an
// exit with reason RollFailed.
//
// Exit: opening orders still working (Entry, RollOpen) are cancelled, and
// every leg with open quantity and no working order gets a closing market
// order. Leftovers (rejected or cancelled closes, late fills) are
// resubmitted on later evaluations, at most max_exit_attempts rounds.
// The Position is Closed and released once it is flat with no working
// order.
//
// While the feed is stale nothing new is started: no entry, no roll, no
// exit round. Orders already working keep being reconciled.
//
// Every structural change publishes a PositionUpdateEvent; every state
// transition publishes a StrategyStateEvent.
//
// Thread model: decision loop only.
// -----------------------------------------------------------------------------
class IronCondorStrategy : public IStrategy {
 public:
  IronCondorStrategy(EventBus& bus, IOrderGateway& gateway,
                     const InstrumentMaster& master, PositionBook& book,
                     IronCondorParams params, domain::RiskLimits limits);
  ~IronCondorStrategy() override;

  IronCondorStrategy(const IronCondorStrategy&) = delete;
  IronCondorStrategy& operator=(const IronCondorStrategy&) = delete;
  IronCondorStrategy(IronCondorStrategy&&) = delete;
  IronCondorStrategy& operator=(IronCondorStrategy&&) = delete;

  const std::string& name() const override { return params_.name; }

  void evaluate(const OptionChainModel& chain,
                const domain::RiskDecision& decision,
                const StrategyContext& context) override;

  void onOrderUpdate(const OrderUpdateEvent& update) override;

  const std::optional<domain::Position>& position() const override {
    return position_;
  }

  domain::PositionState state() const override;

  void hydrate(const domain::Position& position) override;
  void hydrateOrder(const domain::Order& order) override;

  std::size_t workingOrderCount() const { return working_.size(); }
  const IronCondorParams& params() const { return params_; }

 private:
  struct WorkingOrder {
    int leg_index{0};
    domain::OrderPurpose purpose{domain::OrderPurpose::Entry};
  };

  // --- Evaluation steps ----------------------------------------------------------
  void evaluateEntry(const OptionChainModel& chain,
                     const domain::RiskDecision& decision,
                     const StrategyContext& context);
  bool entryPreconditions(const OptionChainModel& chain,
                          const StrategyContext& context) const;
  void enter(const CondorStrikes& strikes, const StrategyContext& context);
  void submitShortsOnceHedged();
  std::optional<domain::ExitReason> strategyExit(
      const OptionChainModel& chain, const StrategyContext& context) const;
  void startRoll(const OptionChainModel& chain, const domain::Hedge& hedge,
                 const StrategyContext& context);
  void beginExit(domain::ExitReason reason, const std::string& detail,
                 std::int64_t now_ms);
  void submitExitRound(std::int64_t now_ms);

  // --- Order feedback -----------------------------------------------------------
  void applyFill(const domain::Order& order, const FillDetail& fill);
  void checkEntryComplete(std::int64_t now_ms);
  void checkRollComplete(std::int64_t now_ms);
  void maybeClose(std::int64_t now_ms);

  // --- Helpers ------------------------------------------------------------------
  domain::OptionLeg makeLeg(domain::Strike strike, domain::OptionType type,
                            domain::Side side, domain::LegRole role) const;
  domain::OptionLeg* legFor(int leg_index);
  domain::Order submitFor(int leg_index, domain::OrderPurpose purpose,
                          const domain::OptionLeg& leg, domain::Side side,
                          std::int64_t quantity);
  bool hasWorkingOrder(int leg_index) const;
  void setState(domain::PositionState next, const std::string& reason,
                std::int64_t now_ms);
  void publishPosition(std::int64_t now_ms);

  EventBus& bus_;
  IOrderGateway& gateway_;
  const InstrumentMaster& master_;
  PositionBook& book_;
  IronCondorParams params_;
  domain::RiskLimits limits_;

  EventBus::SubscriptionId order_sub_id_{0};

  std::optional<domain::Position> position_;
  domain::PositionState idle_state_{domain::PositionState::Idle};
  std::map<domain::OrderId, WorkingOrder> working_;
  bool roll_failed_{false};
  bool exit_exhausted_logged_{false};
  std::uint64_t next_position_seq_{1};

  // Entry allowance for the IST day entry_day_ (istDayIndex).
  std::int64_t entry_day_{-1};
  int entries_today_{0};
  std::optional<std::int64_t> last_close_ms_;
};

}  // namespace condor
