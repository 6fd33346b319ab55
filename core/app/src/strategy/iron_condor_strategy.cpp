#include "condor/strategy/iron_condor_strategy.hpp"
#include "condor/events/position_update_event.hpp"
#include "condor/risk/risk_manager.hpp"
#include "condor/time/time_utils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace condor {

using domain::ExitReason;
using domain::LegRole;
using domain::OptionLeg;
using domain::OptionType;
using domain::OrderPurpose;
using domain::PositionState;
using domain::Side;

namespace {

// The leg a working order acts on: RollOpen orders build the replacement of
// their leg_index, everything else addresses leg_index directly.
int targetOf(int leg_index, OrderPurpose purpose) {
  return purpose == OrderPurpose::RollOpen
             ? leg_index + domain::kReplacementLegOffset
             : leg_index;
}

bool isOpening(OrderPurpose purpose) {
  return purpose == OrderPurpose::Entry || purpose == OrderPurpose::RollOpen;
}

// Position::legs order: short call, long call, short put, long put.
constexpr int kShortLegs[] = {0, 2};
constexpr int kWingLegs[] = {1, 3};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
IronCondorStrategy::IronCondorStrategy(EventBus& bus, IOrderGateway& gateway,
                                       const InstrumentMaster& master,
                                       PositionBook& book,
                                       IronCondorParams params,
                                       domain::RiskLimits limits)
    : bus_(bus),
      gateway_(gateway),
      master_(master),
      book_(book),
      params_(std::move(params)),
      limits_(limits) {
  order_sub_id_ = bus_.subscribe<OrderUpdateEvent>(
      [this](const OrderUpdateEvent& e) { onOrderUpdate(e); });
}

IronCondorStrategy::~IronCondorStrategy() { bus_.unsubscribe(order_sub_id_); }

PositionState IronCondorStrategy::state() const {
  return position_ ? position_->state : idle_state_;
}

// -----------------------------------------------------------------------------
// evaluate(): one decision per chain update or scheduler tick
// -----------------------------------------------------------------------------
void IronCondorStrategy::evaluate(const OptionChainModel& chain,
                                  const domain::RiskDecision& decision,
                                  const StrategyContext& context) {
  if (!position_) {
    evaluateEntry(chain, decision, context);
    return;
  }

  domain::Position& p = *position_;
  if (auto mtm = RiskManager::markToMarket(p, chain.snapshot())) {
    p.unrealized_pnl = *mtm;
  }

  if (p.state == PositionState::Exiting) {
    if (!context.feed_stale) {
      submitExitRound(context.now_ms);
    }
    maybeClose(context.now_ms);
    return;
  }

  if (context.feed_stale) {
    return;
  }

  if (roll_failed_) {
    beginExit(ExitReason::RollFailed, "roll order rejected", context.now_ms);
    return;
  }

  // --- Risk veto: mandatory ------------------------------------------------------
  if (const auto* fx = std::get_if<domain::ForceExit>(&decision)) {
    if (domain::closesPosition(fx->reason)) {
      std::ostringstream detail;
      detail << "observed=" << fx->observed << " limit=" << fx->limit;
      beginExit(fx->reason, detail.str(), context.now_ms);
      return;
    }
  }

  if (auto reason = strategyExit(chain, context)) {
    beginExit(*reason, "", context.now_ms);
    return;
  }

  if (p.state == PositionState::Adjusting && p.roll &&
      params_.roll_timeout_ms > 0 &&
      context.now_ms - p.roll->started_ms >= params_.roll_timeout_ms) {
    beginExit(ExitReason::RollFailed, "roll timed out", context.now_ms);
    return;
  }

  if (p.state == PositionState::Adjusting && !p.roll) {
    // Covers a restart between the wing fills and the short orders.
    submitShortsOnceHedged();
    return;
  }

  if (p.state == PositionState::Entered) {
    if (const auto* hedge = std::get_if<domain::Hedge>(&decision)) {
      startRoll(chain, *hedge, context);
    }
  }
}

// -----------------------------------------------------------------------------
// Entry
// -----------------------------------------------------------------------------
void IronCondorStrategy::evaluateEntry(const OptionChainModel& chain,
                                       const domain::RiskDecision& decision,
                                       const StrategyContext& context) {
  const bool admitted = std::holds_alternative<domain::Continue>(decision);
  if (!admitted || !entryPreconditions(chain, context)) {
    if (idle_state_ == PositionState::Evaluating) {
      setState(PositionState::Idle, "entry preconditions lapsed",
               context.now_ms);
    }
    return;
  }

  if (idle_state_ == PositionState::Idle) {
    std::ostringstream why;
    why << "iv_rank=" << *context.iv_rank
        << " dte=" << chain.daysToExpiry(context.now_ms);
    setState(PositionState::Evaluating, why.str(), context.now_ms);
  }

  auto strikes = selectCondorStrikes(chain, params_.selection);
  if (!strikes) {
    return;
  }

  const std::vector<std::string> ids = {
      InstrumentMaster::optionId(master_.index(), strikes->short_call,
                                 OptionType::Call),
      InstrumentMaster::optionId(master_.index(), strikes->long_call,
                                 OptionType::Call),
      InstrumentMaster::optionId(master_.index(), strikes->short_put,
                                 OptionType::Put),
      InstrumentMaster::optionId(master_.index(), strikes->long_put,
                                 OptionType::Put)};
  for (const auto& id : ids) {
    if (book_.inUse(id)) {
      return;
    }
  }

  enter(*strikes, context);
}

bool IronCondorStrategy::entryPreconditions(
    const OptionChainModel& chain, const StrategyContext& context) const {
  if (context.feed_stale || !chain.spot()) {
    return false;
  }
  const int minute = istMinuteOfDay(context.now_ms);
  if (minute < params_.entry_start_minute ||
      minute >= params_.entry_end_minute) {
    return false;
  }
  const double dte = chain.daysToExpiry(context.now_ms);
  if (dte < params_.min_days_to_expiry || dte > params_.max_days_to_expiry) {
    return false;
  }
  if (params_.max_entries_per_day > 0 &&
      entry_day_ == istDayIndex(context.now_ms) &&
      entries_today_ >= params_.max_entries_per_day) {
    return false;
  }
  if (last_close_ms_ &&
      context.now_ms - *last_close_ms_ < params_.reentry_cooldown_ms) {
    return false;
  }
  return context.iv_rank && *context.iv_rank >= params_.min_iv_rank;
}

void IronCondorStrategy::enter(const CondorStrikes& strikes,
                               const StrategyContext& context) {
  domain::Position p;
  p.id = std::string(domain::toString(master_.index())) + "-IC-" +
         std::to_string(next_position_seq_++);
  p.strategy_name = params_.name;
  p.index = master_.index();
  p.state = PositionState::Evaluating;
  p.entry_time_ms = context.now_ms;
  p.legs = {
      makeLeg(strikes.short_call, OptionType::Call, Side::Sell,
              LegRole::ShortCall),
      makeLeg(strikes.long_call, OptionType::Call, Side::Buy,
              LegRole::LongCall),
      makeLeg(strikes.short_put, OptionType::Put, Side::Sell,
              LegRole::ShortPut),
      makeLeg(strikes.long_put, OptionType::Put, Side::Buy, LegRole::LongPut),
  };

  std::vector<std::string> ids;
  for (const auto& leg : p.legs) {
    ids.push_back(leg.instrument_id);
  }
  book_.reserve(p.id, ids);

  position_ = std::move(p);
  idle_state_ = PositionState::Idle;

  const std::int64_t today = istDayIndex(context.now_ms);
  if (today != entry_day_) {
    entry_day_ = today;
    entries_today_ = 0;
  }
  ++entries_today_;

  std::ostringstream why;
  why << "entry " << strikes.short_call << "C/" << strikes.long_call << "C/"
      << strikes.short_put << "P/" << strikes.long_put << "P";
  setState(PositionState::Adjusting, why.str(), context.now_ms);

  for (int i : kWingLegs) {
    const OptionLeg& leg = position_->legs[static_cast<std::size_t>(i)];
    submitFor(i, OrderPurpose::Entry, leg, leg.side, leg.quantity);
  }
  publishPosition(context.now_ms);
}

void IronCondorStrategy::submitShortsOnceHedged() {
  if (!position_ || position_->state != PositionState::Adjusting ||
      position_->roll || position_->last_rejection) {
    return;
  }
  const domain::Position& p = *position_;
  for (int i : kWingLegs) {
    const OptionLeg& wing = p.legs[static_cast<std::size_t>(i)];
    if (wing.open_quantity != wing.quantity) {
      return;
    }
  }
  for (int i : kShortLegs) {
    const OptionLeg leg = p.legs[static_cast<std::size_t>(i)];
    if (leg.open_quantity == 0 && leg.closed_quantity == 0 &&
        !hasWorkingOrder(i)) {
      submitFor(i, OrderPurpose::Entry, leg, leg.side, leg.quantity);
    }
  }
}

// -----------------------------------------------------------------------------
// Strategy-owned exits
// -----------------------------------------------------------------------------
std::optional<ExitReason> IronCondorStrategy::strategyExit(
    const OptionChainModel& chain, const StrategyContext& context) const {
  const domain::Position& p = *position_;

  const std::int64_t expiry_cutoff =
      chain.master().expiryMs() -
      params_.exit_before_expiry_minutes * kMsPerMinute;
  if (context.now_ms >= expiry_cutoff) {
    return ExitReason::TimeExit;
  }
  if (params_.eod_exit_minute >= 0 &&
      istMinuteOfDay(context.now_ms) >= params_.eod_exit_minute) {
    return ExitReason::TimeExit;
  }
  if (params_.take_profit > 0.0 && p.state == PositionState::Entered &&
      p.totalPnl() >= params_.take_profit) {
    return ExitReason::TakeProfit;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Roll
// -----------------------------------------------------------------------------
void IronCondorStrategy::startRoll(const OptionChainModel& chain,
                                   const domain::Hedge& hedge,
                                   const StrategyContext& context) {
  domain::Position& p = *position_;
  const int short_index = hedge.leg_index;
  const int wing_index = short_index + 1;
  const OptionLeg short_leg = p.legs[static_cast<std::size_t>(short_index)];
  const OptionLeg wing_leg = p.legs[static_cast<std::size_t>(wing_index)];
  const OptionType type = short_leg.option_type;

  auto strike = selectRollStrike(chain, type, short_leg.strike,
                                 limits_.hedge_trigger_delta,
                                 params_.selection);
  if (!strike) {
    beginExit(ExitReason::RollFailed, "no strike to roll to", context.now_ms);
    return;
  }

  domain::RollPlan plan;
  plan.breach_delta = hedge.delta;
  plan.started_ms = context.now_ms;
  plan.replacements.push_back(
      {short_index, makeLeg(*strike, type, Side::Sell, short_leg.role)});

  const bool reaches_wing = type == OptionType::Call
                                ? *strike >= wing_leg.strike
                                : *strike <= wing_leg.strike;
  if (reaches_wing) {
    const domain::Strike wing_strike =
        type == OptionType::Call ? *strike + params_.selection.wing_width
                                 : *strike - params_.selection.wing_width;
    const ChainEntry* e = chain.find(wing_strike, type);
    if (master_.findOption(wing_strike, type) == nullptr || e == nullptr ||
        !e->has_greeks || e->expired) {
      beginExit(ExitReason::RollFailed, "no hedge strike for roll",
                context.now_ms);
      return;
    }
    plan.replacements.push_back(
        {wing_index, makeLeg(wing_strike, type, Side::Buy, wing_leg.role)});
  }

  std::vector<std::string> ids;
  for (const auto& r : plan.replacements) {
    ids.push_back(r.replacement.instrument_id);
  }
  if (!book_.reserve(p.id, ids)) {
    beginExit(ExitReason::RollFailed, "roll strike held by another position",
              context.now_ms);
    return;
  }

  p.roll = plan;
  roll_failed_ = false;

  std::ostringstream why;
  why << "roll " << short_leg.strike << domain::optionSuffix(type) << " -> "
      << *strike << domain::optionSuffix(type) << " (delta "
      << hedge.delta << ")";
  setState(PositionState::Adjusting, why.str(), context.now_ms);

  // Protection first: buy the new wing before anything else moves.
  if (reaches_wing) {
    const OptionLeg& new_wing = p.roll->replacements[1].replacement;
    submitFor(wing_index, OrderPurpose::RollOpen, new_wing, Side::Buy,
              new_wing.quantity);
  }
  submitFor(short_index, OrderPurpose::RollClose, short_leg, Side::Buy,
            short_leg.open_quantity);
  const OptionLeg& new_short = p.roll->replacements[0].replacement;
  submitFor(short_index, OrderPurpose::RollOpen, new_short, Side::Sell,
            new_short.quantity);
  if (reaches_wing) {
    submitFor(wing_index, OrderPurpose::RollClose, wing_leg, Side::Sell,
              wing_leg.open_quantity);
  }
  publishPosition(context.now_ms);
}

// -----------------------------------------------------------------------------
// Exit
// -----------------------------------------------------------------------------
void IronCondorStrategy::beginExit(ExitReason reason,
                                   const std::string& detail,
                                   std::int64_t now_ms) {
  domain::Position& p = *position_;
  p.exit_reason = reason;
  p.exit_attempts = 0;
  exit_exhausted_logged_ = false;

  std::string why = domain::toString(reason);
  if (!detail.empty()) {
    why += " (" + detail + ")";
  }
  setState(PositionState::Exiting, why, now_ms);

  // Collect first: cancel() may publish and re-enter onOrderUpdate.
  std::vector<domain::OrderId> opening;
  for (const auto& [id, w] : working_) {
    if (isOpening(w.purpose)) {
      opening.push_back(id);
    }
  }
  for (domain::OrderId id : opening) {
    gateway_.cancel(id);
  }

  submitExitRound(now_ms);
  publishPosition(now_ms);
  maybeClose(now_ms);
}

void IronCondorStrategy::submitExitRound(std::int64_t now_ms) {
  domain::Position& p = *position_;

  std::vector<int> targets;
  for (int i = 0; i < static_cast<int>(p.legs.size()); ++i) {
    if (p.legs[static_cast<std::size_t>(i)].open_quantity > 0 &&
        !hasWorkingOrder(i)) {
      targets.push_back(i);
    }
  }
  if (p.roll) {
    for (const auto& r : p.roll->replacements) {
      const int target = r.leg_index + domain::kReplacementLegOffset;
      if (r.replacement.open_quantity > 0 && !hasWorkingOrder(target)) {
        targets.push_back(target);
      }
    }
  }
  if (targets.empty()) {
    return;
  }

  if (p.exit_attempts >= params_.max_exit_attempts) {
    if (!exit_exhausted_logged_) {
      exit_exhausted_logged_ = true;
      std::cerr << "[IronCondorStrategy] ERROR: " << p.id << " still has "
                << targets.size() << " open leg(s) after "
                << p.exit_attempts << " exit rounds. Manual action needed.\n";
    }
    return;
  }
  ++p.exit_attempts;

  for (int target : targets) {
    const OptionLeg leg = *legFor(target);
    submitFor(target, OrderPurpose::Exit, leg, domain::opposite(leg.side),
              leg.open_quantity);
  }
  std::cout << "[IronCondorStrategy] " << p.id << " exit round "
            << p.exit_attempts << ": " << targets.size()
            << " closing order(s) at " << formatIst(now_ms) << "\n";
}

// -----------------------------------------------------------------------------
// onOrderUpdate(): fills and terminal statuses
// -----------------------------------------------------------------------------
void IronCondorStrategy::onOrderUpdate(const OrderUpdateEvent& update) {
  const domain::Order& order = update.order;
  if (!position_ || order.position_id != position_->id) {
    return;
  }
  auto it = working_.find(order.id);
  if (it == working_.end()) {
    std::cerr << "[IronCondorStrategy] WARNING: update for untracked order_id="
              << order.id << ". Ignored.\n";
    return;
  }

  const std::int64_t now = update.timestamp_ms;
  if (update.fill) {
    applyFill(order, *update.fill);
  }

  const bool terminal = domain::isTerminal(order.status);
  if (terminal) {
    const WorkingOrder w = it->second;
    working_.erase(it);

    const bool venue_cancel = order.status == domain::OrderStatus::Cancelled &&
                              !order.cancel_requested;
    if (order.status == domain::OrderStatus::Rejected || venue_cancel) {
      const auto code = order.reject_code.value_or(domain::RejectCode::Unknown);
      if (w.purpose == OrderPurpose::RollOpen ||
          w.purpose == OrderPurpose::RollClose) {
        roll_failed_ = true;
      } else if (w.purpose == OrderPurpose::Entry) {
        position_->last_rejection = code;
      }
      std::cerr << "[IronCondorStrategy] " << position_->id << " "
                << domain::toString(w.purpose) << " order " << order.id
                << " on " << order.instrument_id << " ended "
                << domain::toString(order.status) << " ("
                << domain::toString(code) << ")\n";
    }
  }

  submitShortsOnceHedged();
  checkEntryComplete(now);
  checkRollComplete(now);
  if (update.fill || terminal) {
    publishPosition(now);
  }
  maybeClose(now);
}

void IronCondorStrategy::applyFill(const domain::Order& order,
                                   const FillDetail& fill) {
  OptionLeg* leg = legFor(targetOf(order.leg_index, order.purpose));
  if (leg == nullptr) {
    std::cerr << "[IronCondorStrategy] WARNING: fill for order_id="
              << order.id << " has no leg to apply to.\n";
    return;
  }
  const double qty = static_cast<double>(fill.quantity);

  if (isOpening(order.purpose)) {
    const double open = static_cast<double>(leg->open_quantity);
    leg->entry_price = (leg->entry_price * open + fill.price * qty) /
                       (open + qty);
    leg->open_quantity += fill.quantity;
    return;
  }

  const double closed = static_cast<double>(leg->closed_quantity);
  position_->realized_pnl +=
      leg->pnlSign() * (fill.price - leg->entry_price) * qty;
  leg->exit_price = (leg->exit_price * closed + fill.price * qty) /
                    (closed + qty);
  leg->closed_quantity += fill.quantity;
  leg->open_quantity -= fill.quantity;
}

void IronCondorStrategy::checkEntryComplete(std::int64_t now_ms) {
  if (!position_ || position_->state != PositionState::Adjusting ||
      position_->roll) {
    return;
  }
  for (const auto& leg : position_->legs) {
    if (leg.open_quantity != leg.quantity) {
      return;
    }
  }
  setState(PositionState::Entered, "all four legs filled", now_ms);
}

void IronCondorStrategy::checkRollComplete(std::int64_t now_ms) {
  if (!position_ || position_->state != PositionState::Adjusting ||
      !position_->roll) {
    return;
  }
  domain::Position& p = *position_;
  for (const auto& r : p.roll->replacements) {
    const OptionLeg& old_leg = p.legs[static_cast<std::size_t>(r.leg_index)];
    if (old_leg.open_quantity != 0 || hasWorkingOrder(r.leg_index) ||
        r.replacement.open_quantity != r.replacement.quantity) {
      return;
    }
  }
  for (const auto& r : p.roll->replacements) {
    p.legs[static_cast<std::size_t>(r.leg_index)] = r.replacement;
  }
  p.roll.reset();
  setState(PositionState::Entered, "roll filled", now_ms);
}

void IronCondorStrategy::maybeClose(std::int64_t now_ms) {
  if (!position_ || position_->state != PositionState::Exiting ||
      !position_->isFlat() || !working_.empty()) {
    return;
  }
  domain::Position& p = *position_;
  p.unrealized_pnl = 0.0;
  p.closed_time_ms = now_ms;
  setState(PositionState::Closed, "all legs closed", now_ms);
  publishPosition(now_ms);

  std::cout << "[IronCondorStrategy] " << p.id << " CLOSED reason="
            << (p.exit_reason ? domain::toString(*p.exit_reason) : "-")
            << " realized_pnl=" << p.realized_pnl << "\n";

  book_.release(p.id);
  position_.reset();
  idle_state_ = PositionState::Idle;
  roll_failed_ = false;
  last_close_ms_ = now_ms;
}

// -----------------------------------------------------------------------------
// Recovery
// -----------------------------------------------------------------------------
void IronCondorStrategy::hydrate(const domain::Position& position) {
  position_ = position;

  std::vector<std::string> ids;
  for (const auto& leg : position.legs) {
    ids.push_back(leg.instrument_id);
  }
  if (position.roll) {
    for (const auto& r : position.roll->replacements) {
      ids.push_back(r.replacement.instrument_id);
    }
  }
  book_.reserve(position.id, ids);

  // The resumed Position used up one of its day's entries.
  const std::int64_t day = istDayIndex(position.entry_time_ms);
  if (day != entry_day_) {
    entry_day_ = day;
    entries_today_ = 0;
  }
  ++entries_today_;

  const auto pos = position.id.rfind("-IC-");
  if (pos != std::string::npos) {
    try {
      const std::uint64_t seq = std::stoull(position.id.substr(pos + 4));
      if (seq >= next_position_seq_) {
        next_position_seq_ = seq + 1;
      }
    } catch (const std::exception& e) {
      std::cerr << "[IronCondorStrategy] WARNING: unexpected position id "
                << position.id << ": " << e.what() << "\n";
    }
  }
  std::cout << "[IronCondorStrategy] resumed " << position.id << " in state "
            << domain::toString(position.state) << "\n";
}

void IronCondorStrategy::hydrateOrder(const domain::Order& order) {
  if (!position_ || order.position_id != position_->id ||
      domain::isTerminal(order.status)) {
    return;
  }
  working_[order.id] = WorkingOrder{order.leg_index, order.purpose};
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
OptionLeg IronCondorStrategy::makeLeg(domain::Strike strike, OptionType type,
                                      Side side, LegRole role) const {
  OptionLeg leg;
  leg.strike = strike;
  leg.option_type = type;
  leg.expiry_ms = master_.expiryMs();
  leg.instrument_id = InstrumentMaster::optionId(master_.index(), strike, type);
  leg.side = side;
  leg.quantity = static_cast<std::int64_t>(params_.lots) * master_.lotSize();
  leg.role = role;
  return leg;
}

OptionLeg* IronCondorStrategy::legFor(int target) {
  domain::Position& p = *position_;
  if (target >= 0 && target < static_cast<int>(p.legs.size())) {
    return &p.legs[static_cast<std::size_t>(target)];
  }
  if (p.roll) {
    for (auto& r : p.roll->replacements) {
      if (r.leg_index + domain::kReplacementLegOffset == target) {
        return &r.replacement;
      }
    }
  }
  return nullptr;
}

domain::Order IronCondorStrategy::submitFor(int leg_index,
                                            OrderPurpose purpose,
                                            const OptionLeg& leg, Side side,
                                            std::int64_t quantity) {
  LegAction action;
  action.position_id = position_->id;
  action.leg_index = leg_index;
  action.purpose = purpose;
  action.instrument_id = leg.instrument_id;
  action.side = side;
  action.quantity = quantity;

  domain::Order order = gateway_.submit(action);
  working_[order.id] = WorkingOrder{leg_index, purpose};
  return order;
}

bool IronCondorStrategy::hasWorkingOrder(int target) const {
  for (const auto& [id, w] : working_) {
    if (targetOf(w.leg_index, w.purpose) == target) {
      return true;
    }
  }
  return false;
}

void IronCondorStrategy::setState(PositionState next,
                                  const std::string& reason,
                                  std::int64_t now_ms) {
  const PositionState from = state();
  if (from == next) {
    return;
  }
  if (position_) {
    position_->state = next;
  } else {
    idle_state_ = next;
  }

  const std::string id = position_ ? position_->id : std::string();
  std::cout << "[IronCondorStrategy] " << (id.empty() ? params_.name : id)
            << " " << domain::toString(from) << " -> "
            << domain::toString(next) << " (" << reason << ")\n";

  StrategyStateEvent event;
  event.strategy_name = params_.name;
  event.position_id = id;
  event.from = from;
  event.to = next;
  event.reason = reason;
  event.timestamp_ms = now_ms;
  bus_.publish(event);
}

void IronCondorStrategy::publishPosition(std::int64_t now_ms) {
  if (!position_) {
    return;
  }
  bus_.publish(PositionUpdateEvent{*position_, now_ms});
}

}  // namespace condor
