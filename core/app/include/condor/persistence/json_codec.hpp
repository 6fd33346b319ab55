#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/domain/option_leg.hpp"
#include "condor/domain/order.hpp"
#include "condor/domain/order_status.hpp"
#include "condor/domain/position.hpp"
#include "condor/domain/risk_decision.hpp"
#include "condor/domain/tick.hpp"
#include "condor/events/order_update_event.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON mapping of domain types
// -----------------------------------------------------------------------------
// Shared by the order-event log, the position archive, the tick file reader
// and the wire codecs. Enums are written as the same upper-case strings used
// in log lines. Functions live next to the types so nlohmann's ADL lookup
// finds them.
// -----------------------------------------------------------------------------

namespace condor {
namespace domain {

NLOHMANN_JSON_SERIALIZE_ENUM(IndexId, {
    {IndexId::Nifty, "NIFTY"},
    {IndexId::Sensex, "SENSEX"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OptionType, {
    {OptionType::Call, "CE"},
    {OptionType::Put, "PE"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Side, {
    {Side::Buy, "BUY"},
    {Side::Sell, "SELL"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(LegRole, {
    {LegRole::ShortCall, "SHORT_CALL"},
    {LegRole::LongCall, "LONG_CALL"},
    {LegRole::ShortPut, "SHORT_PUT"},
    {LegRole::LongPut, "LONG_PUT"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderType, {
    {OrderType::Market, "MARKET"},
    {OrderType::Limit, "LIMIT"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderPurpose, {
    {OrderPurpose::Entry, "ENTRY"},
    {OrderPurpose::Exit, "EXIT"},
    {OrderPurpose::RollClose, "ROLL_CLOSE"},
    {OrderPurpose::RollOpen, "ROLL_OPEN"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderStatus, {
    {OrderStatus::Pending, "PENDING"},
    {OrderStatus::Placed, "PLACED"},
    {OrderStatus::PartiallyFilled, "PARTIALLY_FILLED"},
    {OrderStatus::Filled, "FILLED"},
    {OrderStatus::Rejected, "REJECTED"},
    {OrderStatus::Cancelled, "CANCELLED"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(RejectCode, {
    {RejectCode::Unknown, "UNKNOWN"},
    {RejectCode::Timeout, "TIMEOUT"},
    {RejectCode::RateLimited, "RATE_LIMITED"},
    {RejectCode::NetworkError, "NETWORK_ERROR"},
    {RejectCode::InsufficientMargin, "INSUFFICIENT_MARGIN"},
    {RejectCode::InvalidInstrument, "INVALID_INSTRUMENT"},
    {RejectCode::InvalidOrder, "INVALID_ORDER"},
    {RejectCode::AuthExpired, "AUTH_EXPIRED"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PositionState, {
    {PositionState::Idle, "IDLE"},
    {PositionState::Evaluating, "EVALUATING"},
    {PositionState::Entered, "ENTERED"},
    {PositionState::Adjusting, "ADJUSTING"},
    {PositionState::Exiting, "EXITING"},
    {PositionState::Closed, "CLOSED"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ExitReason, {
    {ExitReason::StopLossBreached, "STOP_LOSS_BREACHED"},
    {ExitReason::MaxLossBreached, "MAX_LOSS_BREACHED"},
    {ExitReason::PremiumStop, "PREMIUM_STOP"},
    {ExitReason::OrderRejected, "ORDER_REJECTED"},
    {ExitReason::MaxPositionsExceeded, "MAX_POSITIONS_EXCEEDED"},
    {ExitReason::FeedStale, "FEED_STALE"},
    {ExitReason::TimeExit, "TIME_EXIT"},
    {ExitReason::TakeProfit, "TAKE_PROFIT"},
    {ExitReason::RollFailed, "ROLL_FAILED"},
})

void to_json(nlohmann::json& j, const Tick& tick);
void from_json(const nlohmann::json& j, Tick& tick);

void to_json(nlohmann::json& j, const OptionLeg& leg);
void from_json(const nlohmann::json& j, OptionLeg& leg);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

}  // namespace domain

void to_json(nlohmann::json& j, const FillDetail& fill);
void from_json(const nlohmann::json& j, FillDetail& fill);

}  // namespace condor
