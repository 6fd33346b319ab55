#include "condor/domain/instrument.hpp"
#include "condor/domain/order.hpp"
#include "condor/domain/order_status.hpp"
#include "condor/domain/position.hpp"
#include "condor/domain/risk_decision.hpp"

namespace condor {
namespace domain {

IndexSpec indexSpec(IndexId index) {
  switch (index) {
    case IndexId::Nifty:
      return IndexSpec{IndexId::Nifty, "NIFTY", 75, 50, "NFO"};
    case IndexId::Sensex:
      return IndexSpec{IndexId::Sensex, "SENSEX", 20, 100, "BFO"};
  }
  return IndexSpec{};
}

const char* toString(IndexId index) {
  return index == IndexId::Nifty ? "NIFTY" : "SENSEX";
}

const char* toString(OptionType type) {
  return type == OptionType::Call ? "CALL" : "PUT";
}

const char* toString(Side side) { return side == Side::Buy ? "BUY" : "SELL"; }

const char* optionSuffix(OptionType type) {
  return type == OptionType::Call ? "CE" : "PE";
}

std::optional<IndexId> parseIndex(const std::string& text) {
  if (text == "NIFTY") {
    return IndexId::Nifty;
  }
  if (text == "SENSEX") {
    return IndexId::Sensex;
  }
  return std::nullopt;
}

const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:
      return "PENDING";
    case OrderStatus::Placed:
      return "PLACED";
    case OrderStatus::PartiallyFilled:
      return "PARTIALLY_FILLED";
    case OrderStatus::Filled:
      return "FILLED";
    case OrderStatus::Rejected:
      return "REJECTED";
    case OrderStatus::Cancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* toString(OrderType type) {
  return type == OrderType::Market ? "MARKET" : "LIMIT";
}

const char* toString(OrderPurpose purpose) {
  switch (purpose) {
    case OrderPurpose::Entry:
      return "ENTRY";
    case OrderPurpose::Exit:
      return "EXIT";
    case OrderPurpose::RollClose:
      return "ROLL_CLOSE";
    case OrderPurpose::RollOpen:
      return "ROLL_OPEN";
  }
  return "UNKNOWN";
}

bool isTransient(RejectCode code) {
  return code == RejectCode::Timeout || code == RejectCode::RateLimited ||
         code == RejectCode::NetworkError;
}

const char* toString(RejectCode code) {
  switch (code) {
    case RejectCode::Timeout:
      return "TIMEOUT";
    case RejectCode::RateLimited:
      return "RATE_LIMITED";
    case RejectCode::NetworkError:
      return "NETWORK_ERROR";
    case RejectCode::InsufficientMargin:
      return "INSUFFICIENT_MARGIN";
    case RejectCode::InvalidInstrument:
      return "INVALID_INSTRUMENT";
    case RejectCode::InvalidOrder:
      return "INVALID_ORDER";
    case RejectCode::AuthExpired:
      return "AUTH_EXPIRED";
    case RejectCode::Unknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::optional<RejectCode> parseRejectCode(const std::string& text) {
  for (RejectCode code :
       {RejectCode::Timeout, RejectCode::RateLimited, RejectCode::NetworkError,
        RejectCode::InsufficientMargin, RejectCode::InvalidInstrument,
        RejectCode::InvalidOrder, RejectCode::AuthExpired,
        RejectCode::Unknown}) {
    if (text == toString(code)) {
      return code;
    }
  }
  return std::nullopt;
}

const char* toString(PositionState state) {
  switch (state) {
    case PositionState::Idle:
      return "IDLE";
    case PositionState::Evaluating:
      return "EVALUATING";
    case PositionState::Entered:
      return "ENTERED";
    case PositionState::Adjusting:
      return "ADJUSTING";
    case PositionState::Exiting:
      return "EXITING";
    case PositionState::Closed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

const char* toString(ExitReason reason) {
  switch (reason) {
    case ExitReason::StopLossBreached:
      return "STOP_LOSS_BREACHED";
    case ExitReason::MaxLossBreached:
      return "MAX_LOSS_BREACHED";
    case ExitReason::PremiumStop:
      return "PREMIUM_STOP";
    case ExitReason::OrderRejected:
      return "ORDER_REJECTED";
    case ExitReason::MaxPositionsExceeded:
      return "MAX_POSITIONS_EXCEEDED";
    case ExitReason::FeedStale:
      return "FEED_STALE";
    case ExitReason::TimeExit:
      return "TIME_EXIT";
    case ExitReason::TakeProfit:
      return "TAKE_PROFIT";
    case ExitReason::RollFailed:
      return "ROLL_FAILED";
  }
  return "UNKNOWN";
}

bool closesPosition(ExitReason reason) {
  return reason != ExitReason::MaxPositionsExceeded &&
         reason != ExitReason::FeedStale;
}

}  // namespace domain
}  // namespace condor
