#pragma once

#include "condor/domain/instrument.hpp"
#include "condor/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace condor {
namespace domain {

using OrderId = std::uint64_t;

enum class OrderType {
  Market,
  Limit,
};

// Why the order exists, from the Position's point of view.
enum class OrderPurpose {
  Entry,      // Opens one of the four legs
  Exit,       // Closes a leg
  RollClose,  // Closes a leg being replaced by a roll
  RollOpen,   // Opens the replacement leg of a roll
};

// -----------------------------------------------------------------------------
// RejectCode
// -----------------------------------------------------------------------------
// Broker-side rejection classes. The first three are transient and retried
// with backoff; everything else is permanent.
// -----------------------------------------------------------------------------
enum class RejectCode {
  Timeout,
  RateLimited,
  NetworkError,
  InsufficientMargin,
  InvalidInstrument,
  InvalidOrder,
  AuthExpired,
  Unknown,
};

bool isTransient(RejectCode code);

const char* toString(OrderType type);
const char* toString(OrderPurpose purpose);
const char* toString(RejectCode code);
std::optional<RejectCode> parseRejectCode(const std::string& text);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// @brief  One broker order for exactly one leg of exactly one Position.
//
// @details
// (position_id, leg_index, purpose) is the leg reference. For roll orders
// leg_index names the leg being replaced; the replacement leg lives in the
// Position's pending roll until the roll completes. An exit order that closes
// such a replacement carries leg_index + kReplacementLegOffset.
//
// The retry bookkeeping (retries, next_retry_ms, ack_deadline_ms) is carried
// on the order itself and evaluated on each scheduler tick, so retry timing
// is a pure function of the clock.
//
// The authoritative copy is owned by the ExecutionManager; everybody else
// receives snapshots through OrderUpdateEvent.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string position_id;
  int leg_index{0};
  OrderPurpose purpose{OrderPurpose::Entry};
  std::string instrument_id;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  OrderType order_type{OrderType::Market};
  double limit_price{0.0};

  OrderStatus status{OrderStatus::Pending};
  std::string broker_order_id;
  int retries{0};
  std::int64_t filled_quantity{0};
  double avg_fill_price{0.0};

  std::int64_t created_ms{0};
  std::int64_t next_retry_ms{0};    // 0 = no retry scheduled
  std::int64_t ack_deadline_ms{0};  // 0 = not awaiting an ack
  bool cancel_requested{false};

  std::optional<RejectCode> reject_code;
  std::string reject_reason;

  std::int64_t remainingQuantity() const { return quantity - filled_quantity; }
};

}  // namespace domain
}  // namespace condor
