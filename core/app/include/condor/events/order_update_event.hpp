#pragma once

#include "condor/domain/order.hpp"
#include "condor/domain/order_status.hpp"

#include <cstdint>
#include <optional>

namespace condor {

struct FillDetail {
  std::int64_t quantity{0};
  double price{0.0};
  std::uint64_t fill_seq{0};
};

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
// Published by the ExecutionManager after every state change of an order it
// owns. `fill` is set when the change was caused by a new (non-duplicate)
// fill; the strategy applies exactly that quantity to the leg, which is what
// makes fill replay idempotent at the Position level.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  std::optional<FillDetail> fill;
  std::int64_t timestamp_ms{0};
};

}  // namespace condor
