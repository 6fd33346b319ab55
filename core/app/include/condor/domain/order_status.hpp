#pragma once

namespace condor {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
// Order lifecycle as tracked by the ExecutionManager:
//
//   Pending ──ack──> Placed ──fill──> PartiallyFilled ──fill──> Filled
//     │  ▲             │  │                 │
//     │  └─transient───┘  └──cancel──┐      └──cancel──> Cancelled
//     │    reject/timeout            ▼
//     ├──permanent reject / exhausted retries──> Rejected
//     └──cancel confirmed or ack window lapsed──> Cancelled
//
// A fill may arrive before the ack (Pending -> PartiallyFilled/Filled).
// Terminal states: Filled, Rejected, Cancelled.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,
  Placed,
  PartiallyFilled,
  Filled,
  Rejected,
  Cancelled,
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Rejected ||
         status == OrderStatus::Cancelled;
}

const char* toString(OrderStatus status);

}  // namespace domain
}  // namespace condor
