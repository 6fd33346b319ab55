#pragma once

#include "condor/domain/order.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// BrokerRequestEvent
// -----------------------------------------------------------------------------
// Outbound request from the ExecutionManager (decision loop) to the
// OrderRouter (routing thread). `order` is a snapshot taken at request time.
// For QueryStatus, `orders` lists every order whose venue state is wanted.
// -----------------------------------------------------------------------------
struct BrokerRequestEvent {
  enum class Kind { Place, Cancel, Modify, QueryStatus };

  Kind kind{Kind::Place};
  domain::Order order;
  std::int64_t new_quantity{0};
  double new_price{0.0};
  std::vector<domain::Order> orders;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// BrokerReportEvent
// -----------------------------------------------------------------------------
// Inbound push from the venue, as decoded by the broker client.
// A report is matched to an order by client_order_id, falling back to
// broker_order_id when the venue omits the client id.
//
// (broker_order_id, fill_seq) uniquely identifies a fill; replaying a fill
// with the same key is a no-op.
// -----------------------------------------------------------------------------
struct BrokerReportEvent {
  enum class Kind { Ack, Fill, Reject, Cancelled };

  Kind kind{Kind::Ack};
  domain::OrderId client_order_id{0};
  std::string broker_order_id;
  std::uint64_t fill_seq{0};
  std::int64_t fill_quantity{0};
  double fill_price{0.0};
  domain::RejectCode code{domain::RejectCode::Unknown};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

const char* toString(BrokerReportEvent::Kind kind);

struct BrokerFill {
  std::uint64_t fill_seq{0};
  std::int64_t quantity{0};
  double price{0.0};
};

enum class VenueOrderState { Open, Filled, Rejected, Cancelled, NotFound };

// One row of the venue order book, returned by the polling fallback.
struct BrokerOrderStatus {
  domain::OrderId client_order_id{0};
  std::string broker_order_id;
  VenueOrderState state{VenueOrderState::Open};
  std::vector<BrokerFill> fills;
  domain::RejectCode code{domain::RejectCode::Unknown};
  std::string reason;
};

struct OrderStatusSnapshotEvent {
  std::vector<BrokerOrderStatus> orders;
  std::int64_t timestamp_ms{0};
};

}  // namespace condor
