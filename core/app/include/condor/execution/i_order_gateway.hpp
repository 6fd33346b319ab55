#pragma once

#include "condor/domain/order.hpp"

#include <cstdint>
#include <string>

namespace condor {

// One leg-level action requested by a strategy.
struct LegAction {
  std::string position_id;
  int leg_index{0};
  domain::OrderPurpose purpose{domain::OrderPurpose::Entry};
  std::string instrument_id;
  domain::Side side{domain::Side::Buy};
  std::int64_t quantity{0};
  domain::OrderType order_type{domain::OrderType::Market};
  double limit_price{0.0};
};

// -----------------------------------------------------------------------------
// IOrderGateway
// -----------------------------------------------------------------------------
// What a strategy is allowed to do with orders. Implemented by the
// ExecutionManager; the strategy never sees order state except through
// OrderUpdateEvent.
// -----------------------------------------------------------------------------
class IOrderGateway {
 public:
  virtual ~IOrderGateway() = default;

  // Creates a Pending order and sends it to the venue. Never throws for
  // broker-side problems; those come back as OrderUpdateEvents.
  virtual domain::Order submit(const LegAction& action) = 0;

  // false if the order is unknown or already terminal.
  virtual bool cancel(domain::OrderId id) = 0;

  virtual bool modify(domain::OrderId id, std::int64_t new_quantity,
                      double new_price) = 0;
};

}  // namespace condor
