#pragma once

#include "broker_events.hpp"
#include "event_types.hpp"
#include "order_update_event.hpp"
#include "position_update_event.hpp"

#include <variant>

namespace condor {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by every EventBus and every event queue.
// Value semantics: events are copied across threads, never shared.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TickEvent,
    TimerEvent,
    FeedStatusEvent,
    EngineFatalEvent,
    BrokerRequestEvent,
    BrokerReportEvent,
    OrderStatusSnapshotEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    StrategyStateEvent>;

}  // namespace condor
