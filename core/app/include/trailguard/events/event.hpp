#pragma once

#include "trailguard/events/event_types.hpp"
#include "trailguard/events/order_events.hpp"

#include <variant>

namespace trailguard {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by every EventBus and EventLoopThread queue.
// A closed std::variant keeps events as values: no heap allocation per
// message and no downcasts. Subscribers pick their alternative through
// EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceObservationEvent,
    VolatilityUpdateEvent,
    ReconcileEvent,
    StopUpdateEvent,
    OrderRequestEvent,
    OrderOutcomeEvent>;

}  // namespace trailguard
