#pragma once

#include "trailguard/domain/order_request.hpp"

namespace trailguard {

// -----------------------------------------------------------------------------
// OrderRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries an exit OrderRequest from the risk loop (where the
// decision was made and the pending gate set) to the order routing loop.
// -----------------------------------------------------------------------------
struct OrderRequestEvent {
  domain::OrderRequest request;
};

// -----------------------------------------------------------------------------
// OrderOutcomeEvent
// -----------------------------------------------------------------------------
// Responsibility: Final result of one request, published by the
// OrderExecutor on the order routing loop and bridged back to the risk loop,
// where PositionLedger applies it.
// -----------------------------------------------------------------------------
struct OrderOutcomeEvent {
  domain::OrderOutcome outcome;
};

}  // namespace trailguard
