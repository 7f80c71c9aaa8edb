#pragma once

#include "trailguard/domain/market_data.hpp"
#include "trailguard/domain/position.hpp"
#include "trailguard/domain/volatility_info.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// PriceObservationEvent
// -----------------------------------------------------------------------------
// Responsibility: One last-traded price for one ticker, produced by the
// PriceFeed thread and consumed on the risk loop.
// -----------------------------------------------------------------------------
struct PriceObservationEvent {
  std::string ticker;
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// VolatilityUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: A fresh ATR computation (and, when resolved, the
// instrument's tick size) for one ticker. Produced by the control thread,
// which does the broker I/O; applied on the risk loop.
// -----------------------------------------------------------------------------
struct VolatilityUpdateEvent {
  std::string ticker;
  domain::VolatilityInfo info;
  double tick_size{0.0};  // 0 = not resolved
};

// -----------------------------------------------------------------------------
// ReconcileEvent
// -----------------------------------------------------------------------------
// Responsibility: A full snapshot of broker holdings. The risk loop merges it
// into the ledger so reconciliation never races with exit decisions.
// -----------------------------------------------------------------------------
struct ReconcileEvent {
  std::vector<domain::BrokerHolding> holdings;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// StopUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Telemetry emitted on the risk loop whenever a trailing
// stop moves. Forwarded to the IPC publisher.
// -----------------------------------------------------------------------------
struct StopUpdateEvent {
  std::string ticker;
  domain::PositionSide side{domain::PositionSide::Long};
  double previous_stop{0.0};
  double stop{0.0};
  double extreme{0.0};
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace trailguard
