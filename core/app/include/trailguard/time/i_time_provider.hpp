#pragma once

#include <cstdint>

namespace trailguard {

// -----------------------------------------------------------------------------
// ITimeProvider - injectable wall clock
// -----------------------------------------------------------------------------
//
// @brief  Milliseconds since the Unix epoch.
//
// @details
// Every time-dependent rule in the monitor (reconciliation grace, 24h ATR
// refresh, order spacing, market close) asks an ITimeProvider instead of
// calling std::chrono directly, so tests can drive time explicitly with
// SimulationTimeProvider while production uses LiveTimeProvider.
//
// Thread model: implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace trailguard
