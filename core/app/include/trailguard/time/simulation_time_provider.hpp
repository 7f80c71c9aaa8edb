#pragma once

#include "trailguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace trailguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// Clock that only moves when told to. Tests set it to a known instant and
// advance it past grace windows and refresh intervals without sleeping.
// Atomic, so the test thread may advance it while loops read it.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute time.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by a delta.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace trailguard
