#pragma once

#include <cstdint>

namespace trailguard {
namespace domain {

// -----------------------------------------------------------------------------
// VolatilityCategory
// -----------------------------------------------------------------------------
// Bucket derived from ATR as a percentage of the latest close:
//   atr% < 2        → Low    (stop multiplier 1.0)
//   2 <= atr% <= 4  → Medium (stop multiplier 1.5)
//   atr% > 4        → High   (stop multiplier 2.0)
// The category also selects the tranche preset of a position.
// -----------------------------------------------------------------------------
enum class VolatilityCategory { Low, Medium, High };

inline const char* toString(VolatilityCategory c) {
  switch (c) {
    case VolatilityCategory::Low:    return "Low";
    case VolatilityCategory::Medium: return "Medium";
    case VolatilityCategory::High:   return "High";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// VolatilityInfo - result of one ATR computation for one ticker
// -----------------------------------------------------------------------------
//
// @brief  Value snapshot produced by VolatilityEngine and carried to the risk
//         loop inside a VolatilityUpdateEvent.
//
// @details
// daily_high is the favourable extreme of the latest daily bar: the bar high
// for a LONG position and the bar low for a SHORT one. computed_stop_price is
// that extreme minus (LONG) or plus (SHORT) atr * stop_multiplier, before any
// ratcheting against earlier stops.
// -----------------------------------------------------------------------------
struct VolatilityInfo {
  double atr{0.0};
  double atr_percent{0.0};
  VolatilityCategory category{VolatilityCategory::Medium};
  double stop_multiplier{1.5};
  double daily_high{0.0};
  double computed_stop_price{0.0};
  std::int64_t computed_at_ms{0};
};

}  // namespace domain
}  // namespace trailguard
