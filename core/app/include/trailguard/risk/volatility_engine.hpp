#pragma once

#include "trailguard/domain/market_data.hpp"
#include "trailguard/domain/position.hpp"
#include "trailguard/domain/volatility_info.hpp"
#include "trailguard/time/time_utils.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// VolatilityEngine - ATR computation and refresh schedule
// -----------------------------------------------------------------------------
//
// @brief  Turns daily bars into a VolatilityInfo and decides when a ticker's
//         ATR is due for recomputation.
//
// @details
// compute():
//   True Range of bar i = max(high_i - low_i,
//                             |high_i - close_{i-1}|,
//                             |low_i  - close_{i-1}|)
//   ATR = arithmetic mean of the last 20 True Ranges. Each of those bars
//   needs a previous close, so at least 21 bars are required.
//   atr% = ATR / latest close * 100, classified Low / Medium / High with
//   stop multipliers 1.0 / 1.5 / 2.0.
//   Fewer than 21 bars, a non-positive ATR or a non-positive latest close
//   throw InsufficientDataError.
//
// Schedule:
//   isDue() is true for a ticker never computed and 24 hours after the last
//   successful computation. A failed attempt does not call markComputed(),
//   so the next control cycle retries while the previous VolatilityInfo
//   stays in force.
//
// Thread model:
//   compute()/classify() are pure and static. The schedule methods are used
//   only by the control thread and are not synchronised.
// -----------------------------------------------------------------------------
class VolatilityEngine {
 public:
  static constexpr int kAtrPeriod = 20;
  static constexpr int kMinimumBars = kAtrPeriod + 1;
  static constexpr int kLookbackDays = 60;

  explicit VolatilityEngine(std::int64_t refresh_interval_ms = kMillisPerDay);

  static domain::VolatilityInfo compute(
      const std::vector<domain::Candle>& candles, domain::PositionSide side,
      std::int64_t now_ms = 0);

  static double averageTrueRange(const std::vector<domain::Candle>& candles);

  static domain::VolatilityCategory classify(double atr_percent);

  static double multiplierFor(domain::VolatilityCategory category);

  bool isDue(const std::string& ticker, std::int64_t now_ms) const;
  void markComputed(const std::string& ticker, std::int64_t now_ms);
  void forget(const std::string& ticker);

  std::int64_t refreshIntervalMs() const { return refresh_interval_ms_; }

 private:
  std::int64_t refresh_interval_ms_;
  std::unordered_map<std::string, std::int64_t> last_computed_ms_;
};

}  // namespace trailguard
