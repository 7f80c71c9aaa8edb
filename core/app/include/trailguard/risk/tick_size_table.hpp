#pragma once

#include <string>
#include <unordered_map>

namespace trailguard {

// -----------------------------------------------------------------------------
// TickSizeTable - price increment lookup for limit prices
// -----------------------------------------------------------------------------
//
// @brief  Resolves the tick size used to round a limit price.
//
// @details
// Resolution order:
//   1. the instrument's own tick size, when the broker reported one;
//   2. a per-ticker override (AIAENG and CREDITACC trade in 0.10 by default;
//      more can come from configuration);
//   3. the exchange price band:
//        price <    50  → 0.01
//        price <   500  → 0.05
//        price <  1000  → 0.10
//        price <  5000  → 0.25
//        price < 10000  → 0.50
//        otherwise      → 1.00
// -----------------------------------------------------------------------------
class TickSizeTable {
 public:
  TickSizeTable();
  explicit TickSizeTable(std::unordered_map<std::string, double> overrides);

  double tickFor(const std::string& ticker, double price,
                 double instrument_tick = 0.0) const;

  // Nearest multiple of `tick`. A non-positive tick returns price unchanged.
  static double roundToTick(double price, double tick);

  static double bandTick(double price);

 private:
  std::unordered_map<std::string, double> overrides_;
};

}  // namespace trailguard
