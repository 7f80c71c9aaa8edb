#pragma once

#include "trailguard/domain/position.hpp"
#include "trailguard/domain/volatility_info.hpp"
#include "trailguard/persistence/watermark_store.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace trailguard {

// -----------------------------------------------------------------------------
// TrailingStopTracker - per-ticker ratcheting stop
// -----------------------------------------------------------------------------
//
// @brief  Keeps, for each tracked ticker, the most favourable price seen and
//         the stop derived from it. The stop only ever moves in the
//         position's favour.
//
// @details
// For a LONG position:
//   extreme   = highest price observed (daily highs included)
//   candidate = extreme - atr * multiplier
//   stop      = max(candidate, previous stop)
// For a SHORT position the mirror image applies (lowest price, plus, min).
//
// The previous stop survives restarts: the first time a ticker is seen the
// tracker seeds its stop from the WatermarkStore (when the stored side
// matches), and every improvement is written back. forget() drops both the
// in-memory state and the watermark once the position is gone.
//
// Until a ticker has an ATR (applyVolatility() not yet called) prices still
// extend the extreme but no stop exists.
//
// Thread model:
//   Not synchronised. Owned by MonitorEngine and used only on the risk loop
//   through PositionMonitor.
// -----------------------------------------------------------------------------
class TrailingStopTracker {
 public:
  struct StopState {
    domain::PositionSide side{domain::PositionSide::Long};
    std::optional<double> extreme;
    std::optional<double> stop;
    double atr{0.0};
    double multiplier{0.0};
  };

  struct StopChange {
    std::optional<double> previous_stop;
    double stop{0.0};
    double extreme{0.0};
    bool improved{false};
  };

  explicit TrailingStopTracker(WatermarkStore* watermarks = nullptr,
                               const ITimeProvider* clock = nullptr);

  // Installs ATR and multiplier, merges the daily extreme, recomputes.
  StopChange applyVolatility(const std::string& ticker,
                             domain::PositionSide side,
                             const domain::VolatilityInfo& info);

  // Registers a ticker before any ATR is known (seeds from the watermark).
  void track(const std::string& ticker, domain::PositionSide side);

  // Extends the extreme and recomputes. Empty until an ATR is installed.
  std::optional<StopChange> observePrice(const std::string& ticker,
                                         double price);

  std::optional<double> stopFor(const std::string& ticker) const;

  std::optional<StopState> state(const std::string& ticker) const;

  void forget(const std::string& ticker);

  std::size_t size() const { return states_.size(); }

 private:
  StopState& ensure(const std::string& ticker, domain::PositionSide side);

  StopChange recompute(const std::string& ticker, StopState& state);

  static bool isBetter(domain::PositionSide side, double candidate,
                       double current);

  WatermarkStore* watermarks_;
  const ITimeProvider* clock_;
  std::unordered_map<std::string, StopState> states_;
};

}  // namespace trailguard
