#pragma once

#include "trailguard/domain/order_request.hpp"
#include "trailguard/domain/position.hpp"
#include "trailguard/risk/tick_size_table.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace trailguard {

// -----------------------------------------------------------------------------
// ExitDecisionEngine - tranche state machine
// -----------------------------------------------------------------------------
//
// @brief  Given a position, its current stop and a fresh price, decides
//         whether one tranche should exit now and builds the OrderRequest.
//
// @details
// Presets (fixed on the first evaluation, chosen by volatility category):
//
//   category   stop_loss   profit_target_1    profit_target_2
//   Low        50%         30% at 2.0 ATR     20% at 3.0 ATR
//   Medium     40%         30% at 2.5 ATR     30% at 4.0 ATR
//   High       30%         30% at 3.0 ATR     40% at 5.0 ATR
//
// Each tick, in priority order:
//   1. stop_loss (if not triggered) when price crosses the stop:
//      LONG price <= stop, SHORT price >= stop. Limit order half a percent
//      through the stop, rounded to the tick.
//   2. profit targets, highest multiple first. Profit in ATR units is
//      (price - entry) / atr for LONG and (entry - price) / atr for SHORT.
//      The first untriggered target whose multiple is reached fires as a
//      market order.
// At most one tranche fires per evaluation.
//
// Quantity: floor(original * percent / 100), at least 1, at most the
// remaining quantity. The last untriggered tranche takes everything left so
// integer rounding cannot strand shares.
//
// With profit_target_exits off the preset is a single 100% stop_loss
// tranche: no profit targets, and a stop hit exits the whole remaining
// quantity in one order.
//
// evaluate() does not touch has_pending_order or mark tranches triggered;
// PositionMonitor sets the pending gate and PositionLedger marks the tranche
// once the broker confirms.
//
// Thread model: stateless apart from the tick table; used on the risk loop.
// -----------------------------------------------------------------------------
class ExitDecisionEngine {
 public:
  static constexpr double kStopLimitBuffer = 0.005;

  explicit ExitDecisionEngine(TickSizeTable ticks = TickSizeTable(),
                              bool profit_target_exits = true);

  static domain::ExitTranches presetFor(domain::VolatilityCategory category);

  static domain::ExitTranches stopOnlyPreset();

  // Installs the preset for the position's category (or the stop-only
  // preset when profit targets are off) if none is set yet. Returns true if
  // tranches were assigned.
  static bool ensureTranches(domain::Position& position);
  static bool ensureTranches(domain::Position& position,
                             bool profit_target_exits);

  // Requires position.volatility. Returns the exit to place, if any. The
  // returned request has no request_id yet.
  std::optional<domain::OrderRequest> evaluate(domain::Position& position,
                                               double price, double stop,
                                               std::int64_t now_ms) const;

  static std::int64_t trancheQuantity(const domain::Position& position,
                                      const std::string& tranche_id);

  // Stop-loss limit price for the given stop.
  double stopLimitPrice(const domain::Position& position, double stop) const;

  const TickSizeTable& ticks() const { return ticks_; }
  bool profitTargetExits() const { return profit_target_exits_; }

 private:
  domain::OrderRequest buildRequest(const domain::Position& position,
                                    const std::string& tranche_id,
                                    domain::ExitReason reason, double price,
                                    std::int64_t now_ms) const;

  TickSizeTable ticks_;
  bool profit_target_exits_;
};

}  // namespace trailguard
