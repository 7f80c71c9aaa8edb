#pragma once

#include "trailguard/domain/volatility_info.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace trailguard {
namespace domain {

enum class PositionSide { Long, Short };

inline const char* toString(PositionSide s) {
  return s == PositionSide::Long ? "LONG" : "SHORT";
}

// Where a tracked position was discovered.
enum class PositionSource { BrokerHolding, OrdersFile };

// -----------------------------------------------------------------------------
// Tranche identifiers
// -----------------------------------------------------------------------------
inline constexpr const char* kStopLossTranche = "stop_loss";
inline constexpr const char* kProfitTarget1Tranche = "profit_target_1";
inline constexpr const char* kProfitTarget2Tranche = "profit_target_2";

// -----------------------------------------------------------------------------
// TrancheSpec - one slice of the original position
// -----------------------------------------------------------------------------
//
// @brief  Describes a one-shot exit: what fraction of the ORIGINAL quantity
//         it sells and, for profit targets, how many ATRs of profit trigger it.
//
// @details
// profit_multiple_of_atr is empty for the stop-loss tranche. Once triggered
// is set it is never cleared.
// -----------------------------------------------------------------------------
struct TrancheSpec {
  double percent_of_original{0.0};
  bool triggered{false};
  std::optional<double> profit_multiple_of_atr;
};

// Ordered by id so iteration is deterministic in logs and STATUS replies.
using ExitTranches = std::map<std::string, TrancheSpec>;

// -----------------------------------------------------------------------------
// Position - a tracked open holding
// -----------------------------------------------------------------------------
//
// @brief  The authoritative record the monitor keeps per ticker.
//
// @details
// quantity is what remains open; original_quantity is the size when
// tracking began and is the base for every tranche percentage.
//
// has_pending_order is the per-ticker mutual-exclusion gate: while it is set
// the decision engine does not evaluate the ticker, and reconciliation does
// not drop it. pending_since_ms and last_fill_ms drive the reconciliation
// grace window. pending_order_resting marks a pending exit the broker
// accepted without filling; reconciliation settles it from the holdings.
//
// Thread model:
//   Value type. The mutable copy lives in PositionLedger and is only changed
//   on the risk loop thread. Other threads read copies via snapshots().
// -----------------------------------------------------------------------------
struct Position {
  std::string ticker;
  PositionSide side{PositionSide::Long};
  std::int64_t quantity{0};
  std::int64_t original_quantity{0};
  double entry_price{0.0};
  double investment_amount{0.0};
  std::string product{"CNC"};
  std::string exchange{"NSE"};
  std::int64_t instrument_token{0};
  double tick_size{0.0};  // 0 = unknown, fall back to the tick table
  PositionSource source{PositionSource::BrokerHolding};

  bool has_pending_order{false};
  std::uint64_t pending_request_id{0};
  std::int64_t pending_since_ms{0};
  std::string pending_tranche_id;
  bool pending_order_resting{false};
  std::int64_t last_fill_ms{0};
  std::int64_t tracked_since_ms{0};

  ExitTranches exit_tranches;  // empty until the first evaluation
  std::optional<VolatilityInfo> volatility;

  double last_price{0.0};
  double trailing_stop{0.0};  // 0 until an ATR is known
  double realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// Construction-time validation
// -----------------------------------------------------------------------------
// validateTranches: every percentage within [0, 100] and the sum equal to
// 100 (within 1e-6). An empty map is valid (presets not assigned yet).
// validatePosition: non-empty ticker, non-negative quantities,
// original_quantity >= quantity, plus validateTranches.
// Both throw std::invalid_argument on violation.
// -----------------------------------------------------------------------------
void validateTranches(const ExitTranches& tranches);
void validatePosition(const Position& position);

// Sum of percent_of_original over tranches with triggered == false.
double untriggeredPercent(const ExitTranches& tranches);

// Number of tranches not yet triggered.
int untriggeredCount(const ExitTranches& tranches);

}  // namespace domain
}  // namespace trailguard
