#include "trailguard/domain/position.hpp"

#include <cmath>
#include <stdexcept>

namespace trailguard {
namespace domain {

namespace {

constexpr double kPercentTolerance = 1e-6;

}  // namespace

// -----------------------------------------------------------------------------
// validateTranches
// -----------------------------------------------------------------------------
void validateTranches(const ExitTranches& tranches) {
  if (tranches.empty()) {
    return;
  }

  double total = 0.0;
  for (const auto& [id, spec] : tranches) {
    if (spec.percent_of_original < 0.0 || spec.percent_of_original > 100.0) {
      throw std::invalid_argument("tranche " + id +
                                  " percent outside [0, 100]");
    }
    if (spec.profit_multiple_of_atr && *spec.profit_multiple_of_atr <= 0.0) {
      throw std::invalid_argument("tranche " + id +
                                  " profit multiple must be positive");
    }
    total += spec.percent_of_original;
  }

  if (std::fabs(total - 100.0) > kPercentTolerance) {
    throw std::invalid_argument("tranche percentages sum to " +
                                std::to_string(total) + ", expected 100");
  }
}

// -----------------------------------------------------------------------------
// validatePosition
// -----------------------------------------------------------------------------
void validatePosition(const Position& position) {
  if (position.ticker.empty()) {
    throw std::invalid_argument("position ticker must not be empty");
  }
  if (position.quantity < 0) {
    throw std::invalid_argument(position.ticker +
                                ": quantity must be non-negative");
  }
  if (position.original_quantity < position.quantity) {
    throw std::invalid_argument(position.ticker +
                                ": original quantity below remaining quantity");
  }
  validateTranches(position.exit_tranches);
}

double untriggeredPercent(const ExitTranches& tranches) {
  double total = 0.0;
  for (const auto& [id, spec] : tranches) {
    if (!spec.triggered) {
      total += spec.percent_of_original;
    }
  }
  return total;
}

int untriggeredCount(const ExitTranches& tranches) {
  int count = 0;
  for (const auto& [id, spec] : tranches) {
    if (!spec.triggered) {
      ++count;
    }
  }
  return count;
}

}  // namespace domain
}  // namespace trailguard
