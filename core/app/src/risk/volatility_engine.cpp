#include "trailguard/risk/volatility_engine.hpp"
#include "trailguard/errors/errors.hpp"

#include <algorithm>
#include <cmath>

namespace trailguard {

VolatilityEngine::VolatilityEngine(std::int64_t refresh_interval_ms)
    : refresh_interval_ms_(refresh_interval_ms) {}

// -----------------------------------------------------------------------------
// averageTrueRange(): SMA of the last kAtrPeriod True Ranges
// -----------------------------------------------------------------------------
double VolatilityEngine::averageTrueRange(
    const std::vector<domain::Candle>& candles) {
  if (candles.size() < static_cast<std::size_t>(kMinimumBars)) {
    throw InsufficientDataError(
        "need " + std::to_string(kMinimumBars) + " daily bars, have " +
        std::to_string(candles.size()));
  }

  const std::size_t first = candles.size() - kAtrPeriod;
  double sum = 0.0;
  for (std::size_t i = first; i < candles.size(); ++i) {
    const domain::Candle& bar = candles[i];
    const double prev_close = candles[i - 1].close;
    const double true_range =
        std::max({bar.high - bar.low, std::fabs(bar.high - prev_close),
                  std::fabs(bar.low - prev_close)});
    sum += true_range;
  }
  return sum / static_cast<double>(kAtrPeriod);
}

domain::VolatilityCategory VolatilityEngine::classify(double atr_percent) {
  if (atr_percent < 2.0) {
    return domain::VolatilityCategory::Low;
  }
  if (atr_percent <= 4.0) {
    return domain::VolatilityCategory::Medium;
  }
  return domain::VolatilityCategory::High;
}

double VolatilityEngine::multiplierFor(domain::VolatilityCategory category) {
  switch (category) {
    case domain::VolatilityCategory::Low:    return 1.0;
    case domain::VolatilityCategory::Medium: return 1.5;
    case domain::VolatilityCategory::High:   return 2.0;
  }
  return 1.5;
}

// -----------------------------------------------------------------------------
// compute()
// -----------------------------------------------------------------------------
domain::VolatilityInfo VolatilityEngine::compute(
    const std::vector<domain::Candle>& candles, domain::PositionSide side,
    std::int64_t now_ms) {
  const double atr = averageTrueRange(candles);
  if (!(atr > 0.0)) {
    throw InsufficientDataError("ATR is not positive");
  }

  const domain::Candle& latest = candles.back();
  if (!(latest.close > 0.0)) {
    throw InsufficientDataError("latest close is not positive");
  }

  domain::VolatilityInfo info;
  info.atr = atr;
  info.atr_percent = atr / latest.close * 100.0;
  info.category = classify(info.atr_percent);
  info.stop_multiplier = multiplierFor(info.category);
  info.computed_at_ms = now_ms;

  if (side == domain::PositionSide::Long) {
    info.daily_high = latest.high;
    info.computed_stop_price = latest.high - atr * info.stop_multiplier;
  } else {
    info.daily_high = latest.low;
    info.computed_stop_price = latest.low + atr * info.stop_multiplier;
  }
  return info;
}

// --- refresh schedule --------------------------------------------------------

bool VolatilityEngine::isDue(const std::string& ticker,
                             std::int64_t now_ms) const {
  auto it = last_computed_ms_.find(ticker);
  if (it == last_computed_ms_.end()) {
    return true;
  }
  return now_ms - it->second >= refresh_interval_ms_;
}

void VolatilityEngine::markComputed(const std::string& ticker,
                                    std::int64_t now_ms) {
  last_computed_ms_[ticker] = now_ms;
}

void VolatilityEngine::forget(const std::string& ticker) {
  last_computed_ms_.erase(ticker);
}

}  // namespace trailguard
