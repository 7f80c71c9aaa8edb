// =============================================================================
// volatility_engine_test.cpp
// =============================================================================
// Unit tests for trailguard::VolatilityEngine.
//
// Validates:
//   - ATR is the mean of the last 20 True Ranges, gaps included
//   - Category boundaries (2% and 4% are Medium) and stop multipliers
//   - 21 bars minimum; a flat series is rejected as insufficient
//   - LONG uses the latest high, SHORT the latest low
//   - 24h refresh schedule
// =============================================================================

#include "trailguard/errors/errors.hpp"
#include "trailguard/risk/volatility_engine.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

using trailguard::VolatilityEngine;
using trailguard::domain::Candle;
using trailguard::domain::PositionSide;
using trailguard::domain::VolatilityCategory;

// `count` bars closing at `close`, each spanning close +/- half_range.
std::vector<Candle> flatBars(int count, double close, double half_range) {
  std::vector<Candle> bars;
  for (int i = 0; i < count; ++i) {
    Candle c;
    c.timestamp_ms = i;
    c.open = close;
    c.high = close + half_range;
    c.low = close - half_range;
    c.close = close;
    bars.push_back(c);
  }
  return bars;
}

}  // namespace

TEST(VolatilityEngineTest, AtrIsMeanOfLastTwentyTrueRanges) {
  // 30 bars; the first ten are much wider and must not count.
  std::vector<Candle> bars = flatBars(10, 100.0, 20.0);
  const std::vector<Candle> tail = flatBars(20, 100.0, 1.5);
  bars.insert(bars.end(), tail.begin(), tail.end());

  EXPECT_DOUBLE_EQ(VolatilityEngine::averageTrueRange(bars), 3.0);
}

TEST(VolatilityEngineTest, TrueRangeIncludesGapFromPreviousClose) {
  std::vector<Candle> bars = flatBars(21, 100.0, 1.0);
  // Gap up: range 5, but 10 above the previous close.
  bars.back().high = 110.0;
  bars.back().low = 105.0;
  bars.back().close = 108.0;

  // 19 bars of TR 2 plus one of TR 10.
  EXPECT_DOUBLE_EQ(VolatilityEngine::averageTrueRange(bars),
                   (19 * 2.0 + 10.0) / 20.0);
}

TEST(VolatilityEngineTest, ClassifiesWithInclusiveMediumBand) {
  EXPECT_EQ(VolatilityEngine::classify(1.99), VolatilityCategory::Low);
  EXPECT_EQ(VolatilityEngine::classify(2.0), VolatilityCategory::Medium);
  EXPECT_EQ(VolatilityEngine::classify(4.0), VolatilityCategory::Medium);
  EXPECT_EQ(VolatilityEngine::classify(4.01), VolatilityCategory::High);

  EXPECT_DOUBLE_EQ(VolatilityEngine::multiplierFor(VolatilityCategory::Low), 1.0);
  EXPECT_DOUBLE_EQ(VolatilityEngine::multiplierFor(VolatilityCategory::Medium),
                   1.5);
  EXPECT_DOUBLE_EQ(VolatilityEngine::multiplierFor(VolatilityCategory::High),
                   2.0);
}

TEST(VolatilityEngineTest, ComputeLongUsesLatestHigh) {
  const auto info = VolatilityEngine::compute(flatBars(21, 100.0, 1.5),
                                              PositionSide::Long, 42);

  EXPECT_DOUBLE_EQ(info.atr, 3.0);
  EXPECT_DOUBLE_EQ(info.atr_percent, 3.0);
  EXPECT_EQ(info.category, VolatilityCategory::Medium);
  EXPECT_DOUBLE_EQ(info.stop_multiplier, 1.5);
  EXPECT_DOUBLE_EQ(info.daily_high, 101.5);
  EXPECT_DOUBLE_EQ(info.computed_stop_price, 101.5 - 4.5);
  EXPECT_EQ(info.computed_at_ms, 42);
}

TEST(VolatilityEngineTest, ComputeShortUsesLatestLow) {
  const auto info = VolatilityEngine::compute(flatBars(21, 100.0, 3.0),
                                              PositionSide::Short);

  EXPECT_EQ(info.category, VolatilityCategory::High);
  EXPECT_DOUBLE_EQ(info.daily_high, 97.0);
  EXPECT_DOUBLE_EQ(info.computed_stop_price, 97.0 + 6.0 * 2.0);
}

TEST(VolatilityEngineTest, TwentyBarsAreNotEnough) {
  EXPECT_THROW(VolatilityEngine::compute(flatBars(20, 100.0, 1.0),
                                         PositionSide::Long),
               trailguard::InsufficientDataError);
  EXPECT_NO_THROW(VolatilityEngine::compute(flatBars(21, 100.0, 1.0),
                                            PositionSide::Long));
}

TEST(VolatilityEngineTest, ZeroAtrIsInsufficientData) {
  EXPECT_THROW(VolatilityEngine::compute(flatBars(30, 100.0, 0.0),
                                         PositionSide::Long),
               trailguard::InsufficientDataError);
}

TEST(VolatilityEngineTest, RefreshScheduleIsDaily) {
  VolatilityEngine engine;
  const std::int64_t t0 = 1'700'000'000'000;

  EXPECT_TRUE(engine.isDue("INFY", t0));
  engine.markComputed("INFY", t0);
  EXPECT_FALSE(engine.isDue("INFY", t0 + trailguard::kMillisPerDay - 1));
  EXPECT_TRUE(engine.isDue("INFY", t0 + trailguard::kMillisPerDay));

  engine.forget("INFY");
  EXPECT_TRUE(engine.isDue("INFY", t0 + 1));
}
