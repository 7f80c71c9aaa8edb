#include "trailguard/time/market_hours.hpp"
#include "trailguard/time/time_utils.hpp"

namespace trailguard {

namespace {

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

}  // namespace

int MarketHours::localMinuteOfDay(std::int64_t epoch_ms) const {
  const std::int64_t local_ms =
      epoch_ms + static_cast<std::int64_t>(utc_offset_minutes) * kMillisPerMinute;
  const std::int64_t day = floorDiv(local_ms, kMillisPerDay);
  return static_cast<int>((local_ms - day * kMillisPerDay) / kMillisPerMinute);
}

int MarketHours::localWeekday(std::int64_t epoch_ms) const {
  const std::int64_t local_ms =
      epoch_ms + static_cast<std::int64_t>(utc_offset_minutes) * kMillisPerMinute;
  // 1970-01-01 was a Thursday.
  const std::int64_t day = floorDiv(local_ms, kMillisPerDay);
  return static_cast<int>(((day + 4) % 7 + 7) % 7);
}

bool MarketHours::isTradingDay(std::int64_t epoch_ms) const {
  if (!weekdays_only) {
    return true;
  }
  const int weekday = localWeekday(epoch_ms);
  return weekday != 0 && weekday != 6;
}

bool MarketHours::isAfterClose(std::int64_t epoch_ms) const {
  if (!enforce) {
    return false;
  }
  if (!isTradingDay(epoch_ms)) {
    return true;
  }
  return localMinuteOfDay(epoch_ms) >= close_hour * 60 + close_minute;
}

bool MarketHours::isOpen(std::int64_t epoch_ms) const {
  if (!enforce) {
    return true;
  }
  if (!isTradingDay(epoch_ms)) {
    return false;
  }
  const int minute = localMinuteOfDay(epoch_ms);
  return minute >= open_hour * 60 + open_minute &&
         minute < close_hour * 60 + close_minute;
}

}  // namespace trailguard
