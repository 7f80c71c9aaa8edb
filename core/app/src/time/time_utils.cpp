#include "trailguard/time/time_utils.hpp"

#include <cstdio>

namespace trailguard {

namespace {

// Days since 1970-01-01 to a proleptic Gregorian civil date.
void civilFromDays(std::int64_t z, int& year, unsigned& month, unsigned& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 +
                          (month <= 2 ? 1 : 0));
}

}  // namespace

std::string formatLocalTime(std::int64_t epoch_ms, int utc_offset_minutes) {
  const std::int64_t local_ms =
      epoch_ms + static_cast<std::int64_t>(utc_offset_minutes) * kMillisPerMinute;
  std::int64_t days = local_ms / kMillisPerDay;
  std::int64_t rem = local_ms % kMillisPerDay;
  if (rem < 0) {
    rem += kMillisPerDay;
    --days;
  }

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civilFromDays(days, year, month, day);

  const auto seconds = static_cast<int>(rem / kMillisPerSecond);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02d:%02d:%02d", year,
                month, day, seconds / 3600, (seconds / 60) % 60, seconds % 60);
  return buffer;
}

}  // namespace trailguard
