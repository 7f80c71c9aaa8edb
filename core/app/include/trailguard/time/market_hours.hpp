#pragma once

#include <cstdint>

namespace trailguard {

// -----------------------------------------------------------------------------
// MarketHours - exchange session window in a fixed UTC offset
// -----------------------------------------------------------------------------
//
// @brief  Answers "is the session open?" and "has today's session closed?"
//         for a timestamp, without depending on the host time zone.
//
// @details
// Defaults describe NSE cash: 09:15 to 15:30 at UTC+05:30, Monday to Friday.
// Weekends count as closed. With enforce == false both queries report an
// open market, which is what tests and off-hours dry runs use.
// -----------------------------------------------------------------------------
struct MarketHours {
  int open_hour{9};
  int open_minute{15};
  int close_hour{15};
  int close_minute{30};
  int utc_offset_minutes{330};
  bool weekdays_only{true};
  bool enforce{true};

  // Local minutes since midnight and day of week (0 = Sunday).
  int localMinuteOfDay(std::int64_t epoch_ms) const;
  int localWeekday(std::int64_t epoch_ms) const;

  bool isTradingDay(std::int64_t epoch_ms) const;

  // True at or after the close on a trading day, and all day on weekends.
  bool isAfterClose(std::int64_t epoch_ms) const;

  bool isOpen(std::int64_t epoch_ms) const;
};

}  // namespace trailguard
