#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace trailguard {

using Timestamp = std::chrono::system_clock::time_point;

inline constexpr std::int64_t kMillisPerSecond = 1000;
inline constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
inline constexpr std::int64_t kMillisPerDay = 24 * 60 * kMillisPerMinute;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// "YYYY-MM-DD HH:MM:SS" for epoch milliseconds shifted by a fixed UTC offset.
std::string formatLocalTime(std::int64_t epoch_ms, int utc_offset_minutes);

}  // namespace trailguard
