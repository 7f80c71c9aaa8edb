#include "trailguard/broker/retry_policy.hpp"

#include <cmath>
#include <cstdint>

namespace trailguard {

std::chrono::milliseconds RetryPolicy::delayFor(ErrorClass error_class,
                                                int attempt) const {
  const BackoffSchedule& schedule =
      error_class == ErrorClass::RateLimited ? rate_limited : transient;
  const int exponent = attempt < 1 ? 0 : attempt - 1;
  const double millis = static_cast<double>(schedule.base.count()) *
                        std::pow(schedule.factor, exponent);
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(millis)));
}

RetryPolicy RetryPolicy::immediate(int max_attempts) {
  RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.rate_limited = BackoffSchedule{std::chrono::milliseconds(0), 1.0};
  policy.transient = BackoffSchedule{std::chrono::milliseconds(0), 1.0};
  return policy;
}

const char* toString(RetryStatus s) {
  switch (s) {
    case RetryStatus::Success:   return "Success";
    case RetryStatus::Duplicate: return "Duplicate";
    case RetryStatus::Exhausted: return "Exhausted";
    case RetryStatus::Fatal:     return "Fatal";
    case RetryStatus::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

}  // namespace trailguard
