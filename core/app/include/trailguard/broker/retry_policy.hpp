#pragma once

#include "trailguard/concurrent/cancellation_token.hpp"
#include "trailguard/errors/errors.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace trailguard {

// Exponential schedule: delay(attempt) = base * factor^(attempt - 1).
struct BackoffSchedule {
  std::chrono::milliseconds base{1000};
  double factor{1.5};
};

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------
//
// @brief  Bounded retry budget shared by every broker call site that retries.
//
// @details
// max_attempts counts the first try. Rate-limited failures wait on the
// rate_limited schedule (2 s, x1.5), other retryable failures on the
// transient one (1 s, x1.5). Duplicate and Fatal errors are never retried.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{5};
  BackoffSchedule rate_limited{std::chrono::milliseconds(2000), 1.5};
  BackoffSchedule transient{std::chrono::milliseconds(1000), 1.5};

  // Delay to wait after the given failed attempt (1-based).
  std::chrono::milliseconds delayFor(ErrorClass error_class,
                                     int attempt) const;

  // No waiting between attempts. Used by tests.
  static RetryPolicy immediate(int max_attempts = 5);
};

enum class RetryStatus { Success, Duplicate, Exhausted, Fatal, Cancelled };

const char* toString(RetryStatus s);

template <typename T>
struct RetryResult {
  RetryStatus status{RetryStatus::Exhausted};
  std::optional<T> value;
  int attempts{0};
  std::string last_error;
  std::optional<ErrorClass> last_error_class;
};

// -----------------------------------------------------------------------------
// retryCall(policy, token, fn, on_retry)
// -----------------------------------------------------------------------------
//
// @brief  Invokes fn() until it succeeds, the budget runs out, a
//         non-retryable error occurs, or the token is cancelled.
//
// @param  fn        Callable returning a value. Failures are exceptions.
// @param  on_retry  Called before each backoff wait as
//                   on_retry(attempt, error_class, error, delay).
//
// @details
// The backoff wait is CancellationToken::wait_for, so shutdown interrupts it
// immediately. The token is also checked before every attempt; a cancelled
// token yields RetryStatus::Cancelled without calling fn again.
//
// Thread model: runs entirely on the calling thread.
// -----------------------------------------------------------------------------
template <typename Fn, typename OnRetry>
auto retryCall(const RetryPolicy& policy, CancellationToken& token, Fn&& fn,
               OnRetry&& on_retry) -> RetryResult<std::invoke_result_t<Fn&>> {
  RetryResult<std::invoke_result_t<Fn&>> result;

  const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (token.cancelled()) {
      result.status = RetryStatus::Cancelled;
      return result;
    }

    result.attempts = attempt;
    try {
      result.value.emplace(fn());
      result.status = RetryStatus::Success;
      return result;
    } catch (const std::exception& e) {
      const ErrorClass error_class = classifyError(e);
      result.last_error = e.what();
      result.last_error_class = error_class;

      if (error_class == ErrorClass::Duplicate) {
        result.status = RetryStatus::Duplicate;
        return result;
      }
      if (error_class == ErrorClass::Fatal) {
        result.status = RetryStatus::Fatal;
        return result;
      }
      if (attempt == max_attempts) {
        break;
      }

      const auto delay = policy.delayFor(error_class, attempt);
      on_retry(attempt, error_class, e, delay);
      if (delay.count() > 0 && token.wait_for(delay)) {
        result.status = RetryStatus::Cancelled;
        return result;
      }
    }
  }

  result.status = RetryStatus::Exhausted;
  return result;
}

}  // namespace trailguard
