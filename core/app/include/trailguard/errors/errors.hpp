#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace trailguard {

// -----------------------------------------------------------------------------
// Broker error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every failure that crosses the IBrokerClient boundary is one of
//         these types, so call sites can react by type instead of matching
//         message text.
//
// @details
//   InsufficientDataError    fewer than 21 daily bars, or ATR <= 0.
//                            Recoverable: skip the volatility update.
//   RateLimitedError         broker throttled the call. Back off and retry.
//   DuplicateOrderError      the order already exists / already completed.
//                            Treated as success of the original submission.
//   BrokerAuthError          credentials rejected. Fatal at startup.
//   InstrumentNotFoundError  unknown ticker. Skip until resolved.
//   TransientBrokerError     timeouts, connection drops, 5xx. Retry.
//   OrderRejectedError       broker refused the order outright. No retry.
//
// ZmqBrokerClient maps the bridge's error codes onto these, and
// MockBrokerClient throws them from scripted failures.
// -----------------------------------------------------------------------------
class BrokerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InsufficientDataError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class RateLimitedError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class DuplicateOrderError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class BrokerAuthError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class InstrumentNotFoundError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class TransientBrokerError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

class OrderRejectedError : public BrokerError {
 public:
  using BrokerError::BrokerError;
};

// Malformed or mistyped configuration (file or CLI).
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The engine cannot begin monitoring (e.g. nothing to monitor).
class StartupError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// ErrorClass / classifyError
// -----------------------------------------------------------------------------
// How a retrying call site should treat an exception:
//   Duplicate    stop retrying, count as success
//   RateLimited  retry on the rate-limit schedule
//   Retryable    retry on the transient schedule
//   Fatal        stop retrying, report failure
//
// Typed broker errors are classified by type. Anything else is classified by
// message text as a last resort ("duplicate order", "order already
// completed", "rate limit", "too many requests", "429"); unrecognised errors
// are Retryable.
// -----------------------------------------------------------------------------
enum class ErrorClass { Duplicate, RateLimited, Retryable, Fatal };

const char* toString(ErrorClass c);

ErrorClass classifyError(const std::exception& error);

}  // namespace trailguard
