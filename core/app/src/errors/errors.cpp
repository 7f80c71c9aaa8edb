#include "trailguard/errors/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace trailguard {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

const char* toString(ErrorClass c) {
  switch (c) {
    case ErrorClass::Duplicate:   return "Duplicate";
    case ErrorClass::RateLimited: return "RateLimited";
    case ErrorClass::Retryable:   return "Retryable";
    case ErrorClass::Fatal:       return "Fatal";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// classifyError
// -----------------------------------------------------------------------------
ErrorClass classifyError(const std::exception& error) {
  if (dynamic_cast<const DuplicateOrderError*>(&error) != nullptr) {
    return ErrorClass::Duplicate;
  }
  if (dynamic_cast<const RateLimitedError*>(&error) != nullptr) {
    return ErrorClass::RateLimited;
  }
  if (dynamic_cast<const BrokerAuthError*>(&error) != nullptr ||
      dynamic_cast<const InstrumentNotFoundError*>(&error) != nullptr ||
      dynamic_cast<const OrderRejectedError*>(&error) != nullptr ||
      dynamic_cast<const InsufficientDataError*>(&error) != nullptr) {
    return ErrorClass::Fatal;
  }
  if (dynamic_cast<const TransientBrokerError*>(&error) != nullptr) {
    return ErrorClass::Retryable;
  }

  // Untyped errors: fall back to the broker's message wording.
  const std::string message = lowercase(error.what());
  if (contains(message, "order already completed") ||
      contains(message, "duplicate order")) {
    return ErrorClass::Duplicate;
  }
  if (contains(message, "rate limit") ||
      contains(message, "too many requests") || contains(message, "429")) {
    return ErrorClass::RateLimited;
  }
  return ErrorClass::Retryable;
}

}  // namespace trailguard
