#pragma once

#include <atomic>
#include <cstdint>

namespace trailguard {

// -----------------------------------------------------------------------------
// RequestIdGenerator - unique ids for exit order requests
// -----------------------------------------------------------------------------
//
// @brief  Atomic counter starting at 1. Id 0 means "unset".
//
// @details
// Owned by MonitorEngine and injected into PositionMonitor, which stamps
// every OrderRequest it emits. The id is echoed in the audit log and in the
// OrderOutcome so an outcome can be matched to the request that caused it.
// Relaxed ordering is enough: uniqueness is the only requirement.
//
// Thread model: next_id() is safe from any thread.
// -----------------------------------------------------------------------------
class RequestIdGenerator {
 public:
  RequestIdGenerator() = default;

  RequestIdGenerator(const RequestIdGenerator&) = delete;
  RequestIdGenerator& operator=(const RequestIdGenerator&) = delete;
  RequestIdGenerator(RequestIdGenerator&&) = delete;
  RequestIdGenerator& operator=(RequestIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace trailguard
