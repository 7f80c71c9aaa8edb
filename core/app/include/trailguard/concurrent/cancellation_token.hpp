#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace trailguard {

// -----------------------------------------------------------------------------
// CancellationToken - cooperative shutdown signal shared by all loops
// -----------------------------------------------------------------------------
//
// @brief  A one-way latch: once cancel() is called, cancelled() stays true
//         and every thread sleeping in wait_for() wakes immediately.
//
// @details
// Replaces fixed-length sleeps in the price feed, the control thread and the
// order executor's backoff. A loop that would have slept for N seconds calls
// wait_for(N) instead and exits at the next iteration boundary when it
// returns true.
//
// Thread model:
//   cancel(), cancelled() and wait_for() are safe from any thread. The token
//   is owned by MonitorEngine and passed by reference to the components that
//   wait on it; it must outlive them.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;
  CancellationToken(CancellationToken&&) = delete;
  CancellationToken& operator=(CancellationToken&&) = delete;

  // Latches the token and wakes every waiter. Idempotent.
  void cancel() {
    {
      std::lock_guard lock(mutex_);
      cancelled_.store(true);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(); }

  // -------------------------------------------------------------------------
  // wait_for(timeout)
  // -------------------------------------------------------------------------
  // @brief  Sleeps for up to `timeout`, returning early on cancellation.
  // @return true if the token is cancelled (either before or during the
  //         wait), false if the full timeout elapsed.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
  }

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace trailguard
