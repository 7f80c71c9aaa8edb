#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace trailguard {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. Producers push from
// any thread; consumers either block (pop), poll (try_pop), or wait with a
// deadline (wait_pop) so they can also observe a shutdown request.
//
// Used at every thread boundary of the monitor: price feed → risk loop,
// risk loop → order routing, order routing → risk loop, risk loop → IPC.
//
// Thread model: All methods are thread-safe. Multiple producers and
// consumers are allowed.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Owns a mutex and condition variable; share by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one waiting consumer. The notify happens
  // outside the lock so the woken thread can take the mutex immediately.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() - blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting until one is available.
  // The predicate form of wait() re-checks after spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // wait_pop(timeout)
  // -------------------------------------------------------------------------
  // Like pop(), but gives up after `timeout` and returns std::nullopt. Loop
  // threads use this so they notice a stop request within one timeout.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> wait_pop(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() - non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // signalled on push ("not empty")
  std::deque<T> queue_;
};

}  // namespace trailguard
