#pragma once

#include "trailguard/concurrent/thread_safe_queue.hpp"
#include "trailguard/eventbus/event_bus.hpp"
#include "trailguard/events/event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace trailguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Everything subscribed to that
// bus therefore runs serialized on the worker thread, which is how the risk
// loop stays the single owner of the position ledger.
//
// Thread model: push() and eventBus().subscribe() are safe from any thread.
// start()/stop()/stopFor() are called by the owner (MonitorEngine or a test).
// A handler that throws std::exception is logged and the loop continues with
// the next event.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  // Joins the worker (unbounded) if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. No-op if already running.
  void start();

  // Signals the worker and joins it. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // stopFor(timeout)
  // -------------------------------------------------------------------------
  // @brief  Bounded variant of stop().
  // @return true if the worker exited within `timeout` and was joined.
  //         false if it did not; the thread is then detached so the caller
  //         can report it and terminate the process.
  // -------------------------------------------------------------------------
  bool stopFor(std::chrono::milliseconds timeout);

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  bool running() const { return running_.load(); }

 private:
  // Worker entry point: try_pop → publish, otherwise idle-wait on stop_cv_.
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};

  // Guards finished_ and backs stop_cv_. The worker waits on stop_cv_ while
  // idle; stopFor() waits on it for finished_.
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool finished_{true};

  std::thread thread_;
};

}  // namespace trailguard
