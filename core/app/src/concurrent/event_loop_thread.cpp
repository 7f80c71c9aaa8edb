#include "trailguard/concurrent/event_loop_thread.hpp"

#include <exception>
#include <iostream>

namespace trailguard {

namespace {

// Idle wait between queue checks. Short enough that stop() is prompt.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  {
    std::lock_guard lock(stop_mutex_);
    finished_ = false;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// stopFor(timeout)
// -----------------------------------------------------------------------------
// std::thread has no timed join, so the worker flags finished_ as its last
// action and we wait for that flag instead.
// -----------------------------------------------------------------------------
bool EventLoopThread::stopFor(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) {
    return true;
  }

  running_.store(false);
  stop_cv_.notify_all();

  bool finished = false;
  {
    std::unique_lock lock(stop_mutex_);
    finished = stop_cv_.wait_for(lock, timeout, [this] { return finished_; });
  }

  if (finished) {
    thread_.join();
    return true;
  }

  std::cerr << "[" << name_ << "] did not stop within " << timeout.count()
            << " ms; detaching.\n";
  thread_.detach();
  return false;
}

// -----------------------------------------------------------------------------
// run() - worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] handler error: " << e.what() << "\n";
      }
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  {
    std::lock_guard lock(stop_mutex_);
    finished_ = true;
  }
  stop_cv_.notify_all();
}

}  // namespace trailguard
