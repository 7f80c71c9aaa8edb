#include "trailguard/network/order_routing_thread.hpp"

#include <iostream>
#include <utility>

namespace trailguard {

OrderRoutingThread::OrderRoutingThread(IBrokerClient& broker,
                                       const ITimeProvider& clock,
                                       CancellationToken& shutdown,
                                       RetryPolicy policy,
                                       std::chrono::milliseconds min_spacing,
                                       OrderAuditLog* audit)
    : broker_(broker),
      clock_(clock),
      shutdown_(shutdown),
      policy_(std::move(policy)),
      min_spacing_(min_spacing),
      audit_(audit) {}

OrderRoutingThread::~OrderRoutingThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): subscribe the executor, then start the loop
// -----------------------------------------------------------------------------
void OrderRoutingThread::start() {
  if (running_) {
    return;
  }

  executor_ = std::make_unique<OrderExecutor>(loop_.eventBus(), broker_,
                                              clock_, shutdown_, policy_,
                                              min_spacing_, audit_);
  loop_.start();
  running_ = true;

  std::cout << "[OrderRoutingThread] started (max " << policy_.max_attempts
            << " attempts, spacing " << min_spacing_.count() << " ms).\n";
}

void OrderRoutingThread::stop() {
  if (!running_) {
    return;
  }

  loop_.stop();
  executor_.reset();
  running_ = false;

  std::cout << "[OrderRoutingThread] stopped.\n";
}

bool OrderRoutingThread::stopFor(std::chrono::milliseconds timeout) {
  if (!running_) {
    return true;
  }

  running_ = false;
  if (!loop_.stopFor(timeout)) {
    static_cast<void>(executor_.release());
    return false;
  }
  executor_.reset();
  std::cout << "[OrderRoutingThread] stopped.\n";
  return true;
}

void OrderRoutingThread::push(Event event) { loop_.push(std::move(event)); }

EventBus& OrderRoutingThread::eventBus() { return loop_.eventBus(); }

}  // namespace trailguard
