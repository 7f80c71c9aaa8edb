#pragma once

#include "trailguard/broker/i_broker_client.hpp"
#include "trailguard/broker/retry_policy.hpp"
#include "trailguard/concurrent/cancellation_token.hpp"
#include "trailguard/concurrent/event_loop_thread.hpp"
#include "trailguard/execution/order_executor.hpp"
#include "trailguard/persistence/order_audit_log.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <chrono>
#include <memory>

namespace trailguard {

// -----------------------------------------------------------------------------
// OrderRoutingThread - dedicated thread for broker order I/O
// -----------------------------------------------------------------------------
//
// @brief  Pairs an EventLoopThread with the OrderExecutor so broker latency
//         and retry backoff never stall the risk loop.
//
// @details
// Cross-thread bridges (wired by MonitorEngine):
//
//   risk loop                           order routing loop
//   ---------                           ------------------
//   PositionMonitor publishes
//   OrderRequestEvent on risk bus
//         |
//         +-- bridge --push()--> routing queue
//                                       |
//                               OrderExecutor::onRequest()
//                                       |
//                               OrderOutcomeEvent on routing bus
//                                       |
//         <--push()-- bridge -----------+
//         |
//   PositionMonitor::onOutcome()
//
// The executor is created in start() and destroyed in stop(), so it is
// subscribed exactly while the worker runs.
//
// Thread model:
//   start()/stop()/stopFor() from the owning thread; push() from any thread.
//
// Ownership:
//   Owned by MonitorEngine via std::unique_ptr. Owns the EventLoopThread and
//   the OrderExecutor. References the broker, clock, shutdown token and
//   audit log.
// -----------------------------------------------------------------------------
class OrderRoutingThread {
 public:
  OrderRoutingThread(IBrokerClient& broker, const ITimeProvider& clock,
                     CancellationToken& shutdown, RetryPolicy policy,
                     std::chrono::milliseconds min_spacing,
                     OrderAuditLog* audit = nullptr);

  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  void start();

  void stop();

  // Bounded stop. On timeout the worker is detached and the executor is
  // intentionally leaked so the detached thread never touches freed memory.
  bool stopFor(std::chrono::milliseconds timeout);

  void push(Event event);

  EventBus& eventBus();

  bool running() const { return running_; }

 private:
  IBrokerClient& broker_;
  const ITimeProvider& clock_;
  CancellationToken& shutdown_;
  RetryPolicy policy_;
  std::chrono::milliseconds min_spacing_;
  OrderAuditLog* audit_;

  EventLoopThread loop_{"OrderRoutingThread"};
  std::unique_ptr<OrderExecutor> executor_;
  bool running_{false};
};

}  // namespace trailguard
