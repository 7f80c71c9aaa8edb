#pragma once

#include "trailguard/broker/i_broker_client.hpp"
#include "trailguard/broker/retry_policy.hpp"
#include "trailguard/concurrent/cancellation_token.hpp"
#include "trailguard/eventbus/event_bus.hpp"
#include "trailguard/events/order_events.hpp"
#include "trailguard/persistence/order_audit_log.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace trailguard {

// -----------------------------------------------------------------------------
// OrderExecutor - single consumer of exit requests
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to OrderRequestEvent on the order routing loop, places
//         each order with the shared RetryPolicy and publishes exactly one
//         OrderOutcomeEvent per request.
//
// @details
// Because the routing loop drains its queue one event at a time, requests
// are submitted strictly in FIFO order and never concurrently.
//
// Before the first attempt the executor waits until min_spacing has passed
// since the previous submission. Outcome mapping from RetryStatus:
//
//   Success    -> Filled     (broker fill quantity, requested if absent)
//                 Accepted   (broker reported 0 filled; the order rests)
//   Duplicate  -> Duplicate  (the order already exists at the broker;
//                             requested quantity is the best-known fill)
//   Exhausted  -> Failed
//   Fatal      -> Failed
//   Cancelled  -> Cancelled  (shutdown during spacing or backoff)
//
// When a confirmed exit leaves nothing behind (remaining_after_fill == 0),
// standing conditional orders for the ticker are cancelled. Failures there
// are logged and do not change the outcome.
//
// Every submission, retry and outcome goes to stdout/stderr and to the
// OrderAuditLog.
//
// Thread model:
//   onRequest()/execute() run on the order routing loop thread. Backoff
//   waits block only that thread and return early when the shared shutdown
//   token is cancelled.
//
// Ownership:
//   Owned by OrderRoutingThread via std::unique_ptr. References the broker,
//   clock, token and audit log, all owned by MonitorEngine or its caller.
// -----------------------------------------------------------------------------
class OrderExecutor {
 public:
  OrderExecutor(EventBus& bus, IBrokerClient& broker,
                const ITimeProvider& clock, CancellationToken& shutdown,
                RetryPolicy policy, std::chrono::milliseconds min_spacing,
                OrderAuditLog* audit = nullptr);

  ~OrderExecutor();

  OrderExecutor(const OrderExecutor&) = delete;
  OrderExecutor& operator=(const OrderExecutor&) = delete;
  OrderExecutor(OrderExecutor&&) = delete;
  OrderExecutor& operator=(OrderExecutor&&) = delete;

  // -------------------------------------------------------------------------
  // execute(request)
  // -------------------------------------------------------------------------
  // @brief  Places one order with retries and returns its outcome. Does not
  //         publish; onRequest() wraps it and publishes the result.
  // -------------------------------------------------------------------------
  domain::OrderOutcome execute(const domain::OrderRequest& request);

  std::uint64_t processed() const { return processed_.load(); }

 private:
  void onRequest(const OrderRequestEvent& event);

  // Waits out the remaining spacing. Returns false if cancelled meanwhile.
  bool waitForSpacing();

  void cancelConditionalOrders(const std::string& ticker);

  EventBus& bus_;
  IBrokerClient& broker_;
  const ITimeProvider& clock_;
  CancellationToken& shutdown_;
  RetryPolicy policy_;
  std::chrono::milliseconds min_spacing_;
  OrderAuditLog* audit_;

  std::optional<std::chrono::steady_clock::time_point> last_submit_;
  std::atomic<std::uint64_t> processed_{0};

  EventBus::SubscriptionId request_sub_id_{0};
};

}  // namespace trailguard
