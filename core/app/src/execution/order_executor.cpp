#include "trailguard/execution/order_executor.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace trailguard {

namespace {

domain::OrderOutcomeStatus outcomeFor(RetryStatus status) {
  switch (status) {
    case RetryStatus::Success:   return domain::OrderOutcomeStatus::Filled;
    case RetryStatus::Duplicate: return domain::OrderOutcomeStatus::Duplicate;
    case RetryStatus::Cancelled: return domain::OrderOutcomeStatus::Cancelled;
    case RetryStatus::Exhausted:
    case RetryStatus::Fatal:
      break;
  }
  return domain::OrderOutcomeStatus::Failed;
}

// Price to report when the broker did not return an average fill price.
double bestKnownPrice(const domain::OrderRequest& request) {
  return request.limit_price ? *request.limit_price : request.trigger_price;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: subscribe to OrderRequestEvent
// -----------------------------------------------------------------------------
OrderExecutor::OrderExecutor(EventBus& bus, IBrokerClient& broker,
                             const ITimeProvider& clock,
                             CancellationToken& shutdown, RetryPolicy policy,
                             std::chrono::milliseconds min_spacing,
                             OrderAuditLog* audit)
    : bus_(bus),
      broker_(broker),
      clock_(clock),
      shutdown_(shutdown),
      policy_(std::move(policy)),
      min_spacing_(min_spacing),
      audit_(audit) {
  request_sub_id_ = bus_.subscribe<OrderRequestEvent>(
      [this](const OrderRequestEvent& e) { onRequest(e); });
}

OrderExecutor::~OrderExecutor() { bus_.unsubscribe(request_sub_id_); }

void OrderExecutor::onRequest(const OrderRequestEvent& event) {
  domain::OrderOutcome outcome = execute(event.request);
  ++processed_;
  bus_.publish(OrderOutcomeEvent{std::move(outcome)});
}

bool OrderExecutor::waitForSpacing() {
  if (!last_submit_ || min_spacing_.count() <= 0) {
    return !shutdown_.cancelled();
  }
  const auto elapsed = std::chrono::steady_clock::now() - *last_submit_;
  if (elapsed >= min_spacing_) {
    return !shutdown_.cancelled();
  }
  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(min_spacing_ -
                                                            elapsed);
  return !shutdown_.wait_for(remaining);
}

// -----------------------------------------------------------------------------
// execute(): spacing, retrying submission, outcome
// -----------------------------------------------------------------------------
domain::OrderOutcome OrderExecutor::execute(
    const domain::OrderRequest& request) {
  domain::OrderOutcome outcome;
  outcome.request = request;

  if (!waitForSpacing()) {
    outcome.status = domain::OrderOutcomeStatus::Cancelled;
    outcome.last_error = "shutdown before submission";
    outcome.timestamp_ms = clock_.now_ms();
    std::cerr << "[OrderExecutor] " << request.ticker << " "
              << request.tranche_id << " cancelled before submission\n";
    if (audit_ != nullptr) {
      audit_->recordOutcome(outcome);
    }
    return outcome;
  }

  int attempt_no = 0;
  auto submit = [&]() {
    ++attempt_no;
    last_submit_ = std::chrono::steady_clock::now();
    std::cout << "[OrderExecutor] submit " << request.ticker << " tranche="
              << request.tranche_id << " " << domain::toString(request.side)
              << " " << request.quantity << " @ "
              << (request.limit_price ? std::to_string(*request.limit_price)
                                      : std::string("MARKET"))
              << " attempt " << attempt_no << "/" << policy_.max_attempts
              << " request_id=" << request.request_id << "\n";
    if (audit_ != nullptr) {
      audit_->recordSubmission(request, attempt_no, clock_.now_ms());
    }
    return broker_.placeOrder(request);
  };

  auto on_retry = [&](int attempt, ErrorClass error_class,
                      const std::exception& error,
                      std::chrono::milliseconds delay) {
    std::cerr << "[OrderExecutor] " << request.ticker << " tranche="
              << request.tranche_id << " attempt " << attempt << " failed ("
              << toString(error_class) << "): " << error.what()
              << "; retrying in " << delay.count() << " ms\n";
    if (audit_ != nullptr) {
      audit_->recordRetry(request, attempt, error.what(),
                          toString(error_class), delay, clock_.now_ms());
    }
  };

  RetryResult<domain::OrderAck> result =
      retryCall(policy_, shutdown_, submit, on_retry);

  outcome.status = outcomeFor(result.status);
  outcome.attempts = result.attempts;
  outcome.last_error = result.last_error;
  outcome.timestamp_ms = clock_.now_ms();

  if (result.status == RetryStatus::Success && result.value) {
    const domain::OrderAck& ack = *result.value;
    outcome.broker_order_id = ack.order_id;
    if (ack.filled_quantity && *ack.filled_quantity <= 0) {
      // Placed but nothing filled yet: the order rests at the broker.
      outcome.status = domain::OrderOutcomeStatus::Accepted;
      outcome.filled_quantity = 0;
    } else {
      outcome.filled_quantity = ack.filled_quantity.value_or(request.quantity);
      outcome.fill_price = ack.fill_price.value_or(bestKnownPrice(request));
    }
  } else if (result.status == RetryStatus::Duplicate) {
    outcome.filled_quantity = request.quantity;
    outcome.fill_price = bestKnownPrice(request);
  }

  if (domain::isConfirmed(outcome.status)) {
    std::cout << "[OrderExecutor] " << domain::toString(outcome.status) << " "
              << request.ticker << " tranche=" << request.tranche_id
              << " requested " << request.quantity << " filled "
              << outcome.filled_quantity << " @ " << outcome.fill_price
              << " attempts " << outcome.attempts
              << (outcome.broker_order_id.empty()
                      ? std::string()
                      : " order_id=" + outcome.broker_order_id)
              << "\n";
  } else if (outcome.status == domain::OrderOutcomeStatus::Accepted) {
    std::cout << "[OrderExecutor] Accepted " << request.ticker << " tranche="
              << request.tranche_id << " requested " << request.quantity
              << " filled 0 attempts " << outcome.attempts << " order_id="
              << outcome.broker_order_id << "\n";
  } else {
    std::cerr << "[OrderExecutor] " << domain::toString(outcome.status) << " "
              << request.ticker << " tranche=" << request.tranche_id
              << " requested " << request.quantity << " after "
              << outcome.attempts << " attempt(s) (" << toString(result.status)
              << "): " << outcome.last_error << "\n";
  }

  if (audit_ != nullptr) {
    audit_->recordOutcome(outcome);
  }

  if (domain::isConfirmed(outcome.status) &&
      request.remaining_after_fill <= 0 &&
      outcome.filled_quantity >= request.quantity) {
    cancelConditionalOrders(request.ticker);
  }
  return outcome;
}

// -----------------------------------------------------------------------------
// cancelConditionalOrders(): clear standing GTTs after a full exit
// -----------------------------------------------------------------------------
void OrderExecutor::cancelConditionalOrders(const std::string& ticker) {
  std::vector<domain::ConditionalOrder> orders;
  try {
    orders = broker_.conditionalOrders(ticker);
  } catch (const std::exception& e) {
    std::cerr << "[OrderExecutor] could not list conditional orders for "
              << ticker << ": " << e.what() << "\n";
    return;
  }

  for (const auto& order : orders) {
    if (order.status != "active") {
      continue;
    }
    try {
      broker_.cancelConditionalOrder(order.id);
      std::cout << "[OrderExecutor] cancelled conditional order " << order.id
                << " for " << ticker << "\n";
    } catch (const std::exception& e) {
      std::cerr << "[OrderExecutor] failed to cancel conditional order "
                << order.id << " for " << ticker << ": " << e.what() << "\n";
    }
  }
}

}  // namespace trailguard
