#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace trailguard {
namespace domain {

enum class OrderSide { Buy, Sell };

inline const char* toString(OrderSide s) {
  return s == OrderSide::Buy ? "BUY" : "SELL";
}

enum class ExitReason { StopLoss, ProfitTarget };

inline const char* toString(ExitReason r) {
  return r == ExitReason::StopLoss ? "StopLoss" : "ProfitTarget";
}

// -----------------------------------------------------------------------------
// OrderRequest - one exit order, created on the risk loop
// -----------------------------------------------------------------------------
//
// @brief  Immutable instruction handed to the OrderExecutor.
//
// @details
// side is always the opposite of the position side. limit_price is empty for
// market orders (profit targets); stop-loss exits carry a limit price set
// half a percent through the stop and rounded to the instrument tick.
// remaining_after_fill is the quantity the position will hold if the order
// fills completely.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::uint64_t request_id{0};
  std::string ticker;
  std::string exchange{"NSE"};
  std::string product{"CNC"};
  std::int64_t quantity{0};
  OrderSide side{OrderSide::Sell};
  std::optional<double> limit_price;
  ExitReason reason{ExitReason::StopLoss};
  std::string reason_text;
  std::string tranche_id;
  double trigger_price{0.0};
  std::int64_t timestamp_ms{0};
  std::int64_t remaining_after_fill{0};
};

// Broker acknowledgement of a placed order. filled_quantity is empty when the
// broker does not report fills synchronously.
struct OrderAck {
  std::string order_id;
  std::optional<std::int64_t> filled_quantity;
  std::optional<double> fill_price;
};

// Accepted: the broker took the order but reported zero shares filled. The
// order is resting at the broker, so the exit is neither done nor failed.
enum class OrderOutcomeStatus { Filled, Duplicate, Accepted, Failed, Cancelled };

inline const char* toString(OrderOutcomeStatus s) {
  switch (s) {
    case OrderOutcomeStatus::Filled:    return "Filled";
    case OrderOutcomeStatus::Duplicate: return "Duplicate";
    case OrderOutcomeStatus::Accepted:  return "Accepted";
    case OrderOutcomeStatus::Failed:    return "Failed";
    case OrderOutcomeStatus::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

// Filled and Duplicate both mean the exit happened at the broker.
inline bool isConfirmed(OrderOutcomeStatus s) {
  return s == OrderOutcomeStatus::Filled || s == OrderOutcomeStatus::Duplicate;
}

// -----------------------------------------------------------------------------
// OrderOutcome - final result of one OrderRequest
// -----------------------------------------------------------------------------
struct OrderOutcome {
  OrderRequest request;
  OrderOutcomeStatus status{OrderOutcomeStatus::Failed};
  std::int64_t filled_quantity{0};
  double fill_price{0.0};
  std::string broker_order_id;
  int attempts{0};
  std::string last_error;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace trailguard
