#pragma once

#include "trailguard/domain/order_request.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace trailguard {

// -----------------------------------------------------------------------------
// OrderAuditLog - append-only JSON-lines record of exit orders
// -----------------------------------------------------------------------------
//
// @brief  One line per submission, retry and final outcome, so every exit
//         the monitor attempted can be reconstructed after the fact.
//
// @details
// Line shapes (all carry "event", "ticker", "tranche", "request_id",
// "timestamp_ms"):
//   submit   quantity, side, price (null for market), attempt
//   retry    attempt, error, error_class, delay_ms
//   outcome  status, requested, filled, fill_price, attempts, error
//
// An empty path disables the log. A file that cannot be opened is reported
// once on std::cerr and the log stays disabled.
//
// Thread model: all methods lock mutex_. Written from the order routing
// loop.
// -----------------------------------------------------------------------------
class OrderAuditLog {
 public:
  explicit OrderAuditLog(std::string path = "");

  OrderAuditLog(const OrderAuditLog&) = delete;
  OrderAuditLog& operator=(const OrderAuditLog&) = delete;

  void recordSubmission(const domain::OrderRequest& request, int attempt,
                        std::int64_t now_ms);

  void recordRetry(const domain::OrderRequest& request, int attempt,
                   const std::string& error, const char* error_class,
                   std::chrono::milliseconds delay, std::int64_t now_ms);

  void recordOutcome(const domain::OrderOutcome& outcome);

  bool enabled() const;

 private:
  void writeLine(const std::string& line);

  std::string path_;
  mutable std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace trailguard
