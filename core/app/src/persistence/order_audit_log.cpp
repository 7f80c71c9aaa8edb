#include "trailguard/persistence/order_audit_log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <utility>

namespace trailguard {

namespace {

nlohmann::json baseRecord(const char* event,
                          const domain::OrderRequest& request,
                          std::int64_t now_ms) {
  nlohmann::json j;
  j["event"] = event;
  j["request_id"] = request.request_id;
  j["ticker"] = request.ticker;
  j["tranche"] = request.tranche_id;
  j["reason"] = domain::toString(request.reason);
  j["timestamp_ms"] = now_ms;
  return j;
}

}  // namespace

OrderAuditLog::OrderAuditLog(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  out_.open(path_, std::ios::app);
  if (!out_) {
    std::cerr << "[OrderAuditLog] cannot open " << path_
              << "; audit logging disabled.\n";
  }
}

bool OrderAuditLog::enabled() const {
  std::lock_guard lock(mutex_);
  return out_.is_open() && out_.good();
}

void OrderAuditLog::recordSubmission(const domain::OrderRequest& request,
                                     int attempt, std::int64_t now_ms) {
  nlohmann::json j = baseRecord("submit", request, now_ms);
  j["quantity"] = request.quantity;
  j["side"] = domain::toString(request.side);
  j["price"] = request.limit_price ? nlohmann::json(*request.limit_price)
                                   : nlohmann::json(nullptr);
  j["trigger_price"] = request.trigger_price;
  j["attempt"] = attempt;
  writeLine(j.dump());
}

void OrderAuditLog::recordRetry(const domain::OrderRequest& request,
                                int attempt, const std::string& error,
                                const char* error_class,
                                std::chrono::milliseconds delay,
                                std::int64_t now_ms) {
  nlohmann::json j = baseRecord("retry", request, now_ms);
  j["attempt"] = attempt;
  j["error"] = error;
  j["error_class"] = error_class;
  j["delay_ms"] = delay.count();
  writeLine(j.dump());
}

void OrderAuditLog::recordOutcome(const domain::OrderOutcome& outcome) {
  nlohmann::json j =
      baseRecord("outcome", outcome.request, outcome.timestamp_ms);
  j["status"] = domain::toString(outcome.status);
  j["requested"] = outcome.request.quantity;
  j["filled"] = outcome.filled_quantity;
  j["fill_price"] = outcome.fill_price;
  j["broker_order_id"] = outcome.broker_order_id;
  j["attempts"] = outcome.attempts;
  j["error"] = outcome.last_error;
  writeLine(j.dump());
}

void OrderAuditLog::writeLine(const std::string& line) {
  std::lock_guard lock(mutex_);
  if (!out_.is_open() || !out_.good()) {
    return;
  }
  out_ << line << '\n';
  out_.flush();
}

}  // namespace trailguard
