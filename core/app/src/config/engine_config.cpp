#include "trailguard/config/engine_config.hpp"
#include "trailguard/errors/errors.hpp"

#include <fstream>
#include <utility>
#include <sstream>

namespace trailguard {

namespace {

// Copies j[key] into out when present. Type mismatches become ConfigError.
template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& out,
             const std::string& prefix = "") {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("config key '" + prefix + key + "': " + e.what());
  }
}

void readMillis(const nlohmann::json& j, const char* key,
                std::chrono::milliseconds& out,
                const std::string& prefix = "") {
  std::int64_t ms = out.count();
  readKey(j, key, ms, prefix);
  if (ms < 0) {
    throw ConfigError("config key '" + prefix + key + "' must be >= 0");
  }
  out = std::chrono::milliseconds(ms);
}

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config key '") + key +
                      "' must be an object");
  }
  return &*it;
}

}  // namespace

void parseClockTime(const std::string& text, int& hour, int& minute) {
  int h = -1;
  int m = -1;
  char sep = 0;
  std::istringstream in(text);
  in >> h >> sep >> m;
  if (in.fail() || sep != ':' || h < 0 || h > 23 || m < 0 || m > 59) {
    throw ConfigError("invalid clock time '" + text + "', expected HH:MM");
  }
  hour = h;
  minute = m;
}

// -----------------------------------------------------------------------------
// configFromJson()
// -----------------------------------------------------------------------------
EngineConfig configFromJson(const nlohmann::json& j, EngineConfig base) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }
  EngineConfig cfg = std::move(base);

  readKey(j, "exchange", cfg.exchange);
  readKey(j, "product", cfg.product);
  readKey(j, "orders_file", cfg.orders_file);
  readKey(j, "tickers", cfg.tickers);

  readMillis(j, "poll_interval_ms", cfg.poll_interval);
  readKey(j, "price_batch_size", cfg.price_batch_size);
  readMillis(j, "control_interval_ms", cfg.control_interval);
  readMillis(j, "reconcile_interval_ms", cfg.reconcile_interval);
  readMillis(j, "summary_interval_ms", cfg.summary_interval);
  readMillis(j, "reconcile_grace_ms", cfg.reconcile_grace);
  readMillis(j, "volatility_refresh_ms", cfg.volatility_refresh);
  readMillis(j, "shutdown_timeout_ms", cfg.shutdown_timeout);
  readMillis(j, "min_order_spacing_ms", cfg.min_order_spacing);

  if (const auto* retry = section(j, "retry")) {
    readKey(*retry, "max_attempts", cfg.retry.max_attempts, "retry.");
    readMillis(*retry, "rate_limit_base_ms", cfg.retry.rate_limited.base,
               "retry.");
    readMillis(*retry, "transient_base_ms", cfg.retry.transient.base,
               "retry.");
    double factor = cfg.retry.transient.factor;
    readKey(*retry, "factor", factor, "retry.");
    cfg.retry.rate_limited.factor = factor;
    cfg.retry.transient.factor = factor;
  }

  readKey(j, "watermark_path", cfg.watermark_path);
  readKey(j, "audit_log_path", cfg.audit_log_path);

  if (const auto* broker = section(j, "broker")) {
    readKey(*broker, "endpoint", cfg.broker_endpoint, "broker.");
    readMillis(*broker, "timeout_ms", cfg.broker_timeout, "broker.");
  }

  if (const auto* ipc = section(j, "ipc")) {
    readKey(*ipc, "cmd_endpoint", cfg.ipc_cmd_endpoint, "ipc.");
    readKey(*ipc, "pub_endpoint", cfg.ipc_pub_endpoint, "ipc.");
  }

  if (const auto* hours = section(j, "market_hours")) {
    std::string close;
    readKey(*hours, "close", close, "market_hours.");
    if (!close.empty()) {
      parseClockTime(close, cfg.market_hours.close_hour,
                     cfg.market_hours.close_minute);
    }
    std::string open;
    readKey(*hours, "open", open, "market_hours.");
    if (!open.empty()) {
      parseClockTime(open, cfg.market_hours.open_hour,
                     cfg.market_hours.open_minute);
    }
    readKey(*hours, "utc_offset_minutes", cfg.market_hours.utc_offset_minutes,
            "market_hours.");
    readKey(*hours, "weekdays_only", cfg.market_hours.weekdays_only,
            "market_hours.");
    readKey(*hours, "enforce", cfg.market_hours.enforce, "market_hours.");
  }

  readKey(j, "tick_size_overrides", cfg.tick_size_overrides);
  readKey(j, "excluded_tickers", cfg.excluded_tickers);
  readKey(j, "profit_target_exits", cfg.profit_target_exits);
  readKey(j, "simulate", cfg.simulate);
  readKey(j, "verbose", cfg.verbose);

  if (cfg.retry.max_attempts < 1) {
    throw ConfigError("config key 'retry.max_attempts' must be >= 1");
  }
  if (cfg.price_batch_size == 0) {
    throw ConfigError("config key 'price_batch_size' must be > 0");
  }
  if (cfg.poll_interval.count() == 0) {
    throw ConfigError("config key 'poll_interval_ms' must be > 0");
  }
  for (const auto& [ticker, tick] : cfg.tick_size_overrides) {
    if (!(tick > 0.0)) {
      throw ConfigError("tick size override for " + ticker + " must be > 0");
    }
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }
  return configFromJson(j);
}

}  // namespace trailguard
