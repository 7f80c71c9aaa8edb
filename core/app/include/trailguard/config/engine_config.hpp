#pragma once

#include "trailguard/broker/retry_policy.hpp"
#include "trailguard/time/market_hours.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// EngineConfig - every tunable of the monitor
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Defaults are the production settings; a JSON
//         file overrides any subset and the CLI overrides the file.
//
// @details
// JSON layout (all keys optional):
//
//   {
//     "exchange": "NSE", "product": "CNC",
//     "orders_file": "", "tickers": ["INFY"],
//     "poll_interval_ms": 5000, "price_batch_size": 500,
//     "control_interval_ms": 10000, "reconcile_interval_ms": 600000,
//     "summary_interval_ms": 600000, "reconcile_grace_ms": 600000,
//     "volatility_refresh_ms": 86400000, "shutdown_timeout_ms": 5000,
//     "retry": { "max_attempts": 5, "rate_limit_base_ms": 2000,
//                "transient_base_ms": 1000, "factor": 1.5 },
//     "min_order_spacing_ms": 250,
//     "watermark_path": "state/watermarks.json",
//     "audit_log_path": "state/pending_orders.jsonl",
//     "broker": { "endpoint": "tcp://127.0.0.1:5560", "timeout_ms": 5000 },
//     "ipc": { "cmd_endpoint": "", "pub_endpoint": "" },
//     "market_hours": { "close": "15:30", "utc_offset_minutes": 330,
//                       "weekdays_only": true, "enforce": true },
//     "tick_size_overrides": { "AIAENG": 0.10 },
//     "excluded_tickers": ["XYZ"],
//     "profit_target_exits": true,
//     "simulate": false, "verbose": false
//   }
//
// A key of the wrong JSON type, or a value out of range, raises ConfigError
// naming the key.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string exchange{"NSE"};
  std::string product{"CNC"};

  std::string orders_file;
  std::vector<std::string> tickers;  // empty = track everything

  std::chrono::milliseconds poll_interval{5000};
  std::size_t price_batch_size{500};
  std::chrono::milliseconds control_interval{10000};
  std::chrono::milliseconds reconcile_interval{600000};
  std::chrono::milliseconds summary_interval{600000};
  std::chrono::milliseconds reconcile_grace{600000};
  std::chrono::milliseconds volatility_refresh{86400000};
  std::chrono::milliseconds shutdown_timeout{5000};

  RetryPolicy retry;
  std::chrono::milliseconds min_order_spacing{250};

  std::string watermark_path{"state/watermarks.json"};
  std::string audit_log_path{"state/pending_orders.jsonl"};

  std::string broker_endpoint{"tcp://127.0.0.1:5560"};
  std::chrono::milliseconds broker_timeout{5000};

  // Empty endpoints disable the IPC server.
  std::string ipc_cmd_endpoint;
  std::string ipc_pub_endpoint;

  MarketHours market_hours;

  std::unordered_map<std::string, double> tick_size_overrides;
  std::vector<std::string> excluded_tickers;

  // false: no profit-target tranches; a stop hit exits the whole position.
  bool profit_target_exits{true};

  bool simulate{false};
  bool verbose{false};
};

// Reads and parses a config file. Throws ConfigError if the file cannot be
// opened, is not valid JSON, or has a bad key.
EngineConfig loadConfig(const std::string& path);

// Applies the keys present in `j` on top of `base`.
EngineConfig configFromJson(const nlohmann::json& j,
                            EngineConfig base = EngineConfig());

// Parses "HH:MM" into hour and minute. Throws ConfigError.
void parseClockTime(const std::string& text, int& hour, int& minute);

}  // namespace trailguard
