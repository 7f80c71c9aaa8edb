// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for configFromJson(), loadConfig() and parseClockTime().
// =============================================================================

#include "trailguard/config/engine_config.hpp"
#include "trailguard/errors/errors.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;
using trailguard::ConfigError;
using trailguard::configFromJson;

TEST(EngineConfigTest, DefaultsAreProductionSettings) {
  const trailguard::EngineConfig cfg = configFromJson(nlohmann::json::object());

  EXPECT_EQ(cfg.exchange, "NSE");
  EXPECT_EQ(cfg.product, "CNC");
  EXPECT_EQ(cfg.poll_interval, 5000ms);
  EXPECT_EQ(cfg.price_batch_size, 500u);
  EXPECT_EQ(cfg.reconcile_interval, 600000ms);
  EXPECT_EQ(cfg.reconcile_grace, 600000ms);
  EXPECT_EQ(cfg.retry.max_attempts, 5);
  EXPECT_EQ(cfg.market_hours.close_hour, 15);
  EXPECT_EQ(cfg.market_hours.close_minute, 30);
  EXPECT_TRUE(cfg.market_hours.enforce);
  EXPECT_TRUE(cfg.ipc_cmd_endpoint.empty());
  EXPECT_TRUE(cfg.profit_target_exits);
}

TEST(EngineConfigTest, OverridesApply) {
  const auto j = nlohmann::json::parse(R"({
    "exchange": "BSE",
    "tickers": ["INFY", "TCS"],
    "poll_interval_ms": 2000,
    "price_batch_size": 100,
    "retry": {"max_attempts": 3, "rate_limit_base_ms": 500, "factor": 2.0},
    "ipc": {"cmd_endpoint": "tcp://127.0.0.1:6000"},
    "market_hours": {"close": "16:00", "enforce": false},
    "tick_size_overrides": {"AIAENG": 0.1},
    "excluded_tickers": ["BADCO"],
    "profit_target_exits": false,
    "verbose": true
  })");
  const trailguard::EngineConfig cfg = configFromJson(j);

  EXPECT_EQ(cfg.exchange, "BSE");
  EXPECT_EQ(cfg.tickers, (std::vector<std::string>{"INFY", "TCS"}));
  EXPECT_EQ(cfg.poll_interval, 2000ms);
  EXPECT_EQ(cfg.price_batch_size, 100u);
  EXPECT_EQ(cfg.retry.max_attempts, 3);
  EXPECT_EQ(cfg.retry.rate_limited.base, 500ms);
  EXPECT_DOUBLE_EQ(cfg.retry.transient.factor, 2.0);
  EXPECT_EQ(cfg.ipc_cmd_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(cfg.market_hours.close_hour, 16);
  EXPECT_EQ(cfg.market_hours.close_minute, 0);
  EXPECT_FALSE(cfg.market_hours.enforce);
  EXPECT_DOUBLE_EQ(cfg.tick_size_overrides.at("AIAENG"), 0.1);
  EXPECT_EQ(cfg.excluded_tickers.size(), 1u);
  EXPECT_FALSE(cfg.profit_target_exits);
  EXPECT_TRUE(cfg.verbose);
}

TEST(EngineConfigTest, BadValuesRaiseConfigError) {
  EXPECT_THROW(configFromJson(nlohmann::json::array()), ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(R"({"poll_interval_ms": "x"})")),
               ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(R"({"poll_interval_ms": 0})")),
               ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(R"({"reconcile_grace_ms": -1})")),
               ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(R"({"retry": 5})")),
               ConfigError);
  EXPECT_THROW(
      configFromJson(nlohmann::json::parse(R"({"retry": {"max_attempts": 0}})")),
      ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(
                   R"({"tick_size_overrides": {"X": 0}})")),
               ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(
                   R"({"market_hours": {"close": "25:00"}})")),
               ConfigError);
  EXPECT_THROW(configFromJson(nlohmann::json::parse(
                   R"({"profit_target_exits": "no"})")),
               ConfigError);
}

TEST(EngineConfigTest, ParseClockTime) {
  int hour = 0;
  int minute = 0;
  trailguard::parseClockTime("09:15", hour, minute);
  EXPECT_EQ(hour, 9);
  EXPECT_EQ(minute, 15);

  EXPECT_THROW(trailguard::parseClockTime("0915", hour, minute), ConfigError);
  EXPECT_THROW(trailguard::parseClockTime("12:60", hour, minute), ConfigError);
}

TEST(EngineConfigTest, MissingFileRaisesConfigError) {
  EXPECT_THROW(trailguard::loadConfig("/nonexistent/trailguard.json"),
               ConfigError);
}
