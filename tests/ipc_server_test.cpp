// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for the telemetry messages IpcServer publishes.
//
// Only the JSON formatting is covered here; socket round trips need free
// ports and are left to manual runs against a live subscriber.
// =============================================================================

#include "trailguard/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

using trailguard::IpcServer;

TEST(IpcServerTelemetryTest, StopUpdate) {
  trailguard::StopUpdateEvent e;
  e.ticker = "INFY";
  e.side = trailguard::domain::PositionSide::Long;
  e.previous_stop = 85.0;
  e.stop = 95.0;
  e.extreme = 110.0;
  e.price = 110.0;
  e.timestamp_ms = 7;

  auto text = IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());
  const auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j.at("type"), "stop_update");
  EXPECT_EQ(j.at("ticker"), "INFY");
  EXPECT_EQ(j.at("side"), "LONG");
  EXPECT_DOUBLE_EQ(j.at("stop").get<double>(), 95.0);
  EXPECT_EQ(j.at("timestamp_ms").get<std::int64_t>(), 7);
}

TEST(IpcServerTelemetryTest, OrderRequestAndOutcome) {
  trailguard::domain::OrderRequest r;
  r.request_id = 3;
  r.ticker = "INFY";
  r.quantity = 30;
  r.reason = trailguard::domain::ExitReason::ProfitTarget;
  r.tranche_id = trailguard::domain::kProfitTarget1Tranche;

  auto request_text = IpcServer::formatTelemetry(trailguard::OrderRequestEvent{r});
  ASSERT_TRUE(request_text.has_value());
  const auto request_json = nlohmann::json::parse(*request_text);
  EXPECT_EQ(request_json.at("type"), "order_request");
  EXPECT_TRUE(request_json.at("limit_price").is_null());
  EXPECT_EQ(request_json.at("reason"), "ProfitTarget");
  EXPECT_EQ(request_json.at("tranche"), "profit_target_1");

  trailguard::domain::OrderOutcome o;
  o.request = r;
  o.status = trailguard::domain::OrderOutcomeStatus::Duplicate;
  o.filled_quantity = 30;
  o.attempts = 2;

  auto outcome_text =
      IpcServer::formatTelemetry(trailguard::OrderOutcomeEvent{o});
  ASSERT_TRUE(outcome_text.has_value());
  const auto outcome_json = nlohmann::json::parse(*outcome_text);
  EXPECT_EQ(outcome_json.at("type"), "order_outcome");
  EXPECT_EQ(outcome_json.at("status"), "Duplicate");
  EXPECT_EQ(outcome_json.at("request").at("request_id").get<std::uint64_t>(),
            3u);
  EXPECT_EQ(outcome_json.at("attempts").get<int>(), 2);
}

TEST(IpcServerTelemetryTest, InputEventsAreNotPublished) {
  EXPECT_FALSE(IpcServer::formatTelemetry(
                   trailguard::PriceObservationEvent{"INFY", 1.0, 1})
                   .has_value());
  EXPECT_FALSE(
      IpcServer::formatTelemetry(trailguard::ReconcileEvent{}).has_value());
}
