// =============================================================================
// position_monitor_test.cpp
// =============================================================================
// Unit tests for trailguard::PositionMonitor driven through a single EventBus.
//
// Validates:
//   - A volatility update installs the stop and the tranche preset
//   - ATR 10 x 1.5: 110 raises the stop to 95 (StopUpdateEvent), 96 holds,
//     94 raises one stop-loss exit of 40 shares
//   - While the exit is in flight no further request is raised, but the
//     stop still ratchets on new highs
//   - An order accepted with nothing filled keeps the shares and the gate
//     until a reconcile settles it
//   - The outcome releases the gate, and the spent tranche stays spent
//   - A reconcile starts tracking new holdings and drops missing ones
//
// Everything runs on the test thread; the bus is synchronous.
// =============================================================================

#include "trailguard/concurrent/request_id_generator.hpp"
#include "trailguard/eventbus/event_bus.hpp"
#include "trailguard/risk/exit_decision_engine.hpp"
#include "trailguard/risk/position_ledger.hpp"
#include "trailguard/risk/position_monitor.hpp"
#include "trailguard/risk/trailing_stop_tracker.hpp"
#include "trailguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

using namespace trailguard;

constexpr std::int64_t kT0 = 1'700'000'000'000;

class PositionMonitorTest : public ::testing::Test {
 protected:
  PositionMonitorTest() : clock(kT0), ledger(60'000) {
    domain::BrokerHolding h;
    h.ticker = "INFY";
    h.quantity = 100;
    h.average_price = 100.0;
    ledger.upsertFromBroker({h}, kT0);

    monitor = std::make_unique<PositionMonitor>(bus, ledger, tracker,
                                                decisions, ids, clock);

    bus.subscribe<StopUpdateEvent>(
        [this](const StopUpdateEvent& e) { stops.push_back(e); });
    bus.subscribe<OrderRequestEvent>(
        [this](const OrderRequestEvent& e) { requests.push_back(e.request); });
  }

  void volatility() {
    VolatilityUpdateEvent e;
    e.ticker = "INFY";
    e.info.atr = 10.0;
    e.info.atr_percent = 3.0;
    e.info.category = domain::VolatilityCategory::Medium;
    e.info.stop_multiplier = 1.5;
    e.info.daily_high = 100.0;
    e.info.computed_at_ms = kT0;
    e.tick_size = 0.10;
    bus.publish(e);
  }

  void price(double value) {
    clock.advance_by(1000);
    bus.publish(PriceObservationEvent{"INFY", value, clock.now_ms()});
  }

  void fill(const domain::OrderRequest& request) {
    domain::OrderOutcome outcome;
    outcome.request = request;
    outcome.status = domain::OrderOutcomeStatus::Filled;
    outcome.filled_quantity = request.quantity;
    outcome.fill_price = *request.limit_price;
    outcome.attempts = 1;
    bus.publish(OrderOutcomeEvent{outcome});
  }

  EventBus bus;
  SimulationTimeProvider clock;
  PositionLedger ledger;
  TrailingStopTracker tracker;
  ExitDecisionEngine decisions;
  RequestIdGenerator ids;
  std::unique_ptr<PositionMonitor> monitor;

  std::vector<StopUpdateEvent> stops;
  std::vector<domain::OrderRequest> requests;
};

}  // namespace

TEST_F(PositionMonitorTest, VolatilityInstallsStopAndPreset) {
  volatility();

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  ASSERT_TRUE(pos->volatility.has_value());
  EXPECT_DOUBLE_EQ(pos->trailing_stop, 85.0);
  EXPECT_DOUBLE_EQ(pos->volatility->computed_stop_price, 85.0);
  EXPECT_DOUBLE_EQ(pos->tick_size, 0.10);
  EXPECT_EQ(pos->exit_tranches.size(), 3u);
  EXPECT_DOUBLE_EQ(pos->exit_tranches.at(domain::kStopLossTranche)
                       .percent_of_original,
                   40.0);
}

TEST_F(PositionMonitorTest, PriceWithoutVolatilityRaisesNothing) {
  price(50.0);
  EXPECT_TRUE(requests.empty());
  EXPECT_DOUBLE_EQ(ledger.get("INFY")->last_price, 50.0);
}

TEST_F(PositionMonitorTest, StopBreachRaisesOneExitAndGatesTheTicker) {
  volatility();
  stops.clear();

  price(110.0);
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_DOUBLE_EQ(stops[0].previous_stop, 85.0);
  EXPECT_DOUBLE_EQ(stops[0].stop, 95.0);

  price(105.0);
  price(96.0);
  EXPECT_TRUE(requests.empty());
  EXPECT_EQ(stops.size(), 1u);

  price(94.0);
  ASSERT_EQ(requests.size(), 1u);
  const domain::OrderRequest& r = requests[0];
  EXPECT_EQ(r.tranche_id, domain::kStopLossTranche);
  EXPECT_EQ(r.quantity, 40);
  EXPECT_EQ(r.side, domain::OrderSide::Sell);
  EXPECT_DOUBLE_EQ(*r.limit_price, 94.5);
  EXPECT_NE(r.request_id, 0u);
  EXPECT_EQ(monitor->requestsRaised(), 1u);

  auto pos = ledger.get("INFY");
  EXPECT_TRUE(pos->has_pending_order);
  EXPECT_EQ(pos->pending_request_id, r.request_id);

  // In flight: further breaches are ignored.
  price(90.0);
  price(80.0);
  EXPECT_EQ(requests.size(), 1u);
}

TEST_F(PositionMonitorTest, OutcomeReleasesGateAndTrancheStaysSpent) {
  volatility();
  price(110.0);
  price(94.0);
  ASSERT_EQ(requests.size(), 1u);

  fill(requests[0]);

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 60);
  EXPECT_FALSE(pos->has_pending_order);
  EXPECT_TRUE(pos->exit_tranches.at(domain::kStopLossTranche).triggered);

  // Below the stop again: the stop-loss tranche does not fire twice.
  price(93.0);
  EXPECT_EQ(requests.size(), 1u);

  // Delivering the same outcome again changes nothing.
  fill(requests[0]);
  EXPECT_EQ(ledger.get("INFY")->quantity, 60);
}

TEST_F(PositionMonitorTest, FailedOutcomeMakesTickerEligibleAgain) {
  volatility();
  price(110.0);
  price(94.0);
  ASSERT_EQ(requests.size(), 1u);

  domain::OrderOutcome failed;
  failed.request = requests[0];
  failed.status = domain::OrderOutcomeStatus::Failed;
  failed.attempts = 5;
  failed.last_error = "Too many requests";
  bus.publish(OrderOutcomeEvent{failed});

  EXPECT_FALSE(ledger.get("INFY")->has_pending_order);
  EXPECT_EQ(ledger.get("INFY")->quantity, 100);

  price(93.0);
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[1].tranche_id, domain::kStopLossTranche);
  EXPECT_NE(requests[1].request_id, requests[0].request_id);
}

TEST_F(PositionMonitorTest, ReconcileTracksNewAndDropsMissing) {
  domain::BrokerHolding tcs;
  tcs.ticker = "TCS";
  tcs.quantity = 5;
  tcs.average_price = 3500.0;

  clock.advance_by(1000);
  bus.publish(ReconcileEvent{{tcs}, clock.now_ms()});

  EXPECT_TRUE(ledger.contains("TCS"));
  EXPECT_FALSE(ledger.contains("INFY"));
  EXPECT_TRUE(tracker.state("TCS").has_value());
  EXPECT_FALSE(tracker.state("INFY").has_value());
}

TEST_F(PositionMonitorTest, StopKeepsRatchetingWhileExitInFlight) {
  volatility();
  price(110.0);
  price(94.0);
  ASSERT_EQ(requests.size(), 1u);
  stops.clear();

  // New high during the retry window.
  price(130.0);
  EXPECT_EQ(requests.size(), 1u);
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_DOUBLE_EQ(stops[0].previous_stop, 95.0);
  EXPECT_DOUBLE_EQ(stops[0].stop, 115.0);
  EXPECT_DOUBLE_EQ(ledger.get("INFY")->trailing_stop, 115.0);
  EXPECT_DOUBLE_EQ(*tracker.stopFor("INFY"), 115.0);

  domain::OrderOutcome failed;
  failed.request = requests[0];
  failed.status = domain::OrderOutcomeStatus::Failed;
  bus.publish(OrderOutcomeEvent{failed});

  // The retried stop-loss uses the raised stop.
  price(114.0);
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[1].tranche_id, domain::kStopLossTranche);
  // 115 * 0.995 = 114.425 -> 114.4
  EXPECT_DOUBLE_EQ(*requests[1].limit_price, 114.4);
}

TEST_F(PositionMonitorTest, ZeroFillKeepsSharesUntilReconcileSettles) {
  volatility();
  price(110.0);
  price(94.0);
  ASSERT_EQ(requests.size(), 1u);

  domain::OrderOutcome accepted;
  accepted.request = requests[0];
  accepted.status = domain::OrderOutcomeStatus::Accepted;
  accepted.filled_quantity = 0;
  accepted.broker_order_id = "X1";
  bus.publish(OrderOutcomeEvent{accepted});

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 100);
  EXPECT_TRUE(pos->has_pending_order);
  EXPECT_FALSE(pos->exit_tranches.at(domain::kStopLossTranche).triggered);
  EXPECT_TRUE(tracker.state("INFY").has_value());

  price(93.0);
  EXPECT_EQ(requests.size(), 1u);

  // After the grace window the broker shows 40 shares gone.
  domain::BrokerHolding infy;
  infy.ticker = "INFY";
  infy.quantity = 60;
  infy.average_price = 100.0;
  clock.advance_by(60'000);
  bus.publish(ReconcileEvent{{infy}, clock.now_ms()});

  pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 60);
  EXPECT_FALSE(pos->has_pending_order);
  EXPECT_TRUE(pos->exit_tranches.at(domain::kStopLossTranche).triggered);
}
