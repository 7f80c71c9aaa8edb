// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for trailguard::PositionLedger.
//
// Validates:
//   - Reconciliation adds, resizes and drops positions
//   - A position with an exit in flight, or filled within the grace window,
//     is kept when the broker no longer lists it
//   - A closed ticker is not re-added while the broker still reports it
//   - An outcome is applied once, and only when it matches the pending id
//   - A partial fill removes only the filled shares, and the last tranche
//     later sells what is really left
//   - An order accepted with nothing filled changes nothing until
//     reconciliation settles it from the broker holdings
//   - Excluded tickers are never tracked
// =============================================================================

#include "trailguard/risk/exclusion_policy.hpp"
#include "trailguard/risk/exit_decision_engine.hpp"
#include "trailguard/risk/position_ledger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace {

using trailguard::PositionLedger;
using namespace trailguard::domain;

constexpr std::int64_t kGrace = 600'000;
constexpr std::int64_t kT0 = 1'700'000'000'000;

BrokerHolding holding(const std::string& ticker, std::int64_t qty,
                      double avg = 100.0) {
  BrokerHolding h;
  h.ticker = ticker;
  h.quantity = qty;
  h.average_price = avg;
  return h;
}

bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

// Marks `ticker` as having a pending exit of `quantity` and returns the
// matching outcome, a full fill.
OrderOutcome pendingExit(PositionLedger& ledger, const std::string& ticker,
                         std::uint64_t request_id, std::int64_t quantity,
                         double fill_price, std::int64_t now_ms,
                         const std::string& tranche_id = kStopLossTranche) {
  ledger.update(ticker, [&](Position& pos) {
    pos.has_pending_order = true;
    pos.pending_request_id = request_id;
    pos.pending_since_ms = now_ms;
    pos.pending_tranche_id = tranche_id;
  });

  OrderOutcome outcome;
  outcome.request.request_id = request_id;
  outcome.request.ticker = ticker;
  outcome.request.quantity = quantity;
  outcome.request.tranche_id = tranche_id;
  outcome.status = OrderOutcomeStatus::Filled;
  outcome.filled_quantity = quantity;
  outcome.fill_price = fill_price;
  return outcome;
}

// INFY 100 @ 100 with the Medium preset (40 / 30 / 30).
void trackMedium(PositionLedger& ledger) {
  ledger.upsertFromBroker({holding("INFY", 100)}, kT0);
  ledger.update("INFY", [](Position& pos) {
    pos.exit_tranches =
        trailguard::ExitDecisionEngine::presetFor(VolatilityCategory::Medium);
  });
}

}  // namespace

TEST(PositionLedgerTest, ReconcileAddsResizesAndDrops) {
  PositionLedger ledger(kGrace);

  auto first = ledger.upsertFromBroker({holding("INFY", 10), holding("TCS", 5)},
                                       kT0);
  EXPECT_EQ(first.added.size(), 2u);
  EXPECT_EQ(ledger.size(), 2u);
  EXPECT_EQ(ledger.tickers(), (std::vector<std::string>{"INFY", "TCS"}));

  auto second = ledger.upsertFromBroker({holding("INFY", 15)}, kT0 + 1000);
  EXPECT_TRUE(has(second.resized, "INFY"));
  EXPECT_TRUE(has(second.removed, "TCS"));
  EXPECT_FALSE(ledger.contains("TCS"));

  const auto infy = ledger.get("INFY");
  ASSERT_TRUE(infy.has_value());
  EXPECT_EQ(infy->quantity, 15);
  EXPECT_EQ(infy->original_quantity, 15);
}

TEST(PositionLedgerTest, InvalidHoldingsAreSkipped) {
  PositionLedger ledger(kGrace);
  auto report = ledger.upsertFromBroker({holding("", 10), holding("ZERO", 0)},
                                        kT0);
  EXPECT_TRUE(report.added.empty());
  EXPECT_EQ(ledger.size(), 0u);
}

TEST(PositionLedgerTest, PendingExitKeepsPositionAbsentAtBroker) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  pendingExit(ledger, "INFY", 7, 4, 95.0, kT0);

  // Way past the grace window, but the order is still in flight.
  auto report = ledger.upsertFromBroker({}, kT0 + 10 * kGrace);
  EXPECT_TRUE(has(report.kept_in_grace, "INFY"));
  EXPECT_TRUE(ledger.contains("INFY"));
}

TEST(PositionLedgerTest, RecentFillKeepsPositionForGraceWindow) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  auto outcome = pendingExit(ledger, "INFY", 7, 4, 95.0, kT0);
  ASSERT_TRUE(ledger.applyOutcome(outcome, kT0 + 1000).has_value());

  // Broker briefly omits the ticker right after the fill.
  ledger.upsertFromBroker({}, kT0 + 2000);
  EXPECT_TRUE(ledger.contains("INFY"));

  // And the stale broker quantity does not undo the fill.
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0 + 3000);
  EXPECT_EQ(ledger.get("INFY")->quantity, 6);

  // Outside the window the broker view wins again.
  ledger.upsertFromBroker({}, kT0 + 1000 + kGrace);
  EXPECT_FALSE(ledger.contains("INFY"));
}

TEST(PositionLedgerTest, OrdersFilePositionHasGraceOnFirstReconcile) {
  PositionLedger ledger(kGrace);
  BrokerHolding h = holding("NEWCO", 20);
  h.source = PositionSource::OrdersFile;
  ledger.upsertFromBroker({h}, kT0);

  // Fresh order not yet visible in broker holdings.
  ledger.upsertFromBroker({}, kT0 + 60'000);
  EXPECT_TRUE(ledger.contains("NEWCO"));

  ledger.upsertFromBroker({}, kT0 + kGrace);
  EXPECT_FALSE(ledger.contains("NEWCO"));
}

TEST(PositionLedgerTest, ClosedTickerIsNotReaddedWithinGrace) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  auto outcome = pendingExit(ledger, "INFY", 3, 10, 110.0, kT0);

  auto applied = ledger.applyOutcome(outcome, kT0 + 500);
  ASSERT_TRUE(applied.has_value());
  EXPECT_TRUE(applied->closed);
  EXPECT_FALSE(ledger.contains("INFY"));
  EXPECT_TRUE(ledger.recentlyClosed("INFY", kT0 + 1000));

  // Broker still lists the sold shares for a while.
  auto report = ledger.upsertFromBroker({holding("INFY", 10)}, kT0 + 1000);
  EXPECT_TRUE(report.added.empty());
  EXPECT_FALSE(ledger.contains("INFY"));

  // A genuine new holding after the window is tracked again.
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0 + 500 + kGrace);
  EXPECT_TRUE(ledger.contains("INFY"));
}

TEST(PositionLedgerTest, OutcomeAppliesOnceAndComputesPnl) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 100)}, kT0);
  ledger.update("INFY", [](Position& pos) {
    pos.exit_tranches =
        trailguard::ExitDecisionEngine::presetFor(VolatilityCategory::Medium);
  });
  auto outcome = pendingExit(ledger, "INFY", 11, 40, 94.5, kT0);

  auto applied = ledger.applyOutcome(outcome, kT0 + 10);
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(applied->filled_quantity, 40);
  EXPECT_DOUBLE_EQ(applied->realized_pnl, (94.5 - 100.0) * 40);
  EXPECT_FALSE(applied->closed);

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 60);
  EXPECT_FALSE(pos->has_pending_order);
  EXPECT_TRUE(pos->exit_tranches.at(kStopLossTranche).triggered);
  EXPECT_EQ(pos->last_fill_ms, kT0 + 10);

  // The same outcome delivered twice must not decrement again.
  EXPECT_FALSE(ledger.applyOutcome(outcome, kT0 + 20).has_value());
  EXPECT_EQ(ledger.get("INFY")->quantity, 60);
}

TEST(PositionLedgerTest, OutcomeForOtherRequestIsIgnored) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  auto outcome = pendingExit(ledger, "INFY", 5, 4, 95.0, kT0);
  outcome.request.request_id = 6;

  EXPECT_FALSE(ledger.applyOutcome(outcome, kT0 + 1).has_value());
  EXPECT_TRUE(ledger.get("INFY")->has_pending_order);
}

TEST(PositionLedgerTest, FailedOutcomeOnlyClearsGate) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  auto outcome = pendingExit(ledger, "INFY", 5, 4, 95.0, kT0);
  outcome.status = OrderOutcomeStatus::Failed;

  auto applied = ledger.applyOutcome(outcome, kT0 + 1);
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(applied->filled_quantity, 0);

  auto pos = ledger.get("INFY");
  EXPECT_EQ(pos->quantity, 10);
  EXPECT_FALSE(pos->has_pending_order);
  EXPECT_EQ(pos->last_fill_ms, 0);
}

TEST(PositionLedgerTest, ExcludedTickersAreNeverTracked) {
  trailguard::StaticExclusionPolicy exclusions(std::vector<std::string>{"BADCO"});
  PositionLedger ledger(kGrace, &exclusions);

  ledger.upsertFromBroker({holding("BADCO", 10), holding("INFY", 1)}, kT0);
  EXPECT_FALSE(ledger.contains("BADCO"));
  EXPECT_TRUE(ledger.contains("INFY"));
}

TEST(PositionLedgerTest, UpdateRollsBackInvalidMutation) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);

  EXPECT_THROW(ledger.update("INFY", [](Position& pos) { pos.quantity = 50; }),
               std::invalid_argument);
  EXPECT_EQ(ledger.get("INFY")->quantity, 10);
  EXPECT_FALSE(ledger.update("MISSING", [](Position&) {}));
}

TEST(PositionLedgerTest, PartialFillDecrementsOnlyFilledShares) {
  PositionLedger ledger(kGrace);
  trackMedium(ledger);

  auto stop = pendingExit(ledger, "INFY", 21, 40, 94.5, kT0);
  stop.filled_quantity = 25;
  auto applied = ledger.applyOutcome(stop, kT0 + 10);
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(applied->filled_quantity, 25);
  EXPECT_DOUBLE_EQ(applied->realized_pnl, (94.5 - 100.0) * 25);
  EXPECT_FALSE(applied->closed);

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 75);
  EXPECT_EQ(pos->original_quantity, 100);
  EXPECT_TRUE(pos->exit_tranches.at(kStopLossTranche).triggered);
  EXPECT_FALSE(pos->has_pending_order);

  auto target1 = pendingExit(ledger, "INFY", 22, 30, 130.0, kT0 + 20,
                             kProfitTarget1Tranche);
  ASSERT_TRUE(ledger.applyOutcome(target1, kT0 + 30).has_value());
  pos = ledger.get("INFY");
  EXPECT_EQ(pos->quantity, 45);

  // The last tranche sells the 45 really held, not its nominal 30.
  EXPECT_EQ(trailguard::ExitDecisionEngine::trancheQuantity(
                *pos, kProfitTarget2Tranche),
            45);
}

TEST(PositionLedgerTest, AcceptedWithoutFillKeepsPositionAndGate) {
  PositionLedger ledger(kGrace);
  trackMedium(ledger);

  // Broker acknowledged the order with zero shares filled.
  auto zero_fill = pendingExit(ledger, "INFY", 31, 40, 94.5, kT0);
  zero_fill.filled_quantity = 0;
  auto applied = ledger.applyOutcome(zero_fill, kT0 + 10);
  ASSERT_TRUE(applied.has_value());
  EXPECT_TRUE(applied->resting);
  EXPECT_FALSE(applied->closed);
  EXPECT_EQ(applied->filled_quantity, 0);

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 100);
  EXPECT_FALSE(pos->exit_tranches.at(kStopLossTranche).triggered);
  EXPECT_TRUE(pos->has_pending_order);
  EXPECT_TRUE(pos->pending_order_resting);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, 0.0);
  EXPECT_FALSE(ledger.recentlyClosed("INFY", kT0 + 20));

  // The explicit Accepted status behaves the same way.
  PositionLedger other(kGrace);
  trackMedium(other);
  auto accepted = pendingExit(other, "INFY", 32, 40, 94.5, kT0);
  accepted.status = OrderOutcomeStatus::Accepted;
  accepted.filled_quantity = 0;
  ASSERT_TRUE(other.applyOutcome(accepted, kT0 + 10)->resting);
  EXPECT_EQ(other.get("INFY")->quantity, 100);
}

TEST(PositionLedgerTest, RestingExitSettlesFromHoldingsAfterGrace) {
  PositionLedger ledger(kGrace);
  trackMedium(ledger);
  auto zero_fill = pendingExit(ledger, "INFY", 41, 40, 94.5, kT0);
  zero_fill.filled_quantity = 0;
  ledger.applyOutcome(zero_fill, kT0 + 10);

  // Inside the window nothing is settled, whatever the broker shows.
  auto early = ledger.upsertFromBroker({holding("INFY", 60)}, kT0 + 1000);
  EXPECT_TRUE(early.settled.empty());
  EXPECT_EQ(ledger.get("INFY")->quantity, 100);

  // The resting order has since filled 40 at the broker.
  auto late = ledger.upsertFromBroker({holding("INFY", 60)}, kT0 + kGrace);
  ASSERT_EQ(late.settled.size(), 1u);
  EXPECT_EQ(late.settled[0].first, "INFY");
  EXPECT_EQ(late.settled[0].second, 40);

  auto pos = ledger.get("INFY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 60);
  EXPECT_TRUE(pos->exit_tranches.at(kStopLossTranche).triggered);
  EXPECT_FALSE(pos->has_pending_order);
  EXPECT_FALSE(pos->pending_order_resting);
}

TEST(PositionLedgerTest, UnfilledRestingExitReleasesGateWithTrancheArmed) {
  PositionLedger ledger(kGrace);
  trackMedium(ledger);
  auto zero_fill = pendingExit(ledger, "INFY", 51, 40, 94.5, kT0);
  zero_fill.filled_quantity = 0;
  ledger.applyOutcome(zero_fill, kT0 + 10);

  auto report = ledger.upsertFromBroker({holding("INFY", 100)}, kT0 + kGrace);
  ASSERT_EQ(report.settled.size(), 1u);
  EXPECT_EQ(report.settled[0].second, 0);

  auto pos = ledger.get("INFY");
  EXPECT_EQ(pos->quantity, 100);
  EXPECT_FALSE(pos->exit_tranches.at(kStopLossTranche).triggered);
  EXPECT_FALSE(pos->has_pending_order);
}

TEST(PositionLedgerTest, RestingExitFilledCompletelyClosesPosition) {
  PositionLedger ledger(kGrace);
  ledger.upsertFromBroker({holding("INFY", 10)}, kT0);
  auto zero_fill = pendingExit(ledger, "INFY", 61, 10, 94.5, kT0);
  zero_fill.filled_quantity = 0;
  ledger.applyOutcome(zero_fill, kT0 + 10);

  auto report = ledger.upsertFromBroker({}, kT0 + kGrace);
  ASSERT_EQ(report.settled.size(), 1u);
  EXPECT_EQ(report.settled[0].second, 10);
  EXPECT_TRUE(has(report.removed, "INFY"));
  EXPECT_FALSE(ledger.contains("INFY"));
  EXPECT_TRUE(ledger.recentlyClosed("INFY", kT0 + kGrace + 1));
}
