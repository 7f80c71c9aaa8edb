#pragma once

#include "trailguard/concurrent/request_id_generator.hpp"
#include "trailguard/eventbus/event_bus.hpp"
#include "trailguard/events/event_types.hpp"
#include "trailguard/events/order_events.hpp"
#include "trailguard/risk/exit_decision_engine.hpp"
#include "trailguard/risk/position_ledger.hpp"
#include "trailguard/risk/trailing_stop_tracker.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <cstdint>

namespace trailguard {

// -----------------------------------------------------------------------------
// PositionMonitor - the risk loop's single writer
// -----------------------------------------------------------------------------
//
// @brief  Subscribes on the risk loop's EventBus and turns prices,
//         volatility refreshes, broker snapshots and order outcomes into
//         ledger mutations, stop updates and exit requests.
//
// @details
// Per PriceObservationEvent:
//   1. ignore tickers the ledger does not track;
//   2. skip the ticker while its exit order is in flight;
//   3. feed the price to the TrailingStopTracker, publishing a
//      StopUpdateEvent when the stop moves;
//   4. ask the ExitDecisionEngine for a tranche. If one fires, the request
//      gets its id and the position's pending gate is set inside the same
//      ledger update, then an OrderRequestEvent is published.
// Steps 3 and 4 run on one thread with no other writer, so the gate cannot
// be raced.
//
// VolatilityUpdateEvent installs the ATR on the tracker and the position.
// ReconcileEvent merges holdings into the ledger and starts/stops tracking.
// OrderOutcomeEvent is applied to the ledger; a closed position is dropped
// from the tracker (which also clears its watermark).
//
// Thread model:
//   Constructed and destroyed on the owning thread. All callbacks run on the
//   risk loop thread.
//
// Ownership:
//   Owned by MonitorEngine via std::unique_ptr. Holds references to the
//   ledger, tracker, decision engine, id generator and clock, all of which
//   outlive it.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  PositionMonitor(EventBus& bus, PositionLedger& ledger,
                  TrailingStopTracker& tracker,
                  const ExitDecisionEngine& decisions,
                  RequestIdGenerator& ids, const ITimeProvider& clock,
                  bool verbose = false);

  ~PositionMonitor();

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;
  PositionMonitor(PositionMonitor&&) = delete;
  PositionMonitor& operator=(PositionMonitor&&) = delete;

  // Exit requests published so far (diagnostics and tests).
  std::uint64_t requestsRaised() const { return requests_raised_; }

 private:
  void onPrice(const PriceObservationEvent& event);
  void onVolatility(const VolatilityUpdateEvent& event);
  void onReconcile(const ReconcileEvent& event);
  void onOutcome(const OrderOutcomeEvent& event);

  void publishStop(const std::string& ticker, domain::PositionSide side,
                   const TrailingStopTracker::StopChange& change, double price,
                   std::int64_t now_ms);

  EventBus& bus_;
  PositionLedger& ledger_;
  TrailingStopTracker& tracker_;
  const ExitDecisionEngine& decisions_;
  RequestIdGenerator& ids_;
  const ITimeProvider& clock_;
  bool verbose_;

  std::uint64_t requests_raised_{0};

  EventBus::SubscriptionId price_sub_id_{0};
  EventBus::SubscriptionId volatility_sub_id_{0};
  EventBus::SubscriptionId reconcile_sub_id_{0};
  EventBus::SubscriptionId outcome_sub_id_{0};
};

}  // namespace trailguard
