#include "trailguard/risk/position_monitor.hpp"

#include <iostream>
#include <optional>

namespace trailguard {

// -----------------------------------------------------------------------------
// Constructor: subscribe to the four inputs of the risk loop
// -----------------------------------------------------------------------------
PositionMonitor::PositionMonitor(EventBus& bus, PositionLedger& ledger,
                                 TrailingStopTracker& tracker,
                                 const ExitDecisionEngine& decisions,
                                 RequestIdGenerator& ids,
                                 const ITimeProvider& clock, bool verbose)
    : bus_(bus),
      ledger_(ledger),
      tracker_(tracker),
      decisions_(decisions),
      ids_(ids),
      clock_(clock),
      verbose_(verbose) {
  for (const auto& pos : ledger_.snapshots()) {
    tracker_.track(pos.ticker, pos.side);
  }

  price_sub_id_ = bus_.subscribe<PriceObservationEvent>(
      [this](const PriceObservationEvent& e) { onPrice(e); });
  volatility_sub_id_ = bus_.subscribe<VolatilityUpdateEvent>(
      [this](const VolatilityUpdateEvent& e) { onVolatility(e); });
  reconcile_sub_id_ = bus_.subscribe<ReconcileEvent>(
      [this](const ReconcileEvent& e) { onReconcile(e); });
  outcome_sub_id_ = bus_.subscribe<OrderOutcomeEvent>(
      [this](const OrderOutcomeEvent& e) { onOutcome(e); });
}

PositionMonitor::~PositionMonitor() {
  bus_.unsubscribe(outcome_sub_id_);
  bus_.unsubscribe(reconcile_sub_id_);
  bus_.unsubscribe(volatility_sub_id_);
  bus_.unsubscribe(price_sub_id_);
}

void PositionMonitor::publishStop(
    const std::string& ticker, domain::PositionSide side,
    const TrailingStopTracker::StopChange& change, double price,
    std::int64_t now_ms) {
  StopUpdateEvent update;
  update.ticker = ticker;
  update.side = side;
  update.previous_stop = change.previous_stop.value_or(0.0);
  update.stop = change.stop;
  update.extreme = change.extreme;
  update.price = price;
  update.timestamp_ms = now_ms;
  bus_.publish(update);
}

// -----------------------------------------------------------------------------
// onPrice: stop update, then at most one exit decision
// -----------------------------------------------------------------------------
void PositionMonitor::onPrice(const PriceObservationEvent& event) {
  const std::int64_t now_ms = clock_.now_ms();

  std::optional<domain::Position> current = ledger_.get(event.ticker);
  if (!current) {
    return;
  }

  if (!tracker_.state(event.ticker)) {
    tracker_.track(event.ticker, current->side);
  }

  // The stop keeps ratcheting while an exit is in flight; only the decision
  // is gated.
  std::optional<TrailingStopTracker::StopChange> change =
      tracker_.observePrice(event.ticker, event.price);
  if (change && change->improved) {
    if (verbose_ || change->previous_stop) {
      std::cout << "[PositionMonitor] " << event.ticker << " stop "
                << change->previous_stop.value_or(0.0) << " -> "
                << change->stop << " (extreme " << change->extreme
                << ", price " << event.price << ")\n";
    }
    publishStop(event.ticker, current->side, *change, event.price, now_ms);
  }

  if (current->has_pending_order) {
    ledger_.update(event.ticker, [&](domain::Position& pos) {
      pos.last_price = event.price;
      if (change) {
        pos.trailing_stop = change->stop;
      }
    });
    if (verbose_) {
      std::cout << "[PositionMonitor] " << event.ticker << " price "
                << event.price << " not evaluated: order "
                << current->pending_request_id << " in flight\n";
    }
    return;
  }

  std::optional<domain::OrderRequest> request;
  ledger_.update(event.ticker, [&](domain::Position& pos) {
    pos.last_price = event.price;
    if (change) {
      pos.trailing_stop = change->stop;
    }
    if (!change) {
      return;  // no ATR yet: nothing to decide against
    }

    request = decisions_.evaluate(pos, event.price, change->stop, now_ms);
    if (!request) {
      return;
    }
    if (request->quantity <= 0) {
      request.reset();
      return;
    }
    request->request_id = ids_.next_id();
    pos.has_pending_order = true;
    pos.pending_request_id = request->request_id;
    pos.pending_since_ms = now_ms;
    pos.pending_tranche_id = request->tranche_id;
  });

  if (verbose_ && change && !request) {
    std::cout << "[PositionMonitor] " << event.ticker << " price "
              << event.price << " stop " << change->stop << " hold\n";
  }

  if (!request) {
    return;
  }

  ++requests_raised_;
  std::cout << "[PositionMonitor] EXIT " << request->ticker << " tranche="
            << request->tranche_id << " " << domain::toString(request->side)
            << " " << request->quantity << " reason=\""
            << request->reason_text << "\" request_id="
            << request->request_id << "\n";
  bus_.publish(OrderRequestEvent{*request});
}

// -----------------------------------------------------------------------------
// onVolatility: install ATR on the tracker and the position
// -----------------------------------------------------------------------------
void PositionMonitor::onVolatility(const VolatilityUpdateEvent& event) {
  std::optional<domain::Position> current = ledger_.get(event.ticker);
  if (!current) {
    return;
  }

  const TrailingStopTracker::StopChange change =
      tracker_.applyVolatility(event.ticker, current->side, event.info);

  ledger_.update(event.ticker, [&](domain::Position& pos) {
    pos.volatility = event.info;
    pos.volatility->computed_stop_price = change.stop;
    if (event.tick_size > 0.0) {
      pos.tick_size = event.tick_size;
    }
    pos.trailing_stop = change.stop;
    ExitDecisionEngine::ensureTranches(pos, decisions_.profitTargetExits());
  });

  std::cout << "[PositionMonitor] " << event.ticker << " ATR "
            << event.info.atr << " (" << event.info.atr_percent << "%, "
            << domain::toString(event.info.category) << ", x"
            << event.info.stop_multiplier << ") stop " << change.stop << "\n";

  if (change.improved) {
    publishStop(event.ticker, current->side, change,
                current->last_price > 0.0 ? current->last_price
                                          : event.info.daily_high,
                clock_.now_ms());
  }
}

// -----------------------------------------------------------------------------
// onReconcile: merge broker holdings
// -----------------------------------------------------------------------------
void PositionMonitor::onReconcile(const ReconcileEvent& event) {
  const PositionLedger::ReconcileReport report =
      ledger_.upsertFromBroker(event.holdings, clock_.now_ms());

  for (const auto& [ticker, filled] : report.settled) {
    std::cout << "[PositionMonitor] " << ticker
              << " resting exit settled from holdings: " << filled
              << " share(s) filled\n";
  }
  for (const auto& ticker : report.removed) {
    tracker_.forget(ticker);
    std::cout << "[PositionMonitor] " << ticker
              << " no longer held at broker, stopped tracking\n";
  }
  for (const auto& ticker : report.added) {
    if (auto pos = ledger_.get(ticker)) {
      tracker_.track(ticker, pos->side);
      std::cout << "[PositionMonitor] tracking new holding " << ticker << " "
                << domain::toString(pos->side) << " " << pos->quantity
                << " @ " << pos->entry_price << "\n";
    }
  }
  for (const auto& ticker : report.resized) {
    if (auto pos = ledger_.get(ticker)) {
      std::cout << "[PositionMonitor] " << ticker
                << " quantity refreshed from broker: " << pos->quantity
                << "\n";
    }
  }
  if (verbose_ && !report.kept_in_grace.empty()) {
    std::cout << "[PositionMonitor] " << report.kept_in_grace.size()
              << " position(s) absent at broker kept within grace window\n";
  }
}

// -----------------------------------------------------------------------------
// onOutcome: apply to the ledger and release the pending gate
// -----------------------------------------------------------------------------
void PositionMonitor::onOutcome(const OrderOutcomeEvent& event) {
  const domain::OrderOutcome& outcome = event.outcome;
  std::optional<PositionLedger::AppliedOutcome> applied =
      ledger_.applyOutcome(outcome, clock_.now_ms());

  if (!applied) {
    std::cerr << "[PositionMonitor] WARNING: outcome for request "
              << outcome.request.request_id << " (" << outcome.request.ticker
              << ") does not match a pending order, ignored\n";
    return;
  }

  const domain::Position& pos = applied->position;
  if (applied->resting) {
    std::cout << "[PositionMonitor] " << pos.ticker << " exit "
              << outcome.request.tranche_id << " accepted by broker ("
              << (outcome.broker_order_id.empty() ? std::string("no id")
                                                  : outcome.broker_order_id)
              << ") with nothing filled; holding " << pos.quantity
              << " until reconciliation sees the fill\n";
    return;
  }
  if (!domain::isConfirmed(outcome.status)) {
    std::cerr << "[PositionMonitor] " << pos.ticker << " exit "
              << outcome.request.tranche_id << " "
              << domain::toString(outcome.status) << " after "
              << outcome.attempts << " attempt(s): " << outcome.last_error
              << "; eligible again next tick\n";
    return;
  }

  std::cout << "[PositionMonitor] " << pos.ticker << " "
            << outcome.request.tranche_id << " exited "
            << applied->filled_quantity << " @ " << outcome.fill_price
            << " realised P/L " << applied->realized_pnl << " (total "
            << pos.realized_pnl << "), remaining " << pos.quantity << "\n";

  if (applied->closed) {
    tracker_.forget(pos.ticker);
    std::cout << "[PositionMonitor] " << pos.ticker
              << " fully closed, tracking stopped\n";
  }
}

}  // namespace trailguard
