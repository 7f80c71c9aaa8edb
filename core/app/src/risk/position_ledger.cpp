#include "trailguard/risk/position_ledger.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace trailguard {

PositionLedger::PositionLedger(std::int64_t grace_ms,
                               const IExclusionPolicy* exclusions)
    : grace_ms_(grace_ms), exclusions_(exclusions) {}

// --- reads -------------------------------------------------------------------

std::optional<domain::Position> PositionLedger::get(
    const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(ticker);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PositionLedger::contains(const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  return positions_.count(ticker) > 0;
}

std::vector<std::string> PositionLedger::tickers() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> result;
  result.reserve(positions_.size());
  for (const auto& [ticker, pos] : positions_) {
    result.push_back(ticker);
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<domain::Position> PositionLedger::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [ticker, pos] : positions_) {
    result.push_back(pos);
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.ticker < b.ticker;
            });
  return result;
}

std::size_t PositionLedger::size() const {
  std::shared_lock lock(mutex_);
  return positions_.size();
}

// --- writes ------------------------------------------------------------------

void PositionLedger::set(domain::Position position) {
  domain::validatePosition(position);
  std::unique_lock lock(mutex_);
  closed_at_ms_.erase(position.ticker);
  positions_[position.ticker] = std::move(position);
}

bool PositionLedger::remove(const std::string& ticker) {
  std::unique_lock lock(mutex_);
  return positions_.erase(ticker) > 0;
}

bool PositionLedger::update(
    const std::string& ticker,
    const std::function<void(domain::Position&)>& mutator) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(ticker);
  if (it == positions_.end()) {
    return false;
  }

  domain::Position before = it->second;
  mutator(it->second);
  try {
    domain::validatePosition(it->second);
  } catch (const std::invalid_argument&) {
    it->second = std::move(before);
    throw;
  }
  return true;
}

bool PositionLedger::recentlyClosed(const std::string& ticker,
                                    std::int64_t now_ms) const {
  std::shared_lock lock(mutex_);
  auto it = closed_at_ms_.find(ticker);
  return it != closed_at_ms_.end() && now_ms - it->second < grace_ms_;
}

// -----------------------------------------------------------------------------
// fromHolding(): new Position from a broker or orders-file holding
// -----------------------------------------------------------------------------
domain::Position PositionLedger::fromHolding(
    const domain::BrokerHolding& holding, std::int64_t now_ms) {
  domain::Position pos;
  pos.ticker = holding.ticker;
  pos.side = holding.side;
  pos.quantity = holding.quantity;
  pos.original_quantity = holding.quantity;
  pos.entry_price = holding.average_price;
  pos.investment_amount =
      holding.investment_amount > 0.0
          ? holding.investment_amount
          : holding.average_price * static_cast<double>(holding.quantity);
  pos.product = holding.product;
  pos.exchange = holding.exchange;
  pos.instrument_token = holding.instrument_token;
  pos.source = holding.source;
  pos.tracked_since_ms = now_ms;
  return pos;
}

void PositionLedger::clearPending(domain::Position& position) {
  position.has_pending_order = false;
  position.pending_request_id = 0;
  position.pending_since_ms = 0;
  position.pending_tranche_id.clear();
  position.pending_order_resting = false;
}

// -----------------------------------------------------------------------------
// settleResting(): resolve an accepted-but-unfilled exit from the holdings
// -----------------------------------------------------------------------------
// Whatever the broker no longer holds was sold by the resting order. A
// partial or full fill marks the tranche triggered; no fill releases the gate
// with the tranche still armed.
std::int64_t PositionLedger::settleResting(domain::Position& position,
                                           std::int64_t held,
                                           std::int64_t now_ms) {
  const std::int64_t filled =
      std::clamp<std::int64_t>(position.quantity - held, 0, position.quantity);
  if (filled > 0) {
    position.quantity -= filled;
    position.last_fill_ms = now_ms;
    auto tranche = position.exit_tranches.find(position.pending_tranche_id);
    if (tranche != position.exit_tranches.end()) {
      tranche->second.triggered = true;
    }
  }
  clearPending(position);
  return filled;
}

bool PositionLedger::withinGrace(const domain::Position& position,
                                 std::int64_t now_ms) const {
  if (position.last_fill_ms > 0 && now_ms - position.last_fill_ms < grace_ms_) {
    return true;
  }
  if (position.pending_since_ms > 0 &&
      now_ms - position.pending_since_ms < grace_ms_) {
    return true;
  }
  return position.source == domain::PositionSource::OrdersFile &&
         now_ms - position.tracked_since_ms < grace_ms_;
}

// -----------------------------------------------------------------------------
// upsertFromBroker()
// -----------------------------------------------------------------------------
PositionLedger::ReconcileReport PositionLedger::upsertFromBroker(
    const std::vector<domain::BrokerHolding>& holdings, std::int64_t now_ms) {
  ReconcileReport report;

  std::unordered_map<std::string, const domain::BrokerHolding*> at_broker;
  for (const auto& h : holdings) {
    if (h.ticker.empty() || h.quantity <= 0) {
      continue;
    }
    at_broker.emplace(h.ticker, &h);
  }

  std::unique_lock lock(mutex_);

  // Expire tombstones.
  for (auto it = closed_at_ms_.begin(); it != closed_at_ms_.end();) {
    if (now_ms - it->second >= grace_ms_) {
      it = closed_at_ms_.erase(it);
    } else {
      ++it;
    }
  }

  // Drop or resize tracked positions.
  for (auto it = positions_.begin(); it != positions_.end();) {
    domain::Position& pos = it->second;
    auto broker = at_broker.find(pos.ticker);

    if (pos.has_pending_order && pos.pending_order_resting &&
        now_ms - pos.pending_since_ms >= grace_ms_) {
      const std::int64_t held =
          broker == at_broker.end() ? 0 : broker->second->quantity;
      const std::int64_t filled = settleResting(pos, held, now_ms);
      report.settled.push_back({pos.ticker, filled});
      if (pos.quantity <= 0) {
        closed_at_ms_[pos.ticker] = now_ms;
        report.removed.push_back(pos.ticker);
        it = positions_.erase(it);
        continue;
      }
      ++it;
      continue;
    }

    if (broker == at_broker.end()) {
      if (pos.has_pending_order || withinGrace(pos, now_ms)) {
        report.kept_in_grace.push_back(pos.ticker);
        ++it;
        continue;
      }
      report.removed.push_back(pos.ticker);
      it = positions_.erase(it);
      continue;
    }

    const domain::BrokerHolding& h = *broker->second;
    if (!pos.has_pending_order && !withinGrace(pos, now_ms) &&
        h.quantity != pos.quantity) {
      pos.quantity = h.quantity;
      pos.original_quantity = std::max(pos.original_quantity, h.quantity);
      report.resized.push_back(pos.ticker);
    }
    ++it;
  }

  // Add untracked holdings.
  for (const auto& h : holdings) {
    if (h.ticker.empty() || h.quantity <= 0 || positions_.count(h.ticker) > 0) {
      continue;
    }
    if (exclusions_ != nullptr && exclusions_->isExcluded(h.ticker)) {
      continue;
    }
    if (closed_at_ms_.count(h.ticker) > 0) {
      continue;
    }
    domain::Position pos = fromHolding(h, now_ms);
    domain::validatePosition(pos);
    positions_.emplace(pos.ticker, std::move(pos));
    report.added.push_back(h.ticker);
  }

  return report;
}

// -----------------------------------------------------------------------------
// applyOutcome()
// -----------------------------------------------------------------------------
std::optional<PositionLedger::AppliedOutcome> PositionLedger::applyOutcome(
    const domain::OrderOutcome& outcome, std::int64_t now_ms) {
  const domain::OrderRequest& request = outcome.request;

  std::unique_lock lock(mutex_);
  auto it = positions_.find(request.ticker);
  if (it == positions_.end()) {
    return std::nullopt;
  }

  domain::Position& pos = it->second;
  if (!pos.has_pending_order || pos.pending_request_id != request.request_id) {
    return std::nullopt;
  }

  AppliedOutcome applied;

  const bool confirmed = domain::isConfirmed(outcome.status);
  if (outcome.status == domain::OrderOutcomeStatus::Accepted ||
      (confirmed && outcome.filled_quantity <= 0)) {
    // Nothing filled yet: keep the gate until reconciliation sees the fill.
    pos.pending_order_resting = true;
    applied.resting = true;
    applied.position = pos;
    return applied;
  }

  clearPending(pos);

  if (confirmed) {
    const std::int64_t filled = std::min(outcome.filled_quantity, pos.quantity);

    if (outcome.fill_price > 0.0) {
      const double per_share =
          pos.side == domain::PositionSide::Long
              ? outcome.fill_price - pos.entry_price
              : pos.entry_price - outcome.fill_price;
      applied.realized_pnl = per_share * static_cast<double>(filled);
      pos.realized_pnl += applied.realized_pnl;
    }

    pos.quantity -= filled;
    pos.last_fill_ms = now_ms;
    auto tranche = pos.exit_tranches.find(request.tranche_id);
    if (tranche != pos.exit_tranches.end()) {
      tranche->second.triggered = true;
    }
    applied.filled_quantity = filled;
  }

  applied.position = pos;
  if (pos.quantity <= 0) {
    applied.closed = true;
    closed_at_ms_[pos.ticker] = now_ms;
    positions_.erase(it);
  }
  return applied;
}

}  // namespace trailguard
