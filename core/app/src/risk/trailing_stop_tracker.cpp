#include "trailguard/risk/trailing_stop_tracker.hpp"

namespace trailguard {

TrailingStopTracker::TrailingStopTracker(WatermarkStore* watermarks,
                                         const ITimeProvider* clock)
    : watermarks_(watermarks), clock_(clock) {}

bool TrailingStopTracker::isBetter(domain::PositionSide side, double candidate,
                                   double current) {
  return side == domain::PositionSide::Long ? candidate > current
                                            : candidate < current;
}

// -----------------------------------------------------------------------------
// ensure(): find or create state, seeding from the watermark store
// -----------------------------------------------------------------------------
// A side change (position closed and re-entered the other way) starts over.
// -----------------------------------------------------------------------------
TrailingStopTracker::StopState& TrailingStopTracker::ensure(
    const std::string& ticker, domain::PositionSide side) {
  auto it = states_.find(ticker);
  if (it != states_.end() && it->second.side == side) {
    return it->second;
  }

  StopState fresh;
  fresh.side = side;
  if (watermarks_ != nullptr) {
    if (auto mark = watermarks_->get(ticker); mark && mark->side == side) {
      fresh.stop = mark->stop;
      if (mark->extreme > 0.0) {
        fresh.extreme = mark->extreme;
      }
    }
  }
  return states_.insert_or_assign(ticker, fresh).first->second;
}

void TrailingStopTracker::track(const std::string& ticker,
                                domain::PositionSide side) {
  ensure(ticker, side);
}

// -----------------------------------------------------------------------------
// recompute(): candidate from extreme, then ratchet
// -----------------------------------------------------------------------------
TrailingStopTracker::StopChange TrailingStopTracker::recompute(
    const std::string& ticker, StopState& state) {
  StopChange change;
  change.previous_stop = state.stop;
  change.extreme = *state.extreme;

  const double offset = state.atr * state.multiplier;
  const double candidate = state.side == domain::PositionSide::Long
                               ? *state.extreme - offset
                               : *state.extreme + offset;

  if (!state.stop || isBetter(state.side, candidate, *state.stop)) {
    state.stop = candidate;
    change.improved = true;
  }
  change.stop = *state.stop;

  if (change.improved && watermarks_ != nullptr) {
    Watermark mark;
    mark.side = state.side;
    mark.stop = *state.stop;
    mark.extreme = *state.extreme;
    mark.updated_ms = clock_ != nullptr ? clock_->now_ms() : 0;
    watermarks_->put(ticker, mark);
  }
  return change;
}

// -----------------------------------------------------------------------------
// applyVolatility()
// -----------------------------------------------------------------------------
TrailingStopTracker::StopChange TrailingStopTracker::applyVolatility(
    const std::string& ticker, domain::PositionSide side,
    const domain::VolatilityInfo& info) {
  StopState& state = ensure(ticker, side);
  state.atr = info.atr;
  state.multiplier = info.stop_multiplier;

  if (!state.extreme || isBetter(side, info.daily_high, *state.extreme)) {
    state.extreme = info.daily_high;
  }
  return recompute(ticker, state);
}

// -----------------------------------------------------------------------------
// observePrice()
// -----------------------------------------------------------------------------
std::optional<TrailingStopTracker::StopChange> TrailingStopTracker::observePrice(
    const std::string& ticker, double price) {
  auto it = states_.find(ticker);
  if (it == states_.end() || !(price > 0.0)) {
    return std::nullopt;
  }

  StopState& state = it->second;
  if (!state.extreme || isBetter(state.side, price, *state.extreme)) {
    state.extreme = price;
  }

  if (!(state.atr > 0.0)) {
    return std::nullopt;
  }
  return recompute(ticker, state);
}

std::optional<double> TrailingStopTracker::stopFor(
    const std::string& ticker) const {
  auto it = states_.find(ticker);
  if (it == states_.end() || !(it->second.atr > 0.0)) {
    return std::nullopt;
  }
  return it->second.stop;
}

std::optional<TrailingStopTracker::StopState> TrailingStopTracker::state(
    const std::string& ticker) const {
  auto it = states_.find(ticker);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void TrailingStopTracker::forget(const std::string& ticker) {
  states_.erase(ticker);
  if (watermarks_ != nullptr) {
    watermarks_->erase(ticker);
  }
}

}  // namespace trailguard
