#include "trailguard/risk/exit_decision_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace trailguard {

namespace {

domain::TrancheSpec stopTranche(double percent) {
  domain::TrancheSpec spec;
  spec.percent_of_original = percent;
  return spec;
}

domain::TrancheSpec targetTranche(double percent, double multiple) {
  domain::TrancheSpec spec;
  spec.percent_of_original = percent;
  spec.profit_multiple_of_atr = multiple;
  return spec;
}

std::string fixed2(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

ExitDecisionEngine::ExitDecisionEngine(TickSizeTable ticks,
                                       bool profit_target_exits)
    : ticks_(std::move(ticks)), profit_target_exits_(profit_target_exits) {}

// -----------------------------------------------------------------------------
// presetFor()
// -----------------------------------------------------------------------------
domain::ExitTranches ExitDecisionEngine::presetFor(
    domain::VolatilityCategory category) {
  domain::ExitTranches tranches;
  switch (category) {
    case domain::VolatilityCategory::Low:
      tranches[domain::kStopLossTranche] = stopTranche(50.0);
      tranches[domain::kProfitTarget1Tranche] = targetTranche(30.0, 2.0);
      tranches[domain::kProfitTarget2Tranche] = targetTranche(20.0, 3.0);
      break;
    case domain::VolatilityCategory::Medium:
      tranches[domain::kStopLossTranche] = stopTranche(40.0);
      tranches[domain::kProfitTarget1Tranche] = targetTranche(30.0, 2.5);
      tranches[domain::kProfitTarget2Tranche] = targetTranche(30.0, 4.0);
      break;
    case domain::VolatilityCategory::High:
      tranches[domain::kStopLossTranche] = stopTranche(30.0);
      tranches[domain::kProfitTarget1Tranche] = targetTranche(30.0, 3.0);
      tranches[domain::kProfitTarget2Tranche] = targetTranche(40.0, 5.0);
      break;
  }
  return tranches;
}

domain::ExitTranches ExitDecisionEngine::stopOnlyPreset() {
  domain::ExitTranches tranches;
  tranches[domain::kStopLossTranche] = stopTranche(100.0);
  return tranches;
}

bool ExitDecisionEngine::ensureTranches(domain::Position& position) {
  return ensureTranches(position, true);
}

bool ExitDecisionEngine::ensureTranches(domain::Position& position,
                                        bool profit_target_exits) {
  if (!position.exit_tranches.empty() || !position.volatility) {
    return false;
  }
  position.exit_tranches = profit_target_exits
                               ? presetFor(position.volatility->category)
                               : stopOnlyPreset();
  return true;
}

// -----------------------------------------------------------------------------
// trancheQuantity()
// -----------------------------------------------------------------------------
std::int64_t ExitDecisionEngine::trancheQuantity(
    const domain::Position& position, const std::string& tranche_id) {
  if (position.quantity <= 0) {
    return 0;
  }

  auto it = position.exit_tranches.find(tranche_id);
  if (it == position.exit_tranches.end() || it->second.triggered) {
    return 0;
  }

  if (domain::untriggeredCount(position.exit_tranches) == 1) {
    return position.quantity;
  }

  const auto raw = static_cast<std::int64_t>(std::floor(
      static_cast<double>(position.original_quantity) *
      it->second.percent_of_original / 100.0));
  return std::clamp<std::int64_t>(raw, 1, position.quantity);
}

double ExitDecisionEngine::stopLimitPrice(const domain::Position& position,
                                          double stop) const {
  const double raw = position.side == domain::PositionSide::Long
                         ? stop * (1.0 - kStopLimitBuffer)
                         : stop * (1.0 + kStopLimitBuffer);
  const double tick =
      ticks_.tickFor(position.ticker, raw, position.tick_size);
  return TickSizeTable::roundToTick(raw, tick);
}

// -----------------------------------------------------------------------------
// evaluate()
// -----------------------------------------------------------------------------
std::optional<domain::OrderRequest> ExitDecisionEngine::evaluate(
    domain::Position& position, double price, double stop,
    std::int64_t now_ms) const {
  if (position.has_pending_order || position.quantity <= 0 ||
      !position.volatility || !(price > 0.0)) {
    return std::nullopt;
  }
  ensureTranches(position, profit_target_exits_);

  const bool is_long = position.side == domain::PositionSide::Long;

  // 1. Stop-loss tranche.
  auto sl = position.exit_tranches.find(domain::kStopLossTranche);
  if (sl != position.exit_tranches.end() && !sl->second.triggered) {
    const bool crossed = is_long ? price <= stop : price >= stop;
    if (crossed) {
      domain::OrderRequest request = buildRequest(
          position, domain::kStopLossTranche, domain::ExitReason::StopLoss,
          price, now_ms);
      request.limit_price = stopLimitPrice(position, stop);
      request.reason_text = "trailing stop hit: price " + fixed2(price) +
                            (is_long ? " <= " : " >= ") + "stop " +
                            fixed2(stop);
      return request;
    }
  }

  // 2. Profit targets, highest multiple first.
  const double atr = position.volatility->atr;
  if (!(atr > 0.0)) {
    return std::nullopt;
  }
  const double profit_atr = is_long ? (price - position.entry_price) / atr
                                    : (position.entry_price - price) / atr;
  if (!(profit_atr > 0.0)) {
    return std::nullopt;
  }

  std::vector<std::pair<double, std::string>> targets;
  for (const auto& [id, spec] : position.exit_tranches) {
    if (spec.profit_multiple_of_atr && !spec.triggered) {
      targets.emplace_back(*spec.profit_multiple_of_atr, id);
    }
  }
  std::sort(targets.begin(), targets.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });

  for (const auto& [multiple, id] : targets) {
    if (profit_atr >= multiple) {
      domain::OrderRequest request = buildRequest(
          position, id, domain::ExitReason::ProfitTarget, price, now_ms);
      request.reason_text = id + ": profit " + fixed2(profit_atr) +
                            " ATR >= " + fixed2(multiple) + " ATR";
      return request;
    }
  }
  return std::nullopt;
}

domain::OrderRequest ExitDecisionEngine::buildRequest(
    const domain::Position& position, const std::string& tranche_id,
    domain::ExitReason reason, double price, std::int64_t now_ms) const {
  domain::OrderRequest request;
  request.ticker = position.ticker;
  request.exchange = position.exchange;
  request.product = position.product;
  request.side = position.side == domain::PositionSide::Long
                     ? domain::OrderSide::Sell
                     : domain::OrderSide::Buy;
  request.quantity = trancheQuantity(position, tranche_id);
  request.reason = reason;
  request.tranche_id = tranche_id;
  request.trigger_price = price;
  request.timestamp_ms = now_ms;
  request.remaining_after_fill = position.quantity - request.quantity;
  return request;
}

}  // namespace trailguard
