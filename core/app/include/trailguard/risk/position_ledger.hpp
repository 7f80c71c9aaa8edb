#pragma once

#include "trailguard/domain/market_data.hpp"
#include "trailguard/domain/order_request.hpp"
#include "trailguard/domain/position.hpp"
#include "trailguard/risk/exclusion_policy.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// PositionLedger - authoritative set of tracked positions
// -----------------------------------------------------------------------------
//
// @brief  Holds one Position per ticker, merges broker snapshots into it and
//         applies confirmed exit outcomes.
//
// @details
// Reconciliation (upsertFromBroker):
//   * broker holdings not yet tracked are added, unless excluded or closed
//     by a confirmed exit less than grace_ms ago (the broker may still list
//     the shares for a while after the sell);
//   * tracked tickers missing from the broker are dropped, except when an
//     exit order is in flight, a fill was confirmed less than grace_ms ago,
//     or the position came from the orders file less than grace_ms ago;
//   * for idle positions outside the grace window, quantity follows the
//     broker (and original_quantity grows if the holding grew);
//   * an exit the broker accepted without filling is settled once it is
//     older than grace_ms: the shares the broker no longer holds count as
//     filled, and the gate is released either way.
//
// Outcomes (applyOutcome):
//   Only an outcome whose request_id matches the position's pending request
//   is applied, so a repeated outcome cannot decrement twice. Filled and
//   Duplicate reduce quantity by the filled amount, mark the tranche
//   triggered, clear the pending gate and stamp last_fill_ms; quantity 0
//   removes the position. Accepted (or a confirmation with zero shares)
//   changes nothing but keeps the gate for reconciliation to settle.
//   Failed and Cancelled only clear the gate.
//
// Thread model:
//   Writers run on the risk loop only. Readers on other threads (IPC STATUS,
//   control thread, price feed ticker list) use the const accessors, which
//   take a shared lock and return copies.
//
// Ownership:
//   Owned by MonitorEngine; referenced by PositionMonitor.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  struct ReconcileReport {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> resized;
    std::vector<std::string> kept_in_grace;
    // Resting exits settled this pass, with the shares counted as filled.
    std::vector<std::pair<std::string, std::int64_t>> settled;
  };

  struct AppliedOutcome {
    domain::Position position;  // state after the outcome
    std::int64_t filled_quantity{0};
    double realized_pnl{0.0};
    bool closed{false};
    bool resting{false};  // accepted without a fill; gate still held
  };

  static constexpr std::int64_t kDefaultGraceMs = 10 * 60 * 1000;

  explicit PositionLedger(std::int64_t grace_ms = kDefaultGraceMs,
                          const IExclusionPolicy* exclusions = nullptr);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;

  // --- reads (any thread) ---------------------------------------------------
  std::optional<domain::Position> get(const std::string& ticker) const;
  bool contains(const std::string& ticker) const;
  std::vector<std::string> tickers() const;
  std::vector<domain::Position> snapshots() const;
  std::size_t size() const;

  // --- writes (risk loop) ---------------------------------------------------

  // Inserts or replaces. Throws std::invalid_argument if the position
  // fails validatePosition().
  void set(domain::Position position);

  bool remove(const std::string& ticker);

  // Runs `mutator` on the stored position under the write lock and
  // re-validates it. Returns false if the ticker is not tracked. If
  // validation fails the previous state is restored and the exception
  // propagates.
  bool update(const std::string& ticker,
              const std::function<void(domain::Position&)>& mutator);

  ReconcileReport upsertFromBroker(
      const std::vector<domain::BrokerHolding>& holdings, std::int64_t now_ms);

  std::optional<AppliedOutcome> applyOutcome(
      const domain::OrderOutcome& outcome, std::int64_t now_ms);

  // True if the ticker was closed by a confirmed exit within grace_ms.
  bool recentlyClosed(const std::string& ticker, std::int64_t now_ms) const;

  std::int64_t graceMs() const { return grace_ms_; }

 private:
  static domain::Position fromHolding(const domain::BrokerHolding& holding,
                                      std::int64_t now_ms);

  static void clearPending(domain::Position& position);
  static std::int64_t settleResting(domain::Position& position,
                                    std::int64_t held, std::int64_t now_ms);

  bool withinGrace(const domain::Position& position,
                   std::int64_t now_ms) const;

  std::int64_t grace_ms_;
  const IExclusionPolicy* exclusions_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, std::int64_t> closed_at_ms_;
};

}  // namespace trailguard
