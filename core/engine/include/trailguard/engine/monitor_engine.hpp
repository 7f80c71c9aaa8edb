#pragma once

#include "trailguard/broker/i_broker_client.hpp"
#include "trailguard/concurrent/cancellation_token.hpp"
#include "trailguard/concurrent/event_loop_thread.hpp"
#include "trailguard/concurrent/request_id_generator.hpp"
#include "trailguard/config/engine_config.hpp"
#include "trailguard/domain/market_data.hpp"
#include "trailguard/feed/price_feed.hpp"
#include "trailguard/network/ipc_server.hpp"
#include "trailguard/network/order_routing_thread.hpp"
#include "trailguard/persistence/order_audit_log.hpp"
#include "trailguard/persistence/watermark_store.hpp"
#include "trailguard/risk/exclusion_policy.hpp"
#include "trailguard/risk/exit_decision_engine.hpp"
#include "trailguard/risk/position_ledger.hpp"
#include "trailguard/risk/position_monitor.hpp"
#include "trailguard/risk/trailing_stop_tracker.hpp"
#include "trailguard/risk/volatility_engine.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// MonitorEngine - owns every loop, component and bridge of the monitor
// -----------------------------------------------------------------------------
//
// @brief  Top-level orchestrator. Runs the startup gate, wires the risk
//         loop, order routing loop, price feed, control thread and optional
//         IPC server, and tears them down with a bounded join.
//
// @details
// Thread layout after start():
//
//   price feed thread   PriceFeed polls lastPrices() -> risk loop queue
//   risk loop           PositionMonitor: tracker, decisions, ledger writes
//   order routing loop  OrderExecutor: placeOrder() with retries
//   control thread      market close, reconcile, ATR refresh, summary
//   ipc thread          telemetry PUB + command REP (optional)
//
// Startup gate (start(), on the calling thread, before any thread exists):
//   1. broker.authenticate()            BrokerAuthError propagates
//   2. watermark store load             corrupt file propagates
//   3. broker holdings + orders file, filtered by the ticker list
//   4. ledger.upsertFromBroker()
//   5. empty ledger                      StartupError
//
// Shutdown is one CancellationToken. requestShutdown() (SHUTDOWN command,
// market close, signal from main) cancels it; the control thread and any
// executor backoff wake immediately. stop() then joins every thread with
// the given timeout and reports whether all of them finished.
//
// Thread model:
//   start()/stop() from the owning thread (main or a test).
//   executeCommand() runs on the IPC thread and only uses thread-safe reads.
//   requestShutdown()/waitForShutdown() are safe from any thread.
//
// Ownership:
//   Owns the ledger, tracker, decision engine, loops and threads. References
//   the broker client and clock, which must outlive the engine.
// -----------------------------------------------------------------------------
class MonitorEngine {
 public:
  MonitorEngine(EngineConfig config, IBrokerClient& broker,
                const ITimeProvider& clock);

  // Calls stop() with the configured timeout.
  ~MonitorEngine();

  MonitorEngine(const MonitorEngine&) = delete;
  MonitorEngine& operator=(const MonitorEngine&) = delete;
  MonitorEngine(MonitorEngine&&) = delete;
  MonitorEngine& operator=(MonitorEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Runs the startup gate and brings every thread up.
  // @throws BrokerAuthError, StartupError, ConfigError (orders file),
  //         std::runtime_error (corrupt watermark file). Nothing is left
  //         running when start() throws.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop(timeout)
  // -------------------------------------------------------------------------
  // @brief  Cancels and joins everything, each thread bounded by `timeout`.
  // @return true if every thread finished; false if any had to be detached
  //         (the caller should then exit with the forced-termination code).
  // -------------------------------------------------------------------------
  bool stop(std::chrono::milliseconds timeout);
  bool stop() { return stop(config_.shutdown_timeout); }

  void requestShutdown(const std::string& reason);

  bool shutdownRequested() const { return shutdown_.cancelled(); }

  // Blocks for up to `timeout`. Returns true once shutdown was requested.
  bool waitForShutdown(std::chrono::milliseconds timeout) {
    return shutdown_.wait_for(timeout);
  }

  // PING, STATUS and SHUTDOWN. Returns a JSON reply.
  std::string executeCommand(const std::string& command);

  // --- control-thread work, public so tests can drive it deterministically --

  // One pass of the control loop: market close, reconcile when due, ATR
  // refresh, summary when due.
  void runControlCycle();

  // Fetches holdings and hands them to the risk loop. Returns false if the
  // broker call failed (logged).
  bool reconcileNow();

  // Recomputes ATR for every tracked ticker that is due (or all of them with
  // force). Returns the number of VolatilityUpdateEvents pushed.
  std::size_t refreshVolatility(bool force = false);

  std::string portfolioSummary() const;

  // --- accessors -----------------------------------------------------------
  const PositionLedger& ledger() const { return ledger_; }
  const EngineConfig& config() const { return config_; }
  EventBus& riskEventBus() { return risk_loop_.eventBus(); }
  void pushRiskEvent(Event event) { risk_loop_.push(std::move(event)); }
  bool running() const { return running_.load(); }

 private:
  std::vector<domain::BrokerHolding> filterHoldings(
      std::vector<domain::BrokerHolding> holdings) const;

  std::vector<domain::BrokerHolding> fetchHoldings();

  // Resolves (and caches) the instrument for a ticker; empty if unknown.
  std::optional<domain::Instrument> instrumentFor(const std::string& ticker,
                                                  const std::string& exchange);

  // Unlocked bodies of the control work; callers hold cycle_mutex_.
  bool reconcileLocked();
  std::size_t refreshVolatilityLocked(bool force);

  void startControlThread();
  bool stopControlThread(std::chrono::milliseconds timeout);
  void controlLoop();

  void wireBridges();
  void dropBridges();

  EngineConfig config_;
  IBrokerClient& broker_;
  const ITimeProvider& clock_;

  CancellationToken shutdown_;
  RequestIdGenerator request_ids_;

  StaticExclusionPolicy exclusions_;
  std::unordered_set<std::string> ticker_filter_;
  WatermarkStore watermarks_;
  OrderAuditLog audit_log_;
  PositionLedger ledger_;
  TrailingStopTracker tracker_;
  ExitDecisionEngine decisions_;

  // Guarded by cycle_mutex_ (control thread, or a test driving cycles).
  std::mutex cycle_mutex_;
  VolatilityEngine volatility_;
  std::unordered_map<std::string, domain::Instrument> instruments_;
  std::int64_t last_reconcile_ms_{0};
  std::int64_t last_summary_ms_{0};

  EventLoopThread risk_loop_{"RiskLoop"};
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<OrderRoutingThread> order_routing_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<PriceFeed> price_feed_;

  std::vector<std::pair<EventBus*, EventBus::SubscriptionId>> bridges_;

  std::thread control_thread_;
  std::mutex control_mutex_;
  std::condition_variable control_cv_;
  bool control_done_{true};

  std::atomic<bool> running_{false};
};

}  // namespace trailguard
