#include "trailguard/engine/monitor_engine.hpp"
#include "trailguard/errors/errors.hpp"
#include "trailguard/persistence/orders_file.hpp"
#include "trailguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace trailguard {

namespace {

// Logs one broker retry for a control-thread call.
auto controlRetryLogger(const char* what, const std::string& ticker) {
  return [what, ticker](int attempt, ErrorClass error_class,
                        const std::exception& error,
                        std::chrono::milliseconds delay) {
    std::cerr << "[MonitorEngine] " << what
              << (ticker.empty() ? "" : " for " + ticker) << " attempt "
              << attempt << " failed (" << toString(error_class)
              << "): " << error.what() << "; retrying in " << delay.count()
              << " ms\n";
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MonitorEngine::MonitorEngine(EngineConfig config, IBrokerClient& broker,
                             const ITimeProvider& clock)
    : config_(std::move(config)),
      broker_(broker),
      clock_(clock),
      exclusions_(config_.excluded_tickers),
      ticker_filter_(config_.tickers.begin(), config_.tickers.end()),
      watermarks_(config_.watermark_path),
      audit_log_(config_.audit_log_path),
      ledger_(config_.reconcile_grace.count(), &exclusions_),
      tracker_(&watermarks_, &clock_),
      decisions_(TickSizeTable(config_.tick_size_overrides),
                 config_.profit_target_exits),
      volatility_(config_.volatility_refresh.count()) {}

MonitorEngine::~MonitorEngine() { stop(); }

// -----------------------------------------------------------------------------
// filterHoldings(): apply the --tickers filter
// -----------------------------------------------------------------------------
std::vector<domain::BrokerHolding> MonitorEngine::filterHoldings(
    std::vector<domain::BrokerHolding> holdings) const {
  if (ticker_filter_.empty()) {
    return holdings;
  }
  holdings.erase(std::remove_if(holdings.begin(), holdings.end(),
                                [this](const domain::BrokerHolding& h) {
                                  return ticker_filter_.count(h.ticker) == 0;
                                }),
                 holdings.end());
  return holdings;
}

// -----------------------------------------------------------------------------
// fetchHoldings(): broker holdings with the shared retry policy
// -----------------------------------------------------------------------------
std::vector<domain::BrokerHolding> MonitorEngine::fetchHoldings() {
  auto result = retryCall(
      config_.retry, shutdown_, [this] { return broker_.holdings(); },
      controlRetryLogger("holdings", ""));
  if (result.status != RetryStatus::Success || !result.value) {
    throw TransientBrokerError("holdings unavailable (" +
                               std::string(toString(result.status)) +
                               "): " + result.last_error);
  }
  return std::move(*result.value);
}

// -----------------------------------------------------------------------------
// start(): startup gate, then threads
// -----------------------------------------------------------------------------
void MonitorEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Authenticate --------------------------------------------------------
  broker_.authenticate();
  std::cout << "[MonitorEngine] broker session validated.\n";

  // ---  2) Persisted stops ---------------------------------------------------
  watermarks_.load();
  if (watermarks_.size() > 0) {
    std::cout << "[MonitorEngine] loaded " << watermarks_.size()
              << " stop watermark(s) from " << watermarks_.path() << "\n";
  }

  // ---  3) Positions to track ------------------------------------------------
  std::vector<domain::BrokerHolding> holdings;
  try {
    holdings = fetchHoldings();
  } catch (const BrokerError& e) {
    throw StartupError(std::string("cannot read broker holdings: ") +
                       e.what());
  }
  const std::size_t from_broker = holdings.size();

  if (!config_.orders_file.empty()) {
    std::vector<domain::BrokerHolding> from_file =
        loadOrdersFile(config_.orders_file);
    std::cout << "[MonitorEngine] orders file " << config_.orders_file
              << ": " << from_file.size() << " entr"
              << (from_file.size() == 1 ? "y" : "ies") << "\n";
    std::unordered_set<std::string> held;
    for (const auto& h : holdings) {
      held.insert(h.ticker);
    }
    for (auto& h : from_file) {
      if (held.count(h.ticker) > 0) {
        if (config_.verbose) {
          std::cout << "[MonitorEngine] " << h.ticker
                    << " already held at broker, orders file entry skipped\n";
        }
        continue;
      }
      h.exchange = config_.exchange;
      h.product = config_.product;
      holdings.push_back(std::move(h));
    }
  }

  const std::int64_t now_ms = clock_.now_ms();
  ledger_.upsertFromBroker(filterHoldings(std::move(holdings)), now_ms);
  last_reconcile_ms_ = now_ms;
  last_summary_ms_ = now_ms;

  if (ledger_.size() == 0) {
    throw StartupError("no positions to track (" +
                       std::to_string(from_broker) +
                       " broker holding(s) after filters)");
  }
  for (const auto& pos : ledger_.snapshots()) {
    std::cout << "[MonitorEngine] tracking " << pos.ticker << " "
              << domain::toString(pos.side) << " " << pos.quantity << " @ "
              << pos.entry_price
              << (pos.source == domain::PositionSource::OrdersFile
                      ? " (orders file)"
                      : "")
              << "\n";
  }

  // ---  4) Threads ------------------------------------------------------------
  running_ = true;
  try {
    monitor_ = std::make_unique<PositionMonitor>(
        risk_loop_.eventBus(), ledger_, tracker_, decisions_, request_ids_,
        clock_, config_.verbose);
    risk_loop_.start();

    order_routing_ = std::make_unique<OrderRoutingThread>(
        broker_, clock_, shutdown_, config_.retry, config_.min_order_spacing,
        &audit_log_);
    order_routing_->start();

    if (!config_.ipc_cmd_endpoint.empty() &&
        !config_.ipc_pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
      ipc_server_->start();
    }

    wireBridges();

    // First ATR pass before prices flow, so stops exist from the first tick.
    {
      std::lock_guard lock(cycle_mutex_);
      refreshVolatilityLocked(true);
    }

    price_feed_ = std::make_unique<PriceFeed>(
        broker_, clock_, [this] { return ledger_.tickers(); },
        [this](Event event) { risk_loop_.push(std::move(event)); },
        config_.poll_interval, config_.price_batch_size, &exclusions_,
        config_.verbose);
    price_feed_->start();

    startControlThread();
  } catch (const std::exception& e) {
    std::cerr << "[MonitorEngine] startup failed: " << e.what() << "\n";
    stop(config_.shutdown_timeout);
    throw;
  }

  std::cout << "[MonitorEngine] started. Threads: risk, order_routing, "
               "price_feed, control"
            << (ipc_server_ ? ", ipc" : "") << ". Tracking "
            << ledger_.size() << " position(s).\n";
}

// -----------------------------------------------------------------------------
// wireBridges(): cross-loop forwarding
// -----------------------------------------------------------------------------
void MonitorEngine::wireBridges() {
  EventBus& risk_bus = risk_loop_.eventBus();
  EventBus& routing_bus = order_routing_->eventBus();

  // Exit requests: risk loop -> order routing loop.
  bridges_.emplace_back(
      &risk_bus, risk_bus.subscribe<OrderRequestEvent>(
                     [this](const OrderRequestEvent& e) {
                       order_routing_->push(e);
                     }));

  // Outcomes: order routing loop -> risk loop.
  bridges_.emplace_back(
      &routing_bus, routing_bus.subscribe<OrderOutcomeEvent>(
                        [this](const OrderOutcomeEvent& e) {
                          risk_loop_.push(e);
                        }));

  if (!ipc_server_) {
    return;
  }
  IpcServer* ipc = ipc_server_.get();
  bridges_.emplace_back(&risk_bus, risk_bus.subscribe<StopUpdateEvent>(
                                       [ipc](const StopUpdateEvent& e) {
                                         ipc->pushTelemetry(e);
                                       }));
  bridges_.emplace_back(&risk_bus, risk_bus.subscribe<OrderRequestEvent>(
                                       [ipc](const OrderRequestEvent& e) {
                                         ipc->pushTelemetry(e);
                                       }));
  bridges_.emplace_back(&routing_bus, routing_bus.subscribe<OrderOutcomeEvent>(
                                          [ipc](const OrderOutcomeEvent& e) {
                                            ipc->pushTelemetry(e);
                                          }));
}

void MonitorEngine::dropBridges() {
  for (const auto& [bus, id] : bridges_) {
    bus->unsubscribe(id);
  }
  bridges_.clear();
}

// -----------------------------------------------------------------------------
// stop(): cancel, then join in dependency order
// -----------------------------------------------------------------------------
// Producers go first (price feed, control thread, IPC), then the routing
// loop, then the risk loop. Components are destroyed only after the loop
// that calls them has exited; a detached loop keeps its components alive
// for the rest of the process.
// -----------------------------------------------------------------------------
bool MonitorEngine::stop(std::chrono::milliseconds timeout) {
  if (!running_) {
    return true;
  }

  shutdown_.cancel();
  bool clean = true;

  if (price_feed_) {
    if (!price_feed_->stopFor(timeout)) {
      clean = false;
      static_cast<void>(price_feed_.release());
    }
    price_feed_.reset();
  }

  if (!stopControlThread(timeout)) {
    clean = false;
  }

  if (ipc_server_) {
    ipc_server_->stop();
  }

  bool routing_joined = true;
  if (order_routing_) {
    routing_joined = order_routing_->stopFor(timeout);
    clean = clean && routing_joined;
  }

  const bool risk_joined = risk_loop_.stopFor(timeout);
  clean = clean && risk_joined;

  if (risk_joined && routing_joined) {
    dropBridges();
  }

  if (risk_joined) {
    monitor_.reset();
  } else {
    static_cast<void>(monitor_.release());
  }

  if (routing_joined) {
    order_routing_.reset();
  } else {
    static_cast<void>(order_routing_.release());
  }

  if (risk_joined) {
    ipc_server_.reset();
  } else {
    static_cast<void>(ipc_server_.release());
  }

  running_ = false;

  if (clean) {
    std::cout << "[MonitorEngine] stopped. All threads joined.\n";
  } else {
    std::cerr << "[MonitorEngine] stopped with thread(s) still running; "
                 "forced termination required.\n";
  }
  return clean;
}

void MonitorEngine::requestShutdown(const std::string& reason) {
  if (!shutdown_.cancelled()) {
    std::cout << "[MonitorEngine] shutdown requested: " << reason << "\n";
  }
  shutdown_.cancel();
}

// -----------------------------------------------------------------------------
// Control thread
// -----------------------------------------------------------------------------
void MonitorEngine::startControlThread() {
  {
    std::lock_guard lock(control_mutex_);
    control_done_ = false;
  }
  control_thread_ = std::thread([this] { controlLoop(); });
}

bool MonitorEngine::stopControlThread(std::chrono::milliseconds timeout) {
  if (!control_thread_.joinable()) {
    return true;
  }

  bool finished = false;
  {
    std::unique_lock lock(control_mutex_);
    finished =
        control_cv_.wait_for(lock, timeout, [this] { return control_done_; });
  }
  if (finished) {
    control_thread_.join();
    return true;
  }

  std::cerr << "[MonitorEngine] control thread did not stop within "
            << timeout.count() << " ms; detaching.\n";
  control_thread_.detach();
  return false;
}

void MonitorEngine::controlLoop() {
  std::cout << "[MonitorEngine] control loop every "
            << config_.control_interval.count() << " ms\n";
  while (!shutdown_.wait_for(config_.control_interval)) {
    try {
      runControlCycle();
    } catch (const std::exception& e) {
      std::cerr << "[MonitorEngine] control cycle failed: " << e.what()
                << "\n";
    }
  }
  std::cout << "[MonitorEngine] control loop exited.\n";

  {
    std::lock_guard lock(control_mutex_);
    control_done_ = true;
  }
  control_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// runControlCycle()
// -----------------------------------------------------------------------------
void MonitorEngine::runControlCycle() {
  std::lock_guard lock(cycle_mutex_);
  if (shutdown_.cancelled()) {
    return;
  }

  const std::int64_t now_ms = clock_.now_ms();
  if (config_.market_hours.isAfterClose(now_ms)) {
    std::cout << "[MonitorEngine] market closed ("
              << formatLocalTime(now_ms,
                                 config_.market_hours.utc_offset_minutes)
              << ").\n";
    requestShutdown("market closed");
    return;
  }

  if (config_.reconcile_interval.count() > 0 &&
      now_ms - last_reconcile_ms_ >= config_.reconcile_interval.count()) {
    reconcileLocked();
  }

  refreshVolatilityLocked(false);

  if (config_.summary_interval.count() > 0 &&
      now_ms - last_summary_ms_ >= config_.summary_interval.count()) {
    std::cout << portfolioSummary();
    last_summary_ms_ = now_ms;
  }
}

bool MonitorEngine::reconcileNow() {
  std::lock_guard lock(cycle_mutex_);
  return reconcileLocked();
}

bool MonitorEngine::reconcileLocked() {
  std::vector<domain::BrokerHolding> holdings;
  try {
    holdings = fetchHoldings();
  } catch (const BrokerError& e) {
    std::cerr << "[MonitorEngine] reconciliation skipped: " << e.what()
              << "\n";
    return false;
  }

  const std::int64_t now_ms = clock_.now_ms();
  last_reconcile_ms_ = now_ms;
  if (config_.verbose) {
    std::cout << "[MonitorEngine] reconciling against " << holdings.size()
              << " broker holding(s)\n";
  }
  risk_loop_.push(ReconcileEvent{filterHoldings(std::move(holdings)), now_ms});
  return true;
}

// -----------------------------------------------------------------------------
// instrumentFor(): cached instrument lookup
// -----------------------------------------------------------------------------
std::optional<domain::Instrument> MonitorEngine::instrumentFor(
    const std::string& ticker, const std::string& exchange) {
  auto it = instruments_.find(ticker);
  if (it != instruments_.end()) {
    return it->second;
  }

  try {
    domain::Instrument instrument = broker_.lookupInstrument(ticker, exchange);
    if (config_.verbose) {
      std::cout << "[MonitorEngine] " << ticker << " instrument token "
                << instrument.token << " tick " << instrument.tick_size
                << "\n";
    }
    return instruments_.emplace(ticker, std::move(instrument)).first->second;
  } catch (const InstrumentNotFoundError& e) {
    std::cerr << "[MonitorEngine] " << ticker
              << " instrument not found, skipping until resolved: "
              << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[MonitorEngine] " << ticker
              << " instrument lookup failed: " << e.what() << "\n";
  }
  return std::nullopt;
}

std::size_t MonitorEngine::refreshVolatility(bool force) {
  std::lock_guard lock(cycle_mutex_);
  return refreshVolatilityLocked(force);
}

// -----------------------------------------------------------------------------
// refreshVolatilityLocked(): ATR for every due ticker
// -----------------------------------------------------------------------------
// Failures leave the schedule untouched so the next cycle retries, and the
// previous VolatilityInfo stays on the position.
// -----------------------------------------------------------------------------
std::size_t MonitorEngine::refreshVolatilityLocked(bool force) {
  const std::vector<domain::Position> positions = ledger_.snapshots();

  std::unordered_set<std::string> tracked;
  for (const auto& pos : positions) {
    tracked.insert(pos.ticker);
  }
  for (auto it = instruments_.begin(); it != instruments_.end();) {
    if (tracked.count(it->first) == 0) {
      volatility_.forget(it->first);
      it = instruments_.erase(it);
    } else {
      ++it;
    }
  }

  std::size_t pushed = 0;
  for (const auto& pos : positions) {
    if (shutdown_.cancelled()) {
      break;
    }
    const std::int64_t now_ms = clock_.now_ms();
    if (!force && !volatility_.isDue(pos.ticker, now_ms)) {
      continue;
    }

    std::optional<domain::Instrument> instrument =
        instrumentFor(pos.ticker, pos.exchange);
    if (!instrument) {
      continue;
    }

    auto candles = retryCall(
        config_.retry, shutdown_,
        [this, &instrument] {
          return broker_.dailyCandles(*instrument,
                                      VolatilityEngine::kLookbackDays);
        },
        controlRetryLogger("daily candles", pos.ticker));
    if (candles.status != RetryStatus::Success || !candles.value) {
      std::cerr << "[MonitorEngine] " << pos.ticker
                << " daily candles unavailable (" << toString(candles.status)
                << "): " << candles.last_error << "; keeping previous ATR\n";
      continue;
    }

    domain::VolatilityInfo info;
    try {
      info = VolatilityEngine::compute(*candles.value, pos.side, now_ms);
    } catch (const InsufficientDataError& e) {
      std::cerr << "[MonitorEngine] " << pos.ticker << " ATR skipped: "
                << e.what() << "; retrying next cycle\n";
      continue;
    }

    volatility_.markComputed(pos.ticker, now_ms);
    risk_loop_.push(
        VolatilityUpdateEvent{pos.ticker, info, instrument->tick_size});
    ++pushed;
  }
  return pushed;
}

// -----------------------------------------------------------------------------
// portfolioSummary()
// -----------------------------------------------------------------------------
std::string MonitorEngine::portfolioSummary() const {
  const std::int64_t now_ms = clock_.now_ms();
  const std::vector<domain::Position> positions = ledger_.snapshots();

  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << "[MonitorEngine] portfolio summary at "
      << formatLocalTime(now_ms, config_.market_hours.utc_offset_minutes)
      << " (" << positions.size() << " position(s))\n";

  double total_cost = 0.0;
  double total_value = 0.0;
  double total_realized = 0.0;
  for (const auto& pos : positions) {
    const double qty = static_cast<double>(pos.quantity);
    const double price = pos.last_price > 0.0 ? pos.last_price : pos.entry_price;
    const double cost = pos.entry_price * qty;
    const double value = price * qty;
    const double pnl =
        pos.side == domain::PositionSide::Long ? value - cost : cost - value;
    const double pnl_pct = cost > 0.0 ? pnl / cost * 100.0 : 0.0;

    out << "  " << std::left << std::setw(12) << pos.ticker << std::right
        << " " << domain::toString(pos.side) << " qty " << pos.quantity << "/"
        << pos.original_quantity << " entry " << pos.entry_price << " last "
        << price << " P/L " << pnl << " (" << pnl_pct << "%) stop ";
    if (pos.trailing_stop > 0.0) {
      out << pos.trailing_stop;
    } else {
      out << "n/a";
    }
    if (pos.has_pending_order) {
      out << " [exit pending]";
    }
    out << "\n";

    total_cost += cost;
    total_value += value;
    total_realized += pos.realized_pnl;
  }

  out << "  investment " << total_cost << " value " << total_value
      << " unrealised " << (total_value - total_cost) << " realised "
      << total_realized << "\n";
  return out.str();
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string MonitorEngine::executeCommand(const std::string& command) {
  nlohmann::json response;

  if (command == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (command == "STATUS") {
    response["status"] = "ok";
    response["running"] = running_.load();
    response["shutdown_requested"] = shutdown_.cancelled();

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& pos : ledger_.snapshots()) {
      nlohmann::json p;
      p["ticker"] = pos.ticker;
      p["side"] = domain::toString(pos.side);
      p["quantity"] = pos.quantity;
      p["original_quantity"] = pos.original_quantity;
      p["entry_price"] = pos.entry_price;
      p["last_price"] = pos.last_price;
      p["trailing_stop"] =
          pos.trailing_stop > 0.0 ? nlohmann::json(pos.trailing_stop)
                                  : nlohmann::json();
      p["pending_order"] = pos.has_pending_order;
      p["realized_pnl"] = pos.realized_pnl;

      if (pos.volatility) {
        nlohmann::json v;
        v["atr"] = pos.volatility->atr;
        v["atr_percent"] = pos.volatility->atr_percent;
        v["category"] = domain::toString(pos.volatility->category);
        v["multiplier"] = pos.volatility->stop_multiplier;
        p["volatility"] = std::move(v);
      } else {
        p["volatility"] = nullptr;
      }

      nlohmann::json tranches = nlohmann::json::object();
      for (const auto& [id, spec] : pos.exit_tranches) {
        nlohmann::json t;
        t["percent"] = spec.percent_of_original;
        t["triggered"] = spec.triggered;
        t["profit_multiple_of_atr"] =
            spec.profit_multiple_of_atr
                ? nlohmann::json(*spec.profit_multiple_of_atr)
                : nlohmann::json();
        tranches[id] = std::move(t);
      }
      p["tranches"] = std::move(tranches);
      positions.push_back(std::move(p));
    }
    response["positions"] = std::move(positions);
  } else if (command == "SHUTDOWN") {
    requestShutdown("SHUTDOWN command");
    response["status"] = "ok";
    response["response"] = "Shutdown requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + command;
  }

  return response.dump();
}

}  // namespace trailguard
