// -----------------------------------------------------------------------------
// trailguard - single executable entry point
//
//   1) Parse the CLI and build the EngineConfig (file, then CLI overrides).
//   2) Refuse to start once today's session has closed.
//   3) Pick the broker: ZmqBrokerClient, or MockBrokerClient with --simulate.
//   4) Start the MonitorEngine (startup gate, then every thread).
//   5) Block on the engine's shutdown token. SIGINT/SIGTERM, the SHUTDOWN
//      command and the market close all end up cancelling it.
//   6) Stop with a bounded join and map the result to the exit code.
//
// Thread layout after start: see MonitorEngine. The main thread only waits.
// -----------------------------------------------------------------------------

#include "trailguard/broker/mock_broker_client.hpp"
#include "trailguard/broker/zmq_broker_client.hpp"
#include "trailguard/config/engine_config.hpp"
#include "trailguard/engine/monitor_engine.hpp"
#include "trailguard/errors/errors.hpp"
#include "trailguard/persistence/orders_file.hpp"
#include "trailguard/time/live_time_provider.hpp"
#include "trailguard/time/time_utils.hpp"
#include "trailguard/util/cli.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitStartupFailure = 1;
constexpr int kExitForced = 2;

// Set by the signal handler, polled by the main thread.
volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_signal(int signum) { g_signal = signum; }

trailguard::EngineConfig buildConfig(const trailguard::util::CLIArgs& args) {
  trailguard::EngineConfig config;
  if (!args.config_path.empty()) {
    config = trailguard::loadConfig(args.config_path);
  }
  if (!args.orders_file.empty()) {
    config.orders_file = args.orders_file;
  }
  if (!args.tickers.empty()) {
    config.tickers = args.tickers;
  }
  if (args.poll_interval_ms) {
    config.poll_interval = std::chrono::milliseconds(*args.poll_interval_ms);
  }
  config.verbose = config.verbose || args.verbose;
  config.simulate = config.simulate || args.simulate;
  return config;
}

// Mock broker holding either the orders-file entries or, without one, ten
// shares at 100.0 of every --tickers symbol, each on a flat market.
std::unique_ptr<trailguard::MockBrokerClient> makeSimulatedBroker(
    const trailguard::EngineConfig& config) {
  auto broker = std::make_unique<trailguard::MockBrokerClient>();

  std::vector<trailguard::domain::BrokerHolding> holdings;
  if (!config.orders_file.empty()) {
    holdings = trailguard::loadOrdersFile(config.orders_file);
  } else {
    for (const auto& ticker : config.tickers) {
      trailguard::domain::BrokerHolding h;
      h.ticker = ticker;
      h.exchange = config.exchange;
      h.product = config.product;
      h.quantity = 10;
      h.average_price = 100.0;
      h.investment_amount = 1000.0;
      holdings.push_back(h);
    }
  }

  broker->setHoldings(holdings);
  broker->seedFlatMarket(holdings);
  std::cout << "[main] simulation broker seeded with " << holdings.size()
            << " holding(s)\n";
  return broker;
}

}  // namespace

int main(int argc, char* argv[]) {
  trailguard::util::CLIArgs args;
  if (!trailguard::util::parse_args(argc, argv, args)) {
    return kExitStartupFailure;
  }
  if (args.help) {
    trailguard::util::print_help();
    return kExitClean;
  }

  trailguard::EngineConfig config;
  try {
    config = buildConfig(args);
  } catch (const trailguard::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return kExitStartupFailure;
  }

  trailguard::LiveTimeProvider clock;
  const std::int64_t now_ms = clock.now_ms();
  if (config.market_hours.isAfterClose(now_ms)) {
    std::cout << "[main] market is closed ("
              << trailguard::formatLocalTime(
                     now_ms, config.market_hours.utc_offset_minutes)
              << "). Nothing to monitor until the next session.\n";
    return kExitClean;
  }

  std::unique_ptr<trailguard::IBrokerClient> broker;
  try {
    if (config.simulate) {
      broker = makeSimulatedBroker(config);
    } else {
      broker = std::make_unique<trailguard::ZmqBrokerClient>(
          config.broker_endpoint, config.broker_timeout);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] cannot create broker client: " << e.what() << "\n";
    return kExitStartupFailure;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  trailguard::MonitorEngine engine(config, *broker, clock);
  try {
    engine.start();
  } catch (const trailguard::BrokerAuthError& e) {
    std::cerr << "[main] broker authentication failed: " << e.what() << "\n";
    return kExitStartupFailure;
  } catch (const trailguard::StartupError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return kExitStartupFailure;
  } catch (const trailguard::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return kExitStartupFailure;
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return kExitStartupFailure;
  }

  while (!engine.waitForShutdown(std::chrono::milliseconds(200))) {
    if (g_signal != 0) {
      engine.requestShutdown(g_signal == SIGINT ? "SIGINT" : "SIGTERM");
    }
  }

  if (!engine.stop()) {
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(kExitForced);
  }
  std::cout << "[main] clean shutdown.\n";
  return kExitClean;
}
