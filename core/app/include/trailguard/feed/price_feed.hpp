#pragma once

#include "trailguard/broker/i_broker_client.hpp"
#include "trailguard/concurrent/cancellation_token.hpp"
#include "trailguard/events/event.hpp"
#include "trailguard/risk/exclusion_policy.hpp"
#include "trailguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// PriceFeed - batched last-traded-price polling thread
// -----------------------------------------------------------------------------
//
// @brief  Every poll interval, asks the broker for the last price of every
//         tracked ticker and pushes one PriceObservationEvent per quote into
//         the risk loop.
//
// @details
// The ticker list is pulled from a TickerSource on each cycle, so positions
// added or closed by the risk loop are picked up on the next poll. Excluded
// tickers are dropped before the request. Symbols are sent in batches of at
// most batch_size (500 by default).
//
// A failing batch is logged and skipped; the other batches of the same cycle
// and the next cycle proceed normally. Tickers with no quote in the reply
// produce no event.
//
// The wait between cycles is CancellationToken::wait_for, so stop() wakes
// the thread immediately instead of waiting out the interval.
//
// Thread model:
//   start()/stop()/stopFor() from the owning thread. The poll loop runs on
//   its own std::thread. pollOnce() may also be called directly (tests, or
//   the engine's first poll before the thread starts).
//
// Ownership:
//   Owned by MonitorEngine via std::unique_ptr. Holds references to the
//   broker client and clock, both owned by the engine's caller.
// -----------------------------------------------------------------------------
class PriceFeed {
 public:
  using TickerSource = std::function<std::vector<std::string>()>;
  using EventSink = std::function<void(Event)>;

  static constexpr std::size_t kDefaultBatchSize = 500;

  PriceFeed(IBrokerClient& broker, const ITimeProvider& clock,
            TickerSource tickers, EventSink sink,
            std::chrono::milliseconds interval,
            std::size_t batch_size = kDefaultBatchSize,
            const IExclusionPolicy* exclusions = nullptr,
            bool verbose = false);

  ~PriceFeed();

  PriceFeed(const PriceFeed&) = delete;
  PriceFeed& operator=(const PriceFeed&) = delete;
  PriceFeed(PriceFeed&&) = delete;
  PriceFeed& operator=(PriceFeed&&) = delete;

  // Spawns the poll thread. No-op if already running.
  void start();

  // Cancels and joins. Idempotent.
  void stop();

  // Bounded stop(). Returns false (and detaches) if the thread did not
  // finish in time.
  bool stopFor(std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // pollOnce()
  // -------------------------------------------------------------------------
  // @brief  Runs one polling cycle on the calling thread.
  // @return Number of PriceObservationEvents delivered to the sink.
  // -------------------------------------------------------------------------
  std::size_t pollOnce();

  std::uint64_t cycles() const { return cycles_.load(); }

 private:
  void run();

  IBrokerClient& broker_;
  const ITimeProvider& clock_;
  TickerSource tickers_;
  EventSink sink_;
  std::chrono::milliseconds interval_;
  std::size_t batch_size_;
  const IExclusionPolicy* exclusions_;
  bool verbose_;

  CancellationToken token_;
  std::atomic<std::uint64_t> cycles_{0};

  std::mutex done_mutex_;
  std::condition_variable done_cv_;
  bool done_{true};

  std::thread thread_;
};

}  // namespace trailguard
