#include "trailguard/feed/price_feed.hpp"
#include "trailguard/events/event_types.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace trailguard {

PriceFeed::PriceFeed(IBrokerClient& broker, const ITimeProvider& clock,
                     TickerSource tickers, EventSink sink,
                     std::chrono::milliseconds interval,
                     std::size_t batch_size,
                     const IExclusionPolicy* exclusions, bool verbose)
    : broker_(broker),
      clock_(clock),
      tickers_(std::move(tickers)),
      sink_(std::move(sink)),
      interval_(interval),
      batch_size_(batch_size == 0 ? kDefaultBatchSize : batch_size),
      exclusions_(exclusions),
      verbose_(verbose) {}

PriceFeed::~PriceFeed() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the poll thread
// -----------------------------------------------------------------------------
// The token is one-shot, so a feed that has been stopped stays stopped.
// -----------------------------------------------------------------------------
void PriceFeed::start() {
  if (thread_.joinable() || token_.cancelled()) {
    return;
  }
  {
    std::lock_guard lock(done_mutex_);
    done_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void PriceFeed::stop() {
  token_.cancel();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool PriceFeed::stopFor(std::chrono::milliseconds timeout) {
  token_.cancel();
  if (!thread_.joinable()) {
    return true;
  }

  bool finished = false;
  {
    std::unique_lock lock(done_mutex_);
    finished = done_cv_.wait_for(lock, timeout, [this] { return done_; });
  }
  if (finished) {
    thread_.join();
    return true;
  }

  std::cerr << "[PriceFeed] poll thread did not stop within "
            << timeout.count() << " ms; detaching.\n";
  thread_.detach();
  return false;
}

// -----------------------------------------------------------------------------
// run(): poll, then wait for the interval or cancellation
// -----------------------------------------------------------------------------
void PriceFeed::run() {
  std::cout << "[PriceFeed] polling every " << interval_.count() << " ms\n";
  while (!token_.cancelled()) {
    pollOnce();
    if (token_.wait_for(interval_)) {
      break;
    }
  }
  std::cout << "[PriceFeed] poll loop exited.\n";

  {
    std::lock_guard lock(done_mutex_);
    done_ = true;
  }
  done_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// pollOnce(): one cycle over every tracked ticker
// -----------------------------------------------------------------------------
std::size_t PriceFeed::pollOnce() {
  std::vector<std::string> symbols = tickers_();
  if (exclusions_ != nullptr) {
    symbols.erase(std::remove_if(symbols.begin(), symbols.end(),
                                 [this](const std::string& s) {
                                   return exclusions_->isExcluded(s);
                                 }),
                  symbols.end());
  }
  ++cycles_;
  if (symbols.empty()) {
    return 0;
  }

  std::size_t delivered = 0;
  for (std::size_t begin = 0; begin < symbols.size(); begin += batch_size_) {
    if (token_.cancelled()) {
      break;
    }
    const std::size_t end = std::min(begin + batch_size_, symbols.size());
    const std::vector<std::string> batch(symbols.begin() + begin,
                                         symbols.begin() + end);

    std::unordered_map<std::string, double> quotes;
    try {
      quotes = broker_.lastPrices(batch);
    } catch (const std::exception& e) {
      std::cerr << "[PriceFeed] price batch of " << batch.size()
                << " failed: " << e.what() << "\n";
      continue;
    }

    const std::int64_t now_ms = clock_.now_ms();
    for (const auto& symbol : batch) {
      auto it = quotes.find(symbol);
      if (it == quotes.end() || !(it->second > 0.0)) {
        if (verbose_) {
          std::cout << "[PriceFeed] no quote for " << symbol << "\n";
        }
        continue;
      }
      sink_(PriceObservationEvent{symbol, it->second, now_ms});
      ++delivered;
    }
  }

  if (verbose_) {
    std::cout << "[PriceFeed] cycle " << cycles_.load() << ": " << delivered
              << "/" << symbols.size() << " quotes\n";
  }
  return delivered;
}

}  // namespace trailguard
