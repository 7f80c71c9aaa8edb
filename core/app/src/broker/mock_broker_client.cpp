#include "trailguard/broker/mock_broker_client.hpp"
#include "trailguard/errors/errors.hpp"
#include "trailguard/time/time_utils.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace trailguard {

// --- scripting ---------------------------------------------------------------

void MockBrokerClient::setHoldings(std::vector<domain::BrokerHolding> holdings) {
  std::lock_guard lock(mutex_);
  holdings_ = std::move(holdings);
}

void MockBrokerClient::setPrice(const std::string& ticker, double price) {
  std::lock_guard lock(mutex_);
  prices_[ticker] = price;
}

void MockBrokerClient::clearPrice(const std::string& ticker) {
  std::lock_guard lock(mutex_);
  prices_.erase(ticker);
}

void MockBrokerClient::setCandles(const std::string& ticker,
                                  std::vector<domain::Candle> candles) {
  std::lock_guard lock(mutex_);
  candles_[ticker] = std::move(candles);
}

void MockBrokerClient::setInstrument(domain::Instrument instrument) {
  std::lock_guard lock(mutex_);
  instruments_[instrument.ticker] = std::move(instrument);
}

void MockBrokerClient::setConditionalOrders(
    const std::string& ticker, std::vector<domain::ConditionalOrder> orders) {
  std::lock_guard lock(mutex_);
  conditional_[ticker] = std::move(orders);
}

void MockBrokerClient::failAuthentication(bool fail) {
  std::lock_guard lock(mutex_);
  fail_auth_ = fail;
}

void MockBrokerClient::failPriceRequests(int count) {
  std::lock_guard lock(mutex_);
  failing_price_requests_ = count;
}

void MockBrokerClient::scriptOrderFailure(const std::string& ticker,
                                          std::exception_ptr error) {
  std::lock_guard lock(mutex_);
  order_failures_[ticker].push_back(std::move(error));
}

void MockBrokerClient::scriptFillQuantity(const std::string& ticker,
                                          std::int64_t filled) {
  std::lock_guard lock(mutex_);
  scripted_fills_[ticker].push_back(filled);
}

// -----------------------------------------------------------------------------
// seedFlatMarket(): quiet bars around each holding's average price
// -----------------------------------------------------------------------------
void MockBrokerClient::seedFlatMarket(
    const std::vector<domain::BrokerHolding>& holdings) {
  constexpr int kBars = 30;
  std::lock_guard lock(mutex_);
  for (const auto& h : holdings) {
    const double mid = h.average_price > 0.0 ? h.average_price : 100.0;
    prices_[h.ticker] = mid;

    std::vector<domain::Candle> bars;
    bars.reserve(kBars);
    for (int i = 0; i < kBars; ++i) {
      domain::Candle c;
      c.timestamp_ms = static_cast<std::int64_t>(i) * kMillisPerDay;
      c.open = mid;
      c.high = mid * 1.01;
      c.low = mid * 0.99;
      c.close = mid;
      c.volume = 1000.0;
      bars.push_back(c);
    }
    candles_[h.ticker] = std::move(bars);
  }
}

// --- inspection --------------------------------------------------------------

std::vector<domain::OrderRequest> MockBrokerClient::placedOrders() const {
  std::lock_guard lock(mutex_);
  return placed_;
}

int MockBrokerClient::placeAttempts() const {
  std::lock_guard lock(mutex_);
  return place_attempts_;
}

int MockBrokerClient::priceRequests() const {
  std::lock_guard lock(mutex_);
  return price_requests_;
}

int MockBrokerClient::holdingsRequests() const {
  std::lock_guard lock(mutex_);
  return holdings_requests_;
}

std::vector<std::string> MockBrokerClient::cancelledConditionalOrders() const {
  std::lock_guard lock(mutex_);
  return cancelled_conditional_;
}

// --- IBrokerClient -----------------------------------------------------------

void MockBrokerClient::authenticate() {
  std::lock_guard lock(mutex_);
  if (fail_auth_) {
    throw BrokerAuthError("invalid access token");
  }
}

std::unordered_map<std::string, double> MockBrokerClient::lastPrices(
    const std::vector<std::string>& symbols) {
  std::lock_guard lock(mutex_);
  ++price_requests_;
  if (failing_price_requests_ > 0) {
    --failing_price_requests_;
    throw TransientBrokerError("quote service unavailable");
  }

  std::unordered_map<std::string, double> result;
  for (const auto& symbol : symbols) {
    auto it = prices_.find(symbol);
    if (it != prices_.end()) {
      result.emplace(symbol, it->second);
    }
  }
  return result;
}

std::vector<domain::Candle> MockBrokerClient::dailyCandles(
    const domain::Instrument& instrument, int lookback_days) {
  std::lock_guard lock(mutex_);
  auto it = candles_.find(instrument.ticker);
  if (it == candles_.end()) {
    return {};
  }
  const auto& bars = it->second;
  if (lookback_days <= 0 ||
      static_cast<std::size_t>(lookback_days) >= bars.size()) {
    return bars;
  }
  return std::vector<domain::Candle>(bars.end() - lookback_days, bars.end());
}

std::vector<domain::BrokerHolding> MockBrokerClient::holdings() {
  std::lock_guard lock(mutex_);
  ++holdings_requests_;
  return holdings_;
}

// -----------------------------------------------------------------------------
// placeOrder(): consume one scripted failure, else fill as scripted
// -----------------------------------------------------------------------------
domain::OrderAck MockBrokerClient::placeOrder(
    const domain::OrderRequest& request) {
  std::lock_guard lock(mutex_);
  ++place_attempts_;

  auto failures = order_failures_.find(request.ticker);
  if (failures != order_failures_.end() && !failures->second.empty()) {
    std::exception_ptr error = failures->second.front();
    failures->second.pop_front();
    std::rethrow_exception(error);
  }

  placed_.push_back(request);

  domain::OrderAck ack;
  ack.order_id = "MOCK-" + std::to_string(next_order_id_++);
  ack.filled_quantity = request.quantity;
  auto fills = scripted_fills_.find(request.ticker);
  if (fills != scripted_fills_.end() && !fills->second.empty()) {
    ack.filled_quantity =
        std::clamp<std::int64_t>(fills->second.front(), 0, request.quantity);
    fills->second.pop_front();
  }
  if (request.limit_price) {
    ack.fill_price = *request.limit_price;
  } else {
    auto price = prices_.find(request.ticker);
    ack.fill_price = price != prices_.end() ? price->second : 0.0;
  }
  return ack;
}

std::vector<domain::ConditionalOrder> MockBrokerClient::conditionalOrders(
    const std::string& ticker) {
  std::lock_guard lock(mutex_);
  auto it = conditional_.find(ticker);
  return it != conditional_.end() ? it->second
                                  : std::vector<domain::ConditionalOrder>{};
}

void MockBrokerClient::cancelConditionalOrder(const std::string& order_id) {
  std::lock_guard lock(mutex_);
  cancelled_conditional_.push_back(order_id);
  for (auto& [ticker, orders] : conditional_) {
    orders.erase(std::remove_if(orders.begin(), orders.end(),
                                [&order_id](const domain::ConditionalOrder& o) {
                                  return o.id == order_id;
                                }),
                 orders.end());
  }
}

domain::Instrument MockBrokerClient::lookupInstrument(
    const std::string& ticker, const std::string& exchange) {
  std::lock_guard lock(mutex_);
  auto it = instruments_.find(ticker);
  if (it != instruments_.end()) {
    return it->second;
  }
  // Unknown tickers still resolve when there is market data for them.
  if (candles_.count(ticker) > 0 || prices_.count(ticker) > 0) {
    domain::Instrument instrument;
    instrument.ticker = ticker;
    instrument.exchange = exchange;
    instrument.token = static_cast<std::int64_t>(
                           std::hash<std::string>{}(ticker) % 1000000) + 1;
    return instrument;
  }
  throw InstrumentNotFoundError("unknown instrument " + exchange + ":" + ticker);
}

}  // namespace trailguard
