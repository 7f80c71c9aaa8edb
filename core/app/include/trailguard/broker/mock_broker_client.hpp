#pragma once

#include "trailguard/broker/i_broker_client.hpp"

#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// MockBrokerClient - scripted in-process broker
// -----------------------------------------------------------------------------
//
// @brief  Deterministic IBrokerClient for tests and --simulate runs.
//
// @details
// Every answer is set up front: holdings, last prices, daily candles,
// instruments and conditional orders. Failures are scripted per ticker as a
// FIFO of exceptions; each placeOrder() call for that ticker consumes one
// and rethrows it, and once the script is empty the order succeeds with a
// full fill at the limit price (or the last price for market orders).
// scriptFillQuantity() caps the fill of the next successful order for a
// ticker, to model partial fills (or 0 for an order left resting).
//
// All placed orders and every placeOrder() attempt are recorded so tests can
// assert on them.
//
// Thread model: every method locks mutex_; safe from any thread.
// -----------------------------------------------------------------------------
class MockBrokerClient final : public IBrokerClient {
 public:
  MockBrokerClient() = default;

  // --- scripting ------------------------------------------------------------
  void setHoldings(std::vector<domain::BrokerHolding> holdings);
  void setPrice(const std::string& ticker, double price);
  void clearPrice(const std::string& ticker);
  void setCandles(const std::string& ticker,
                  std::vector<domain::Candle> candles);
  void setInstrument(domain::Instrument instrument);
  void setConditionalOrders(const std::string& ticker,
                            std::vector<domain::ConditionalOrder> orders);
  void failAuthentication(bool fail);
  void failPriceRequests(int count);

  // Queue an exception for the next placeOrder() on `ticker`.
  void scriptOrderFailure(const std::string& ticker, std::exception_ptr error);

  // Queue the filled quantity reported by the next successful placeOrder()
  // on `ticker`, capped at the requested quantity.
  void scriptFillQuantity(const std::string& ticker, std::int64_t filled);

  // Seeds a quiet market for each holding: price at the average price and
  // 30 flat daily bars of +/-1% range.
  void seedFlatMarket(const std::vector<domain::BrokerHolding>& holdings);

  // --- inspection -----------------------------------------------------------
  std::vector<domain::OrderRequest> placedOrders() const;
  int placeAttempts() const;
  int priceRequests() const;
  int holdingsRequests() const;
  std::vector<std::string> cancelledConditionalOrders() const;

  // --- IBrokerClient --------------------------------------------------------
  void authenticate() override;

  std::unordered_map<std::string, double> lastPrices(
      const std::vector<std::string>& symbols) override;

  std::vector<domain::Candle> dailyCandles(const domain::Instrument& instrument,
                                           int lookback_days) override;

  std::vector<domain::BrokerHolding> holdings() override;

  domain::OrderAck placeOrder(const domain::OrderRequest& request) override;

  std::vector<domain::ConditionalOrder> conditionalOrders(
      const std::string& ticker) override;

  void cancelConditionalOrder(const std::string& order_id) override;

  domain::Instrument lookupInstrument(const std::string& ticker,
                                      const std::string& exchange) override;

 private:
  mutable std::mutex mutex_;

  std::vector<domain::BrokerHolding> holdings_;
  std::unordered_map<std::string, double> prices_;
  std::unordered_map<std::string, std::vector<domain::Candle>> candles_;
  std::unordered_map<std::string, domain::Instrument> instruments_;
  std::map<std::string, std::vector<domain::ConditionalOrder>> conditional_;
  std::unordered_map<std::string, std::deque<std::exception_ptr>>
      order_failures_;
  std::unordered_map<std::string, std::deque<std::int64_t>> scripted_fills_;

  bool fail_auth_{false};
  int failing_price_requests_{0};

  std::vector<domain::OrderRequest> placed_;
  std::vector<std::string> cancelled_conditional_;
  int place_attempts_{0};
  int price_requests_{0};
  int holdings_requests_{0};
  std::int64_t next_order_id_{1};
};

}  // namespace trailguard
