#pragma once

#include "trailguard/domain/market_data.hpp"
#include "trailguard/domain/order_request.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// IBrokerClient - everything the monitor needs from a brokerage
// -----------------------------------------------------------------------------
//
// @brief  Abstract boundary between the monitor and the broker. The engine,
//         price feed and executor depend only on this interface.
//
// @details
// Failures are reported by throwing the types in trailguard/errors/errors.hpp
// (RateLimitedError, DuplicateOrderError, BrokerAuthError, ...). Callers
// classify them with classifyError() and never parse message text.
//
// Implementations:
//   ZmqBrokerClient   JSON over a ZeroMQ REQ socket to a broker bridge.
//   MockBrokerClient  scripted data and failures, for tests and --simulate.
//
// Thread model:
//   Implementations must tolerate calls from several threads (price feed,
//   control thread, order routing loop). ZmqBrokerClient serialises calls
//   internally.
// -----------------------------------------------------------------------------
class IBrokerClient {
 public:
  virtual ~IBrokerClient() = default;

  // Validates the session. Throws BrokerAuthError if credentials are bad.
  virtual void authenticate() = 0;

  // Last traded price per symbol. Symbols missing from the reply had no
  // quote. Callers send at most 500 symbols per call.
  virtual std::unordered_map<std::string, double> lastPrices(
      const std::vector<std::string>& symbols) = 0;

  // Daily bars for the instrument, oldest first.
  virtual std::vector<domain::Candle> dailyCandles(
      const domain::Instrument& instrument, int lookback_days) = 0;

  // Current holdings, already merged with the CNC positions of the day.
  virtual std::vector<domain::BrokerHolding> holdings() = 0;

  virtual domain::OrderAck placeOrder(const domain::OrderRequest& request) = 0;

  virtual std::vector<domain::ConditionalOrder> conditionalOrders(
      const std::string& ticker) = 0;

  virtual void cancelConditionalOrder(const std::string& order_id) = 0;

  // Throws InstrumentNotFoundError for unknown tickers.
  virtual domain::Instrument lookupInstrument(const std::string& ticker,
                                              const std::string& exchange) = 0;
};

}  // namespace trailguard
