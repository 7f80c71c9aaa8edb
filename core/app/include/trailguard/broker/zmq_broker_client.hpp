#pragma once

#include "trailguard/broker/i_broker_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace trailguard {

// -----------------------------------------------------------------------------
// ZmqBrokerClient - IBrokerClient over a ZeroMQ REQ socket
// -----------------------------------------------------------------------------
//
// @brief  Talks to an out-of-process broker bridge that owns the brokerage
//         session and its credentials. Each call is one JSON request and one
//         JSON reply.
//
// @details
// Request:  {"op": "<name>", ...arguments}
// Reply:    {"status": "ok", "data": <payload>}
//        or {"status": "error", "code": "<code>", "message": "..."}
//
// Error codes map onto exception types:
//   rate_limited       → RateLimitedError
//   duplicate          → DuplicateOrderError
//   auth               → BrokerAuthError
//   not_found          → InstrumentNotFoundError
//   insufficient_data  → InsufficientDataError
//   rejected           → OrderRejectedError
//   anything else      → TransientBrokerError
//
// A REQ socket that misses a reply is stuck in the "awaiting reply" state,
// so on receive timeout the socket is closed and rebuilt before the
// TransientBrokerError is thrown. The next call starts clean.
//
// Thread model:
//   One mutex serialises all calls; a REQ socket must strictly alternate
//   send and recv. Safe to share between the price feed, the control thread
//   and the order routing loop.
//
// Ownership:
//   Owns the ZMQ context and socket. Owned by main() via unique_ptr and
//   handed to MonitorEngine by reference.
// -----------------------------------------------------------------------------
class ZmqBrokerClient final : public IBrokerClient {
 public:
  ZmqBrokerClient(std::string endpoint, std::chrono::milliseconds timeout);
  ~ZmqBrokerClient() override;

  ZmqBrokerClient(const ZmqBrokerClient&) = delete;
  ZmqBrokerClient& operator=(const ZmqBrokerClient&) = delete;
  ZmqBrokerClient(ZmqBrokerClient&&) = delete;
  ZmqBrokerClient& operator=(ZmqBrokerClient&&) = delete;

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
  // Sends one request and returns the "data" member of a successful reply.
  // Throws the mapped exception type for error replies.
  nlohmann::json call(const nlohmann::json& request);

  // Caller holds mutex_.
  void connectLocked();

  [[noreturn]] static void throwForCode(const std::string& code,
                                        const std::string& message);

  std::string endpoint_;
  std::chrono::milliseconds timeout_;

  std::mutex mutex_;
  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace trailguard
