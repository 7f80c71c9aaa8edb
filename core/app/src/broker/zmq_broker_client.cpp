#include "trailguard/broker/zmq_broker_client.hpp"
#include "trailguard/errors/errors.hpp"

#include <utility>

namespace trailguard {

namespace {

const char* sideToWire(domain::PositionSide side) {
  return side == domain::PositionSide::Long ? "LONG" : "SHORT";
}

domain::PositionSide sideFromWire(const std::string& side) {
  return side == "SHORT" ? domain::PositionSide::Short
                         : domain::PositionSide::Long;
}

nlohmann::json opRequest(const char* op) {
  nlohmann::json request = nlohmann::json::object();
  request["op"] = op;
  return request;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
ZmqBrokerClient::ZmqBrokerClient(std::string endpoint,
                                 std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
  std::lock_guard lock(mutex_);
  context_ = std::make_unique<zmq::context_t>(1);
  connectLocked();
}

ZmqBrokerClient::~ZmqBrokerClient() {
  std::lock_guard lock(mutex_);
  socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// connectLocked(): (re)build the REQ socket
// -----------------------------------------------------------------------------
void ZmqBrokerClient::connectLocked() {
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_.count()));
  socket_->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_.count()));
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// call(): one request/reply round trip
// -----------------------------------------------------------------------------
nlohmann::json ZmqBrokerClient::call(const nlohmann::json& request) {
  const std::string payload = request.dump();
  std::string reply_text;

  {
    std::lock_guard lock(mutex_);

    zmq::message_t out(payload.data(), payload.size());
    zmq::send_result_t sent;
    try {
      sent = socket_->send(out, zmq::send_flags::none);
    } catch (const zmq::error_t& e) {
      connectLocked();
      throw TransientBrokerError(std::string("broker bridge send failed: ") +
                                 e.what());
    }
    if (!sent.has_value()) {
      connectLocked();
      throw TransientBrokerError("broker bridge send timed out");
    }

    zmq::message_t in;
    zmq::recv_result_t received;
    try {
      received = socket_->recv(in, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      connectLocked();
      throw TransientBrokerError(std::string("broker bridge recv failed: ") +
                                 e.what());
    }
    if (!received.has_value()) {
      // REQ socket is now wedged waiting for a reply; start over.
      connectLocked();
      throw TransientBrokerError("broker bridge timed out on op " +
                                 request.value("op", std::string("?")));
    }
    reply_text = in.to_string();
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(reply_text);
  } catch (const nlohmann::json::exception& e) {
    throw TransientBrokerError(std::string("malformed bridge reply: ") +
                               e.what());
  }

  const std::string status = reply.value("status", std::string("error"));
  if (status != "ok") {
    throwForCode(reply.value("code", std::string()),
                 reply.value("message", std::string("unknown broker error")));
  }
  return reply.contains("data") ? reply.at("data") : nlohmann::json();
}

// -----------------------------------------------------------------------------
// throwForCode(): map bridge error codes onto the exception taxonomy
// -----------------------------------------------------------------------------
void ZmqBrokerClient::throwForCode(const std::string& code,
                                   const std::string& message) {
  if (code == "rate_limited") {
    throw RateLimitedError(message);
  }
  if (code == "duplicate") {
    throw DuplicateOrderError(message);
  }
  if (code == "auth") {
    throw BrokerAuthError(message);
  }
  if (code == "not_found") {
    throw InstrumentNotFoundError(message);
  }
  if (code == "insufficient_data") {
    throw InsufficientDataError(message);
  }
  if (code == "rejected") {
    throw OrderRejectedError(message);
  }
  throw TransientBrokerError(code.empty() ? message : code + ": " + message);
}

// --- authenticate ------------------------------------------------------------
void ZmqBrokerClient::authenticate() {
  call(opRequest("authenticate"));
}

// --- lastPrices --------------------------------------------------------------
std::unordered_map<std::string, double> ZmqBrokerClient::lastPrices(
    const std::vector<std::string>& symbols) {
  const nlohmann::json data = call({{"op", "ltp"}, {"symbols", symbols}});

  std::unordered_map<std::string, double> prices;
  try {
    for (const auto& [symbol, price] : data.items()) {
      if (price.is_number()) {
        prices[symbol] = price.get<double>();
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw TransientBrokerError(std::string("bad ltp payload: ") + e.what());
  }
  return prices;
}

// --- dailyCandles ------------------------------------------------------------
std::vector<domain::Candle> ZmqBrokerClient::dailyCandles(
    const domain::Instrument& instrument, int lookback_days) {
  const nlohmann::json data = call({{"op", "candles"},
                                    {"ticker", instrument.ticker},
                                    {"exchange", instrument.exchange},
                                    {"token", instrument.token},
                                    {"days", lookback_days}});

  std::vector<domain::Candle> candles;
  try {
    candles.reserve(data.size());
    for (const auto& bar : data) {
      domain::Candle c;
      c.timestamp_ms = bar.value("timestamp_ms", std::int64_t{0});
      c.open = bar.at("open").get<double>();
      c.high = bar.at("high").get<double>();
      c.low = bar.at("low").get<double>();
      c.close = bar.at("close").get<double>();
      c.volume = bar.value("volume", 0.0);
      candles.push_back(c);
    }
  } catch (const nlohmann::json::exception& e) {
    throw TransientBrokerError(std::string("bad candles payload: ") + e.what());
  }
  return candles;
}

// --- holdings ----------------------------------------------------------------
// Settled and T+1 quantities are reported separately; both are sellable.
std::vector<domain::BrokerHolding> ZmqBrokerClient::holdings() {
  const nlohmann::json data = call(opRequest("holdings"));

  std::vector<domain::BrokerHolding> result;
  try {
    for (const auto& row : data) {
      domain::BrokerHolding h;
      h.ticker = row.at("ticker").get<std::string>();
      h.exchange = row.value("exchange", std::string("NSE"));
      h.product = row.value("product", std::string("CNC"));
      h.side = sideFromWire(row.value("side", std::string(sideToWire(h.side))));
      h.quantity = row.value("quantity", std::int64_t{0}) +
                   row.value("t1_quantity", std::int64_t{0});
      h.average_price = row.value("average_price", 0.0);
      h.investment_amount =
          row.value("investment_amount",
                    h.average_price * static_cast<double>(h.quantity));
      h.instrument_token = row.value("instrument_token", std::int64_t{0});
      result.push_back(std::move(h));
    }
  } catch (const nlohmann::json::exception& e) {
    throw TransientBrokerError(std::string("bad holdings payload: ") +
                               e.what());
  }
  return result;
}

// --- placeOrder --------------------------------------------------------------
domain::OrderAck ZmqBrokerClient::placeOrder(
    const domain::OrderRequest& request) {
  nlohmann::json j;
  j["op"] = "place_order";
  j["tag"] = "tg" + std::to_string(request.request_id);
  j["ticker"] = request.ticker;
  j["exchange"] = request.exchange;
  j["product"] = request.product;
  j["side"] = domain::toString(request.side);
  j["quantity"] = request.quantity;
  if (request.limit_price) {
    j["order_type"] = "LIMIT";
    j["price"] = *request.limit_price;
  } else {
    j["order_type"] = "MARKET";
  }

  const nlohmann::json data = call(j);

  domain::OrderAck ack;
  ack.order_id = data.value("order_id", std::string());
  if (data.contains("filled_quantity") && data["filled_quantity"].is_number()) {
    ack.filled_quantity = data["filled_quantity"].get<std::int64_t>();
  }
  if (data.contains("average_price") && data["average_price"].is_number()) {
    ack.fill_price = data["average_price"].get<double>();
  }
  return ack;
}

// --- conditionalOrders -------------------------------------------------------
std::vector<domain::ConditionalOrder> ZmqBrokerClient::conditionalOrders(
    const std::string& ticker) {
  const nlohmann::json data = call({{"op", "gtt_list"}, {"ticker", ticker}});

  std::vector<domain::ConditionalOrder> result;
  for (const auto& row : data) {
    domain::ConditionalOrder order;
    order.id = row.value("id", std::string());
    order.ticker = row.value("ticker", ticker);
    order.status = row.value("status", std::string("active"));
    result.push_back(std::move(order));
  }
  return result;
}

// --- cancelConditionalOrder --------------------------------------------------
void ZmqBrokerClient::cancelConditionalOrder(const std::string& order_id) {
  call({{"op", "gtt_cancel"}, {"id", order_id}});
}

// --- lookupInstrument --------------------------------------------------------
domain::Instrument ZmqBrokerClient::lookupInstrument(
    const std::string& ticker, const std::string& exchange) {
  const nlohmann::json data =
      call({{"op", "instrument"}, {"ticker", ticker}, {"exchange", exchange}});

  domain::Instrument instrument;
  instrument.ticker = ticker;
  instrument.exchange = exchange;
  instrument.token = data.value("token", std::int64_t{0});
  instrument.tick_size = data.value("tick_size", 0.0);
  if (instrument.token == 0) {
    throw InstrumentNotFoundError("no instrument token for " + exchange + ":" +
                                  ticker);
  }
  return instrument;
}

}  // namespace trailguard
