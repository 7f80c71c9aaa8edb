#include "trailguard/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace trailguard {

namespace {

std::string formatStopUpdate(const StopUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "stop_update";
  j["ticker"] = e.ticker;
  j["side"] = domain::toString(e.side);
  j["previous_stop"] = e.previous_stop;
  j["stop"] = e.stop;
  j["extreme"] = e.extreme;
  j["price"] = e.price;
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

nlohmann::json requestJson(const domain::OrderRequest& r) {
  nlohmann::json j;
  j["request_id"] = r.request_id;
  j["ticker"] = r.ticker;
  j["exchange"] = r.exchange;
  j["side"] = domain::toString(r.side);
  j["quantity"] = r.quantity;
  j["limit_price"] =
      r.limit_price ? nlohmann::json(*r.limit_price) : nlohmann::json();
  j["reason"] = domain::toString(r.reason);
  j["reason_text"] = r.reason_text;
  j["tranche"] = r.tranche_id;
  j["trigger_price"] = r.trigger_price;
  j["remaining_after_fill"] = r.remaining_after_fill;
  return j;
}

std::string formatOrderRequest(const OrderRequestEvent& e) {
  nlohmann::json j = requestJson(e.request);
  j["type"] = "order_request";
  j["timestamp_ms"] = e.request.timestamp_ms;
  return j.dump();
}

std::string formatOrderOutcome(const OrderOutcomeEvent& e) {
  const domain::OrderOutcome& o = e.outcome;
  nlohmann::json j;
  j["type"] = "order_outcome";
  j["request"] = requestJson(o.request);
  j["status"] = domain::toString(o.status);
  j["filled_quantity"] = o.filled_quantity;
  j["fill_price"] = o.fill_price;
  j["broker_order_id"] = o.broker_order_id;
  j["attempts"] = o.attempts;
  j["last_error"] = o.last_error;
  j["timestamp_ms"] = o.timestamp_ms;
  return j.dump();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto text = formatTelemetry(*event);
    if (!text) {
      continue;
    }
    zmq::message_t msg(text->data(), text->size());
    try {
      static_cast<void>(pub_socket_->send(msg, zmq::send_flags::dontwait));
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] telemetry send failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;
  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[IpcServer] command recv failed: " << e.what() << "\n";
    }
    return;
  }
  if (!result.has_value()) {
    return;
  }

  const std::string command = request.to_string();
  std::string response;
  try {
    response = command_handler_(command);
  } catch (const std::exception& e) {
    nlohmann::json j;
    j["status"] = "error";
    j["message"] = e.what();
    response = j.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  try {
    static_cast<void>(cmd_socket_->send(reply, zmq::send_flags::none));
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] command reply failed: " << e.what() << "\n";
  }
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (const auto* e = std::get_if<StopUpdateEvent>(&event)) {
    return formatStopUpdate(*e);
  }
  if (const auto* e = std::get_if<OrderRequestEvent>(&event)) {
    return formatOrderRequest(*e);
  }
  if (const auto* e = std::get_if<OrderOutcomeEvent>(&event)) {
    return formatOrderOutcome(*e);
  }
  return std::nullopt;
}

}  // namespace trailguard
