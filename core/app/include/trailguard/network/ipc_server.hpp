#pragma once

#include "trailguard/concurrent/thread_safe_queue.hpp"
#include "trailguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace trailguard {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ telemetry publisher and command endpoint
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two sockets: a PUB socket that
//         broadcasts JSON telemetry and a REP socket that answers commands.
//
// @details
// Telemetry (PUB): StopUpdateEvent, OrderRequestEvent and OrderOutcomeEvent
// are bridged in from the risk loop with pushTelemetry() and published as
// JSON objects with "type" set to "stop_update", "order_request" or
// "order_outcome". Other event types are dropped.
//
// Commands (REP): each request string is handed to the CommandHandler
// (MonitorEngine::executeCommand) and its reply is sent back. A handler
// that throws produces {"status":"error","message":...}.
//
// The REP socket has a receive timeout of kPollTimeoutMs, so the worker
// alternates between draining telemetry and waiting for a command, and
// notices stop() within one timeout.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by MonitorEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Throws zmq::error_t if an
  // endpoint cannot be bound. No-op if already running.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // JSON text for a telemetry event, or empty for non-telemetry events.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace trailguard
