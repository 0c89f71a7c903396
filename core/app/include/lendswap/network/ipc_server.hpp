#pragma once

#include "lendswap/concurrent/thread_safe_queue.hpp"
#include "lendswap/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace lendswap {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a worker thread that answers JSON commands on a REP socket
//         and broadcasts protocol telemetry on a PUB socket.
//
// @details
// Two sockets share one thread:
//
//   1. REP socket (commands):
//      Each request is handed to the command handler (bound to
//      LendingEngine::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the loop from blocking, so the thread alternates
//      between commands and telemetry.
//
//   2. PUB socket (telemetry):
//      PositionUpdateEvent, ReserveUpdateEvent and OperationRejectedEvent
//      are serialized to JSON and published. Events reach the thread
//      through a ThreadSafeQueue filled by EventBus bridges.
//
// 128-bit and token quantities are written as decimal strings so that
// clients never lose precision to double-based JSON parsers.
//
// Thread model:
//   start() / stop() are called from the owning thread (LendingEngine).
//   pushTelemetry() may be called from any thread. The command handler runs
//   on the worker thread.
//
// Ownership:
//   Owned by LendingEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Joins the worker (within kPollTimeoutMs) and closes the sockets.
  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Serializes one telemetry event.
  //
  // @return JSON text with a "type" discriminator of "position_update",
  //         "reserve_update" or "operation_rejected".
  //
  // Pure; public so the wire format can be tested without sockets.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatReserveUpdate(const ReserveUpdateEvent& e);
  static std::string formatOperationRejected(const OperationRejectedEvent& e);

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

}  // namespace lendswap
