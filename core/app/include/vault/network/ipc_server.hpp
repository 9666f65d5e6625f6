#pragma once

#include "vault/concurrent/thread_safe_queue.hpp"
#include "vault/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace vault {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ front door of the ledger
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving JSON commands on a REP socket and
//         broadcasting ledger telemetry on a PUB socket.
//
// @details
// Sockets:
//
//   REP (command_endpoint, default tcp://127.0.0.1:5556)
//     Each request is one JSON command. It is handed to the CommandHandler
//     (bound to LedgerEngine::executeCommand()) and the returned JSON string
//     is sent back. ZMQ_RCVTIMEO keeps the loop from blocking forever so it
//     can also drain telemetry and notice stop().
//
//   PUB (telemetry_endpoint, default tcp://127.0.0.1:5557)
//     One JSON object per ledger event, see formatTelemetry().
//
// Events reach the worker through a ThreadSafeQueue<Event>: EventBus
// bridges in LedgerEngine call pushTelemetry() on the command thread and the
// worker formats and sends them.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The CommandHandler runs on the worker thread.
//
// Ownership:
//   Owned by LedgerEngine via std::unique_ptr. Owns the ZMQ context, both
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

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // No-op if already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Clears the running flag, joins the worker (within kPollTimeoutMs) and
  // closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  The PUB wire format: a JSON object whose "type" names the event.
  //
  //   asset_created        {"type","timestamp","asset":{...}}
  //   asset_price_updated  {"type","timestamp","previous_price","asset":{...}}
  //   order_created        {"type","timestamp","order":{...}}
  //   trade_executed       {"type","timestamp","order","asset",
  //                         "previous_owner","buyer","settlement_source",
  //                         "settlement_destination","settled_amount"}
  //   trade_rejected       {"type","timestamp","order_id","asset_id",
  //                         "error","reason"}
  //
  // Records use the record_codec.hpp schema.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, poll one command, repeat until stopped.
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

}  // namespace vault
