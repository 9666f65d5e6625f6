#include "vault/network/ipc_server.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/persistence/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace vault {

namespace {

struct TelemetryFormatter {
  nlohmann::json operator()(const AssetCreatedEvent& e) const {
    nlohmann::json j;
    j["type"] = "asset_created";
    j["timestamp"] = e.timestamp;
    j["asset"] = assetToJson(e.asset);
    return j;
  }

  nlohmann::json operator()(const AssetPriceUpdatedEvent& e) const {
    nlohmann::json j;
    j["type"] = "asset_price_updated";
    j["timestamp"] = e.timestamp;
    j["previous_price"] = e.previous_price;
    j["asset"] = assetToJson(e.asset);
    return j;
  }

  nlohmann::json operator()(const OrderCreatedEvent& e) const {
    nlohmann::json j;
    j["type"] = "order_created";
    j["timestamp"] = e.timestamp;
    j["order"] = orderToJson(e.order);
    return j;
  }

  nlohmann::json operator()(const TradeExecutedEvent& e) const {
    nlohmann::json j;
    j["type"] = "trade_executed";
    j["timestamp"] = e.timestamp;
    j["order"] = orderToJson(e.order);
    j["asset"] = assetToJson(e.asset);
    j["previous_owner"] = e.previous_owner;
    j["buyer"] = e.buyer;
    j["settlement_source"] = e.settlement_source;
    j["settlement_destination"] = e.settlement_destination;
    j["settled_amount"] = e.settled_amount;
    return j;
  }

  nlohmann::json operator()(const TradeRejectedEvent& e) const {
    nlohmann::json j;
    j["type"] = "trade_rejected";
    j["timestamp"] = e.timestamp;
    j["order_id"] = e.order_id;
    j["asset_id"] = e.asset_id;
    j["error"] = errorCodeToString(e.error);
    j["reason"] = e.reason;
    return j;
  }
};

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
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

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
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

  // Publish whatever the last commands produced.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round-trip, or nothing on timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(TelemetryFormatter{}, event).dump();
}

}  // namespace vault
