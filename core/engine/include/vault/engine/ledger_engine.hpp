#pragma once

#include "vault/auth/i_authorization_provider.hpp"
#include "vault/config/ledger_config.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/execution/trade_execution_engine.hpp"
#include "vault/network/ipc_server.hpp"
#include "vault/orderbook/order_book.hpp"
#include "vault/persistence/i_state_source.hpp"
#include "vault/registry/asset_registry.hpp"
#include "vault/settlement/i_settlement_provider.hpp"
#include "vault/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// LedgerEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of the ledger: owns the event bus, the three core
//         components and the IPC server, and runs every command as one
//         serialized unit.
//
// @details
// The engine plays the role of the host ledger. Each executeCommand() call
// takes command_mutex_ for its whole duration, so no two operations ever
// interleave and the core components need no locks of their own. A command
// either completes or throws before writing anything; the engine turns the
// outcome into one JSON response.
//
// Before any component is called the engine verifies the acting identity of
// the command (owner / caller credential) with the IAuthorizationProvider.
// execute_trade credentials are verified by TradeExecutionEngine itself.
//
// Lifecycle:
//   start(source)  hydrate from `source` (if any), start the IpcServer when
//                  both endpoints are configured, wire telemetry bridges.
//   stop()         stop the IpcServer, write the snapshot when
//                  snapshot_path is set.
// executeCommand() works whether or not the engine is started; tests drive
// it directly with empty endpoints.
//
// Ownership:
//   LedgerEngine
//    ├── bus_          (EventBus — value member)
//    ├── registry_     (AssetRegistry — value member)
//    ├── book_         (OrderBook — value member)
//    ├── trades_       (TradeExecutionEngine — value member)
//    └── ipc_server_   (unique_ptr<IpcServer>, declared last so it is
//                       destroyed first)
//   clock, auth and settlement are non-owning references and must outlive
//   the engine.
// -----------------------------------------------------------------------------
class LedgerEngine {
 public:
  LedgerEngine(const ITimeProvider& clock, const IAuthorizationProvider& auth,
               ISettlementProvider& settlement, LedgerConfig config);

  ~LedgerEngine();

  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;
  LedgerEngine(LedgerEngine&&) = delete;
  LedgerEngine& operator=(LedgerEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(source)
  // -------------------------------------------------------------------------
  //
  // @param  source  Optional non-owning warm-up source. Records are hydrated
  //                 before the IpcServer accepts its first command.
  //
  // Idempotent.
  //
  // @throws Whatever the source throws while loading, and zmq::error_t if
  //         an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start(IStateSource* source = nullptr);

  // Idempotent. Snapshot write failures are logged, not thrown, so the
  // destructor can call stop().
  void stop();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one JSON command and returns the JSON response.
  //
  // @details
  // Request:  {"op": <name>, ...fields}
  // Success:  {"status":"ok", ...result}
  // Failure:  {"status":"error","error":<ErrorCode name>,"message":<text>}
  //
  // Ops: ping, create_asset, update_price, create_order, execute_trade,
  // get_asset, get_order, list_assets, list_orders, market_summary,
  // snapshot. Malformed JSON, missing or mistyped fields and unknown ops
  // report InvalidRequest.
  //
  // Thread-safety: Safe from any thread; calls are serialized.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  const AssetRegistry& assets() const { return registry_; }
  const OrderBook& orders() const { return book_; }
  const LedgerConfig& config() const { return config_; }
  bool isRunning() const { return running_; }

 private:
  nlohmann::json dispatch(const std::string& op, const nlohmann::json& request);

  nlohmann::json handleCreateAsset(const nlohmann::json& request);
  nlohmann::json handleUpdatePrice(const nlohmann::json& request);
  nlohmann::json handleCreateOrder(const nlohmann::json& request);
  nlohmann::json handleExecuteTrade(const nlohmann::json& request);
  nlohmann::json handleGetAsset(const nlohmann::json& request) const;
  nlohmann::json handleGetOrder(const nlohmann::json& request) const;
  nlohmann::json handleListAssets(const nlohmann::json& request) const;
  nlohmann::json handleListOrders(const nlohmann::json& request) const;
  nlohmann::json handleMarketSummary() const;
  nlohmann::json handleSnapshot() const;

  // @throws LedgerError(Unauthorized) if the credential does not verify.
  void authenticate(const domain::Credential& credential) const;

  void hydrate(IStateSource& source);

  const ITimeProvider& clock_;
  const IAuthorizationProvider& auth_;
  ISettlementProvider& settlement_;
  LedgerConfig config_;

  EventBus bus_;
  AssetRegistry registry_;
  OrderBook book_;
  TradeExecutionEngine trades_;

  std::mutex command_mutex_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;
  bool running_{false};

  std::unique_ptr<IpcServer> ipc_server_;
};

}  // namespace vault
