#pragma once

#include "vault/auth/i_authorization_provider.hpp"
#include "vault/config/ledger_config.hpp"
#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"
#include "vault/domain/trade_order.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/orderbook/order_book.hpp"
#include "vault/registry/asset_registry.hpp"
#include "vault/settlement/i_settlement_provider.hpp"
#include "vault/time/i_time_provider.hpp"

#include <cstdint>
#include <string>

namespace vault {

class LedgerError;

// Everything executeTrade() needs to settle one order.
struct TradeRequest {
  domain::OrderId order_id;
  domain::AssetId asset_id;
  domain::Credential order_owner;
  domain::Credential buyer;
  std::string settlement_source;
  std::string settlement_destination;
};

// Post-trade snapshots returned to the caller.
struct TradeReceipt {
  domain::TradeOrder order;
  domain::Asset asset;
  std::uint64_t settled_amount{0};
};

// -----------------------------------------------------------------------------
// TradeExecutionEngine — atomic order execution
// -----------------------------------------------------------------------------
//
// @brief  Validates a trade, settles it through the ISettlementProvider and
//         then consumes the order and hands the asset to the buyer.
//
// @details
// Check order (first failure wins, nothing is written):
//
//   lookup      order exists            else OrderNotFound
//               asset exists            else AssetNotFound
//   1           order.is_active         else OrderInactive
//   2           order.quantity > 0      else InvalidQuantity
//   3           both credentials verify and the order-owner credential
//               names order.owner_id    else Unauthorized
//   4           order.asset_ref == asset_id else AssetMismatch
//               (only when require_matching_asset is set)
//   settlement  amount per SettlementAmountPolicy (AmountOverflow), then
//               transfer(source, destination, amount, order owner)
//
// Only after settlement returns Ok are the two records written:
// OrderBook::deactivate() and AssetRegistry::transferOwnership(). Both are
// private to their owners and reachable only from here. The registry and
// book are passed per call; the engine holds no reference to either between
// trades.
//
// The buyer credential proves the buyer is a real, consenting party. Nothing
// ties it to settlement_source or settlement_destination: which accounts pay
// and receive is the submitter's choice.
//
// Events:
//   success → TradeExecutedEvent
//   failure → TradeRejectedEvent, then the LedgerError is rethrown
//
// Thread model:
//   No locking. LedgerEngine serializes calls.
// -----------------------------------------------------------------------------
class TradeExecutionEngine {
 public:
  TradeExecutionEngine(EventBus& bus, const ITimeProvider& clock,
                       const IAuthorizationProvider& auth,
                       ISettlementProvider& settlement,
                       SettlementAmountPolicy amount_policy,
                       bool require_matching_asset = false);

  TradeExecutionEngine(const TradeExecutionEngine&) = delete;
  TradeExecutionEngine& operator=(const TradeExecutionEngine&) = delete;

  // @throws LedgerError with the first failing check's code.
  TradeReceipt executeTrade(AssetRegistry& registry, OrderBook& book,
                            const TradeRequest& request);

 private:
  // Runs every check and the settlement call. Returns the settled amount.
  std::uint64_t verifyAndSettle(const AssetRegistry& registry,
                                const OrderBook& book,
                                const TradeRequest& request);

  std::uint64_t settlementAmount(const domain::TradeOrder& order) const;

  void publishRejection(const TradeRequest& request, const LedgerError& error);

  EventBus& bus_;
  const ITimeProvider& clock_;
  const IAuthorizationProvider& auth_;
  ISettlementProvider& settlement_;
  SettlementAmountPolicy amount_policy_;
  bool require_matching_asset_;
};

}  // namespace vault
