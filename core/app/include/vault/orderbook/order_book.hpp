#pragma once

#include "vault/config/ledger_config.hpp"
#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"
#include "vault/domain/trade_order.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/store/address_deriver.hpp"
#include "vault/store/record_store.hpp"
#include "vault/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace vault {

class TradeExecutionEngine;

// Optional predicates for OrderBook::list(). Unset fields match everything.
struct OrderFilter {
  std::optional<domain::AssetId> asset_ref;
  std::optional<domain::OrderType> order_type;
  std::optional<domain::Identity> owner;
  std::optional<bool> is_active;
  std::size_t skip{0};
  std::size_t limit{100};
};

// -----------------------------------------------------------------------------
// OrderBook — sole owner of TradeOrder records
// -----------------------------------------------------------------------------
//
// @brief  Records trade intents and exposes the deactivation primitive used
//         when a trade executes.
//
// @details
// createOrder() validates nothing: the asset may not exist, the creator need
// not own it, and quantity may be zero. Those conditions are caught (or
// deliberately not) at execution time by TradeExecutionEngine.
//
// Lifecycle:
//   Active --deactivate()--> Consumed (is_active = false, quantity = 0)
// No other transition exists; there is no cancel or expiry.
//
// Thread model:
//   No internal locking. Every call is serialized by
//   LedgerEngine::executeCommand().
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  OrderBook(EventBus& bus, const ITimeProvider& clock, AddressScheme scheme);

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;

  // -------------------------------------------------------------------------
  // createOrder(asset_id, owner, order_type, quantity, price_per_unit)
  // -------------------------------------------------------------------------
  //
  // @brief  Stores a new active order stamped with the clock's current
  //         second and publishes OrderCreatedEvent.
  //
  // @return The new order's address.
  //
  // @throws LedgerError(DuplicateOrder) if the derived address is taken.
  //         Under AddressScheme::Legacy this happens when one owner creates
  //         two orders in the same second.
  // -------------------------------------------------------------------------
  domain::OrderId createOrder(const domain::AssetId& asset_id,
                              const domain::Identity& owner,
                              domain::OrderType order_type,
                              std::uint64_t quantity,
                              std::uint64_t price_per_unit);

  const domain::TradeOrder* find(const domain::OrderId& order_id) const;

  std::vector<domain::TradeOrder> list(const OrderFilter& filter) const;
  std::vector<domain::TradeOrder> all() const;
  std::size_t activeCount() const;
  std::size_t size() const { return orders_.size(); }

  // Warm-up only: inserts or overwrites a restored record. No event.
  void hydrateOrder(const domain::TradeOrder& order);

 private:
  friend class TradeExecutionEngine;

  // Marks the order consumed: quantity = 0, is_active = false.
  // @throws LedgerError(OrderNotFound) if order_id is unknown.
  void deactivate(const domain::OrderId& order_id);

  EventBus& bus_;
  const ITimeProvider& clock_;
  AddressDeriver addresses_;
  RecordStore<domain::TradeOrder> orders_;
};

}  // namespace vault
