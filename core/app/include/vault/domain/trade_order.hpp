#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"

#include <cstdint>
#include <string>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Record address of a TradeOrder. Derived from the owner, the creation time
// and (under the sequenced scheme) a per-owner counter.
// -----------------------------------------------------------------------------
using OrderId = std::string;

enum class OrderType {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// TradeOrder
// -----------------------------------------------------------------------------
//
// @brief  A standing intent to buy or sell `quantity` of one Asset at a fixed
//         `price_per_unit`.
//
// @details
// The order lifecycle is a two-state machine:
//
//   Active ──execute──> Consumed (is_active = false, quantity = 0)
//
// There is no cancel, expiry or partial fill. is_active flips true → false
// exactly once, inside TradeExecutionEngine::executeTrade(), and never back.
//
// asset_ref is recorded but not validated at creation: any identity may
// place an order against any asset id, existing or not.
//
// Ownership:
//   The authoritative copy lives inside OrderBook's RecordStore.
// -----------------------------------------------------------------------------
struct TradeOrder {
  OrderId id;
  AssetId asset_ref;
  Identity owner_id;
  OrderType order_type{OrderType::Sell};
  std::uint64_t quantity{0};
  std::uint64_t price_per_unit{0};
  std::int64_t created_at{0};  // Epoch seconds
  bool is_active{false};
};

}  // namespace domain
}  // namespace vault
