#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/trade_order.hpp"

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// Record lifecycle events
// -----------------------------------------------------------------------------
// Published on the LedgerEngine's EventBus after a mutation has been
// committed. Each event carries a full snapshot of the record as it now
// stands, so subscribers (IpcServer telemetry, tests, logging) never need to
// reach back into the owning component.
//
// `timestamp` is the ledger clock reading (epoch seconds) of the operation.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// AssetCreatedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces a new Asset record.
// Published by: AssetRegistry::createAsset().
// -----------------------------------------------------------------------------
struct AssetCreatedEvent {
  domain::Asset asset;
  std::int64_t timestamp{0};
};

// -----------------------------------------------------------------------------
// AssetPriceUpdatedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces an owner-initiated price change. previous_price
// is the value current_price held before the update.
// Published by: AssetRegistry::updatePrice().
// -----------------------------------------------------------------------------
struct AssetPriceUpdatedEvent {
  domain::Asset asset;
  std::uint64_t previous_price{0};
  std::int64_t timestamp{0};
};

// -----------------------------------------------------------------------------
// OrderCreatedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces a new, active TradeOrder.
// Published by: OrderBook::createOrder().
// -----------------------------------------------------------------------------
struct OrderCreatedEvent {
  domain::TradeOrder order;
  std::int64_t timestamp{0};
};

}  // namespace vault
