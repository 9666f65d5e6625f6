#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/domain/trade_order.hpp"

#include <cstdint>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// TradeExecutedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by TradeExecutionEngine after a trade has settled and
//         both records have been written.
//
// @details
// `order` and `asset` are post-trade snapshots (order consumed, asset owned
// by `buyer`). `previous_owner` is the asset owner before the transfer.
// `settled_amount` is exactly what was passed to the settlement provider.
//
// Thread model:
//   Created on the thread running the command. Plain data, safe to copy
//   into the IpcServer telemetry queue.
// -----------------------------------------------------------------------------
struct TradeExecutedEvent {
  domain::TradeOrder order;
  domain::Asset asset;
  domain::Identity previous_owner;
  domain::Identity buyer;
  std::string settlement_source;
  std::string settlement_destination;
  std::uint64_t settled_amount{0};
  std::int64_t timestamp{0};
};

// -----------------------------------------------------------------------------
// TradeRejectedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by TradeExecutionEngine when executeTrade() is refused.
//
// @details
// Carries the ids from the request (the records may not exist) and the
// typed reason. The same LedgerError is rethrown to the caller right after
// this event is published; the event exists for telemetry only.
// -----------------------------------------------------------------------------
struct TradeRejectedEvent {
  domain::OrderId order_id;
  domain::AssetId asset_id;
  ErrorCode error{ErrorCode::Unauthorized};
  std::string reason;
  std::int64_t timestamp{0};
};

}  // namespace vault
