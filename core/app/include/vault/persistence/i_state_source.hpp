#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/trade_order.hpp"

#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// IStateSource — warm-up state for a restarting ledger
// -----------------------------------------------------------------------------
//
// @brief  Supplies the Asset and TradeOrder records that existed before this
//         process started.
//
// @details
// LedgerEngine::start() calls loadAssets() then loadOrders() exactly once,
// before the IpcServer accepts commands, and feeds each record into
// AssetRegistry::hydrateAsset() / OrderBook::hydrateOrder().
//
// Ownership:
//   LedgerEngine receives a non-owning pointer in start() and drops it when
//   start() returns. main() (or the test) owns the source.
//
// Thread model:
//   Called on the thread that calls start(), before any command runs.
// -----------------------------------------------------------------------------
class IStateSource {
 public:
  virtual ~IStateSource() = default;

  virtual std::vector<domain::Asset> loadAssets() = 0;
  virtual std::vector<domain::TradeOrder> loadOrders() = 0;
};

}  // namespace vault
