#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/trade_order.hpp"
#include "vault/persistence/i_state_source.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace vault {

class AssetRegistry;
class OrderBook;

// -----------------------------------------------------------------------------
// JsonSnapshotSource — IStateSource backed by a snapshot file
// -----------------------------------------------------------------------------
//
// @brief  Reads {"assets":[...], "orders":[...]} written by writeSnapshot().
//
// @details
// The file is parsed once, in the constructor. A path that does not exist
// yields an empty source (first run); a file that exists but cannot be
// parsed throws, so a corrupt snapshot never silently starts an empty
// ledger.
//
// @throws nlohmann::json::exception  malformed JSON or record fields.
// @throws LedgerError(InvalidRequest) unknown enum names in a record.
// -----------------------------------------------------------------------------
class JsonSnapshotSource final : public IStateSource {
 public:
  explicit JsonSnapshotSource(const std::string& path);

  // Parses an in-memory document of the same shape.
  explicit JsonSnapshotSource(const nlohmann::json& document);

  std::vector<domain::Asset> loadAssets() override { return assets_; }
  std::vector<domain::TradeOrder> loadOrders() override { return orders_; }

 private:
  void parse(const nlohmann::json& document);

  std::vector<domain::Asset> assets_;
  std::vector<domain::TradeOrder> orders_;
};

// Serializes every record held by `registry` and `book`.
nlohmann::json snapshotToJson(const AssetRegistry& registry,
                              const OrderBook& book);

// -----------------------------------------------------------------------------
// writeSnapshot(path, registry, book)
// -----------------------------------------------------------------------------
// Writes snapshotToJson() to `path + ".tmp"` and renames it over `path`, so
// a crash mid-write leaves the previous snapshot intact.
//
// @throws std::runtime_error if the file cannot be written or renamed.
// -----------------------------------------------------------------------------
void writeSnapshot(const std::string& path, const AssetRegistry& registry,
                   const OrderBook& book);

}  // namespace vault
