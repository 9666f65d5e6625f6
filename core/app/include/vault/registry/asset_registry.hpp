#pragma once

#include "vault/config/ledger_config.hpp"
#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/store/address_deriver.hpp"
#include "vault/store/record_store.hpp"
#include "vault/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace vault {

class TradeExecutionEngine;

// -----------------------------------------------------------------------------
// AssetFilter — optional predicates for AssetRegistry::list()
// -----------------------------------------------------------------------------
// Unset fields match everything. is_active defaults to true: listings show
// live assets unless the caller asks otherwise. limit is clamped by the
// command layer to 1..1000.
// -----------------------------------------------------------------------------
struct AssetFilter {
  std::optional<domain::AssetType> asset_type;
  std::optional<domain::Identity> owner;
  std::optional<bool> is_active{true};
  std::size_t skip{0};
  std::size_t limit{100};
};

// -----------------------------------------------------------------------------
// AssetRegistry — sole owner of Asset records
// -----------------------------------------------------------------------------
//
// @brief  Creates assets, applies owner-authorized price updates, and
//         exposes the ownership-transfer primitive used by trade settlement.
//
// @details
// All Asset state lives in one RecordStore keyed by the address the
// AddressDeriver produces. Next to it the registry keeps an owner → asset
// ids index so assetsOwnedBy() does not scan the store; the index is
// updated on create, transfer and hydration.
//
// Authorization rule:
//   Only the current owner may change the price. Nobody outside
//   TradeExecutionEngine may change the owner: transferOwnership() is
//   private and TradeExecutionEngine is the only friend.
//
// Events (published after the write, on the caller's thread):
//   createAsset()  → AssetCreatedEvent
//   updatePrice()  → AssetPriceUpdatedEvent
//   transferOwnership() publishes nothing; TradeExecutionEngine announces
//   the whole trade as one TradeExecutedEvent.
//
// Thread model:
//   No internal locking. LedgerEngine::executeCommand() serializes every
//   call into the registry.
//
// Ownership:
//   Owned by LedgerEngine as a value member. Holds references to the bus
//   and clock, both owned by LedgerEngine (or the test fixture).
// -----------------------------------------------------------------------------
class AssetRegistry {
 public:
  AssetRegistry(EventBus& bus, const ITimeProvider& clock,
                AddressScheme scheme);

  AssetRegistry(const AssetRegistry&) = delete;
  AssetRegistry& operator=(const AssetRegistry&) = delete;

  // -------------------------------------------------------------------------
  // createAsset(...)
  // -------------------------------------------------------------------------
  //
  // @brief  Registers a new asset owned by `owner`.
  //
  // @return The new asset's address.
  //
  // @details
  // The record is stored with is_active = true, created_at = clock now,
  // current_price = initial_price and last_price_update = 0. weight, purity
  // and certification are stored unvalidated.
  //
  // @throws LedgerError(DuplicateAsset) if the derived address is taken
  //         (only possible under AddressScheme::Legacy).
  // -------------------------------------------------------------------------
  domain::AssetId createAsset(const domain::Identity& owner,
                              domain::AssetType asset_type,
                              std::uint64_t weight, std::uint8_t purity,
                              const std::string& certification,
                              std::uint64_t initial_price);

  // -------------------------------------------------------------------------
  // updatePrice(asset_id, caller, new_price)
  // -------------------------------------------------------------------------
  //
  // @brief  Sets current_price = new_price and last_price_update = now.
  //
  // @details
  // No floor, ceiling or rate-of-change limit is applied: the registry only
  // records a price decided elsewhere.
  //
  // @throws LedgerError(AssetNotFound) if asset_id is unknown.
  // @throws LedgerError(Unauthorized) if caller is not the current owner.
  //         The record is untouched in both cases.
  // -------------------------------------------------------------------------
  void updatePrice(const domain::AssetId& asset_id,
                   const domain::Identity& caller, std::uint64_t new_price);

  // Read access. The pointer stays valid until the next mutating call.
  const domain::Asset* find(const domain::AssetId& asset_id) const;

  std::vector<domain::Asset> assetsOwnedBy(const domain::Identity& owner) const;
  std::vector<domain::Asset> list(const AssetFilter& filter) const;
  std::vector<domain::Asset> all() const;
  std::size_t size() const { return assets_.size(); }

  // -------------------------------------------------------------------------
  // hydrateAsset(asset)
  // -------------------------------------------------------------------------
  //
  // @brief  Inserts or overwrites a restored record at asset.id.
  //
  // @details
  // Warm-up only: called by LedgerEngine::start() while loading a snapshot,
  // before any command is accepted. Publishes no event.
  // -------------------------------------------------------------------------
  void hydrateAsset(const domain::Asset& asset);

 private:
  friend class TradeExecutionEngine;

  // -------------------------------------------------------------------------
  // transferOwnership(asset_id, new_owner)
  // -------------------------------------------------------------------------
  //
  // @brief  Unconditionally overwrites owner_id. No authorization check:
  //         TradeExecutionEngine has already verified the trade.
  //
  // @throws LedgerError(AssetNotFound) if asset_id is unknown.
  // -------------------------------------------------------------------------
  void transferOwnership(const domain::AssetId& asset_id,
                         const domain::Identity& new_owner);

  void indexOwner(const domain::Identity& owner, const domain::AssetId& id);
  void unindexOwner(const domain::Identity& owner, const domain::AssetId& id);

  EventBus& bus_;
  const ITimeProvider& clock_;
  AddressDeriver addresses_;
  RecordStore<domain::Asset> assets_;
  std::unordered_map<domain::Identity, std::set<domain::AssetId>> owner_index_;
};

}  // namespace vault
