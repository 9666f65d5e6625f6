#include "vault/registry/asset_registry.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/events/event_types.hpp"

namespace vault {

AssetRegistry::AssetRegistry(EventBus& bus, const ITimeProvider& clock,
                             AddressScheme scheme)
    : bus_(bus), clock_(clock), addresses_(scheme) {}

// -----------------------------------------------------------------------------
// createAsset: derive address, init record, index owner, announce
// -----------------------------------------------------------------------------
domain::AssetId AssetRegistry::createAsset(const domain::Identity& owner,
                                           domain::AssetType asset_type,
                                           std::uint64_t weight,
                                           std::uint8_t purity,
                                           const std::string& certification,
                                           std::uint64_t initial_price) {
  domain::AssetId id = addresses_.assetAddress(
      owner, asset_type,
      [this](const std::string& address) { return assets_.contains(address); });

  domain::Asset asset;
  asset.id = id;
  asset.owner_id = owner;
  asset.asset_type = asset_type;
  asset.weight = weight;
  asset.purity = purity;
  asset.certification = certification;
  asset.current_price = initial_price;
  asset.created_at = clock_.now_seconds();
  asset.last_price_update = 0;
  asset.is_active = true;

  if (!assets_.create(id, asset)) {
    throw LedgerError(ErrorCode::DuplicateAsset,
                      "an asset already exists at " + id);
  }
  indexOwner(owner, id);

  AssetCreatedEvent event;
  event.asset = asset;
  event.timestamp = asset.created_at;
  bus_.publish(event);

  return id;
}

// -----------------------------------------------------------------------------
// updatePrice: owner-only price change
// -----------------------------------------------------------------------------
void AssetRegistry::updatePrice(const domain::AssetId& asset_id,
                                const domain::Identity& caller,
                                std::uint64_t new_price) {
  domain::Asset* asset = assets_.findMutable(asset_id);
  if (asset == nullptr) {
    throw LedgerError(ErrorCode::AssetNotFound, "no asset at " + asset_id);
  }
  if (asset->owner_id != caller) {
    throw LedgerError(ErrorCode::Unauthorized,
                      caller + " does not own " + asset_id);
  }

  AssetPriceUpdatedEvent event;
  event.previous_price = asset->current_price;

  asset->current_price = new_price;
  asset->last_price_update = clock_.now_seconds();

  event.asset = *asset;
  event.timestamp = asset->last_price_update;
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// transferOwnership: trade settlement primitive
// -----------------------------------------------------------------------------
void AssetRegistry::transferOwnership(const domain::AssetId& asset_id,
                                      const domain::Identity& new_owner) {
  domain::Asset* asset = assets_.findMutable(asset_id);
  if (asset == nullptr) {
    throw LedgerError(ErrorCode::AssetNotFound, "no asset at " + asset_id);
  }

  unindexOwner(asset->owner_id, asset_id);
  asset->owner_id = new_owner;
  indexOwner(new_owner, asset_id);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
const domain::Asset* AssetRegistry::find(const domain::AssetId& asset_id) const {
  return assets_.find(asset_id);
}

std::vector<domain::Asset> AssetRegistry::assetsOwnedBy(
    const domain::Identity& owner) const {
  std::vector<domain::Asset> result;
  auto it = owner_index_.find(owner);
  if (it == owner_index_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (const auto& id : it->second) {
    if (const domain::Asset* asset = assets_.find(id)) {
      result.push_back(*asset);
    }
  }
  return result;
}

std::vector<domain::Asset> AssetRegistry::list(const AssetFilter& filter) const {
  std::vector<domain::Asset> result;
  std::size_t skipped = 0;

  assets_.forEach([&](const std::string&, const domain::Asset& asset) {
    if (result.size() >= filter.limit) {
      return;
    }
    if (filter.asset_type && asset.asset_type != *filter.asset_type) {
      return;
    }
    if (filter.owner && asset.owner_id != *filter.owner) {
      return;
    }
    if (filter.is_active && asset.is_active != *filter.is_active) {
      return;
    }
    if (skipped < filter.skip) {
      ++skipped;
      return;
    }
    result.push_back(asset);
  });

  return result;
}

std::vector<domain::Asset> AssetRegistry::all() const {
  std::vector<domain::Asset> result;
  result.reserve(assets_.size());
  assets_.forEach([&result](const std::string&, const domain::Asset& asset) {
    result.push_back(asset);
  });
  return result;
}

// -----------------------------------------------------------------------------
// hydrateAsset: warm-up insert, keeps the owner index consistent
// -----------------------------------------------------------------------------
void AssetRegistry::hydrateAsset(const domain::Asset& asset) {
  if (const domain::Asset* existing = assets_.find(asset.id)) {
    unindexOwner(existing->owner_id, asset.id);
  }
  assets_.put(asset.id, asset);
  indexOwner(asset.owner_id, asset.id);
}

void AssetRegistry::indexOwner(const domain::Identity& owner,
                               const domain::AssetId& id) {
  owner_index_[owner].insert(id);
}

void AssetRegistry::unindexOwner(const domain::Identity& owner,
                                 const domain::AssetId& id) {
  auto it = owner_index_.find(owner);
  if (it == owner_index_.end()) {
    return;
  }
  it->second.erase(id);
  if (it->second.empty()) {
    owner_index_.erase(it);
  }
}

}  // namespace vault
