#pragma once

#include "vault/config/ledger_config.hpp"
#include "vault/domain/asset.hpp"
#include "vault/domain/identity.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace vault {

// -----------------------------------------------------------------------------
// AddressDeriver — deterministic record addresses from identity seeds
// -----------------------------------------------------------------------------
//
// @brief  Produces the address under which a new Asset or TradeOrder is
//         created, following the configured AddressScheme.
//
// @details
// Seeds, joined with '/':
//
//   Asset  "asset", owner, asset type name [, n]
//   Order  "order", owner, created_at      [, n]
//
// Under AddressScheme::Legacy the optional sequence is omitted and the
// address is returned even when it is taken; the caller's store create()
// then fails and the caller reports DuplicateAsset / DuplicateOrder.
//
// Under AddressScheme::Sequenced each owner has one asset counter and one
// order counter. The deriver hands out the next n whose address the
// `is_taken` probe reports free, so restored records from a snapshot never
// collide with fresh ones.
//
// Thread model:
//   Not thread-safe; owned by one component and used only inside a
//   serialized command.
// -----------------------------------------------------------------------------
class AddressDeriver {
 public:
  using IsTaken = std::function<bool(const std::string&)>;

  explicit AddressDeriver(AddressScheme scheme);

  AddressDeriver(const AddressDeriver&) = delete;
  AddressDeriver& operator=(const AddressDeriver&) = delete;

  AddressScheme scheme() const { return scheme_; }

  std::string assetAddress(const domain::Identity& owner,
                           domain::AssetType type, const IsTaken& is_taken);

  std::string orderAddress(const domain::Identity& owner,
                           std::int64_t created_at, const IsTaken& is_taken);

 private:
  // Appends "/<n>" to base for the first counter value that is free and
  // advances the counter past it.
  static std::string nextSequenced(const std::string& base,
                                   std::uint64_t& counter,
                                   const IsTaken& is_taken);

  AddressScheme scheme_;
  std::unordered_map<domain::Identity, std::uint64_t> asset_sequence_;
  std::unordered_map<domain::Identity, std::uint64_t> order_sequence_;
};

}  // namespace vault
