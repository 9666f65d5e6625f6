#pragma once

#include "vault/domain/identity.hpp"

#include <cstdint>
#include <string>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// AssetId
// -----------------------------------------------------------------------------
// Record address of an Asset, produced by AddressDeriver from the owner's
// identity and the asset type (see store/address_deriver.hpp). Treated as an
// opaque key everywhere else.
// -----------------------------------------------------------------------------
using AssetId = std::string;

// -----------------------------------------------------------------------------
// AssetType
// -----------------------------------------------------------------------------
// Closed set of materials the registry accepts. The numeric order is part of
// the snapshot format only through the string names in enum_codec.hpp, so
// values may be appended but never renamed.
// -----------------------------------------------------------------------------
enum class AssetType {
  Gold,
  Silver,
  Platinum,
  Palladium,
  Diamond,
  Ruby,
  Emerald,
  Sapphire,
};

// -----------------------------------------------------------------------------
// Asset
// -----------------------------------------------------------------------------
//
// @brief  One physical unit of a precious metal or gem under custody.
//
// @details
// Created by AssetRegistry::createAsset(). After that only two things ever
// change it:
//   - AssetRegistry::updatePrice()      → current_price, last_price_update
//   - AssetRegistry::transferOwnership() → owner_id (trade settlement only)
//
// weight, purity and certification are stored exactly as supplied. The
// registry performs no range checks on them.
//
// Ownership:
//   The authoritative copy lives inside AssetRegistry's RecordStore. Every
//   accessor hands out const references or copies.
// -----------------------------------------------------------------------------
struct Asset {
  AssetId id;                         // Record address
  Identity owner_id;                  // Current owner
  AssetType asset_type{AssetType::Gold};
  std::uint64_t weight{0};            // Milligram-equivalent units
  std::uint8_t purity{0};             // Percentage, intended 0-100
  std::string certification;          // Provenance / certificate reference
  std::uint64_t current_price{0};     // Smallest settlement denomination
  std::int64_t created_at{0};         // Epoch seconds
  std::int64_t last_price_update{0};  // Epoch seconds, 0 until first update
  bool is_active{false};
};

}  // namespace domain
}  // namespace vault
