#include "vault/domain/enum_codec.hpp"

#include <array>
#include <utility>

namespace vault {
namespace domain {

namespace {

constexpr std::array<std::pair<AssetType, const char*>, 8> kAssetTypeNames{{
    {AssetType::Gold, "gold"},
    {AssetType::Silver, "silver"},
    {AssetType::Platinum, "platinum"},
    {AssetType::Palladium, "palladium"},
    {AssetType::Diamond, "diamond"},
    {AssetType::Ruby, "ruby"},
    {AssetType::Emerald, "emerald"},
    {AssetType::Sapphire, "sapphire"},
}};

}  // namespace

// -----------------------------------------------------------------------------
// assetTypeToString / parseAssetType
// -----------------------------------------------------------------------------
const char* assetTypeToString(AssetType type) {
  for (const auto& [value, name] : kAssetTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

std::optional<AssetType> parseAssetType(const std::string& name) {
  for (const auto& [value, known] : kAssetTypeNames) {
    if (name == known) {
      return value;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// orderTypeToString / parseOrderType
// -----------------------------------------------------------------------------
const char* orderTypeToString(OrderType type) {
  switch (type) {
    case OrderType::Buy:  return "buy";
    case OrderType::Sell: return "sell";
  }
  return "unknown";
}

std::optional<OrderType> parseOrderType(const std::string& name) {
  if (name == "buy") {
    return OrderType::Buy;
  }
  if (name == "sell") {
    return OrderType::Sell;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace vault
