#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/trade_order.hpp"

#include <optional>
#include <string>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// Enum <-> wire-name conversion
// -----------------------------------------------------------------------------
//
// @brief  Lower-case names used by the JSON command protocol, telemetry and
//         the snapshot file ("gold", "sapphire", "buy", "sell").
//
// @details
// The parse functions accept exactly the names the *ToString functions
// produce and return std::nullopt for anything else, so a caller can decide
// whether an unknown name is a request error or a configuration error.
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------
const char* assetTypeToString(AssetType type);
std::optional<AssetType> parseAssetType(const std::string& name);

const char* orderTypeToString(OrderType type);
std::optional<OrderType> parseOrderType(const std::string& name);

}  // namespace domain
}  // namespace vault
