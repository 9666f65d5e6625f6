#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/trade_order.hpp"

#include <nlohmann/json.hpp>

namespace vault {

// -----------------------------------------------------------------------------
// Record <-> JSON
// -----------------------------------------------------------------------------
//
// @brief  The one fixed-schema JSON form of an Asset and a TradeOrder, shared
//         by command responses, telemetry and the snapshot file.
//
// @details
// Asset:
//   {"id","owner_id","asset_type","weight","purity","certification",
//    "current_price","created_at","last_price_update","is_active"}
// TradeOrder:
//   {"id","asset_ref","owner_id","order_type","quantity","price_per_unit",
//    "created_at","is_active"}
//
// Enum fields use the lower-case wire names from enum_codec.hpp.
//
// The *FromJson functions throw nlohmann::json::exception for a missing or
// mistyped field and LedgerError(InvalidRequest) for an unknown enum name,
// a negative or fractional amount, or a purity above 255.
// -----------------------------------------------------------------------------
nlohmann::json assetToJson(const domain::Asset& asset);
domain::Asset assetFromJson(const nlohmann::json& j);

nlohmann::json orderToJson(const domain::TradeOrder& order);
domain::TradeOrder orderFromJson(const nlohmann::json& j);

}  // namespace vault
