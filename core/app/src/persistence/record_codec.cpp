#include "vault/persistence/record_codec.hpp"
#include "vault/domain/enum_codec.hpp"
#include "vault/domain/ledger_error.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace vault {

namespace {

// A negative JSON integer would wrap through get<std::uint64_t>().
std::uint64_t requireUnsigned(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (!value.is_number_unsigned()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      std::string("'") + key +
                          "' must be a non-negative integer, got " +
                          value.dump());
  }
  return value.get<std::uint64_t>();
}

}  // namespace

nlohmann::json assetToJson(const domain::Asset& asset) {
  nlohmann::json j;
  j["id"] = asset.id;
  j["owner_id"] = asset.owner_id;
  j["asset_type"] = domain::assetTypeToString(asset.asset_type);
  j["weight"] = asset.weight;
  j["purity"] = asset.purity;
  j["certification"] = asset.certification;
  j["current_price"] = asset.current_price;
  j["created_at"] = asset.created_at;
  j["last_price_update"] = asset.last_price_update;
  j["is_active"] = asset.is_active;
  return j;
}

domain::Asset assetFromJson(const nlohmann::json& j) {
  const std::string type_name = j.at("asset_type").get<std::string>();
  auto type = domain::parseAssetType(type_name);
  if (!type) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "unknown asset_type '" + type_name + "'");
  }

  const std::uint64_t purity = requireUnsigned(j, "purity");
  if (purity > std::numeric_limits<std::uint8_t>::max()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "purity " + std::to_string(purity) +
                          " does not fit in 8 bits");
  }

  domain::Asset asset;
  asset.id = j.at("id").get<std::string>();
  asset.owner_id = j.at("owner_id").get<std::string>();
  asset.asset_type = *type;
  asset.weight = requireUnsigned(j, "weight");
  asset.purity = static_cast<std::uint8_t>(purity);
  asset.certification = j.at("certification").get<std::string>();
  asset.current_price = requireUnsigned(j, "current_price");
  asset.created_at = j.at("created_at").get<std::int64_t>();
  asset.last_price_update = j.at("last_price_update").get<std::int64_t>();
  asset.is_active = j.at("is_active").get<bool>();
  return asset;
}

nlohmann::json orderToJson(const domain::TradeOrder& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["asset_ref"] = order.asset_ref;
  j["owner_id"] = order.owner_id;
  j["order_type"] = domain::orderTypeToString(order.order_type);
  j["quantity"] = order.quantity;
  j["price_per_unit"] = order.price_per_unit;
  j["created_at"] = order.created_at;
  j["is_active"] = order.is_active;
  return j;
}

domain::TradeOrder orderFromJson(const nlohmann::json& j) {
  const std::string type_name = j.at("order_type").get<std::string>();
  auto type = domain::parseOrderType(type_name);
  if (!type) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "unknown order_type '" + type_name + "'");
  }

  domain::TradeOrder order;
  order.id = j.at("id").get<std::string>();
  order.asset_ref = j.at("asset_ref").get<std::string>();
  order.owner_id = j.at("owner_id").get<std::string>();
  order.order_type = *type;
  order.quantity = requireUnsigned(j, "quantity");
  order.price_per_unit = requireUnsigned(j, "price_per_unit");
  order.created_at = j.at("created_at").get<std::int64_t>();
  order.is_active = j.at("is_active").get<bool>();
  return order;
}

}  // namespace vault
