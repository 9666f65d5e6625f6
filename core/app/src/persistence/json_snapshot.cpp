#include "vault/persistence/json_snapshot.hpp"
#include "vault/orderbook/order_book.hpp"
#include "vault/persistence/record_codec.hpp"
#include "vault/registry/asset_registry.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace vault {

JsonSnapshotSource::JsonSnapshotSource(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return;
  }
  parse(nlohmann::json::parse(in));
}

JsonSnapshotSource::JsonSnapshotSource(const nlohmann::json& document) {
  parse(document);
}

void JsonSnapshotSource::parse(const nlohmann::json& document) {
  for (const auto& record : document.value("assets", nlohmann::json::array())) {
    assets_.push_back(assetFromJson(record));
  }
  for (const auto& record : document.value("orders", nlohmann::json::array())) {
    orders_.push_back(orderFromJson(record));
  }
}

nlohmann::json snapshotToJson(const AssetRegistry& registry,
                              const OrderBook& book) {
  nlohmann::json assets = nlohmann::json::array();
  for (const auto& asset : registry.all()) {
    assets.push_back(assetToJson(asset));
  }

  nlohmann::json orders = nlohmann::json::array();
  for (const auto& order : book.all()) {
    orders.push_back(orderToJson(order));
  }

  nlohmann::json document;
  document["assets"] = std::move(assets);
  document["orders"] = std::move(orders);
  return document;
}

void writeSnapshot(const std::string& path, const AssetRegistry& registry,
                   const OrderBook& book) {
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("cannot open snapshot file " + tmp_path);
    }
    out << snapshotToJson(registry, book).dump(2) << "\n";
    if (!out.good()) {
      throw std::runtime_error("failed writing snapshot file " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    throw std::runtime_error("cannot replace snapshot file " + path);
  }
}

}  // namespace vault
