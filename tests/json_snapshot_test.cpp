// =============================================================================
// json_snapshot_test.cpp
// =============================================================================
// Unit tests for the record JSON schema and the snapshot file.
//
// Validates:
//   - assetToJson / orderToJson emit the fixed field set and wire names
//   - *FromJson reject unknown enum names, out-of-range purity, negative
//     amounts, missing keys
//   - writeSnapshot + JsonSnapshotSource restore an identical ledger
//   - A missing snapshot file is an empty first run
// =============================================================================

#include "vault/domain/ledger_error.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/orderbook/order_book.hpp"
#include "vault/persistence/json_snapshot.hpp"
#include "vault/persistence/record_codec.hpp"
#include "vault/registry/asset_registry.hpp"
#include "vault/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

using vault::domain::AssetType;
using vault::domain::OrderType;

// -----------------------------------------------------------------------------
// 1. Asset JSON carries every field with lower-case enum names.
// -----------------------------------------------------------------------------
TEST(RecordCodecTest, AssetJsonHasFixedSchema) {
  vault::domain::Asset asset;
  asset.id = "asset/alice/sapphire/0";
  asset.owner_id = "alice";
  asset.asset_type = AssetType::Sapphire;
  asset.weight = 12;
  asset.purity = 95;
  asset.certification = "GIA-1";
  asset.current_price = 900;
  asset.created_at = 10;
  asset.last_price_update = 20;
  asset.is_active = true;

  auto j = vault::assetToJson(asset);
  EXPECT_EQ(j.size(), 10u);
  EXPECT_EQ(j["asset_type"], "sapphire");
  EXPECT_EQ(j["purity"], 95);
  EXPECT_EQ(j["last_price_update"], 20);

  auto back = vault::assetFromJson(j);
  EXPECT_EQ(back.id, asset.id);
  EXPECT_EQ(back.asset_type, AssetType::Sapphire);
  EXPECT_EQ(back.purity, 95u);
  EXPECT_EQ(back.certification, "GIA-1");
}

// -----------------------------------------------------------------------------
// 2. Order JSON uses "buy"/"sell".
// -----------------------------------------------------------------------------
TEST(RecordCodecTest, OrderJsonUsesWireNames) {
  vault::domain::TradeOrder order;
  order.id = "order/bob/5/0";
  order.order_type = OrderType::Buy;
  order.quantity = 3;

  auto j = vault::orderToJson(order);
  EXPECT_EQ(j.size(), 8u);
  EXPECT_EQ(j["order_type"], "buy");
  EXPECT_EQ(vault::orderFromJson(j).order_type, OrderType::Buy);
}

// -----------------------------------------------------------------------------
// 3. Bad records are refused.
// -----------------------------------------------------------------------------
TEST(RecordCodecTest, RejectsMalformedRecords) {
  auto j = vault::assetToJson(vault::domain::Asset{});

  auto bad_type = j;
  bad_type["asset_type"] = "unobtainium";
  EXPECT_THROW(vault::assetFromJson(bad_type), vault::LedgerError);

  auto bad_purity = j;
  bad_purity["purity"] = 256u;
  EXPECT_THROW(vault::assetFromJson(bad_purity), vault::LedgerError);

  auto missing = j;
  missing.erase("owner_id");
  EXPECT_THROW(vault::assetFromJson(missing), nlohmann::json::exception);

  auto order = vault::orderToJson(vault::domain::TradeOrder{});
  order["order_type"] = "hold";
  EXPECT_THROW(vault::orderFromJson(order), vault::LedgerError);
}

// -----------------------------------------------------------------------------
// 4. Negative amounts are refused instead of wrapping to huge values.
// -----------------------------------------------------------------------------
TEST(RecordCodecTest, RejectsNegativeAmounts) {
  auto asset = vault::assetToJson(vault::domain::Asset{});
  for (const char* key : {"weight", "purity", "current_price"}) {
    auto bad = asset;
    bad[key] = -5;
    try {
      vault::assetFromJson(bad);
      FAIL() << key << " = -5 was accepted";
    } catch (const vault::LedgerError& e) {
      EXPECT_EQ(e.code(), vault::ErrorCode::InvalidRequest) << key;
    }
  }

  auto order = vault::orderToJson(vault::domain::TradeOrder{});
  for (const char* key : {"quantity", "price_per_unit"}) {
    auto bad = order;
    bad[key] = -1;
    try {
      vault::orderFromJson(bad);
      FAIL() << key << " = -1 was accepted";
    } catch (const vault::LedgerError& e) {
      EXPECT_EQ(e.code(), vault::ErrorCode::InvalidRequest) << key;
    }
  }

  // Through the snapshot document path as well.
  auto document = nlohmann::json::parse(R"({"assets": [], "orders": [
    {"id": "order/A/1/0", "asset_ref": "asset/A/gold/0", "owner_id": "A",
     "order_type": "sell", "quantity": -10, "price_per_unit": 5,
     "created_at": 1, "is_active": true}]})");
  EXPECT_THROW(vault::JsonSnapshotSource{document}, vault::LedgerError);
}

class JsonSnapshotTest : public ::testing::Test {
 protected:
  vault::EventBus bus;
  vault::SimulationTimeProvider clock{1700000000};
  vault::AssetRegistry registry{bus, clock, vault::AddressScheme::Sequenced};
  vault::OrderBook book{bus, clock, vault::AddressScheme::Sequenced};
  std::string path = ::testing::TempDir() + "vault_snapshot_test.json";

  void TearDown() override { std::remove(path.c_str()); }
};

// -----------------------------------------------------------------------------
// 5. writeSnapshot → JsonSnapshotSource restores the same records.
// -----------------------------------------------------------------------------
TEST_F(JsonSnapshotTest, WriteThenLoadRestoresRecords) {
  auto gold = registry.createAsset("alice", AssetType::Gold, 1000, 99, "C1",
                                   5000);
  registry.createAsset("bob", AssetType::Emerald, 7, 80, "E", 300);
  auto order = book.createOrder(gold, "alice", OrderType::Sell, 10, 5000);

  vault::writeSnapshot(path, registry, book);

  vault::JsonSnapshotSource source(path);
  auto assets = source.loadAssets();
  auto orders = source.loadOrders();
  ASSERT_EQ(assets.size(), 2u);
  ASSERT_EQ(orders.size(), 1u);

  vault::EventBus other_bus;
  vault::AssetRegistry restored(other_bus, clock,
                                vault::AddressScheme::Sequenced);
  for (const auto& a : assets) {
    restored.hydrateAsset(a);
  }
  const auto* restored_gold = restored.find(gold);
  ASSERT_NE(restored_gold, nullptr);
  EXPECT_EQ(restored_gold->owner_id, "alice");
  EXPECT_EQ(restored_gold->current_price, 5000u);
  EXPECT_EQ(orders[0].id, order);
  EXPECT_EQ(orders[0].quantity, 10u);
}

// -----------------------------------------------------------------------------
// 6. A missing file is an empty source; a corrupt one throws.
// -----------------------------------------------------------------------------
TEST_F(JsonSnapshotTest, MissingFileIsEmptyCorruptFileThrows) {
  vault::JsonSnapshotSource empty(path);
  EXPECT_TRUE(empty.loadAssets().empty());
  EXPECT_TRUE(empty.loadOrders().empty());

  {
    std::FILE* f = std::fopen(path.c_str(), "w");
    ASSERT_NE(f, nullptr);
    std::fputs("{\"assets\": [", f);
    std::fclose(f);
  }
  EXPECT_THROW(vault::JsonSnapshotSource corrupt(path),
               nlohmann::json::exception);
}
