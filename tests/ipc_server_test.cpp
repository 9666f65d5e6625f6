// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for vault::IpcServer's telemetry wire format. Socket I/O is not
// exercised here; formatTelemetry() is the whole contract with subscribers.
// =============================================================================

#include "vault/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Every event kind maps to its "type" tag.
// -----------------------------------------------------------------------------
TEST(IpcServerTelemetryTest, TypeTagPerEvent) {
  auto type_of = [](const vault::Event& e) {
    return json::parse(vault::IpcServer::formatTelemetry(e))["type"]
        .get<std::string>();
  };

  EXPECT_EQ(type_of(vault::AssetCreatedEvent{}), "asset_created");
  EXPECT_EQ(type_of(vault::AssetPriceUpdatedEvent{}), "asset_price_updated");
  EXPECT_EQ(type_of(vault::OrderCreatedEvent{}), "order_created");
  EXPECT_EQ(type_of(vault::TradeExecutedEvent{}), "trade_executed");
  EXPECT_EQ(type_of(vault::TradeRejectedEvent{}), "trade_rejected");
}

// -----------------------------------------------------------------------------
// 2. trade_executed carries both records and the settlement legs.
// -----------------------------------------------------------------------------
TEST(IpcServerTelemetryTest, TradeExecutedPayload) {
  vault::TradeExecutedEvent e;
  e.order.id = "order/A/1/0";
  e.asset.id = "asset/A/gold/0";
  e.asset.owner_id = "B";
  e.previous_owner = "A";
  e.buyer = "B";
  e.settlement_source = "tok/A";
  e.settlement_destination = "tok/B";
  e.settled_amount = 10;
  e.timestamp = 99;

  auto j = json::parse(vault::IpcServer::formatTelemetry(e));
  EXPECT_EQ(j["order"]["id"], "order/A/1/0");
  EXPECT_EQ(j["asset"]["owner_id"], "B");
  EXPECT_EQ(j["previous_owner"], "A");
  EXPECT_EQ(j["settlement_source"], "tok/A");
  EXPECT_EQ(j["settled_amount"], 10);
  EXPECT_EQ(j["timestamp"], 99);
}

// -----------------------------------------------------------------------------
// 3. trade_rejected names the error code.
// -----------------------------------------------------------------------------
TEST(IpcServerTelemetryTest, TradeRejectedPayload) {
  vault::TradeRejectedEvent e;
  e.order_id = "order/A/1/0";
  e.error = vault::ErrorCode::InsufficientFunds;
  e.reason = "InsufficientFunds: settlement refused";

  auto j = json::parse(vault::IpcServer::formatTelemetry(e));
  EXPECT_EQ(j["error"], "InsufficientFunds");
  EXPECT_EQ(j["order_id"], "order/A/1/0");
}
