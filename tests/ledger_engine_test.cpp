// =============================================================================
// ledger_engine_test.cpp
// =============================================================================
// Unit tests for vault::LedgerEngine and its JSON command protocol.
//
// Validates:
//   - Every op's success shape
//   - Acting-identity verification before the core runs
//   - Error responses: typed ErrorCode names, InvalidRequest for bad input,
//     InternalError for any other exception
//   - Lifecycle: start() hydration, stop() snapshot, idempotency
//
// The engine is built with empty IPC endpoints, so no sockets are bound and
// executeCommand() is called directly, the way the IpcServer would.
// =============================================================================

#include "vault/auth/keyring_authorization_provider.hpp"
#include "vault/engine/ledger_engine.hpp"
#include "vault/persistence/json_snapshot.hpp"
#include "vault/settlement/i_settlement_provider.hpp"
#include "vault/settlement/token_ledger.hpp"
#include "vault/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;

namespace {

// Settlement provider that fails with a non-runtime_error exception.
class FaultySettlementProvider final : public vault::ISettlementProvider {
 public:
  vault::SettlementStatus transfer(const std::string&, const std::string&,
                                   std::uint64_t,
                                   const vault::domain::Identity&) override {
    throw std::logic_error("settlement backend misconfigured");
  }
};

}  // namespace

class LedgerEngineTest : public ::testing::Test {
 protected:
  vault::SimulationTimeProvider clock{1700000000};
  vault::KeyringAuthorizationProvider keyring;
  vault::TokenLedger tokens;
  std::unique_ptr<vault::LedgerEngine> engine;

  void SetUp() override {
    keyring.registerIdentity("A", "a-secret");
    keyring.registerIdentity("B", "b-secret");
    tokens.openAccount("tok/A", "A", 100);
    tokens.openAccount("tok/B", "B", 0);
    engine = makeEngine(vault::LedgerConfig{});
  }

  std::unique_ptr<vault::LedgerEngine> makeEngine(vault::LedgerConfig config) {
    config.command_endpoint.clear();
    config.telemetry_endpoint.clear();
    return std::make_unique<vault::LedgerEngine>(clock, keyring, tokens,
                                                 std::move(config));
  }

  json run(const json& request) {
    return json::parse(engine->executeCommand(request.dump()));
  }

  static json cred(const std::string& identity, const std::string& proof) {
    return json{{"identity", identity}, {"proof", proof}};
  }

  json createGold() {
    return run({{"op", "create_asset"},
                {"owner", cred("A", "a-secret")},
                {"asset_type", "gold"},
                {"weight", 1000},
                {"purity", 99},
                {"certification", "C1"},
                {"initial_price", 5000}});
  }

  json createSell(const std::string& asset_id, std::uint64_t quantity = 10) {
    return run({{"op", "create_order"},
                {"asset_id", asset_id},
                {"owner", cred("A", "a-secret")},
                {"order_type", "sell"},
                {"quantity", quantity},
                {"price_per_unit", 5000}});
  }

  json executeTrade(const std::string& order_id, const std::string& asset_id) {
    return run({{"op", "execute_trade"},
                {"order_id", order_id},
                {"asset_id", asset_id},
                {"order_owner", cred("A", "a-secret")},
                {"buyer", cred("B", "b-secret")},
                {"settlement_source", "tok/A"},
                {"settlement_destination", "tok/B"}});
  }
};

// -----------------------------------------------------------------------------
// 1. ping.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, PingReturnsPong) {
  auto response = run({{"op", "ping"}});
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["response"], "pong");
}

// -----------------------------------------------------------------------------
// 2. End-to-end over the command protocol.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, CreateOrderAndExecuteTrade) {
  auto created = createGold();
  ASSERT_EQ(created["status"], "ok") << created.dump();
  const std::string asset_id = created["asset_id"];
  EXPECT_EQ(created["asset"]["owner_id"], "A");
  EXPECT_EQ(created["asset"]["created_at"], 1700000000);
  EXPECT_EQ(created["asset"]["last_price_update"], 0);
  EXPECT_EQ(created["asset"]["is_active"], true);

  auto order = createSell(asset_id);
  ASSERT_EQ(order["status"], "ok") << order.dump();
  const std::string order_id = order["order_id"];

  auto trade = executeTrade(order_id, asset_id);
  ASSERT_EQ(trade["status"], "ok") << trade.dump();
  EXPECT_EQ(trade["asset"]["owner_id"], "B");
  EXPECT_EQ(trade["order"]["quantity"], 0);
  EXPECT_EQ(trade["order"]["is_active"], false);
  EXPECT_EQ(trade["settled_amount"], 10);

  EXPECT_EQ(tokens.balance("tok/A"), 90u);
  EXPECT_EQ(tokens.balance("tok/B"), 10u);

  auto again = executeTrade(order_id, asset_id);
  EXPECT_EQ(again["status"], "error");
  EXPECT_EQ(again["error"], "OrderInactive");
}

// -----------------------------------------------------------------------------
// 3. Insufficient settlement funds: error response, nothing changed.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, SettlementFailureReportsAndLeavesRecords) {
  const std::string asset_id = createGold()["asset_id"];
  const std::string order_id = createSell(asset_id, 500)["order_id"];

  auto trade = executeTrade(order_id, asset_id);
  EXPECT_EQ(trade["error"], "InsufficientFunds");

  auto asset = run({{"op", "get_asset"}, {"asset_id", asset_id}});
  EXPECT_EQ(asset["asset"]["owner_id"], "A");
  auto order = run({{"op", "get_order"}, {"order_id", order_id}});
  EXPECT_EQ(order["order"]["is_active"], true);
  EXPECT_EQ(order["order"]["quantity"], 500);
}

// -----------------------------------------------------------------------------
// 4. update_price: owner succeeds, bad proof and non-owner are Unauthorized.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, UpdatePriceChecksCaller) {
  const std::string asset_id = createGold()["asset_id"];
  clock.advance(30);

  auto ok = run({{"op", "update_price"},
                 {"asset_id", asset_id},
                 {"caller", cred("A", "a-secret")},
                 {"new_price", 6000}});
  ASSERT_EQ(ok["status"], "ok") << ok.dump();
  EXPECT_EQ(ok["asset"]["current_price"], 6000);
  EXPECT_EQ(ok["asset"]["last_price_update"], 1700000030);

  auto forged = run({{"op", "update_price"},
                     {"asset_id", asset_id},
                     {"caller", cred("A", "guess")},
                     {"new_price", 1}});
  EXPECT_EQ(forged["error"], "Unauthorized");

  auto not_owner = run({{"op", "update_price"},
                        {"asset_id", asset_id},
                        {"caller", cred("B", "b-secret")},
                        {"new_price", 1}});
  EXPECT_EQ(not_owner["error"], "Unauthorized");

  auto asset = run({{"op", "get_asset"}, {"asset_id", asset_id}});
  EXPECT_EQ(asset["asset"]["current_price"], 6000);
}

// -----------------------------------------------------------------------------
// 5. create_asset with an unverified owner is refused before the registry.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, CreateAssetRequiresVerifiedOwner) {
  auto response = run({{"op", "create_asset"},
                       {"owner", cred("A", "nope")},
                       {"asset_type", "gold"},
                       {"weight", 1},
                       {"purity", 1},
                       {"certification", ""},
                       {"initial_price", 1}});
  EXPECT_EQ(response["error"], "Unauthorized");
  EXPECT_EQ(engine->assets().size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Malformed input is InvalidRequest.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, MalformedCommandsAreInvalidRequest) {
  auto not_json = json::parse(engine->executeCommand("{oops"));
  EXPECT_EQ(not_json["status"], "error");
  EXPECT_EQ(not_json["error"], "InvalidRequest");

  EXPECT_EQ(run(json::array())["error"], "InvalidRequest");
  EXPECT_EQ(run({{"op", "teleport"}})["error"], "InvalidRequest");
  EXPECT_EQ(run({{"op", "get_asset"}})["error"], "InvalidRequest");

  auto negative = run({{"op", "create_asset"},
                       {"owner", cred("A", "a-secret")},
                       {"asset_type", "gold"},
                       {"weight", -5},
                       {"purity", 1},
                       {"certification", ""},
                       {"initial_price", 1}});
  EXPECT_EQ(negative["error"], "InvalidRequest");

  auto wide_purity = run({{"op", "create_asset"},
                          {"owner", cred("A", "a-secret")},
                          {"asset_type", "gold"},
                          {"weight", 1},
                          {"purity", 300},
                          {"certification", ""},
                          {"initial_price", 1}});
  EXPECT_EQ(wide_purity["error"], "InvalidRequest");

  auto bad_type = run({{"op", "create_asset"},
                       {"owner", cred("A", "a-secret")},
                       {"asset_type", "copper"},
                       {"weight", 1},
                       {"purity", 1},
                       {"certification", ""},
                       {"initial_price", 1}});
  EXPECT_EQ(bad_type["error"], "InvalidRequest");
}

// -----------------------------------------------------------------------------
// 7. Lookups of unknown records.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, UnknownRecordsAreNotFound) {
  EXPECT_EQ(run({{"op", "get_asset"}, {"asset_id", "asset/x"}})["error"],
            "AssetNotFound");
  EXPECT_EQ(run({{"op", "get_order"}, {"order_id", "order/x"}})["error"],
            "OrderNotFound");
}

// -----------------------------------------------------------------------------
// 8. Legacy scheme through the protocol: second gold asset of A collides.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, LegacySchemeReportsDuplicateAsset) {
  vault::LedgerConfig config;
  config.address_scheme = vault::AddressScheme::Legacy;
  engine = makeEngine(config);

  EXPECT_EQ(createGold()["status"], "ok");
  EXPECT_EQ(createGold()["error"], "DuplicateAsset");
}

// -----------------------------------------------------------------------------
// 9. list_assets / list_orders filters, limit bounds, market_summary.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ListingsAndMarketSummary) {
  const std::string gold = createGold()["asset_id"];
  createGold();
  run({{"op", "create_asset"},
       {"owner", cred("B", "b-secret")},
       {"asset_type", "silver"},
       {"weight", 10},
       {"purity", 90},
       {"certification", "S"},
       {"initial_price", 20}});
  const std::string order_id = createSell(gold)["order_id"];
  createSell(gold);
  ASSERT_EQ(executeTrade(order_id, gold)["status"], "ok");

  auto all = run({{"op", "list_assets"}});
  EXPECT_EQ(all["assets"].size(), 3u);

  auto silver = run({{"op", "list_assets"}, {"asset_type", "silver"}});
  ASSERT_EQ(silver["assets"].size(), 1u);
  EXPECT_EQ(silver["assets"][0]["owner_id"], "B");

  auto owned_by_b = run({{"op", "list_assets"}, {"owner", "B"}});
  EXPECT_EQ(owned_by_b["assets"].size(), 2u);

  auto paged = run({{"op", "list_assets"}, {"skip", 1}, {"limit", 1}});
  EXPECT_EQ(paged["assets"].size(), 1u);

  EXPECT_EQ(run({{"op", "list_assets"}, {"limit", 0}})["error"],
            "InvalidRequest");
  EXPECT_EQ(run({{"op", "list_assets"}, {"limit", 1001}})["error"],
            "InvalidRequest");

  auto orders = run({{"op", "list_orders"}, {"asset_id", gold}});
  EXPECT_EQ(orders["orders"].size(), 2u);
  auto active = run({{"op", "list_orders"}, {"is_active", true}});
  EXPECT_EQ(active["orders"].size(), 1u);

  auto summary = run({{"op", "market_summary"}});
  ASSERT_EQ(summary["status"], "ok");
  EXPECT_EQ(summary["total_assets"], 3);
  EXPECT_DOUBLE_EQ(summary["total_value"].get<double>(),
                   2 * 5000.0 * 1000.0 + 20.0 * 10.0);
  EXPECT_EQ(summary["active_orders"], 1);
}

// -----------------------------------------------------------------------------
// 10. start() hydrates from a source; stop() writes the snapshot; snapshot
//     op without a path is InvalidRequest.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, SnapshotLifecycle) {
  EXPECT_EQ(run({{"op", "snapshot"}})["error"], "InvalidRequest");

  const std::string path = ::testing::TempDir() + "vault_engine_test.json";
  vault::LedgerConfig config;
  config.snapshot_path = path;
  engine = makeEngine(config);

  engine->start();
  EXPECT_TRUE(engine->isRunning());
  const std::string asset_id = createGold()["asset_id"];
  createSell(asset_id);
  engine->stop();
  EXPECT_FALSE(engine->isRunning());
  engine->stop();

  vault::JsonSnapshotSource source(path);
  auto restarted = makeEngine(config);
  restarted->start(&source);
  EXPECT_EQ(restarted->assets().size(), 1u);
  EXPECT_EQ(restarted->orders().size(), 1u);
  ASSERT_NE(restarted->assets().find(asset_id), nullptr);
  EXPECT_EQ(restarted->assets().find(asset_id)->owner_id, "A");

  auto response = json::parse(
      restarted->executeCommand(R"({"op":"snapshot"})"));
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["assets"], 1);

  restarted.reset();
  std::remove(path.c_str());
}

// -----------------------------------------------------------------------------
// 11. Every mutation reaches EventBus subscribers.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, EventBusSeesCommands) {
  std::vector<std::size_t> kinds;
  engine->eventBus().subscribe(
      [&kinds](const vault::Event& e) { kinds.push_back(e.index()); });

  const std::string asset_id = createGold()["asset_id"];
  const std::string order_id = createSell(asset_id)["order_id"];
  executeTrade(order_id, asset_id);
  executeTrade(order_id, asset_id);

  ASSERT_EQ(kinds.size(), 4u);
  EXPECT_TRUE((kinds[0] == vault::Event(vault::AssetCreatedEvent{}).index()));
  EXPECT_TRUE((kinds[1] == vault::Event(vault::OrderCreatedEvent{}).index()));
  EXPECT_TRUE((kinds[2] == vault::Event(vault::TradeExecutedEvent{}).index()));
  EXPECT_TRUE((kinds[3] == vault::Event(vault::TradeRejectedEvent{}).index()));
}

// -----------------------------------------------------------------------------
// 12. Any other std::exception becomes InternalError instead of escaping.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, UnexpectedExceptionIsInternalError) {
  FaultySettlementProvider faulty;
  vault::LedgerConfig config;
  config.command_endpoint.clear();
  config.telemetry_endpoint.clear();
  engine = std::make_unique<vault::LedgerEngine>(clock, keyring, faulty,
                                                 std::move(config));

  const std::string asset_id = createGold()["asset_id"];
  const std::string order_id = createSell(asset_id)["order_id"];

  json response;
  ASSERT_NO_THROW(response = executeTrade(order_id, asset_id));
  EXPECT_EQ(response["status"], "error");
  EXPECT_EQ(response["error"], "InternalError");
  EXPECT_EQ(response["message"], "settlement backend misconfigured");

  EXPECT_TRUE(engine->orders().find(order_id)->is_active);
  EXPECT_EQ(engine->assets().find(asset_id)->owner_id, "A");
  EXPECT_EQ(run({{"op", "ping"}})["status"], "ok");

  engine.reset();
}
