#include "vault/engine/ledger_engine.hpp"
#include "vault/config/config_loader.hpp"
#include "vault/domain/enum_codec.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/persistence/json_snapshot.hpp"
#include "vault/persistence/record_codec.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>

namespace vault {

namespace {

constexpr std::size_t kMaxListLimit = 1000;
constexpr std::size_t kDefaultListLimit = 100;

using nlohmann::json;

const json& requireField(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      std::string("missing field '") + key + "'");
  }
  return *it;
}

std::string requireString(const json& request, const char* key) {
  const json& value = requireField(request, key);
  if (!value.is_string()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      std::string("'") + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::uint64_t requireUnsigned(const json& request, const char* key) {
  const json& value = requireField(request, key);
  if (!value.is_number_unsigned()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      std::string("'") + key +
                          "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

domain::Credential requireCredential(const json& request, const char* key) {
  const json& value = requireField(request, key);
  if (!value.is_object()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      std::string("'") + key +
                          "' must be {\"identity\", \"proof\"}");
  }
  domain::Credential credential;
  credential.identity = requireString(value, "identity");
  credential.proof = requireString(value, "proof");
  return credential;
}

std::optional<std::string> optionalString(const json& request,
                                          const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  return requireString(request, key);
}

domain::AssetType requireAssetType(const std::string& name) {
  auto type = domain::parseAssetType(name);
  if (!type) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "unknown asset_type '" + name + "'");
  }
  return *type;
}

domain::OrderType requireOrderType(const std::string& name) {
  auto type = domain::parseOrderType(name);
  if (!type) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "unknown order_type '" + name + "'");
  }
  return *type;
}

// is_active: absent → fallback, null → any, bool → that value.
std::optional<bool> activeFilter(const json& request,
                                 std::optional<bool> fallback) {
  auto it = request.find("is_active");
  if (it == request.end()) {
    return fallback;
  }
  if (it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "'is_active' must be a boolean or null");
  }
  return it->get<bool>();
}

void readPaging(const json& request, std::size_t& skip, std::size_t& limit) {
  skip = 0;
  limit = kDefaultListLimit;
  if (request.contains("skip")) {
    skip = static_cast<std::size_t>(requireUnsigned(request, "skip"));
  }
  if (request.contains("limit")) {
    const std::uint64_t requested = requireUnsigned(request, "limit");
    if (requested < 1 || requested > kMaxListLimit) {
      throw LedgerError(ErrorCode::InvalidRequest,
                        "'limit' must be between 1 and 1000");
    }
    limit = static_cast<std::size_t>(requested);
  }
}

std::string errorResponse(const char* code, const std::string& message) {
  json response;
  response["status"] = "error";
  response["error"] = code;
  response["message"] = message;
  return response.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LedgerEngine::LedgerEngine(const ITimeProvider& clock,
                           const IAuthorizationProvider& auth,
                           ISettlementProvider& settlement,
                           LedgerConfig config)
    : clock_(clock),
      auth_(auth),
      settlement_(settlement),
      config_(std::move(config)),
      registry_(bus_, clock_, config_.address_scheme),
      book_(bus_, clock_, config_.address_scheme),
      trades_(bus_, clock_, auth_, settlement_, config_.settlement_amount,
              config_.require_matching_asset) {}

LedgerEngine::~LedgerEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LedgerEngine::start(IStateSource* source) {
  if (running_) {
    return;
  }

  // ---  1) Warm-up: restore records before any client can reach us --------
  if (source != nullptr) {
    hydrate(*source);
  }

  // ---  2) IpcServer + telemetry bridges ------------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscriptions_.push_back(bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); }));
  }

  running_ = true;

  std::cout << "[LedgerEngine] started. address_scheme="
            << addressSchemeToString(config_.address_scheme)
            << " settlement_amount="
            << settlementAmountPolicyToString(config_.settlement_amount)
            << (config_.require_matching_asset ? " require_matching_asset" : "")
            << (ipc_server_ ? "" : " (IPC disabled)") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LedgerEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No more commands: join the IPC worker first -----------------------
  for (auto id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();
  ipc_server_.reset();

  // ---  2) Persist ----------------------------------------------------------
  if (!config_.snapshot_path.empty()) {
    std::lock_guard lock(command_mutex_);
    try {
      writeSnapshot(config_.snapshot_path, registry_, book_);
      std::cout << "[LedgerEngine] snapshot written to "
                << config_.snapshot_path << " (" << registry_.size()
                << " asset(s), " << book_.size() << " order(s)).\n";
    } catch (const std::exception& e) {
      std::cerr << "[LedgerEngine] snapshot NOT written: " << e.what()
                << "\n";
    }
  }

  running_ = false;
  std::cout << "[LedgerEngine] stopped.\n";
}

void LedgerEngine::hydrate(IStateSource& source) {
  std::lock_guard lock(command_mutex_);

  auto assets = source.loadAssets();
  for (const auto& asset : assets) {
    registry_.hydrateAsset(asset);
  }

  auto orders = source.loadOrders();
  for (const auto& order : orders) {
    book_.hydrateOrder(order);
  }

  std::cout << "[LedgerEngine] Hydration complete: " << assets.size()
            << " asset(s), " << orders.size() << " order(s).\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, serialize, dispatch, report
// -----------------------------------------------------------------------------
std::string LedgerEngine::executeCommand(const std::string& cmd) {
  std::lock_guard lock(command_mutex_);

  try {
    const json request = json::parse(cmd);
    if (!request.is_object()) {
      throw LedgerError(ErrorCode::InvalidRequest,
                        "command must be a JSON object");
    }

    json response = dispatch(requireString(request, "op"), request);
    response["status"] = "ok";
    return response.dump();
  } catch (const LedgerError& e) {
    return errorResponse(errorCodeToString(e.code()), e.what());
  } catch (const json::exception& e) {
    return errorResponse(errorCodeToString(ErrorCode::InvalidRequest),
                         e.what());
  } catch (const std::exception& e) {
    std::cerr << "[LedgerEngine] command failed: " << e.what() << "\n";
    return errorResponse("InternalError", e.what());
  }
}

json LedgerEngine::dispatch(const std::string& op, const json& request) {
  if (op == "ping") {
    json response;
    response["response"] = "pong";
    return response;
  }
  if (op == "create_asset") {
    return handleCreateAsset(request);
  }
  if (op == "update_price") {
    return handleUpdatePrice(request);
  }
  if (op == "create_order") {
    return handleCreateOrder(request);
  }
  if (op == "execute_trade") {
    return handleExecuteTrade(request);
  }
  if (op == "get_asset") {
    return handleGetAsset(request);
  }
  if (op == "get_order") {
    return handleGetOrder(request);
  }
  if (op == "list_assets") {
    return handleListAssets(request);
  }
  if (op == "list_orders") {
    return handleListOrders(request);
  }
  if (op == "market_summary") {
    return handleMarketSummary();
  }
  if (op == "snapshot") {
    return handleSnapshot();
  }
  throw LedgerError(ErrorCode::InvalidRequest, "unknown op '" + op + "'");
}

void LedgerEngine::authenticate(const domain::Credential& credential) const {
  if (!auth_.verify(credential)) {
    throw LedgerError(ErrorCode::Unauthorized,
                      "credential rejected for " + credential.identity);
  }
}

// -----------------------------------------------------------------------------
// Mutating ops
// -----------------------------------------------------------------------------
json LedgerEngine::handleCreateAsset(const json& request) {
  const domain::Credential owner = requireCredential(request, "owner");
  const domain::AssetType type =
      requireAssetType(requireString(request, "asset_type"));
  const std::uint64_t weight = requireUnsigned(request, "weight");
  const std::uint64_t purity = requireUnsigned(request, "purity");
  if (purity > std::numeric_limits<std::uint8_t>::max()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "'purity' must fit in 8 bits");
  }
  const std::string certification = requireString(request, "certification");
  const std::uint64_t initial_price = requireUnsigned(request, "initial_price");

  authenticate(owner);

  const domain::AssetId id = registry_.createAsset(
      owner.identity, type, weight, static_cast<std::uint8_t>(purity),
      certification, initial_price);

  json response;
  response["asset_id"] = id;
  response["asset"] = assetToJson(*registry_.find(id));
  return response;
}

json LedgerEngine::handleUpdatePrice(const json& request) {
  const domain::AssetId asset_id = requireString(request, "asset_id");
  const domain::Credential caller = requireCredential(request, "caller");
  const std::uint64_t new_price = requireUnsigned(request, "new_price");

  authenticate(caller);
  registry_.updatePrice(asset_id, caller.identity, new_price);

  json response;
  response["asset"] = assetToJson(*registry_.find(asset_id));
  return response;
}

json LedgerEngine::handleCreateOrder(const json& request) {
  const domain::AssetId asset_id = requireString(request, "asset_id");
  const domain::Credential owner = requireCredential(request, "owner");
  const domain::OrderType type =
      requireOrderType(requireString(request, "order_type"));
  const std::uint64_t quantity = requireUnsigned(request, "quantity");
  const std::uint64_t price_per_unit =
      requireUnsigned(request, "price_per_unit");

  authenticate(owner);

  const domain::OrderId id = book_.createOrder(asset_id, owner.identity, type,
                                               quantity, price_per_unit);

  json response;
  response["order_id"] = id;
  response["order"] = orderToJson(*book_.find(id));
  return response;
}

json LedgerEngine::handleExecuteTrade(const json& request) {
  TradeRequest trade;
  trade.order_id = requireString(request, "order_id");
  trade.asset_id = requireString(request, "asset_id");
  trade.order_owner = requireCredential(request, "order_owner");
  trade.buyer = requireCredential(request, "buyer");
  trade.settlement_source = requireString(request, "settlement_source");
  trade.settlement_destination =
      requireString(request, "settlement_destination");

  const TradeReceipt receipt = trades_.executeTrade(registry_, book_, trade);

  json response;
  response["order"] = orderToJson(receipt.order);
  response["asset"] = assetToJson(receipt.asset);
  response["settled_amount"] = receipt.settled_amount;
  return response;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
json LedgerEngine::handleGetAsset(const json& request) const {
  const domain::AssetId asset_id = requireString(request, "asset_id");
  const domain::Asset* asset = registry_.find(asset_id);
  if (asset == nullptr) {
    throw LedgerError(ErrorCode::AssetNotFound, "no asset at " + asset_id);
  }
  json response;
  response["asset"] = assetToJson(*asset);
  return response;
}

json LedgerEngine::handleGetOrder(const json& request) const {
  const domain::OrderId order_id = requireString(request, "order_id");
  const domain::TradeOrder* order = book_.find(order_id);
  if (order == nullptr) {
    throw LedgerError(ErrorCode::OrderNotFound, "no order at " + order_id);
  }
  json response;
  response["order"] = orderToJson(*order);
  return response;
}

json LedgerEngine::handleListAssets(const json& request) const {
  AssetFilter filter;
  if (auto type = optionalString(request, "asset_type")) {
    filter.asset_type = requireAssetType(*type);
  }
  filter.owner = optionalString(request, "owner");
  filter.is_active = activeFilter(request, true);
  readPaging(request, filter.skip, filter.limit);

  json assets = json::array();
  for (const auto& asset : registry_.list(filter)) {
    assets.push_back(assetToJson(asset));
  }
  json response;
  response["assets"] = std::move(assets);
  return response;
}

json LedgerEngine::handleListOrders(const json& request) const {
  OrderFilter filter;
  filter.asset_ref = optionalString(request, "asset_id");
  if (auto type = optionalString(request, "order_type")) {
    filter.order_type = requireOrderType(*type);
  }
  filter.owner = optionalString(request, "owner");
  filter.is_active = activeFilter(request, std::nullopt);
  readPaging(request, filter.skip, filter.limit);

  json orders = json::array();
  for (const auto& order : book_.list(filter)) {
    orders.push_back(orderToJson(order));
  }
  json response;
  response["orders"] = std::move(orders);
  return response;
}

// -----------------------------------------------------------------------------
// handleMarketSummary(): active assets, their price × weight, active orders
// -----------------------------------------------------------------------------
json LedgerEngine::handleMarketSummary() const {
  std::size_t total_assets = 0;
  double total_value = 0.0;
  for (const auto& asset : registry_.all()) {
    if (!asset.is_active) {
      continue;
    }
    ++total_assets;
    total_value += static_cast<double>(asset.current_price) *
                   static_cast<double>(asset.weight);
  }

  json response;
  response["total_assets"] = total_assets;
  response["total_value"] = total_value;
  response["active_orders"] = book_.activeCount();
  return response;
}

json LedgerEngine::handleSnapshot() const {
  if (config_.snapshot_path.empty()) {
    throw LedgerError(ErrorCode::InvalidRequest,
                      "snapshot_path is not configured");
  }
  writeSnapshot(config_.snapshot_path, registry_, book_);

  json response;
  response["path"] = config_.snapshot_path;
  response["assets"] = registry_.size();
  response["orders"] = book_.size();
  return response;
}

}  // namespace vault
