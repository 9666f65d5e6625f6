#include "vault/config/config_loader.hpp"

#include <cstdint>
#include <fstream>

namespace vault {

namespace {

AddressScheme parseAddressScheme(const std::string& name) {
  if (name == "sequenced") {
    return AddressScheme::Sequenced;
  }
  if (name == "legacy") {
    return AddressScheme::Legacy;
  }
  throw ConfigError("address_scheme must be \"sequenced\" or \"legacy\", got \"" +
                    name + "\"");
}

SettlementAmountPolicy parseSettlementAmount(const std::string& name) {
  if (name == "quantity") {
    return SettlementAmountPolicy::Quantity;
  }
  if (name == "notional") {
    return SettlementAmountPolicy::Notional;
  }
  throw ConfigError(
      "settlement_amount must be \"quantity\" or \"notional\", got \"" + name +
      "\"");
}

// Reads an optional non-negative integer. json::get<uint64_t> would wrap a
// negative number instead of rejecting it.
std::uint64_t readUnsigned(const nlohmann::json& object, const char* key,
                           std::uint64_t fallback) {
  if (!object.contains(key)) {
    return fallback;
  }
  const auto& value = object.at(key);
  if (!value.is_number_unsigned()) {
    throw ConfigError(std::string("'") + key +
                      "' must be a non-negative integer, got " + value.dump());
  }
  return value.get<std::uint64_t>();
}

}  // namespace

const char* addressSchemeToString(AddressScheme scheme) {
  switch (scheme) {
    case AddressScheme::Sequenced: return "sequenced";
    case AddressScheme::Legacy:    return "legacy";
  }
  return "unknown";
}

const char* settlementAmountPolicyToString(SettlementAmountPolicy policy) {
  switch (policy) {
    case SettlementAmountPolicy::Quantity: return "quantity";
    case SettlementAmountPolicy::Notional: return "notional";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseLedgerConfig
// -----------------------------------------------------------------------------
LedgerConfig parseLedgerConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  LedgerConfig config;

  try {
    if (document.contains("address_scheme")) {
      config.address_scheme =
          parseAddressScheme(document.at("address_scheme").get<std::string>());
    }
    if (document.contains("settlement_amount")) {
      config.settlement_amount = parseSettlementAmount(
          document.at("settlement_amount").get<std::string>());
    }
    config.require_matching_asset =
        document.value("require_matching_asset", config.require_matching_asset);

    if (document.contains("ipc")) {
      const auto& ipc = document.at("ipc");
      config.command_endpoint =
          ipc.value("command_endpoint", config.command_endpoint);
      config.telemetry_endpoint =
          ipc.value("telemetry_endpoint", config.telemetry_endpoint);
    }

    config.snapshot_path = document.value("snapshot_path", config.snapshot_path);

    for (const auto& entry : document.value("identities", nlohmann::json::array())) {
      IdentitySeed seed;
      seed.identity = entry.at("identity").get<std::string>();
      seed.proof = entry.at("proof").get<std::string>();
      config.identities.push_back(std::move(seed));
    }

    for (const auto& entry :
         document.value("settlement_accounts", nlohmann::json::array())) {
      SettlementAccountSeed seed;
      seed.address = entry.at("address").get<std::string>();
      seed.owner = entry.at("owner").get<std::string>();
      seed.balance = readUnsigned(entry, "balance", 0);
      config.settlement_accounts.push_back(std::move(seed));
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  return config;
}

LedgerConfig loadLedgerConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " + e.what());
  }
  return parseLedgerConfig(document);
}

}  // namespace vault
