#pragma once

#include "vault/config/ledger_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace vault {

// Raised for unreadable config files and invalid config values.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// parseLedgerConfig(document)
// -----------------------------------------------------------------------------
//
// @brief  Builds a LedgerConfig from JSON. Missing keys keep their defaults.
//
// @details
// Recognized keys:
//
//   address_scheme         "sequenced" | "legacy"
//   settlement_amount      "quantity"  | "notional"
//   require_matching_asset bool (default false)
//   ipc.command_endpoint   string ("" disables the IpcServer)
//   ipc.telemetry_endpoint string ("" disables the IpcServer)
//   snapshot_path          string ("" disables snapshots)
//   identities             [{"identity": str, "proof": str}]
//   settlement_accounts    [{"address": str, "owner": str, "balance": uint}]
//
// Unknown keys are ignored.
//
// @throws ConfigError for unknown enum names, mistyped values or a negative
//         balance.
// -----------------------------------------------------------------------------
LedgerConfig parseLedgerConfig(const nlohmann::json& document);

// Reads and parses `path`. @throws ConfigError if the file is missing or not
// valid JSON, or parseLedgerConfig() rejects it.
LedgerConfig loadLedgerConfig(const std::string& path);

const char* addressSchemeToString(AddressScheme scheme);
const char* settlementAmountPolicyToString(SettlementAmountPolicy policy);

}  // namespace vault
