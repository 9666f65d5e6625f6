#pragma once

#include "vault/domain/identity.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// AddressScheme — how record addresses are derived from identity seeds
// -----------------------------------------------------------------------------
//
//   Sequenced  asset/<owner>/<type>/<n>, order/<owner>/<created_at>/<n>
//              with a per-owner counter that skips addresses already taken.
//              An owner may hold any number of assets of one type and may
//              create several orders within one clock second.
//
//   Legacy     asset/<owner>/<type>, order/<owner>/<created_at>
//              One asset per (owner, type); one order per (owner, second).
//              Collisions surface as DuplicateAsset / DuplicateOrder.
// -----------------------------------------------------------------------------
enum class AddressScheme {
  Sequenced,
  Legacy,
};

// -----------------------------------------------------------------------------
// SettlementAmountPolicy — what executeTrade asks the settlement provider
// to move
// -----------------------------------------------------------------------------
//
//   Quantity  amount = order.quantity (price_per_unit is informational)
//   Notional  amount = order.quantity * order.price_per_unit
// -----------------------------------------------------------------------------
enum class SettlementAmountPolicy {
  Quantity,
  Notional,
};

// Seed entry for the in-memory KeyringAuthorizationProvider.
struct IdentitySeed {
  domain::Identity identity;
  std::string proof;
};

// Seed entry for the in-memory TokenLedger.
struct SettlementAccountSeed {
  std::string address;
  domain::Identity owner;
  std::uint64_t balance{0};
};

// -----------------------------------------------------------------------------
// LedgerConfig — engine-wide settings
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct handed to LedgerEngine at construction. Every
//         field has a usable default, so `LedgerConfig{}` runs a complete
//         in-process ledger with no network sockets bound by tests that
//         clear the endpoints.
//
// @details
// Loaded from JSON by loadLedgerConfig() (config/config_loader.hpp). The
// identities and settlement_accounts lists only matter for the standalone
// binary, which backs its collaborators with in-memory implementations.
//
// Thread model:
//   Copied into components at construction; never mutated afterwards.
// -----------------------------------------------------------------------------
struct LedgerConfig {
  AddressScheme address_scheme{AddressScheme::Sequenced};
  SettlementAmountPolicy settlement_amount{SettlementAmountPolicy::Quantity};

  // When set, executeTrade rejects a request whose asset_id differs from
  // order.asset_ref with AssetMismatch. Off by default: the order's asset
  // reference is informational and the named asset changes hands.
  bool require_matching_asset{false};

  // Empty endpoint disables the IpcServer.
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  // Empty path disables snapshot load/save.
  std::string snapshot_path;

  std::vector<IdentitySeed> identities;
  std::vector<SettlementAccountSeed> settlement_accounts;
};

}  // namespace vault
