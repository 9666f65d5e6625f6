#pragma once

#include "vault/auth/i_authorization_provider.hpp"
#include "vault/domain/identity.hpp"

#include <string>
#include <unordered_map>

namespace vault {

// -----------------------------------------------------------------------------
// KeyringAuthorizationProvider — in-memory identity → proof table
// -----------------------------------------------------------------------------
//
// @brief  Accepts a credential when its proof equals the proof registered
//         for its identity.
//
// @details
// Seeded from LedgerConfig::identities by main(); tests register the parties
// they need. An identity that was never registered fails every check.
// -----------------------------------------------------------------------------
class KeyringAuthorizationProvider final : public IAuthorizationProvider {
 public:
  KeyringAuthorizationProvider() = default;

  // Registers or replaces the proof for `identity`.
  void registerIdentity(const domain::Identity& identity,
                        const std::string& proof);

  bool verify(const domain::Credential& credential) const override;

 private:
  std::unordered_map<domain::Identity, std::string> proofs_;
};

}  // namespace vault
