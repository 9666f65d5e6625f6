#pragma once

#include "vault/domain/identity.hpp"

namespace vault {

// -----------------------------------------------------------------------------
// IAuthorizationProvider — credential verification seam
// -----------------------------------------------------------------------------
//
// @brief  Answers one question: does this credential prove control of its
//         identity?
//
// @details
// The ledger core never inspects proofs itself. LedgerEngine verifies the
// acting identity of every mutating command before handing it to a
// component, and TradeExecutionEngine verifies both trade parties.
// Signature schemes, key rotation and wallets live behind this interface.
//
// Ownership:
//   Not owned by the engine. main() (or the test fixture) owns the provider
//   and passes a reference to LedgerEngine.
//
// Thread model:
//   Called only from inside a serialized LedgerEngine command.
// -----------------------------------------------------------------------------
class IAuthorizationProvider {
 public:
  virtual ~IAuthorizationProvider() = default;

  virtual bool verify(const domain::Credential& credential) const = 0;
};

}  // namespace vault
