#pragma once

#include <string>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// Identity
// -----------------------------------------------------------------------------
// Responsibility: Names a party on the ledger (an owner, a caller, a buyer).
// The core never interprets the string; it only compares identities for
// equality. Public-key encoding and signature math belong to the
// authorization provider.
// -----------------------------------------------------------------------------
using Identity = std::string;

// -----------------------------------------------------------------------------
// Credential
// -----------------------------------------------------------------------------
//
// @brief  A claim that the presenter controls `identity`, backed by `proof`.
//
// @details
// The Trade Execution Engine requires two credentials (order owner and
// buyer) to co-authorize a trade. Whether `proof` is a signature, a token or
// a shared secret is decided by the IAuthorizationProvider implementation.
//
// Value type: cheap to copy, safe to pass across threads.
// -----------------------------------------------------------------------------
struct Credential {
  Identity identity;
  std::string proof;
};

}  // namespace domain
}  // namespace vault
