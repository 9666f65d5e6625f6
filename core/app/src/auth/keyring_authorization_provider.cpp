#include "vault/auth/keyring_authorization_provider.hpp"

namespace vault {

void KeyringAuthorizationProvider::registerIdentity(
    const domain::Identity& identity, const std::string& proof) {
  proofs_[identity] = proof;
}

bool KeyringAuthorizationProvider::verify(
    const domain::Credential& credential) const {
  auto it = proofs_.find(credential.identity);
  return it != proofs_.end() && it->second == credential.proof;
}

}  // namespace vault
