#pragma once

#include "vault/domain/identity.hpp"
#include "vault/settlement/i_settlement_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// TokenLedger — in-memory settlement accounts
// -----------------------------------------------------------------------------
//
// @brief  Minimal token custody: named accounts, each controlled by one
//         identity, holding an unsigned balance.
//
// @details
// transfer() checks, in order:
//   1. source and destination exist          else UnknownAccount
//   2. authority controls the source account else Unauthorized
//   3. source balance >= amount              else InsufficientFunds
// and then debits and credits in one step. A destination credit that would
// overflow 64 bits is reported as InsufficientFunds on the receiving side
// and nothing moves.
//
// Seeded by main() from LedgerConfig::settlement_accounts.
//
// Thread model:
//   No locking; called from inside a serialized LedgerEngine command.
// -----------------------------------------------------------------------------
class TokenLedger final : public ISettlementProvider {
 public:
  TokenLedger() = default;

  TokenLedger(const TokenLedger&) = delete;
  TokenLedger& operator=(const TokenLedger&) = delete;

  // Opens (or resets) an account.
  void openAccount(const std::string& address, const domain::Identity& owner,
                   std::uint64_t balance);

  std::optional<std::uint64_t> balance(const std::string& address) const;

  SettlementStatus transfer(const std::string& source,
                            const std::string& destination,
                            std::uint64_t amount,
                            const domain::Identity& authority) override;

  // Number of transfers that completed with Ok.
  std::size_t completedTransfers() const { return completed_; }

 private:
  struct Account {
    domain::Identity owner;
    std::uint64_t balance{0};
  };

  std::map<std::string, Account> accounts_;
  std::size_t completed_{0};
};

}  // namespace vault
