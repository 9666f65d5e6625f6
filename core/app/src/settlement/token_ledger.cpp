#include "vault/settlement/token_ledger.hpp"

#include <limits>

namespace vault {

void TokenLedger::openAccount(const std::string& address,
                              const domain::Identity& owner,
                              std::uint64_t balance) {
  accounts_[address] = Account{owner, balance};
}

std::optional<std::uint64_t> TokenLedger::balance(
    const std::string& address) const {
  auto it = accounts_.find(address);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.balance;
}

SettlementStatus TokenLedger::transfer(const std::string& source,
                                       const std::string& destination,
                                       std::uint64_t amount,
                                       const domain::Identity& authority) {
  auto from = accounts_.find(source);
  auto to = accounts_.find(destination);
  if (from == accounts_.end() || to == accounts_.end()) {
    return SettlementStatus::UnknownAccount;
  }
  if (from->second.owner != authority) {
    return SettlementStatus::Unauthorized;
  }
  if (from->second.balance < amount) {
    return SettlementStatus::InsufficientFunds;
  }

  if (from != to) {
    if (to->second.balance >
        std::numeric_limits<std::uint64_t>::max() - amount) {
      return SettlementStatus::DestinationOverflow;
    }
    from->second.balance -= amount;
    to->second.balance += amount;
  }

  ++completed_;
  return SettlementStatus::Ok;
}

}  // namespace vault
