#pragma once

#include "vault/domain/identity.hpp"

#include <cstdint>
#include <string>

namespace vault {

// Outcome of one ISettlementProvider::transfer() call.
enum class SettlementStatus {
  Ok,
  InsufficientFunds,
  Unauthorized,    // authority does not control the source account
  UnknownAccount,  // source or destination does not exist
  DestinationOverflow,  // crediting would overflow the destination balance
};

// -----------------------------------------------------------------------------
// ISettlementProvider — fungible-token transfer seam
// -----------------------------------------------------------------------------
//
// @brief  Moves `amount` units from `source` to `destination`, authorized by
//         `authority`.
//
// @details
// Contract:
//   - On Ok the transfer has happened in full.
//   - On any other status nothing has moved.
//   - The call is synchronous and performs no retries.
//
// TradeExecutionEngine calls transfer() exactly once per successful trade,
// after every precondition has passed and before any record is written.
// -----------------------------------------------------------------------------
class ISettlementProvider {
 public:
  virtual ~ISettlementProvider() = default;

  virtual SettlementStatus transfer(const std::string& source,
                                    const std::string& destination,
                                    std::uint64_t amount,
                                    const domain::Identity& authority) = 0;
};

const char* settlementStatusToString(SettlementStatus status);

}  // namespace vault
