#pragma once

#include <stdexcept>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// ErrorCode — typed failure reasons surfaced by every ledger operation
// -----------------------------------------------------------------------------
//
// @brief  One value per way an operation can be refused.
//
// @details
// Every error is terminal for the invocation that raised it and leaves all
// records exactly as they were before the call. Nothing inside the core
// retries; retry policy belongs to whoever submitted the command.
//
//   Unauthorized              caller is not the controlling identity, a
//                             credential failed verification, or the
//                             settlement provider refused the authority
//   OrderInactive             execution on a consumed order
//   InvalidQuantity           execution with quantity == 0
//   DuplicateAsset            asset address already taken
//   DuplicateOrder            order address already taken (legacy scheme)
//   AssetNotFound / OrderNotFound
//   AssetMismatch             order.asset_ref does not name the given asset
//   InsufficientFunds         settlement source balance too low
//   SettlementAccountNotFound settlement source/destination unknown
//   AmountOverflow            notional settlement amount overflows 64 bits
//   InvalidRequest            malformed command (command layer only)
// -----------------------------------------------------------------------------
enum class ErrorCode {
  Unauthorized,
  OrderInactive,
  InvalidQuantity,
  DuplicateAsset,
  DuplicateOrder,
  AssetNotFound,
  OrderNotFound,
  AssetMismatch,
  InsufficientFunds,
  SettlementAccountNotFound,
  AmountOverflow,
  InvalidRequest,
};

// Stable wire name for an ErrorCode ("Unauthorized", "OrderInactive", ...).
const char* errorCodeToString(ErrorCode code);

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown by AssetRegistry, OrderBook and
//         TradeExecutionEngine when an operation is refused.
//
// @details
// what() returns "<CodeName>: <detail>". Callers that need to branch on the
// reason use code(). The LedgerEngine command layer catches LedgerError and
// turns it into {"status":"error","error":<CodeName>,...}.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& detail);

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace vault
