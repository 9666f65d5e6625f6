#include "vault/domain/ledger_error.hpp"

namespace vault {

const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Unauthorized:              return "Unauthorized";
    case ErrorCode::OrderInactive:             return "OrderInactive";
    case ErrorCode::InvalidQuantity:           return "InvalidQuantity";
    case ErrorCode::DuplicateAsset:            return "DuplicateAsset";
    case ErrorCode::DuplicateOrder:            return "DuplicateOrder";
    case ErrorCode::AssetNotFound:             return "AssetNotFound";
    case ErrorCode::OrderNotFound:             return "OrderNotFound";
    case ErrorCode::AssetMismatch:             return "AssetMismatch";
    case ErrorCode::InsufficientFunds:         return "InsufficientFunds";
    case ErrorCode::SettlementAccountNotFound: return "SettlementAccountNotFound";
    case ErrorCode::AmountOverflow:            return "AmountOverflow";
    case ErrorCode::InvalidRequest:            return "InvalidRequest";
  }
  return "Unknown";
}

LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + detail),
      code_(code) {}

}  // namespace vault
