#include "vault/settlement/i_settlement_provider.hpp"

namespace vault {

const char* settlementStatusToString(SettlementStatus status) {
  switch (status) {
    case SettlementStatus::Ok:
      return "Ok";
    case SettlementStatus::InsufficientFunds:
      return "InsufficientFunds";
    case SettlementStatus::Unauthorized:
      return "Unauthorized";
    case SettlementStatus::UnknownAccount:
      return "UnknownAccount";
    case SettlementStatus::DestinationOverflow:
      return "DestinationOverflow";
  }
  return "Unknown";
}

}  // namespace vault
