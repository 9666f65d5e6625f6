#include "vault/store/address_deriver.hpp"
#include "vault/domain/enum_codec.hpp"

namespace vault {

AddressDeriver::AddressDeriver(AddressScheme scheme) : scheme_(scheme) {}

// -----------------------------------------------------------------------------
// assetAddress: "asset/<owner>/<type>[/<n>]"
// -----------------------------------------------------------------------------
std::string AddressDeriver::assetAddress(const domain::Identity& owner,
                                         domain::AssetType type,
                                         const IsTaken& is_taken) {
  std::string base = "asset/" + owner + "/" + domain::assetTypeToString(type);

  if (scheme_ == AddressScheme::Legacy) {
    return base;
  }
  return nextSequenced(base, asset_sequence_[owner], is_taken);
}

// -----------------------------------------------------------------------------
// orderAddress: "order/<owner>/<created_at>[/<n>]"
// -----------------------------------------------------------------------------
std::string AddressDeriver::orderAddress(const domain::Identity& owner,
                                         std::int64_t created_at,
                                         const IsTaken& is_taken) {
  std::string base = "order/" + owner + "/" + std::to_string(created_at);

  if (scheme_ == AddressScheme::Legacy) {
    return base;
  }
  return nextSequenced(base, order_sequence_[owner], is_taken);
}

// -----------------------------------------------------------------------------
// nextSequenced: probe base/<counter>, base/<counter+1>, ... until free
// -----------------------------------------------------------------------------
std::string AddressDeriver::nextSequenced(const std::string& base,
                                          std::uint64_t& counter,
                                          const IsTaken& is_taken) {
  std::string address = base + "/" + std::to_string(counter);
  while (is_taken && is_taken(address)) {
    ++counter;
    address = base + "/" + std::to_string(counter);
  }
  ++counter;
  return address;
}

}  // namespace vault
