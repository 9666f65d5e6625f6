#pragma once

#include "vault/time/i_time_provider.hpp"

namespace vault {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock time truncated to whole seconds.
//
// @details
// Used by the standalone vault_ledger binary. Tests inject a
// SimulationTimeProvider instead so that created_at / last_price_update are
// predictable.
//
// Thread model:
//   system_clock::now() is safe to call from any thread. No internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_seconds() const override;
};

}  // namespace vault
