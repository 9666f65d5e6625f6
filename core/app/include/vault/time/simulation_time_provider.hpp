#pragma once

#include "vault/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Lets tests (and replays of a recorded command stream) decide exactly which
// second each record is stamped with. Two orders created without advancing
// the clock share a created_at, which is how the order-address collision of
// the legacy scheme is reproduced.
//
// Internal storage is a std::atomic<int64_t>, so set_time() from one thread
// and now_seconds() from another need no further locking.
//
// Ownership:
//   Owned by the test fixture or main(); components hold a const reference
//   through the ITimeProvider interface.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_seconds);

  std::int64_t now_seconds() const override;

  // -------------------------------------------------------------------------
  // set_time(seconds)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock to an absolute epoch second. Monotonicity is the
  //         caller's responsibility; tests occasionally rewind on purpose.
  // -------------------------------------------------------------------------
  void set_time(std::int64_t seconds);

  // -------------------------------------------------------------------------
  // advance(delta_seconds)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_seconds (may be 0).
  // -------------------------------------------------------------------------
  void advance(std::int64_t delta_seconds);

 private:
  std::atomic<std::int64_t> current_seconds_{0};
};

}  // namespace vault
