#pragma once

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract clock consumed by the ledger core
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that supplies "now" to every operation that
//         stamps a record (createAsset, updatePrice, createOrder).
//
// @details
// On a real ledger the timestamp comes from the host's consensus clock, not
// from the machine the code happens to run on. Components therefore never
// call std::chrono directly; they receive `const ITimeProvider&` and call
// now_seconds().
//
//   - LiveTimeProvider       → std::chrono::system_clock, truncated to
//                              seconds.
//   - SimulationTimeProvider → a value set explicitly (tests, replays).
//
// Resolution is whole seconds since the Unix epoch, the same unit the
// Asset and TradeOrder records persist.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Writers (e.g.
//   SimulationTimeProvider::set_time) synchronize internally.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_seconds()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as seconds since 1970-01-01 00:00:00 UTC.
  //
  // @return int64_t  Epoch seconds. 0 for a simulation clock that has not
  //         been set yet.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_seconds() const = 0;
};

}  // namespace vault
