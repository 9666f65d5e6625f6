#include "vault/time/live_time_provider.hpp"

#include <chrono>

namespace vault {

// -----------------------------------------------------------------------------
// now_seconds(): delegate to system_clock and convert to epoch seconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_seconds() const {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(
             now.time_since_epoch())
      .count();
}

}  // namespace vault
