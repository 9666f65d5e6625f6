#include "vault/time/simulation_time_provider.hpp"

namespace vault {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_seconds)
    : current_seconds_(start_seconds) {}

// -----------------------------------------------------------------------------
// now_seconds(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_seconds() const {
  return current_seconds_.load();
}

// -----------------------------------------------------------------------------
// set_time() / advance(): atomic writes
// -----------------------------------------------------------------------------
void SimulationTimeProvider::set_time(std::int64_t seconds) {
  current_seconds_.store(seconds);
}

void SimulationTimeProvider::advance(std::int64_t delta_seconds) {
  current_seconds_.fetch_add(delta_seconds);
}

}  // namespace vault
