#include "lendswap/time/simulation_time_provider.hpp"

namespace lendswap {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_seconds(std::int64_t seconds) {
  current_time_ms_.fetch_add(seconds * 1000);
}

}  // namespace lendswap
