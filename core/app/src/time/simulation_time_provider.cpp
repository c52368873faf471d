#include "chronoid/time/simulation_time_provider.hpp"

namespace chronoid {

std::int64_t SimulationTimeProvider::now_ns() const {
  return current_time_ns_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ns) {
  current_time_ns_.store(new_time_ns);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ns) {
  current_time_ns_.fetch_add(delta_ns);
}

}  // namespace chronoid
