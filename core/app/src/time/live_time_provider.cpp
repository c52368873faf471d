#include "chronoid/time/live_time_provider.hpp"

#include <chrono>

namespace chronoid {

// -----------------------------------------------------------------------------
// now_ns(): delegate to system_clock and convert to epoch nanoseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ns() const {
  // duration_cast truncates toward zero; system_clock's own period is
  // already nanoseconds on libstdc++ and libc++, so nothing is lost there.
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch)
      .count();
}

}  // namespace chronoid
