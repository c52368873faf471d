#pragma once

#include "chronoid/time/i_time_provider.hpp"

namespace chronoid {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and converts to epoch nanoseconds.
//
// @details
// The effective resolution is whatever the platform clock offers (tens of
// nanoseconds on Linux, up to several milliseconds on some Windows builds).
// measure_clock_precision() reports what a given host actually delivers.
//
// Thread model:
//   system_clock::now() is safe from any thread. No internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ns() const override;
};

}  // namespace chronoid
