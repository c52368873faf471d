#pragma once

#include "chronoid/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace chronoid {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is whatever the caller last set.
//
// @details
// Used to make "now" generation deterministic: tests freeze the clock to
// force several ids into the same sub-millisecond tick, step it backwards
// to exercise clock regressions, or replay recorded timestamps.
//
// Internal storage is a single std::atomic<int64_t>; reads and writes are
// lock-free on 64-bit platforms.
//
// Thread model:
//   advance_time() and now_ns() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ns)
      : current_time_ns_(start_ns) {}

  // Returns the last value set by advance_time(), or the start value.
  std::int64_t now_ns() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ns)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to `new_time_ns`.
  //
  // @details
  // Monotonicity is NOT enforced: moving the clock backwards is a
  // legitimate test scenario for the generator.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ns);

  // Moves the clock forward (or back, for negative deltas) by `delta_ns`.
  void advance_by(std::int64_t delta_ns);

 private:
  std::atomic<std::int64_t> current_time_ns_{0};
};

}  // namespace chronoid
