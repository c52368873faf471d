#pragma once

#include <cstdint>

namespace chronoid {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract wall-clock source
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// The Uuid7Generator never calls std::chrono directly. It receives a
// `const ITimeProvider&` and calls now_ns() for every "now" identifier:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set by the caller (tests, replay).
//
// Platforms with a coarse system clock, or deployments that want a
// different clock, inject their own implementation instead of patching a
// module-level function.
//
// Semantics:
//   The value is treated as wall-clock time. It may jump backward across
//   calls; the generator tolerates that because its monotonic state keys
//   off the supplied value.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   The generator holds a const reference; the provider must outlive it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ns()
  // -------------------------------------------------------------------------
  // @brief  Current time as nanoseconds since 1970-01-01 00:00:00 UTC.
  //
  // @return int64_t  Non-negative for any real clock. A negative value is
  //                  rejected by the generator with InvalidTimestamp.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ns() const = 0;
};

}  // namespace chronoid
