#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chronoid {

// Calendar timestamp type handed to callers that want more than raw
// nanoseconds.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridge between epoch nanoseconds (what the generator and the
//         extractor speak) and std::chrono time points.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kNanosPerMilli = 1'000'000;
constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

// -------------------------------------------------------------------------
// ns_to_timestamp
// -------------------------------------------------------------------------
// @brief  Converts epoch nanoseconds to a system_clock time point.
//
// @details
// On platforms whose system_clock is coarser than nanoseconds the value is
// truncated to the clock's period.
// -------------------------------------------------------------------------
inline Timestamp ns_to_timestamp(std::int64_t ns) {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::nanoseconds{ns})};
}

// Inverse of ns_to_timestamp().
inline std::int64_t timestamp_to_ns(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_iso8601_utc
// -------------------------------------------------------------------------
// @brief  Renders epoch nanoseconds as `YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ`.
//
// @param  ns  Nanoseconds since 1970-01-01 00:00:00 UTC.
// @return UTC string with a fixed nine-digit fraction.
// -------------------------------------------------------------------------
std::string format_iso8601_utc(std::int64_t ns);

// Same rendering from whole milliseconds plus the nanoseconds within that
// millisecond (`frac_ns` < 1'000'000). Reaches past the int64 nanosecond
// range, up to the last millisecond a UUIDv7 can carry.
std::string format_iso8601_utc(std::uint64_t unix_ms, std::uint32_t frac_ns);

}  // namespace chronoid
