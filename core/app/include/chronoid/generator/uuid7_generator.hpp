#pragma once

#include "chronoid/codec/codec.hpp"
#include "chronoid/codec/compact_codec.hpp"
#include "chronoid/concurrent/monotonic_state.hpp"
#include "chronoid/domain/identifier.hpp"
#include "chronoid/random/i_random_provider.hpp"
#include "chronoid/time/i_time_provider.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace chronoid {

// -----------------------------------------------------------------------------
// Uuid7Generator — time-ordered UUIDv7 source
// -----------------------------------------------------------------------------
//
// @brief  Produces version-7 identifiers that sort strictly increasing per
//         channel, even when called faster than the clock ticks.
//
// @details
// Every identifier carries:
//   - unix_ts_ms  whole milliseconds of the timestamp
//   - sub_ms      20 bits: floor(remainder_ns * 2^20 / 1'000'000), possibly
//                 bumped by the channel's MonotonicState (12 bits in
//                 rand_a, 8 bits atop rand_b)
//   - 54 bits     from the injected IRandomProvider (7 bytes fetched)
//
// Two channels, each with its own MonotonicState:
//   generate()      "now":   timestamp from the injected clock;
//                            Reconcile::NeverRegress, so consecutive ids
//                            strictly increase even on a frozen clock
//   generate(ns)    "as-of": timestamp supplied by the caller;
//                            Reconcile::OnExactMatch, so only an exact
//                            repeat of the previous stamp is bumped and
//                            out-of-order backfills keep their timestamps
// Backfilling history through the as-of channel therefore never disturbs
// the ordering of live ids.
//
// Sentinels (as-of channel only, no state touched):
//   generate(0)   → Identifier::nil()
//   generate(-1)  → Identifier::max()
//
// Call sequence per non-sentinel id:
//   1. Fetch 7 random bytes (may throw EntropyError).
//   2. Lock the channel state; for "now", read the clock inside the lock;
//      validate (may throw InvalidTimestamp); reconcile; store.
//   3. Pack via layout::pack().
// Steps that can fail run before the state is written, so a failed call
// leaves no trace.
//
// Thread model:
//   All generate*() methods are safe to call concurrently from any number
//   of threads. "now" and "as-of" callers never contend with each other.
//
// Ownership:
//   Borrows the clock and randomness providers; both must outlive the
//   generator. Owns its two MonotonicState instances. Non-copyable and
//   non-movable: a copy would be a second source handing out the same
//   sequence values.
// -----------------------------------------------------------------------------
class Uuid7Generator {
 public:
  // Largest value of the 48-bit unix_ts_ms field (year 10889).
  static constexpr std::uint64_t kMaxUnixTsMs = 0xFFFFFFFFFFFFULL;

  // Input timestamps are signed 64-bit epoch nanoseconds, so the latest
  // instant this generator can stamp is INT64_MAX ns, 2262-04-11T23:47:16Z.
  // That is far inside the 48-bit field; identifiers from other sources
  // may carry later timestamps and are still extractable.
  static constexpr std::uint64_t kMaxGeneratedUnixTsMs =
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max() /
                                 1'000'000);

  // Timestamp values that select the reserved sentinels.
  static constexpr std::int64_t kNilTimestamp = 0;
  static constexpr std::int64_t kMaxTimestamp = -1;

  Uuid7Generator(const ITimeProvider& clock, IRandomProvider& random);

  Uuid7Generator(const Uuid7Generator&) = delete;
  Uuid7Generator& operator=(const Uuid7Generator&) = delete;
  Uuid7Generator(Uuid7Generator&&) = delete;
  Uuid7Generator& operator=(Uuid7Generator&&) = delete;

  // -------------------------------------------------------------------------
  // generate()
  // -------------------------------------------------------------------------
  // @brief  New identifier stamped with the injected clock's current time.
  //
  // @throws InvalidTimestamp if the clock returns a negative value.
  // @throws EntropyError     if the randomness provider fails.
  // -------------------------------------------------------------------------
  Identifier generate();

  // -------------------------------------------------------------------------
  // generate(timestamp_ns)
  // -------------------------------------------------------------------------
  // @brief  New identifier "as of" an explicit epoch-nanosecond timestamp.
  //
  // @param  timestamp_ns  0 → nil, -1 → max, otherwise >= 0.
  //
  // @throws InvalidTimestamp for any other negative value.
  // @throws EntropyError     if the randomness provider fails.
  // -------------------------------------------------------------------------
  Identifier generate(std::int64_t timestamp_ns);

  // Dispatches to generate() when empty, generate(ns) otherwise.
  Identifier generate(std::optional<std::int64_t> timestamp_ns);

  // Convenience renderers over generate(optional).
  std::string generate_string(
      std::optional<std::int64_t> timestamp_ns = std::nullopt);
  std::string generate_hex(
      std::optional<std::int64_t> timestamp_ns = std::nullopt);
  codec::ByteArray generate_bytes(
      std::optional<std::int64_t> timestamp_ns = std::nullopt);
  std::string generate_compact(
      compact::LetterCase letter_case = compact::LetterCase::Lower,
      std::optional<std::int64_t> timestamp_ns = std::nullopt);

  // Last stamp handed out on each channel (diagnostics and tests).
  SubMsStamp snapshot_now_state() const { return now_state_.snapshot(); }
  SubMsStamp snapshot_as_of_state() const { return as_of_state_.snapshot(); }

 private:
  // Splits validated epoch nanoseconds into (ms, sub_ms).
  static SubMsStamp split_timestamp(std::int64_t timestamp_ns);

  // Draws 7 bytes and keeps the low 54 bits.
  std::uint64_t draw_random_bits();

  Identifier assemble(const SubMsStamp& stamp, std::uint64_t random_bits) const;

  void log_saturation(const char* channel, const SubMsStamp& stamp) const;

  const ITimeProvider& clock_;
  IRandomProvider& random_;

  MonotonicState now_state_{Reconcile::NeverRegress};
  MonotonicState as_of_state_{Reconcile::OnExactMatch};
};

}  // namespace chronoid
