#pragma once

#include "chronoid/codec/codec.hpp"
#include "chronoid/domain/identifier.hpp"
#include "chronoid/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace chronoid {

// How much of the embedded timestamp to recover.
enum class Precision {
  Full,             // unix_ts_ms plus the 20-bit sub-ms field
  MillisecondOnly,  // unix_ts_ms only; the sub-ms bits are ignored
};

// -----------------------------------------------------------------------------
// ExtractOptions — per-extractor behaviour switches
// -----------------------------------------------------------------------------
struct ExtractOptions {
  Precision precision{Precision::Full};

  /// Throw NotVersion7 instead of returning std::nullopt for non-v7 input.
  bool strict{false};

  /// Report the nil identifier as timestamp 0 instead of "not applicable".
  bool nil_as_zero{false};
};

// The embedded timestamp as whole milliseconds plus the nanoseconds within
// that millisecond. Covers the whole 48-bit field, through year 10889.
struct TimestampParts {
  std::uint64_t unix_ts_ms{0};
  std::uint32_t frac_ns{0};  // [0, 999'999]; 0 under MillisecondOnly
};

// unix_ts_ms * 1'000'000 + frac_ns, or std::nullopt when that exceeds
// signed 64-bit nanoseconds (after 2262-04-11T23:47:16.854775807Z).
std::optional<std::int64_t> to_epoch_ns(const TimestampParts& parts);

// -----------------------------------------------------------------------------
// TimestampExtractor — recovers the timestamp embedded in a UUIDv7
// -----------------------------------------------------------------------------
//
// @brief  Accepts any representation the codecs understand, normalizes it
//         to an Identifier, and reads the timestamp back out if the ver
//         field is 7.
//
// @details
// Reconstruction (Precision::Full):
//
//   t_sub   = (rand_a << 8) | top 8 bits of rand_b
//   frac_ns = floor(t_sub * 1'000'000 / 2^20)
//   ns      = unix_ts_ms * 1'000'000 + frac_ns
//
// The sub-ms field has ~0.95 ns granularity, so a timestamp that went
// through the generator comes back at most 1 ns early (or later, by the
// counter bumps the generator applied).
//
// Not applicable:
//   ver != 7 (this includes nil and max) → std::nullopt, or NotVersion7 in
//   strict mode. With nil_as_zero the nil id yields 0 instead.
//
// The 48-bit millisecond field reaches the year 10889, past what signed
// 64-bit nanoseconds can hold (2262). extract_parts() and extract_ms()
// cover the whole field. extract_ns() and extract_time_point() throw
// InvalidTimestamp for such a value rather than return a wrapped one.
//
// Thread-safety: Immutable after construction. Safe from any thread.
// -----------------------------------------------------------------------------
class TimestampExtractor {
 public:
  TimestampExtractor() = default;
  explicit TimestampExtractor(const ExtractOptions& options)
      : options_(options) {}

  const ExtractOptions& options() const { return options_; }

  // Milliseconds plus sub-millisecond nanoseconds, or std::nullopt when not
  // applicable. Never overflows.
  std::optional<TimestampParts> extract_parts(const Identifier& id) const;

  // Epoch nanoseconds, or std::nullopt when not applicable.
  std::optional<std::int64_t> extract_ns(const Identifier& id) const;
  std::optional<std::int64_t> extract_ns(const codec::ByteArray& bytes) const;
  // Any of hex, canonical, or compact text (see codec::parse).
  std::optional<std::int64_t> extract_ns(std::string_view text) const;

  // The raw 48-bit unix_ts_ms field, or std::nullopt when not applicable.
  std::optional<std::uint64_t> extract_ms(const Identifier& id) const;
  std::optional<std::uint64_t> extract_ms(std::string_view text) const;

  // Calendar timestamp built from extract_ns().
  std::optional<Timestamp> extract_time_point(const Identifier& id) const;
  std::optional<Timestamp> extract_time_point(std::string_view text) const;

 private:
  // True when `id` carries a usable timestamp; throws in strict mode.
  bool applicable(const Identifier& id) const;

  ExtractOptions options_{};
};

}  // namespace chronoid
