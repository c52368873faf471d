#include "chronoid/generator/uuid7_generator.hpp"
#include "chronoid/domain/errors.hpp"
#include "chronoid/layout/bit_layout.hpp"
#include "chronoid/time/time_utils.hpp"

#include <array>
#include <iostream>

namespace chronoid {

namespace {

// Random bytes drawn per identifier: 56 bits, of which the low 54 are used.
constexpr std::size_t kRandomBytes = 7;

static_assert(Uuid7Generator::kMaxGeneratedUnixTsMs <=
                  Uuid7Generator::kMaxUnixTsMs,
              "int64 nanoseconds always fit the 48-bit millisecond field");

}  // namespace

Uuid7Generator::Uuid7Generator(const ITimeProvider& clock,
                               IRandomProvider& random)
    : clock_(clock), random_(random) {}

// -----------------------------------------------------------------------------
// generate(): "now" channel
// -----------------------------------------------------------------------------
Identifier Uuid7Generator::generate() {
  const std::uint64_t random_bits = draw_random_bits();

  // The clock is read inside the state lock: two racing callers then see
  // clock samples in the same order as their state updates.
  const MonotonicState::Advance adv = now_state_.advance_with(
      [this] { return split_timestamp(clock_.now_ns()); });

  if (adv.saturated_now) {
    log_saturation("now", adv.stamp);
  }
  return assemble(adv.stamp, random_bits);
}

// -----------------------------------------------------------------------------
// generate(ns): "as-of" channel, with nil/max sentinels
// -----------------------------------------------------------------------------
Identifier Uuid7Generator::generate(std::int64_t timestamp_ns) {
  if (timestamp_ns == kNilTimestamp) {
    return Identifier::nil();
  }
  if (timestamp_ns == kMaxTimestamp) {
    return Identifier::max();
  }

  // Validate before touching randomness or state.
  const SubMsStamp candidate = split_timestamp(timestamp_ns);
  const std::uint64_t random_bits = draw_random_bits();

  const MonotonicState::Advance adv = as_of_state_.advance(candidate);
  if (adv.saturated_now) {
    log_saturation("as-of", adv.stamp);
  }
  return assemble(adv.stamp, random_bits);
}

Identifier Uuid7Generator::generate(std::optional<std::int64_t> timestamp_ns) {
  return timestamp_ns ? generate(*timestamp_ns) : generate();
}

std::string Uuid7Generator::generate_string(
    std::optional<std::int64_t> timestamp_ns) {
  return codec::to_canonical(generate(timestamp_ns));
}

std::string Uuid7Generator::generate_hex(
    std::optional<std::int64_t> timestamp_ns) {
  return codec::to_hex(generate(timestamp_ns));
}

codec::ByteArray Uuid7Generator::generate_bytes(
    std::optional<std::int64_t> timestamp_ns) {
  return codec::to_bytes(generate(timestamp_ns));
}

std::string Uuid7Generator::generate_compact(
    compact::LetterCase letter_case, std::optional<std::int64_t> timestamp_ns) {
  return compact::encode(generate(timestamp_ns), letter_case);
}

SubMsStamp Uuid7Generator::split_timestamp(std::int64_t timestamp_ns) {
  if (timestamp_ns < 0) {
    throw InvalidTimestamp("timestamp must be non-negative, got " +
                           std::to_string(timestamp_ns) + "ns");
  }

  const auto ns = static_cast<std::uint64_t>(timestamp_ns);
  const auto per_ms = static_cast<std::uint64_t>(kNanosPerMilli);

  // Any non-negative int64 fits the 48-bit field (see kMaxGeneratedUnixTsMs).
  SubMsStamp stamp;
  stamp.ms = ns / per_ms;
  // remainder < 10^6, so remainder << 20 stays well inside 64 bits.
  const std::uint64_t remainder = ns % per_ms;
  stamp.sub_ms = static_cast<std::uint32_t>((remainder << layout::kSubMsBits) /
                                            per_ms);
  return stamp;
}

std::uint64_t Uuid7Generator::draw_random_bits() {
  std::array<std::uint8_t, kRandomBytes> bytes{};
  random_.fill(bytes.data(), bytes.size());

  std::uint64_t bits = 0;
  for (std::uint8_t b : bytes) {
    bits = (bits << 8) | b;
  }
  return bits & layout::kRandomBitsMask;
}

Identifier Uuid7Generator::assemble(const SubMsStamp& stamp,
                                    std::uint64_t random_bits) const {
  const layout::RandomFields fields =
      layout::fields_for_sub_ms(stamp.sub_ms, random_bits);
  return layout::pack(stamp.ms, fields.rand_a, fields.rand_b);
}

void Uuid7Generator::log_saturation(const char* channel,
                                    const SubMsStamp& stamp) const {
  std::cerr << "[Uuid7Generator] WARNING: sub-millisecond counter saturated on "
            << channel << " channel at unix_ts_ms=" << stamp.ms
            << "; further ids in this millisecond are ordered by their random "
               "bits only\n";
}

}  // namespace chronoid
