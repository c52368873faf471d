#include "chronoid/extract/timestamp_extractor.hpp"
#include "chronoid/domain/errors.hpp"
#include "chronoid/layout/bit_layout.hpp"

#include <limits>
#include <string>

namespace chronoid {

std::optional<std::int64_t> to_epoch_ns(const TimestampParts& parts) {
  constexpr std::int64_t kMaxNanos = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMaxMs =
      static_cast<std::uint64_t>(kMaxNanos / kNanosPerMilli);

  if (parts.unix_ts_ms > kMaxMs) {
    return std::nullopt;
  }
  const std::int64_t ns =
      static_cast<std::int64_t>(parts.unix_ts_ms) * kNanosPerMilli;
  if (ns > kMaxNanos - static_cast<std::int64_t>(parts.frac_ns)) {
    return std::nullopt;
  }
  return ns + static_cast<std::int64_t>(parts.frac_ns);
}

bool TimestampExtractor::applicable(const Identifier& id) const {
  if (id.is_nil() && options_.nil_as_zero) {
    return true;
  }
  if (id.version() == layout::kVersion) {
    return true;
  }
  if (options_.strict) {
    throw NotVersion7("identifier " + codec::to_canonical(id) +
                          " is version " + std::to_string(id.version()) +
                          ", not 7; no timestamp to extract",
                      id.version());
  }
  return false;
}

std::optional<TimestampParts> TimestampExtractor::extract_parts(
    const Identifier& id) const {
  if (!applicable(id)) {
    return std::nullopt;
  }
  if (id.is_nil()) {
    return TimestampParts{};
  }

  const layout::Uuid7Fields fields = layout::unpack(id);
  TimestampParts parts;
  parts.unix_ts_ms = fields.unix_ts_ms;
  if (options_.precision == Precision::Full) {
    // floor(t_sub * 1'000'000 / 2^20)
    const std::uint64_t sub_ms = layout::sub_ms_of(fields);
    parts.frac_ns = static_cast<std::uint32_t>(
        (sub_ms * static_cast<std::uint64_t>(kNanosPerMilli)) >>
        layout::kSubMsBits);
  }
  return parts;
}

std::optional<std::int64_t> TimestampExtractor::extract_ns(
    const Identifier& id) const {
  const std::optional<TimestampParts> parts = extract_parts(id);
  if (!parts) {
    return std::nullopt;
  }
  const std::optional<std::int64_t> ns = to_epoch_ns(*parts);
  if (!ns) {
    throw InvalidTimestamp("unix_ts_ms " + std::to_string(parts->unix_ts_ms) +
                           " cannot be expressed in 64-bit nanoseconds");
  }
  return ns;
}

std::optional<std::int64_t> TimestampExtractor::extract_ns(
    const codec::ByteArray& bytes) const {
  return extract_ns(codec::from_bytes(bytes));
}

std::optional<std::int64_t> TimestampExtractor::extract_ns(
    std::string_view text) const {
  return extract_ns(codec::parse(text));
}

std::optional<std::uint64_t> TimestampExtractor::extract_ms(
    const Identifier& id) const {
  if (!applicable(id)) {
    return std::nullopt;
  }
  return layout::unpack(id).unix_ts_ms;
}

std::optional<std::uint64_t> TimestampExtractor::extract_ms(
    std::string_view text) const {
  return extract_ms(codec::parse(text));
}

std::optional<Timestamp> TimestampExtractor::extract_time_point(
    const Identifier& id) const {
  std::optional<std::int64_t> ns = extract_ns(id);
  if (!ns) {
    return std::nullopt;
  }
  return ns_to_timestamp(*ns);
}

std::optional<Timestamp> TimestampExtractor::extract_time_point(
    std::string_view text) const {
  return extract_time_point(codec::parse(text));
}

}  // namespace chronoid
