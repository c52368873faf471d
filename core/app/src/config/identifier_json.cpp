#include "chronoid/config/identifier_json.hpp"
#include "chronoid/codec/codec.hpp"
#include "chronoid/codec/compact_codec.hpp"
#include "chronoid/time/time_utils.hpp"

#include <cstdio>

namespace chronoid {
namespace config {

nlohmann::json describe_identifier(const Identifier& id,
                                   const ExtractOptions& options) {
  const TimestampExtractor extractor(options);
  const codec::ByteArray bytes = codec::to_bytes(id);

  nlohmann::json out;
  out["canonical"] = codec::to_canonical(id);
  out["hex"] = codec::to_hex(id);
  out["int"] = codec::to_decimal(id);
  out["id25"] = compact::encode(id, compact::LetterCase::Lower);
  out["ID25"] = compact::encode(id, compact::LetterCase::Upper);
  out["bytes"] = nlohmann::json::array();
  for (std::uint8_t b : bytes) {
    out["bytes"].push_back(b);
  }
  out["version"] = id.version();
  out["variant"] = id.variant();

  const std::optional<TimestampParts> parts = extractor.extract_parts(id);
  if (parts) {
    out["unix_ts_ms"] = parts->unix_ts_ms;
    // Past 2262 the value no longer fits signed 64-bit nanoseconds.
    const std::optional<std::int64_t> ns = to_epoch_ns(*parts);
    if (ns) {
      out["timestamp_ns"] = *ns;
    } else {
      out["timestamp_ns"] = nullptr;
    }
    out["timestamp_utc"] =
        format_iso8601_utc(parts->unix_ts_ms, parts->frac_ns);
  } else {
    out["unix_ts_ms"] = nullptr;
    out["timestamp_ns"] = nullptr;
    out["timestamp_utc"] = nullptr;
  }
  return out;
}

std::string render_identifier(const Identifier& id, OutputFormat format) {
  switch (format) {
    case OutputFormat::Canonical:
      return codec::to_canonical(id);
    case OutputFormat::Hex:
      return codec::to_hex(id);
    case OutputFormat::Decimal:
      return codec::to_decimal(id);
    case OutputFormat::Bytes: {
      std::string out;
      for (std::uint8_t b : codec::to_bytes(id)) {
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%02x", b);
        if (!out.empty()) out.push_back(' ');
        out += buf;
      }
      return out;
    }
    case OutputFormat::CompactLower:
      return compact::encode(id, compact::LetterCase::Lower);
    case OutputFormat::CompactUpper:
      return compact::encode(id, compact::LetterCase::Upper);
  }
  return codec::to_canonical(id);
}

}  // namespace config
}  // namespace chronoid
