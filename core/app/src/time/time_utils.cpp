#include "chronoid/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace chronoid {

namespace {

std::string format_utc(std::int64_t seconds, std::int64_t nanos) {
  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&tt, &utc);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long long>(nanos));
  return buf;
}

}  // namespace

std::string format_iso8601_utc(std::int64_t ns) {
  // Floor division so pre-epoch values still land on the right second.
  std::int64_t seconds = ns / kNanosPerSecond;
  std::int64_t frac = ns % kNanosPerSecond;
  if (frac < 0) {
    frac += kNanosPerSecond;
    --seconds;
  }

  return format_utc(seconds, frac);
}

std::string format_iso8601_utc(std::uint64_t unix_ms, std::uint32_t frac_ns) {
  const auto seconds = static_cast<std::int64_t>(unix_ms / 1000);
  const auto nanos =
      static_cast<std::int64_t>(unix_ms % 1000) * kNanosPerMilli + frac_ns;
  return format_utc(seconds, nanos);
}

}  // namespace chronoid
