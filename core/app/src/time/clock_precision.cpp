#include "chronoid/time/clock_precision.hpp"

#include <cstdio>
#include <unordered_set>
#include <utility>

namespace chronoid {

namespace {

// 1234567 -> "1,234,567"
std::string with_thousands(std::uint64_t value) {
  std::string digits = std::to_string(value);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i % 3) == lead % 3) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

}  // namespace

ClockPrecisionReport measure_clock_precision(
    const ITimeProvider& clock, std::string label, std::size_t max_distinct,
    std::chrono::nanoseconds max_duration) {
  ClockPrecisionReport report;
  report.label = std::move(label);

  std::unordered_set<std::int64_t> values;
  const auto started = std::chrono::steady_clock::now();
  std::chrono::nanoseconds elapsed{0};

  while (true) {
    values.insert(clock.now_ns());
    ++report.samples;
    elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > max_duration || values.size() >= max_distinct) {
      break;
    }
  }

  report.distinct = values.size();
  report.elapsed_ns = elapsed.count();
  report.precision_ns = static_cast<double>(report.elapsed_ns) /
                        static_cast<double>(report.distinct);
  report.ideal_precision_ns = static_cast<double>(report.elapsed_ns) /
                              static_cast<double>(report.samples);
  return report;
}

std::string format_precision_report(const ClockPrecisionReport& report) {
  char seconds[32];
  std::snprintf(seconds, sizeof(seconds), "%.2f",
                static_cast<double>(report.elapsed_ns) / 1e9);

  return report.label + " has a timing precision of " +
         with_thousands(static_cast<std::uint64_t>(report.precision_ns + 0.5)) +
         "ns rather than " +
         with_thousands(
             static_cast<std::uint64_t>(report.ideal_precision_ns + 0.5)) +
         "ns (" + with_thousands(report.samples) + " samples of which " +
         with_thousands(report.distinct) + " are distinct, in " + seconds +
         "s)";
}

}  // namespace chronoid
