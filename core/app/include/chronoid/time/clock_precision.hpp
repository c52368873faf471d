#pragma once

#include "chronoid/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chronoid {

// -----------------------------------------------------------------------------
// ClockPrecisionReport — what a clock actually resolves on this host
// -----------------------------------------------------------------------------
//
// @details
// The sub-millisecond field is only as good as the clock feeding it. A
// Linux system_clock typically ticks every few hundred nanoseconds; some
// Windows builds tick every ~5 ms, in which case most "now" ids inside a
// tick are ordered by the counter rather than by real time.
//
//   precision_ns        elapsed / distinct values   (observed tick)
//   ideal_precision_ns  elapsed / samples           (cost of one call)
//
// If the two are close, the clock ticks faster than it can be read.
// -----------------------------------------------------------------------------
struct ClockPrecisionReport {
  std::string label;
  std::size_t samples{0};
  std::size_t distinct{0};
  std::int64_t elapsed_ns{0};
  double precision_ns{0.0};
  double ideal_precision_ns{0.0};
};

// -------------------------------------------------------------------------
// measure_clock_precision
// -------------------------------------------------------------------------
// @brief  Polls `clock` until `max_distinct` distinct values were seen or
//         `max_duration` elapsed (measured on steady_clock).
//
// @param  clock         Clock under test.
// @param  label         Name echoed into the report.
// @param  max_distinct  Stop after this many distinct readings. Must be > 0.
// @param  max_duration  Hard time budget for sampling.
//
// Thread-safety: Reentrant. Blocks the calling thread for up to
//                max_duration.
// -------------------------------------------------------------------------
ClockPrecisionReport measure_clock_precision(
    const ITimeProvider& clock, std::string label,
    std::size_t max_distinct = 1000,
    std::chrono::nanoseconds max_duration = std::chrono::milliseconds(500));

// One human-readable line, e.g.
//   "system_clock has a timing precision of 221ns rather than 221ns
//    (1,000 samples of which 1,000 are distinct, in 0.00s)"
std::string format_precision_report(const ClockPrecisionReport& report);

}  // namespace chronoid
