#pragma once

#include "chronoid/config/tool_config.hpp"
#include "chronoid/domain/identifier.hpp"
#include "chronoid/extract/timestamp_extractor.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace chronoid {
namespace config {

// -----------------------------------------------------------------------------
// describe_identifier
// -----------------------------------------------------------------------------
// @brief  Every representation of `id` plus its decoded fields, as JSON.
//
// @details
// Output shape:
//   {
//     "canonical": "...", "hex": "...", "int": "...", "id25": "...",
//     "ID25": "...", "bytes": [..16 ints..],
//     "version": 7, "variant": 2,
//     "unix_ts_ms": 1645557742000,          // null unless applicable
//     "timestamp_ns": 1645557742000797701,  // null unless applicable, or
//                                           // after 2262 (int64 overflow)
//     "timestamp_utc": "2022-02-22T19:22:22.000797701Z"  // null likewise
//   }
// The decimal form is a string because JSON numbers cannot hold 128 bits.
//
// @throws NotVersion7 when `options.strict` is set and ver != 7.
// -----------------------------------------------------------------------------
nlohmann::json describe_identifier(const Identifier& id,
                                   const ExtractOptions& options = {});

// Renders `id` in the given output format.
std::string render_identifier(const Identifier& id, OutputFormat format);

}  // namespace config
}  // namespace chronoid
