#pragma once

#include "chronoid/extract/timestamp_extractor.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chronoid {
namespace config {

// Rendering used by `chronoid gen`.
enum class OutputFormat {
  Canonical,     // 017f22e2-79b0-7cc3-98c4-dc0c0c07398f
  Hex,           // 017f22e279b07cc398c4dc0c0c07398f
  Decimal,       // 1989357241971137676463954034883508623
  Bytes,         // 16 space-separated hex bytes
  CompactLower,  // id25
  CompactUpper,  // ID25
};

// Thrown for unreadable files, malformed JSON, and out-of-domain values.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// ToolConfig — defaults for the command-line tool
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct loaded from JSON; command-line flags override
//         individual fields afterwards.
//
// @details
// Expected JSON (every key optional):
//   {
//     "format":      "canonical",   // canonical|hex|int|bytes|id25|ID25
//     "count":       1,             // ids per `gen` invocation, >= 1
//     "precision":   "full",        // full|ms
//     "strict":      false,         // NotVersion7 instead of null
//     "nil_as_zero": false          // nil id extracts as timestamp 0
//   }
//
// Thread model:
//   Value semantics; copied into whatever needs it.
// -----------------------------------------------------------------------------
struct ToolConfig {
  OutputFormat format{OutputFormat::Canonical};
  std::size_t count{1};
  ExtractOptions extract{};
};

// Parses a JSON document. Throws ConfigError.
ToolConfig parse_tool_config(std::string_view json_text);

// Reads and parses a JSON file. Throws ConfigError.
ToolConfig load_tool_config(const std::string& path);

// "canonical" → OutputFormat::Canonical, etc. Throws ConfigError.
OutputFormat parse_output_format(std::string_view name);
std::string_view output_format_name(OutputFormat format);

// "full" / "ms". Throws ConfigError.
Precision parse_precision(std::string_view name);

}  // namespace config
}  // namespace chronoid
