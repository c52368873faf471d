#include "chronoid/config/tool_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace chronoid {
namespace config {

OutputFormat parse_output_format(std::string_view name) {
  if (name == "canonical" || name == "str") return OutputFormat::Canonical;
  if (name == "hex") return OutputFormat::Hex;
  if (name == "int") return OutputFormat::Decimal;
  if (name == "bytes") return OutputFormat::Bytes;
  if (name == "id25") return OutputFormat::CompactLower;
  if (name == "ID25") return OutputFormat::CompactUpper;
  throw ConfigError("unknown output format '" + std::string(name) +
                    "' (expected canonical, hex, int, bytes, id25 or ID25)");
}

std::string_view output_format_name(OutputFormat format) {
  switch (format) {
    case OutputFormat::Canonical:
      return "canonical";
    case OutputFormat::Hex:
      return "hex";
    case OutputFormat::Decimal:
      return "int";
    case OutputFormat::Bytes:
      return "bytes";
    case OutputFormat::CompactLower:
      return "id25";
    case OutputFormat::CompactUpper:
      return "ID25";
  }
  return "canonical";
}

Precision parse_precision(std::string_view name) {
  if (name == "full") return Precision::Full;
  if (name == "ms") return Precision::MillisecondOnly;
  throw ConfigError("unknown precision '" + std::string(name) +
                    "' (expected full or ms)");
}

ToolConfig parse_tool_config(std::string_view json_text) {
  ToolConfig cfg;
  try {
    // parse() throws parse_error on malformed input; get<>() throws
    // type_error when a key holds the wrong JSON type.
    const auto json = nlohmann::json::parse(json_text);
    if (!json.is_object()) {
      throw ConfigError("config root must be a JSON object");
    }

    if (json.contains("format")) {
      cfg.format = parse_output_format(json.at("format").get<std::string>());
    }
    if (json.contains("count")) {
      const auto count = json.at("count").get<std::int64_t>();
      if (count < 1) {
        throw ConfigError("count must be >= 1, got " + std::to_string(count));
      }
      cfg.count = static_cast<std::size_t>(count);
    }
    if (json.contains("precision")) {
      cfg.extract.precision =
          parse_precision(json.at("precision").get<std::string>());
    }
    if (json.contains("strict")) {
      cfg.extract.strict = json.at("strict").get<bool>();
    }
    if (json.contains("nil_as_zero")) {
      cfg.extract.nil_as_zero = json.at("nil_as_zero").get<bool>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config JSON: ") + e.what());
  }
  return cfg;
}

ToolConfig load_tool_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_tool_config(buffer.str());
}

}  // namespace config
}  // namespace chronoid
