// -----------------------------------------------------------------------------
// chronoid: command-line front end for the UUIDv7 / id25 library.
//
// Subcommands:
//   gen        print one or more new identifiers (now, or --as-of NS)
//   inspect    parse an identifier in any supported form and print every
//              representation plus its embedded timestamp as JSON
//   precision  report the effective resolution of the system clock
//
// Settings come from an optional JSON file (--config) first; flags given on
// the command line override the file.
//
// No global state: the clock, randomness source, and generator are all
// stack-local in main() and passed by reference.
// -----------------------------------------------------------------------------

#include "chronoid/codec/codec.hpp"
#include "chronoid/config/identifier_json.hpp"
#include "chronoid/config/tool_config.hpp"
#include "chronoid/domain/errors.hpp"
#include "chronoid/generator/uuid7_generator.hpp"
#include "chronoid/random/system_random_provider.hpp"
#include "chronoid/time/clock_precision.hpp"
#include "chronoid/time/live_time_provider.hpp"

#include <cxxopts.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

int run_gen(chronoid::Uuid7Generator& generator,
            const chronoid::config::ToolConfig& cfg,
            std::optional<std::int64_t> as_of_ns) {
  for (std::size_t i = 0; i < cfg.count; ++i) {
    std::cout << chronoid::config::render_identifier(
                     generator.generate(as_of_ns), cfg.format)
              << "\n";
  }
  return 0;
}

int run_inspect(const std::string& text,
                const chronoid::config::ToolConfig& cfg) {
  const chronoid::Identifier id = chronoid::codec::parse(text);
  std::cout << chronoid::config::describe_identifier(id, cfg.extract).dump(2)
            << "\n";
  return 0;
}

int run_precision(const chronoid::ITimeProvider& clock) {
  std::cout << chronoid::format_precision_report(
                   chronoid::measure_clock_precision(clock, "system_clock"))
            << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  cxxopts::Options options("chronoid",
                           "Time-ordered UUIDv7 and id25 identifiers");
  options.add_options()
      ("command", "gen | inspect | precision",
       cxxopts::value<std::string>()->default_value("gen"))
      ("id", "Identifier to inspect", cxxopts::value<std::string>())
      ("c,config", "JSON config file", cxxopts::value<std::string>())
      ("n,count", "Number of identifiers to generate", cxxopts::value<int>())
      ("f,format", "canonical | hex | int | bytes | id25 | ID25",
       cxxopts::value<std::string>())
      ("as-of", "Generate as of this epoch-nanosecond timestamp "
                "(0 = nil, -1 = max)", cxxopts::value<std::int64_t>())
      ("ms-only", "Ignore the sub-millisecond timestamp bits")
      ("strict", "Fail on identifiers that are not version 7")
      ("nil-as-zero", "Treat the nil identifier as timestamp 0")
      ("h,help", "Print usage");
  options.parse_positional({"command", "id"});

  try {
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      std::cout << options.help() << "\n";
      return 0;
    }

    chronoid::config::ToolConfig cfg;
    if (result.count("config")) {
      cfg = chronoid::config::load_tool_config(
          result["config"].as<std::string>());
    }
    if (result.count("count")) {
      const int count = result["count"].as<int>();
      if (count < 1) {
        throw chronoid::config::ConfigError("--count must be >= 1");
      }
      cfg.count = static_cast<std::size_t>(count);
    }
    if (result.count("format")) {
      cfg.format = chronoid::config::parse_output_format(
          result["format"].as<std::string>());
    }
    if (result.count("ms-only")) {
      cfg.extract.precision = chronoid::Precision::MillisecondOnly;
    }
    if (result.count("strict")) {
      cfg.extract.strict = true;
    }
    if (result.count("nil-as-zero")) {
      cfg.extract.nil_as_zero = true;
    }

    chronoid::LiveTimeProvider clock;
    chronoid::SystemRandomProvider random;
    chronoid::Uuid7Generator generator(clock, random);

    const std::string command = result["command"].as<std::string>();
    if (command == "gen") {
      std::optional<std::int64_t> as_of;
      if (result.count("as-of")) {
        as_of = result["as-of"].as<std::int64_t>();
      }
      return run_gen(generator, cfg, as_of);
    }
    if (command == "inspect") {
      if (!result.count("id")) {
        std::cerr << "[main] inspect needs an identifier argument\n";
        return 1;
      }
      return run_inspect(result["id"].as<std::string>(), cfg);
    }
    if (command == "precision") {
      return run_precision(clock);
    }

    std::cerr << "[main] unknown command '" << command << "'\n"
              << options.help() << "\n";
    return 1;
  } catch (const chronoid::IdentifierError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  } catch (const chronoid::config::ConfigError& e) {
    std::cerr << "[main] CONFIG ERROR: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    // cxxopts reports bad flags and bad values through std::exception
    // subclasses whose names differ between its major versions.
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }
}
