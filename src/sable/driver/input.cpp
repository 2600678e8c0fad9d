#include "input.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"
#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/config_merger.hpp"
#include "sable/config/option.hpp"
#include "sable/directive/range_intersector.hpp"

namespace sable::driver {

void AddRunFlags(argparse::ArgumentParser& program) {
  program.add_argument("-l", "--line-length")
      .scan<'i', int64_t>()
      .metavar("N")
      .help("How many characters per line to allow");
  program.add_argument("-t", "--target-version")
      .append()
      .metavar("VERSION")
      .help("Python version the output must support, e.g. py311 (repeatable)");
  program.add_argument("--include")
      .metavar("REGEX")
      .help("Files to include during directory walks");
  program.add_argument("--exclude")
      .metavar("REGEX")
      .help("Files and directories to exclude (replaces the default)");
  program.add_argument("--extend-exclude")
      .metavar("REGEX")
      .help("Like --exclude, but adds to the default");
  program.add_argument("--force-exclude")
      .metavar("REGEX")
      .help("Exclude matching paths even when named explicitly");
  program.add_argument("-S", "--skip-string-normalization")
      .default_value(false)
      .implicit_value(true)
      .help("Don't normalize string quotes or prefixes");
  program.add_argument("-C", "--skip-magic-trailing-comma")
      .default_value(false)
      .implicit_value(true)
      .help("Don't use trailing commas as a reason to split lines");
  program.add_argument("--line-ranges")
      .append()
      .metavar("START-END")
      .help("Only format lines in this range, 1-indexed inclusive (repeatable)");
  program.add_argument("--config")
      .metavar("FILE")
      .help("Read configuration from FILE instead of searching for it");
  program.add_argument("--workers")
      .scan<'i', int64_t>()
      .metavar("N")
      .help("Number of parallel workers (default: SABLE_NUM_WORKERS or CPUs)");
  program.add_argument("--strict-directives")
      .default_value(false)
      .implicit_value(true)
      .help("Fail a file whose '# fmt: off' is never turned back on");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Report configuration and per-file decisions on stderr");
  program.add_argument("sources").remaining().help(
      "Files or directories to plan");
}

auto BuildRunOptions(const argparse::ArgumentParser& program)
    -> Result<RunOptions> {
  RunOptions options{.overrides = config::OverrideLayer()};

  if (auto sources = program.present<std::vector<std::string>>("sources")) {
    options.inputs = *sources;
  }

  if (auto path = program.present<std::string>("--config")) {
    options.explicit_config = *path;
  }

  // Overrides: only what was given explicitly, so file values survive
  if (auto value = program.present<int64_t>("--line-length")) {
    options.overrides.Set(config::kLineLength, *value);
  }
  if (auto values =
          program.present<std::vector<std::string>>("--target-version")) {
    options.overrides.Set(config::kTargetVersion, *values);
  }
  if (auto value = program.present<std::string>("--include")) {
    options.overrides.Set(config::kInclude, *value);
  }
  if (auto value = program.present<std::string>("--exclude")) {
    options.overrides.Set(config::kExclude, *value);
  }
  if (auto value = program.present<std::string>("--extend-exclude")) {
    options.overrides.Set(config::kExtendExclude, *value);
  }
  if (auto value = program.present<std::string>("--force-exclude")) {
    options.overrides.Set(config::kForceExclude, *value);
  }
  if (program.get<bool>("--skip-string-normalization")) {
    options.overrides.Set(config::kSkipStringNormalization, true);
  }
  if (program.get<bool>("--skip-magic-trailing-comma")) {
    options.overrides.Set(config::kSkipMagicTrailingComma, true);
  }

  if (auto ranges = program.present<std::vector<std::string>>("--line-ranges")) {
    for (const auto& text : *ranges) {
      auto range = directive::ParseLineRange(text);
      if (!range) {
        return std::unexpected(range.error());
      }
      options.line_ranges.push_back(*range);
    }
  }

  options.workers = program.present<int64_t>("--workers");
  if (program.get<bool>("--strict-directives")) {
    options.unmatched_pause = directive::UnmatchedPausePolicy::kError;
  }
  options.verbose = program.get<bool>("--verbose") ? 1 : 0;

  return options;
}

}  // namespace sable::driver
