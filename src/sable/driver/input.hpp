#pragma once

#include <argparse/argparse.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/line_range_set.hpp"
#include "sable/config/config_merger.hpp"
#include "sable/directive/directive_scanner.hpp"

namespace sable::driver {

// Everything the command line contributes to one run.
struct RunOptions {
  std::vector<std::string> inputs;
  std::optional<std::filesystem::path> explicit_config;
  // Only flags that were given on the command line
  config::ConfigLayer overrides;
  std::vector<common::LineRange> line_ranges;
  std::optional<int64_t> workers;
  directive::UnmatchedPausePolicy unmatched_pause =
      directive::UnmatchedPausePolicy::kExtendToEof;
  int verbose = 0;
};

// Add option flags (-l, -t, --include, ...), --config, --line-ranges,
// --workers, --strict-directives, -v and the positional sources.
void AddRunFlags(argparse::ArgumentParser& program);

// Collect parsed flags into RunOptions. Option flags become entries of the
// override layer, named as in the config file.
// Returns error Diagnostic for a malformed --line-ranges value.
auto BuildRunOptions(const argparse::ArgumentParser& program)
    -> Result<RunOptions>;

}  // namespace sable::driver
