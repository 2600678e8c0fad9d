#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/diagnostic/diagnostic_sink.hpp"
#include "sable/config/config_cache.hpp"
#include "sable/pipeline/run_context.hpp"

namespace sable::pipeline {

struct SourceFile {
  // Absolute, canonical
  std::filesystem::path path;
  // As given on the command line, or relative to the directory given
  std::string display;
  // Configuration of the run; its project root anchors the patterns
  config::ProjectConfig project;
};

// Expand command-line inputs into candidate files, in input order.
//
// The configuration is resolved once, from the deepest directory common to
// all inputs, and shared by every file found. A project file nested below
// that directory does not apply.
// Directories are walked recursively in sorted order; a subdirectory is
// pruned when the exclude, extend-exclude or force-exclude patterns match it.
// Per-input path problems (missing path, symlink loop) are reported to
// `sink` and the input is skipped.
// Returns error Diagnostic if the configuration cannot be resolved.
auto DiscoverSources(
    std::span<const std::string> inputs, RunContext& context,
    DiagnosticSink& sink) -> Result<std::vector<SourceFile>>;

}  // namespace sable::pipeline
