#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/config/resolved_config.hpp"
#include "sable/directive/directive_scanner.hpp"
#include "sable/directive/range_intersector.hpp"
#include "sable/filter/exclusion_matcher.hpp"
#include "sable/pipeline/run_context.hpp"
#include "sable/pipeline/source_discovery.hpp"

namespace sable::pipeline {

enum class FileStatus : uint8_t {
  kPlanned,   // Regions computed
  kExcluded,  // Filtered out by the include/exclude rules
  kFailed,    // Unreadable, or the scan failed
};

// Outcome of one file. Produced by one worker, read by the driver after all
// workers finish.
struct FileResult {
  SourceFile source;
  FileStatus status = FileStatus::kFailed;
  filter::MatchDecision decision;
  // Where the configuration came from; project_root anchors the patterns
  config::LocatedConfig location;
  std::shared_ptr<const config::ResolvedConfig> config;
  uint32_t line_count = 0;
  std::vector<directive::DirectiveSpan> spans;
  std::vector<directive::FormatRegion> regions;
  // Warnings and the error behind kFailed, in reporting order
  std::vector<Diagnostic> diagnostics;
};

// Read a source file as bytes.
// Returns error Diagnostic if the file cannot be opened or read.
auto ReadSource(const std::filesystem::path& path, std::string_view display)
    -> Result<std::string>;

// Run the per-file pipeline under the configuration discovery attached to
// `source`: decide inclusion, read, scan directives and intersect with the
// requested line ranges. Never throws; failures are recorded in the result.
auto ProcessFile(const SourceFile& source, RunContext& context) -> FileResult;

}  // namespace sable::pipeline
