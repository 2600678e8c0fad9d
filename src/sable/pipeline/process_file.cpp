#include "sable/pipeline/process_file.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/directive/directive_scanner.hpp"
#include "sable/directive/range_intersector.hpp"
#include "sable/filter/exclusion_matcher.hpp"
#include "sable/pipeline/run_context.hpp"

namespace sable::pipeline {

namespace fs = std::filesystem;

auto ReadSource(const fs::path& path, std::string_view display)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::PathError(std::string(display), "cannot open file"));
  }
  std::string text{
      std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::PathError(std::string(display), "error reading file"));
  }
  return text;
}

auto ProcessFile(const SourceFile& source, RunContext& context) -> FileResult {
  FileResult result{.source = source};

  result.location = source.project.location;
  result.config = source.project.config;

  filter::ExclusionMatcher matcher(result.config->Patterns());
  result.decision = matcher.Decide(
      source.path, result.location.project_root, filter::PathKind::kFile);
  if (!result.decision.included) {
    result.status = FileStatus::kExcluded;
    return result;
  }

  auto text = ReadSource(source.path, source.display);
  if (!text) {
    result.diagnostics.push_back(text.error());
    return result;
  }

  auto scanned = directive::Scan(
      *text, {
                 .unmatched_pause = context.UnmatchedPause(),
                 .path = source.display,
             });
  if (!scanned) {
    result.diagnostics.push_back(scanned.error());
    return result;
  }

  result.line_count = scanned->line_count;
  result.spans = std::move(scanned->spans);
  for (auto& diag : scanned->diagnostics) {
    result.diagnostics.push_back(std::move(diag));
  }
  result.regions = directive::Intersect(result.spans, context.Requested());
  result.status = FileStatus::kPlanned;
  return result;
}

}  // namespace sable::pipeline
