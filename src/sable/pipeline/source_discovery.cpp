#include "sable/pipeline/source_discovery.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <iterator>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/diagnostic/diagnostic_sink.hpp"
#include "sable/config/config_cache.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/filter/exclusion_matcher.hpp"
#include "sable/pipeline/run_context.hpp"

namespace sable::pipeline {

namespace fs = std::filesystem;

namespace {

// An input that resolved to an existing file or directory.
struct ResolvedInput {
  fs::path path;
  const std::string* spelling;
  bool is_directory;
};

void WalkDirectory(
    const ResolvedInput& input, const config::ProjectConfig& project,
    const filter::ExclusionMatcher& matcher, DiagnosticSink& sink,
    std::vector<SourceFile>& out) {
  const fs::path& root = input.path;
  const fs::path& project_root = project.location.project_root;
  std::vector<SourceFile> found;

  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    sink.Report(
        Diagnostic::PathError(
            *input.spelling,
            std::format("cannot read directory: {}", ec.message())));
    return;
  }

  const auto end = fs::end(it);
  while (it != end) {
    fs::path path = it->path();
    std::error_code type_ec;

    if (it->is_directory(type_ec)) {
      if (!matcher.Decide(path, project_root, filter::PathKind::kDirectory)
               .included) {
        it.disable_recursion_pending();
      }
    } else if (it->is_regular_file(type_ec)) {
      found.push_back(
          SourceFile{
              .path = path,
              .display = (fs::path(*input.spelling) /
                          path.lexically_relative(root))
                             .generic_string(),
              .project = project,
          });
    }

    it.increment(ec);
    if (ec) {
      sink.Report(
          Diagnostic::PathError(
              path.string(),
              std::format("cannot read directory: {}", ec.message())));
      break;
    }
  }

  std::ranges::sort(found, {}, &SourceFile::path);
  out.insert(
      out.end(), std::make_move_iterator(found.begin()),
      std::make_move_iterator(found.end()));
}

}  // namespace

auto DiscoverSources(
    std::span<const std::string> inputs, RunContext& context,
    DiagnosticSink& sink) -> Result<std::vector<SourceFile>> {
  std::vector<ResolvedInput> resolved;
  std::vector<fs::path> paths;

  for (const auto& input : inputs) {
    std::error_code ec;
    fs::path path = fs::absolute(input, ec);
    if (!ec) {
      path = fs::canonical(path, ec);
    }
    if (ec) {
      sink.Report(
          Diagnostic::PathError(
              input, std::format("cannot resolve path: {}", ec.message())));
      continue;
    }

    fs::file_status status = fs::status(path, ec);
    bool is_directory = !ec && fs::is_directory(status);
    if (!is_directory && (ec || !fs::is_regular_file(status))) {
      sink.Report(
          Diagnostic::PathError(input, "not a regular file or directory"));
      continue;
    }
    resolved.push_back(
        ResolvedInput{
            .path = path, .spelling = &input, .is_directory = is_directory});
    paths.push_back(path);
  }

  std::vector<SourceFile> sources;
  if (resolved.empty()) {
    return sources;
  }

  auto base = config::CommonBase(paths);
  if (!base) {
    return std::unexpected(base.error());
  }
  auto project = context.Cache().Resolve(*base);
  if (!project) {
    return std::unexpected(project.error());
  }
  filter::ExclusionMatcher matcher(project->config->Patterns());

  for (const auto& input : resolved) {
    if (input.is_directory) {
      WalkDirectory(input, *project, matcher, sink, sources);
      continue;
    }
    sources.push_back(
        SourceFile{
            .path = input.path,
            .display = *input.spelling,
            .project = *project,
        });
  }

  return sources;
}

}  // namespace sable::pipeline
