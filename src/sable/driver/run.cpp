#include "run.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "input.hpp"
#include "print.hpp"
#include "sable/common/diagnostic/diagnostic_sink.hpp"
#include "sable/common/environment.hpp"
#include "sable/config/config_cache.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/config/option.hpp"
#include "sable/config/run_environment.hpp"
#include "sable/pipeline/parallel_for.hpp"
#include "sable/pipeline/process_file.hpp"
#include "sable/pipeline/run_context.hpp"
#include "sable/pipeline/source_discovery.hpp"
#include "verbose_logger.hpp"

namespace sable::driver {

namespace fs = std::filesystem;

namespace {

// "Identified `/repo` as project root containing a .git directory."
void LogProject(VerboseLogger& vlog, const pipeline::FileResult& result) {
  const auto& location = result.location;
  vlog.Log(
      "config",
      fmt::format(
          "Identified `{}` as project root containing {}.",
          location.project_root.string(),
          config::RootReasonDescription(location.reason)));

  if (!location.config_path) {
    vlog.Log("config", "Using built-in defaults.");
  } else if (location.user_level) {
    vlog.Log(
        "config", fmt::format(
                      "Using configuration in user-level file `{}`.",
                      location.config_path->string()));
  } else {
    vlog.Log(
        "config", fmt::format(
                      "Using configuration from `{}`.",
                      location.config_path->string()));
  }

  for (const auto& [name, entry] : result.config->Entries()) {
    if (entry.source == config::OptionSource::kBuiltin) {
      continue;
    }
    vlog.Log(
        "config", fmt::format(
                      "  {} = {} ({})", name, config::DescribeValue(entry.value),
                      entry.origin));
  }
}

void LogFile(VerboseLogger& vlog, const pipeline::FileResult& result) {
  switch (result.status) {
    case pipeline::FileStatus::kPlanned:
      vlog.Log(
          "file", fmt::format(
                      "{}: {} line{}, {} span{}, {} region{}",
                      result.source.display, result.line_count,
                      result.line_count == 1 ? "" : "s", result.spans.size(),
                      result.spans.size() == 1 ? "" : "s",
                      result.regions.size(),
                      result.regions.size() == 1 ? "" : "s"));
      break;
    case pipeline::FileStatus::kExcluded:
      vlog.Log(
          "file", fmt::format(
                      "{}: ignored, matches the {} rule ({})",
                      result.source.display, result.decision.rule,
                      result.decision.normalized));
      break;
    case pipeline::FileStatus::kFailed:
      vlog.Log("file", fmt::format("{}: failed", result.source.display));
      break;
  }
}

}  // namespace

auto Run(RunOptions options) -> int {
  VerboseLogger vlog(options.verbose);
  EnvLookup env = ProcessEnvironment();

  if (options.inputs.empty()) {
    fmt::print(stderr, "No sources given. Nothing to do.\n");
    return 0;
  }

  auto workers = config::ResolveWorkerCount(options.workers, env);
  if (!workers) {
    PrintDiagnostic(workers.error());
    return 1;
  }

  if (vlog.Enabled(1)) {
    if (auto cache_dir = config::ResolveCacheDir(env)) {
      vlog.Log("config", fmt::format("Cache directory: {}", cache_dir->string()));
    }
    vlog.Log("config", fmt::format("Workers: {}", *workers));
  }

  pipeline::RunContext context(
      config::ConfigResolver(
          options.explicit_config, std::move(options.overrides), env),
      options.line_ranges, options.unmatched_pause);

  DiagnosticSink discovery_sink;
  std::vector<pipeline::SourceFile> sources;
  {
    PhaseTimer timer(vlog, "discover");
    auto discovered =
        pipeline::DiscoverSources(options.inputs, context, discovery_sink);
    if (!discovered) {
      PrintDiagnostics(discovery_sink);
      PrintDiagnostic(discovered.error());
      return 1;
    }
    sources = std::move(*discovered);
  }
  PrintDiagnostics(discovery_sink);

  std::vector<pipeline::FileResult> results(sources.size());
  {
    PhaseTimer timer(vlog, "plan", true);
    pipeline::ParallelFor(sources.size(), *workers, [&](size_t i) {
      results[i] = pipeline::ProcessFile(sources[i], context);
    });
  }

  bool failed = discovery_sink.HasErrors();
  std::set<fs::path> logged_roots;
  for (const auto& result : results) {
    if (vlog.Enabled(1) && result.config &&
        logged_roots.insert(result.location.project_root).second) {
      LogProject(vlog, result);
    }
    for (const auto& diag : result.diagnostics) {
      PrintDiagnostic(diag);
      if (diag.IsError()) {
        failed = true;
      }
    }
    if (vlog.Enabled(1)) {
      LogFile(vlog, result);
    }
    PrintRegions(result);
  }

  vlog.Log(
      "config", fmt::format(
                    "{} configuration walk{}, {} load{}",
                    context.Cache().WalkCount(),
                    context.Cache().WalkCount() == 1 ? "" : "s",
                    context.Cache().LoadCount(),
                    context.Cache().LoadCount() == 1 ? "" : "s"));
  PrintSummary(results);
  return failed ? 1 : 0;
}

}  // namespace sable::driver
