#include "print.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/diagnostic/diagnostic_sink.hpp"
#include "sable/common/source_location.hpp"
#include "sable/pipeline/process_file.hpp"

namespace sable::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kConfigError:
      return "config error:";
    case DiagKind::kPathError:
      return "error:";
    case DiagKind::kRangeError:
      return "range error:";
    case DiagKind::kDirectiveError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kConfigError:
    case DiagKind::kPathError:
    case DiagKind::kRangeError:
    case DiagKind::kDirectiveError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  std::string location;
  if (const auto* loc = std::get_if<SourceLocation>(&item.location)) {
    location = FormatSourceLocation(*loc);
  }
  if (location.empty()) {
    location = fmt::format("{}", fmt::styled("sable", kToolStyle));
  } else {
    location = fmt::format("{}", fmt::styled(location, fmt::emphasis::bold));
  }

  fmt::print(
      stderr, "{}: {} {}\n", location,
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("sable", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  for (const auto& diag : sink.GetDiagnostics()) {
    PrintDiagnostic(diag);
  }
}

void PrintRegions(const pipeline::FileResult& result) {
  for (const auto& region : result.regions) {
    fmt::print("{}:{}-{}\n", result.source.display, region.start, region.end);
  }
}

void PrintSummary(std::span<const pipeline::FileResult> results) {
  uint32_t planned = 0;
  uint32_t excluded = 0;
  uint32_t failed = 0;
  uint32_t warnings = 0;

  for (const auto& result : results) {
    switch (result.status) {
      case pipeline::FileStatus::kPlanned:
        ++planned;
        break;
      case pipeline::FileStatus::kExcluded:
        ++excluded;
        break;
      case pipeline::FileStatus::kFailed:
        ++failed;
        break;
    }
    for (const auto& diag : result.diagnostics) {
      if (!diag.IsError()) {
        ++warnings;
      }
    }
  }

  std::string summary = fmt::format(
      "{} file{} planned", planned, planned == 1 ? "" : "s");
  if (excluded > 0) {
    summary += fmt::format(", {} excluded", excluded);
  }
  if (warnings > 0) {
    summary += fmt::format(
        ", {} warning{}", warnings, warnings == 1 ? "" : "s");
  }
  if (failed > 0) {
    summary += fmt::format(", {} failed", failed);
  }
  fmt::print(stderr, "{}.\n", summary);
}

}  // namespace sable::driver
