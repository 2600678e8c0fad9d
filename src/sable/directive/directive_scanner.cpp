#include "sable/directive/directive_scanner.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/source_location.hpp"
#include "sable/directive/line_lexer.hpp"

namespace sable::directive {

namespace {

enum class Marker : uint8_t {
  kNone,
  kPause,
  kResume,
};

// Comment bodies, compared after the '#' and any following whitespace
constexpr std::array<std::string_view, 3> kPauseMarkers = {
    "fmt: off", "fmt:off", "yapf: disable"};
constexpr std::array<std::string_view, 3> kResumeMarkers = {
    "fmt: on", "fmt:on", "yapf: enable"};
constexpr std::array<std::string_view, 2> kSkipMarkers = {
    "fmt: skip", "fmt:skip"};

auto Trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\f\v";
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

auto IsOneOf(std::string_view text, std::span<const std::string_view> set)
    -> bool {
  return std::ranges::find(set, text) != set.end();
}

// `comment` starts with '#'.
auto ClassifyStandalone(std::string_view comment) -> Marker {
  std::string_view body = Trim(comment.substr(1));
  if (IsOneOf(body, kPauseMarkers)) {
    return Marker::kPause;
  }
  if (IsOneOf(body, kResumeMarkers)) {
    return Marker::kResume;
  }
  return Marker::kNone;
}

// The skip marker may be the last of several '#'-separated comments, as in
// "# noqa: E501 # fmt: skip".
auto IsSkipComment(std::string_view comment) -> bool {
  std::string_view last = comment.substr(comment.rfind('#') + 1);
  return IsOneOf(Trim(last), kSkipMarkers);
}

auto Coalesce(const std::vector<SpanKind>& kinds)
    -> std::vector<DirectiveSpan> {
  std::vector<DirectiveSpan> spans;
  for (size_t i = 0; i < kinds.size(); ++i) {
    auto line = static_cast<uint32_t>(i + 1);
    if (!spans.empty() && spans.back().kind == kinds[i]) {
      spans.back().end = line;
      continue;
    }
    spans.push_back({.start = line, .end = line, .kind = kinds[i]});
  }
  return spans;
}

}  // namespace

auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t newline = text.find('\n', pos);
    size_t end = newline == std::string_view::npos ? text.size() : newline;
    std::string_view line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    pos = newline + 1;
  }
  return lines;
}

auto Scan(std::string_view text, const ScanOptions& options)
    -> Result<ScanResult> {
  auto lines = SplitLines(text);
  std::vector<SpanKind> kinds(lines.size(), SpanKind::kFormattable);

  LineLexer lexer;
  SpanKind state = SpanKind::kFormattable;
  uint32_t pause_line = 0;
  uint32_t statement_start = 1;

  for (size_t i = 0; i < lines.size(); ++i) {
    auto line_no = static_cast<uint32_t>(i + 1);
    LineInfo info = lexer.Feed(lines[i]);
    if (!info.continues_statement) {
      statement_start = line_no;
    }
    Marker marker = info.standalone_comment
                        ? ClassifyStandalone(*info.comment)
                        : Marker::kNone;

    switch (state) {
      case SpanKind::kFormattable:
        if (marker == Marker::kPause) {
          state = SpanKind::kPreserved;
          pause_line = line_no;
          kinds[i] = SpanKind::kPreserved;
        } else if (
            info.ends_statement && info.comment &&
            IsSkipComment(*info.comment)) {
          std::fill(
              kinds.begin() + (statement_start - 1), kinds.begin() + i + 1,
              SpanKind::kPreserved);
        }
        break;
      case SpanKind::kPreserved:
        // Nested pauses are absorbed; only a resume leaves this state.
        kinds[i] = SpanKind::kPreserved;
        if (marker == Marker::kResume) {
          state = SpanKind::kFormattable;
        }
        break;
    }
  }

  ScanResult result{
      .spans = Coalesce(kinds),
      .line_count = static_cast<uint32_t>(lines.size()),
      .diagnostics = {},
  };

  if (state == SpanKind::kPreserved) {
    SourceLocation loc{.path = options.path, .line = pause_line};
    switch (options.unmatched_pause) {
      case UnmatchedPausePolicy::kExtendToEof:
        result.diagnostics.push_back(
            Diagnostic::Warning(
                loc,
                "formatting is paused here and never resumed; preserving to "
                "end of file"));
        break;
      case UnmatchedPausePolicy::kError:
        return std::unexpected(
            Diagnostic::DirectiveError(
                loc, "formatting is paused here and never resumed"));
    }
  }

  return result;
}

}  // namespace sable::directive
