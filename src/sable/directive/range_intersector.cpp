#include "sable/directive/range_intersector.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/line_range_set.hpp"
#include "sable/directive/directive_scanner.hpp"

namespace sable::directive {

namespace {

auto ParseLineNumber(std::string_view text) -> std::optional<uint32_t> {
  uint32_t value = 0;
  const char* end = text.data() + text.size();
  auto result = std::from_chars(text.data(), end, value);
  if (text.empty() || result.ec != std::errc{} || result.ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto ParseLineRange(std::string_view text) -> Result<common::LineRange> {
  auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    return std::unexpected(
        Diagnostic::RangeError(
            std::format(
                "invalid line range '{}': expected START-END", text)));
  }

  auto start = ParseLineNumber(text.substr(0, dash));
  auto end = ParseLineNumber(text.substr(dash + 1));
  if (!start || !end) {
    return std::unexpected(
        Diagnostic::RangeError(
            std::format(
                "invalid line range '{}': START and END must be integers",
                text)));
  }
  if (*start < 1) {
    return std::unexpected(
        Diagnostic::RangeError(
            std::format(
                "invalid line range '{}': line numbers start at 1", text)));
  }
  if (*start > *end) {
    return std::unexpected(
        Diagnostic::RangeError(
            std::format(
                "invalid line range '{}': start {} is after end {}", text,
                *start, *end)));
  }
  return common::LineRange{.start = *start, .end = *end};
}

auto RequestedLines(std::span<const common::LineRange> ranges)
    -> common::LineRangeSet {
  common::LineRangeSet requested;
  if (ranges.empty()) {
    requested.MarkFullExtent();
    return requested;
  }
  for (const auto& range : ranges) {
    requested.Insert(range);
  }
  return requested;
}

auto Intersect(
    std::span<const DirectiveSpan> spans,
    const common::LineRangeSet& requested) -> std::vector<FormatRegion> {
  std::vector<FormatRegion> regions;
  for (const auto& span : spans) {
    if (span.kind != SpanKind::kFormattable) {
      continue;
    }
    for (const auto& piece :
         requested.Clip({.start = span.start, .end = span.end})) {
      if (!regions.empty() && regions.back().end + 1 == piece.start) {
        regions.back().end = piece.end;
        continue;
      }
      regions.push_back({.start = piece.start, .end = piece.end});
    }
  }
  return regions;
}

}  // namespace sable::directive
