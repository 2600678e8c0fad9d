#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/line_range_set.hpp"
#include "sable/directive/directive_scanner.hpp"

namespace sable::directive {

// Inclusive, 1-indexed lines that may be rewritten.
struct FormatRegion {
  uint32_t start = 0;
  uint32_t end = 0;

  auto operator==(const FormatRegion&) const -> bool = default;
};

// Parse "START-END" (1-indexed, inclusive).
// Returns error Diagnostic if the text is malformed, START < 1 or
// START > END.
auto ParseLineRange(std::string_view text) -> Result<common::LineRange>;

// Union of the requested ranges; the whole file when `ranges` is empty.
auto RequestedLines(std::span<const common::LineRange> ranges)
    -> common::LineRangeSet;

// Formattable lines inside `requested`, as maximal regions sorted by start.
// Requests past the last line are clipped; requests covering only preserved
// lines contribute nothing.
auto Intersect(
    std::span<const DirectiveSpan> spans,
    const common::LineRangeSet& requested) -> std::vector<FormatRegion>;

inline auto Intersect(
    std::span<const DirectiveSpan> spans,
    std::span<const common::LineRange> ranges) -> std::vector<FormatRegion> {
  return Intersect(spans, RequestedLines(ranges));
}

}  // namespace sable::directive
