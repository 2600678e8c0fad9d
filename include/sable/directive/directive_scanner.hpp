#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"

namespace sable::directive {

enum class SpanKind : uint8_t {
  kFormattable,
  kPreserved,
};

// Inclusive, 1-indexed run of lines of one kind.
struct DirectiveSpan {
  uint32_t start = 0;
  uint32_t end = 0;
  SpanKind kind = SpanKind::kFormattable;

  auto operator==(const DirectiveSpan&) const -> bool = default;
};

// What to do when a pause marker is never resumed.
enum class UnmatchedPausePolicy : uint8_t {
  kExtendToEof,  // Preserve to end of file and warn
  kError,        // Fail the scan
};

struct ScanOptions {
  UnmatchedPausePolicy unmatched_pause = UnmatchedPausePolicy::kExtendToEof;
  // Used in diagnostic locations only
  std::string path;
};

struct ScanResult {
  // Ordered, contiguous, covering lines 1..line_count exactly once.
  std::vector<DirectiveSpan> spans;
  uint32_t line_count = 0;
  // Warnings (e.g. unmatched pause under kExtendToEof)
  std::vector<Diagnostic> diagnostics;
};

// Split on '\n', dropping a trailing '\r' from each line. A final newline does
// not start another line.
auto SplitLines(std::string_view text) -> std::vector<std::string_view>;

// Partition `text` into Formattable and Preserved spans.
//
// "# fmt: off" / "# yapf: disable" on a standalone comment line pauses
// formatting until "# fmt: on" / "# yapf: enable"; both marker lines are
// preserved. "# fmt: skip" as the trailing comment of the line ending a
// logical statement preserves the whole statement.
// Returns error Diagnostic for an unmatched pause under
// UnmatchedPausePolicy::kError.
auto Scan(std::string_view text, const ScanOptions& options = {})
    -> Result<ScanResult>;

}  // namespace sable::directive
