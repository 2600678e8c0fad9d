#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/directive/directive_scanner.hpp"

namespace sable::directive {
namespace {

using Spans = std::vector<DirectiveSpan>;

constexpr auto kF = SpanKind::kFormattable;
constexpr auto kP = SpanKind::kPreserved;

auto Span(uint32_t start, uint32_t end, SpanKind kind) -> DirectiveSpan {
  return DirectiveSpan{.start = start, .end = end, .kind = kind};
}

class DirectiveScannerTest : public ::testing::Test {
 protected:
  static auto ScanOk(std::string_view text) -> ScanResult {
    auto result = Scan(text);
    EXPECT_TRUE(result.has_value()) << result.error().primary.message;
    if (!result) {
      return {};
    }
    ExpectPartition(*result);
    return std::move(*result);
  }

  // Spans are ordered, contiguous and cover every line exactly once.
  static void ExpectPartition(const ScanResult& result) {
    uint32_t next = 1;
    for (const auto& span : result.spans) {
      EXPECT_EQ(span.start, next);
      EXPECT_LE(span.start, span.end);
      next = span.end + 1;
    }
    EXPECT_EQ(next, result.line_count + 1);
  }
};

// =============================================================================
// SplitLines
// =============================================================================

TEST_F(DirectiveScannerTest, SplitLines) {
  using Lines = std::vector<std::string_view>;
  EXPECT_EQ(SplitLines("a\nb\n"), (Lines{"a", "b"}));
  EXPECT_EQ(SplitLines("a\nb"), (Lines{"a", "b"}));
  EXPECT_EQ(SplitLines("a\r\n\r\nb\r\n"), (Lines{"a", "", "b"}));
  EXPECT_EQ(SplitLines("\n"), (Lines{""}));
  EXPECT_TRUE(SplitLines("").empty());
}

// =============================================================================
// Pause / resume
// =============================================================================

TEST_F(DirectiveScannerTest, NoMarkersIsOneFormattableSpan) {
  auto result = ScanOk("import os\n\nx = 1\n");
  EXPECT_EQ(result.line_count, 3U);
  EXPECT_EQ(result.spans, (Spans{Span(1, 3, kF)}));
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(DirectiveScannerTest, EmptyTextHasNoSpans) {
  auto result = ScanOk("");
  EXPECT_EQ(result.line_count, 0U);
  EXPECT_TRUE(result.spans.empty());
}

TEST_F(DirectiveScannerTest, PausedBlockIsPreservedWithMarkers) {
  auto result = ScanOk(
      "a = 1\n"         // 1
      "b = 2\n"         // 2
      "# fmt: off\n"    // 3
      "custom = [\n"    // 4
      "  1,2,\n"        // 5
      "]\n"             // 6
      "# fmt: on\n"     // 7
      "c = 3\n"         // 8
      "d = 4\n"         // 9
      "e = 5\n");       // 10
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 2, kF), Span(3, 7, kP), Span(8, 10, kF)}));
}

TEST_F(DirectiveScannerTest, AlternateMarkerSpellings) {
  auto result = ScanOk(
      "a = 1\n"
      "#fmt:off\n"
      "b  =  2\n"
      "#   fmt:on\n"
      "c = 3\n"
      "# yapf: disable\n"
      "d  =  4\n"
      "# yapf: enable\n");
  EXPECT_EQ(
      result.spans,
      (Spans{
          Span(1, 1, kF), Span(2, 4, kP), Span(5, 5, kF), Span(6, 8, kP)}));
}

TEST_F(DirectiveScannerTest, IndentedMarkersInsideBlock) {
  auto result = ScanOk(
      "def f():\n"
      "    # fmt: off\n"
      "    x = [1,\n"
      "         2]\n"
      "    # fmt: on\n"
      "    return x\n");
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 1, kF), Span(2, 5, kP), Span(6, 6, kF)}));
}

TEST_F(DirectiveScannerTest, NestedPauseIsAbsorbed) {
  auto result = ScanOk(
      "a = 1\n"
      "# fmt: off\n"
      "# fmt: off\n"
      "b = 2\n"
      "# fmt: on\n"
      "c = 3\n");
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 1, kF), Span(2, 5, kP), Span(6, 6, kF)}));
}

TEST_F(DirectiveScannerTest, StrayResumeIsIgnored) {
  auto result = ScanOk(
      "a = 1\n"
      "# fmt: on\n"
      "b = 2\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 3, kF)}));
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(DirectiveScannerTest, TrailingPauseCommentIsNotAMarker) {
  auto result = ScanOk(
      "a = 1  # fmt: off\n"
      "b = 2\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 2, kF)}));
}

TEST_F(DirectiveScannerTest, MarkerWithExtraTextIsNotAMarker) {
  auto result = ScanOk(
      "# fmt: off because reasons\n"
      "b = 2\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 2, kF)}));
}

TEST_F(DirectiveScannerTest, MarkersInsideStringsAreIgnored) {
  auto result = ScanOk(
      "doc = \"\"\"\n"
      "# fmt: off\n"
      "\"\"\"\n"
      "s = '# fmt: off'\n"
      "x = 1\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 5, kF)}));
}

TEST_F(DirectiveScannerTest, PauseInsideBracketsIsHonored) {
  auto result = ScanOk(
      "x = [\n"
      "    # fmt: off\n"
      "    1,   2,\n"
      "    # fmt: on\n"
      "    3,\n"
      "]\n");
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 1, kF), Span(2, 4, kP), Span(5, 6, kF)}));
}

// =============================================================================
// Unmatched pause
// =============================================================================

TEST_F(DirectiveScannerTest, UnmatchedPauseExtendsToEofWithWarning) {
  auto result = Scan(
      "a = 1\n"
      "# fmt: off\n"
      "b = 2\n"
      "c = 3\n",
      ScanOptions{.path = "mod.py"});
  ASSERT_TRUE(result.has_value());
  ExpectPartition(*result);
  EXPECT_EQ(result->spans, (Spans{Span(1, 1, kF), Span(2, 4, kP)}));
  ASSERT_EQ(result->diagnostics.size(), 1U);
  const DiagItem& warning = result->diagnostics[0].primary;
  EXPECT_EQ(warning.kind, DiagKind::kWarning);
  EXPECT_EQ(
      std::get<SourceLocation>(warning.location),
      (SourceLocation{.path = "mod.py", .line = 2}));
}

TEST_F(DirectiveScannerTest, UnmatchedPauseUnderStrictPolicyFails) {
  auto result = Scan(
      "# fmt: off\n"
      "b = 2\n",
      ScanOptions{
          .unmatched_pause = UnmatchedPausePolicy::kError, .path = "mod.py"});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.kind, DiagKind::kDirectiveError);
  EXPECT_EQ(
      std::get<SourceLocation>(result.error().primary.location).line, 1U);
}

// =============================================================================
// Skip
// =============================================================================

TEST_F(DirectiveScannerTest, SkipPreservesSingleLine) {
  auto result = ScanOk(
      "a = 1\n"
      "b  =  [1,2]  # fmt: skip\n"
      "c = 3\n");
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 1, kF), Span(2, 2, kP), Span(3, 3, kF)}));
}

TEST_F(DirectiveScannerTest, SkipPreservesWholeMultiLineStatement) {
  auto result = ScanOk(
      "a = 1\n"
      "b = call(\n"
      "    1,\n"
      "    2)  # fmt: skip\n"
      "c = 3\n");
  EXPECT_EQ(
      result.spans, (Spans{Span(1, 1, kF), Span(2, 4, kP), Span(5, 5, kF)}));
}

TEST_F(DirectiveScannerTest, SkipOnIntermediateLineHasNoEffect) {
  auto result = ScanOk(
      "b = call(  # fmt: skip\n"
      "    1,\n"
      ")\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 3, kF)}));
}

TEST_F(DirectiveScannerTest, SkipAfterOtherComment) {
  auto result = ScanOk(
      "import os  # noqa: F401 # fmt: skip\n"
      "x = 1\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 1, kP), Span(2, 2, kF)}));
}

TEST_F(DirectiveScannerTest, SkipBeforeOtherCommentIsNotASkip) {
  auto result = ScanOk("import os  # fmt: skip # noqa\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 1, kF)}));
}

TEST_F(DirectiveScannerTest, SkipInsideStringIsIgnored) {
  auto result = ScanOk("s = 'x  # fmt: skip'\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 1, kF)}));
}

TEST_F(DirectiveScannerTest, SkipAfterBackslashContinuation) {
  auto result = ScanOk(
      "x = 1 + \\\n"
      "    2  # fmt:skip\n"
      "y = 3\n");
  EXPECT_EQ(result.spans, (Spans{Span(1, 2, kP), Span(3, 3, kF)}));
}

}  // namespace
}  // namespace sable::directive
