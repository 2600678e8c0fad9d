#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sable/config/option.hpp"
#include "sable/filter/exclusion_matcher.hpp"
#include "sable/filter/path_pattern.hpp"

namespace sable::filter {
namespace {

class ExclusionMatcherTest : public ::testing::Test {
 protected:
  void Add(PatternRole role, std::string_view source) {
    auto pattern = CompilePattern(role, source);
    ASSERT_TRUE(pattern.has_value()) << pattern.error().primary.message;
    patterns_.push_back(std::move(*pattern));
  }

  void AddDefaults() {
    Add(PatternRole::kInclude, config::kDefaultInclude);
    Add(PatternRole::kExclude, config::kDefaultExclude);
  }

  [[nodiscard]] auto Matcher() const -> ExclusionMatcher {
    return ExclusionMatcher(patterns_);
  }

  std::vector<PathPattern> patterns_;
};

// =============================================================================
// NormalizePath
// =============================================================================

TEST_F(ExclusionMatcherTest, NormalizeRelativeToRoot) {
  EXPECT_EQ(NormalizePath("/repo/src/a.py", "/repo", PathKind::kFile), "/src/a.py");
  EXPECT_EQ(NormalizePath("/repo/src", "/repo", PathKind::kDirectory), "/src/");
  EXPECT_EQ(NormalizePath("/repo", "/repo", PathKind::kDirectory), "/");
  EXPECT_EQ(
      NormalizePath("/repo/./src/../lib/b.py", "/repo", PathKind::kFile),
      "/lib/b.py");
}

TEST_F(ExclusionMatcherTest, NormalizeOutsideRootStaysAbsolute) {
  EXPECT_EQ(
      NormalizePath("/other/x.py", "/repo", PathKind::kFile), "/other/x.py");
  EXPECT_EQ(NormalizePath("/other", "/repo", PathKind::kDirectory), "/other/");
}

// =============================================================================
// Decide
// =============================================================================

TEST_F(ExclusionMatcherTest, ExcludeAndExtendExclude) {
  AddDefaults();
  Add(PatternRole::kExclude, "tests/");
  Add(PatternRole::kExtendExclude, "generated/");
  // Replacing exclude drops the default list; keep ordering by rank
  patterns_.erase(patterns_.begin() + 1);
  auto matcher = Matcher();

  auto tests = matcher.Decide("/repo/tests/x.py", "/repo", PathKind::kFile);
  EXPECT_FALSE(tests.included);
  EXPECT_EQ(tests.rule, "exclude");
  EXPECT_EQ(tests.normalized, "/tests/x.py");

  auto generated =
      matcher.Decide("/repo/generated/y.py", "/repo", PathKind::kFile);
  EXPECT_FALSE(generated.included);
  EXPECT_EQ(generated.rule, "extend-exclude");

  auto source = matcher.Decide("/repo/src/z.py", "/repo", PathKind::kFile);
  EXPECT_TRUE(source.included);
  EXPECT_EQ(source.rule, "default");
}

TEST_F(ExclusionMatcherTest, IncludeMissExcludesFiles) {
  AddDefaults();
  auto matcher = Matcher();

  auto readme = matcher.Decide("/README.md", PathKind::kFile);
  EXPECT_FALSE(readme.included);
  EXPECT_EQ(readme.rule, "include");

  EXPECT_TRUE(matcher.Decide("/pkg/mod.pyi", PathKind::kFile).included);
}

TEST_F(ExclusionMatcherTest, IncludeDoesNotApplyToDirectories) {
  AddDefaults();
  auto matcher = Matcher();

  EXPECT_TRUE(matcher.Decide("/src/", PathKind::kDirectory).included);
  auto build = matcher.Decide("/build/", PathKind::kDirectory);
  EXPECT_FALSE(build.included);
  EXPECT_EQ(build.rule, "exclude");
}

TEST_F(ExclusionMatcherTest, ForceExcludeBeatsInclude) {
  AddDefaults();
  Add(PatternRole::kForceExclude, "vendored/");
  std::ranges::stable_sort(
      patterns_, {}, [](const PathPattern& p) { return p.rank; });
  auto matcher = Matcher();

  auto decision = matcher.Decide("/vendored/lib.py", PathKind::kFile);
  EXPECT_FALSE(decision.included);
  EXPECT_EQ(decision.rule, "force-exclude");
}

TEST_F(ExclusionMatcherTest, NoPatternsIncludesEverything) {
  auto matcher = Matcher();
  EXPECT_TRUE(matcher.Decide("/anything.txt", PathKind::kFile).included);
  EXPECT_TRUE(matcher.Decide("/build/", PathKind::kDirectory).included);
}

TEST_F(ExclusionMatcherTest, TrailingSlashDistinguishesDirectories) {
  Add(PatternRole::kExclude, "/docs/");
  auto matcher = Matcher();

  EXPECT_FALSE(matcher.Decide("/repo/docs", "/repo", PathKind::kDirectory)
                   .included);
  EXPECT_TRUE(matcher.Decide("/repo/docs", "/repo", PathKind::kFile).included);
}

TEST_F(ExclusionMatcherTest, PatternsSeeRootRelativePaths) {
  // The project itself lives under a directory named "build"
  AddDefaults();
  auto matcher = Matcher();

  auto decision =
      matcher.Decide("/home/build/proj/a.py", "/home/build/proj", PathKind::kFile);
  EXPECT_TRUE(decision.included);
  EXPECT_EQ(decision.normalized, "/a.py");
}

}  // namespace
}  // namespace sable::filter
