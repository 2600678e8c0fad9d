#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"
#include "sable/config/config_cache.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/config/config_merger.hpp"
#include "tests/unit/scratch_dir.hpp"

namespace sable::config {
namespace {

auto EmptyEnvironment() -> EnvLookup {
  return [](std::string_view) -> std::optional<std::string> {
    return std::nullopt;
  };
}

class ConfigCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    scratch_.MakeDir(".git");
  }

  test::ScratchDir scratch_;
  ConfigResolver resolver_{std::nullopt, OverrideLayer(), EmptyEnvironment()};
};

TEST_F(ConfigCacheTest, FilesUnderOneRootShareConfig) {
  scratch_.Write("repo/pyproject.toml", "[tool.sable]\nline-length = 100\n");
  auto repo = scratch_.Root() / "repo";
  auto sub = scratch_.MakeDir("repo/sub");

  ConfigCache cache(resolver_);
  auto top = cache.Resolve(repo);
  auto nested = cache.Resolve(sub);
  ASSERT_TRUE(top.has_value()) << top.error().primary.message;
  ASSERT_TRUE(nested.has_value());

  EXPECT_EQ(top->config.get(), nested->config.get());
  EXPECT_EQ(top->config->LineLength(), 100);
  EXPECT_EQ(nested->location.project_root, repo);
  EXPECT_EQ(cache.LoadCount(), 1U);
}

TEST_F(ConfigCacheTest, VisitedDirectoriesAreNotWalkedAgain) {
  scratch_.Write("repo/pyproject.toml", "[tool.sable]\n");
  auto deep = scratch_.MakeDir("repo/a/b/c");

  ConfigCache cache(resolver_);
  ASSERT_TRUE(cache.Resolve(deep).has_value());
  ASSERT_TRUE(cache.Resolve(scratch_.Root() / "repo" / "a").has_value());
  ASSERT_TRUE(cache.Resolve(scratch_.Root() / "repo" / "a" / "b").has_value());
  EXPECT_EQ(cache.WalkCount(), 1U);

  // A sibling walks once more but reuses the loaded root
  ASSERT_TRUE(cache.Resolve(scratch_.MakeDir("repo/d")).has_value());
  EXPECT_EQ(cache.WalkCount(), 2U);
  EXPECT_EQ(cache.LoadCount(), 1U);
}

TEST_F(ConfigCacheTest, CommonBaseOfNestedInputsUsesOuterProject) {
  scratch_.Write("outer/pyproject.toml", "[tool.sable]\nline-length = 100\n");
  scratch_.Write(
      "outer/inner/pyproject.toml", "[tool.sable]\nline-length = 60\n");
  std::vector<std::filesystem::path> inputs = {
      scratch_.Write("outer/src/a.py", "a = 1\n"),
      scratch_.Write("outer/inner/src/b.py", "b = 1\n"),
  };

  auto base = CommonBase(inputs);
  ASSERT_TRUE(base.has_value());
  EXPECT_EQ(*base, scratch_.Root() / "outer");

  ConfigCache cache(resolver_);
  auto project = cache.Resolve(*base);
  ASSERT_TRUE(project.has_value());
  EXPECT_EQ(project->config->LineLength(), 100);
  EXPECT_EQ(project->location.project_root, scratch_.Root() / "outer");
}

TEST_F(ConfigCacheTest, OverridesApplyToEveryRoot) {
  scratch_.Write("a/pyproject.toml", "[tool.sable]\nline-length = 100\n");
  scratch_.Write("b/pyproject.toml", "[tool.sable]\nline-length = 60\n");
  ConfigLayer overrides = OverrideLayer();
  overrides.Set("line-length", int64_t{120});
  ConfigResolver resolver(std::nullopt, overrides, EmptyEnvironment());

  ConfigCache cache(resolver);
  auto a = cache.Resolve(scratch_.Root() / "a");
  auto b = cache.Resolve(scratch_.Root() / "b");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->config->LineLength(), 120);
  EXPECT_EQ(b->config->LineLength(), 120);
}

TEST_F(ConfigCacheTest, FailedLoadIsCached) {
  scratch_.Write("repo/pyproject.toml", "[tool.sable]\nline-length = 0\n");
  auto repo = scratch_.Root() / "repo";

  ConfigCache cache(resolver_);
  auto first = cache.Resolve(repo);
  auto second = cache.Resolve(scratch_.MakeDir("repo/pkg"));
  ASSERT_FALSE(first.has_value());
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(first.error(), second.error());
  EXPECT_EQ(first.error().primary.kind, DiagKind::kConfigError);
  EXPECT_EQ(cache.LoadCount(), 1U);
}

TEST_F(ConfigCacheTest, FailedWalkIsCached) {
  scratch_.Write("repo/pyproject.toml", "[tool.sable\n");
  auto pkg = scratch_.MakeDir("repo/pkg");

  ConfigCache cache(resolver_);
  auto first = cache.Resolve(pkg);
  auto second = cache.Resolve(pkg);
  ASSERT_FALSE(first.has_value());
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(first.error(), second.error());
  EXPECT_EQ(first.error().primary.kind, DiagKind::kConfigError);
  EXPECT_EQ(cache.WalkCount(), 1U);
  EXPECT_EQ(cache.LoadCount(), 0U);
}

TEST_F(ConfigCacheTest, BrokenUserConfigIsNoted) {
  scratch_.Write("cfg/sable", "[tool.sable]\nline-length = \"wide\"\n");
  auto config_home = (scratch_.Root() / "cfg").string();
  ConfigResolver resolver(
      std::nullopt, OverrideLayer(),
      [config_home](std::string_view name) -> std::optional<std::string> {
        if (name == "XDG_CONFIG_HOME") {
          return config_home;
        }
        return std::nullopt;
      });

  ConfigCache cache(resolver);
  auto project = cache.Resolve(scratch_.MakeDir("proj"));
  ASSERT_FALSE(project.has_value());
  EXPECT_EQ(project.error().primary.kind, DiagKind::kConfigError);
  ASSERT_EQ(project.error().notes.size(), 1U);
  EXPECT_EQ(project.error().notes[0].kind, DiagKind::kNote);
  EXPECT_NE(
      project.error().notes[0].message.find("user-level file applies"),
      std::string::npos);
}

TEST_F(ConfigCacheTest, ConcurrentResolveLoadsOnce) {
  scratch_.Write("repo/pyproject.toml", "[tool.sable]\n");
  std::vector<std::filesystem::path> dirs;
  for (int i = 0; i < 8; ++i) {
    dirs.push_back(scratch_.MakeDir("repo/pkg" + std::to_string(i)));
  }

  ConfigCache cache(resolver_);
  std::vector<const ResolvedConfig*> seen(dirs.size(), nullptr);
  {
    std::vector<std::jthread> threads;
    for (size_t i = 0; i < dirs.size(); ++i) {
      threads.emplace_back([&, i] {
        auto resolved = cache.Resolve(dirs[i]);
        if (resolved) {
          seen[i] = resolved->config.get();
        }
      });
    }
  }

  EXPECT_EQ(cache.LoadCount(), 1U);
  for (const ResolvedConfig* config : seen) {
    EXPECT_NE(config, nullptr);
    EXPECT_EQ(config, seen.front());
  }
}

}  // namespace
}  // namespace sable::config
