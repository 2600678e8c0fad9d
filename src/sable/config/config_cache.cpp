#include "sable/config/config_cache.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/config/config_merger.hpp"
#include "sable/config/project_file.hpp"
#include "sable/config/resolved_config.hpp"

namespace sable::config {

namespace fs = std::filesystem;

auto ConfigResolver::Locate(const fs::path& start_dir) const
    -> Result<LocatedConfig> {
  return LocateFrom(start_dir, explicit_config_, env_);
}

auto ConfigResolver::Load(const LocatedConfig& location) const
    -> Result<std::shared_ptr<const ResolvedConfig>> {
  auto merged = [&]() -> Result<ResolvedConfig> {
    std::vector<ConfigLayer> layers;
    layers.push_back(BuiltinLayer());
    if (location.config_path) {
      auto file_layer = LoadConfigFile(*location.config_path);
      if (!file_layer) {
        return std::unexpected(file_layer.error());
      }
      layers.push_back(std::move(*file_layer));
    }
    layers.push_back(overrides_);
    return Merge(layers);
  }();

  if (!merged) {
    if (location.user_level) {
      return std::unexpected(
          Diagnostic(merged.error())
              .WithNote(std::format(
                  "no project configuration found above `{}`; the "
                  "user-level file applies",
                  location.project_root.string())));
    }
    return std::unexpected(merged.error());
  }
  return std::make_shared<const ResolvedConfig>(std::move(*merged));
}

auto ConfigCache::Resolve(const fs::path& dir) -> Result<ProjectConfig> {
  std::scoped_lock lock(mutex_);

  if (auto it = dir_to_root_.find(dir.string()); it != dir_to_root_.end()) {
    return by_root_.at(it->second.string());
  }
  if (auto it = failed_walks_.find(dir.string()); it != failed_walks_.end()) {
    return std::unexpected(it->second);
  }

  ++walks_;
  auto located = resolver_.Locate(dir);
  if (!located) {
    failed_walks_.emplace(dir.string(), located.error());
    return std::unexpected(located.error());
  }
  const fs::path& root = located->project_root;

  // Every directory between `dir` and the root resolves the same way.
  for (fs::path visited = dir;; visited = visited.parent_path()) {
    dir_to_root_.emplace(visited.string(), root);
    if (visited == root || visited == visited.parent_path()) {
      break;
    }
  }

  if (auto it = by_root_.find(root.string()); it != by_root_.end()) {
    return it->second;
  }

  ++loads_;
  auto loaded = resolver_.Load(*located);
  if (!loaded) {
    auto [it, inserted] =
        by_root_.emplace(root.string(), std::unexpected(loaded.error()));
    return it->second;
  }
  auto [it, inserted] = by_root_.emplace(
      root.string(),
      ProjectConfig{.location = *located, .config = std::move(*loaded)});
  return it->second;
}

auto ConfigCache::WalkCount() const -> size_t {
  std::scoped_lock lock(mutex_);
  return walks_;
}

auto ConfigCache::LoadCount() const -> size_t {
  std::scoped_lock lock(mutex_);
  return loads_;
}

}  // namespace sable::config
