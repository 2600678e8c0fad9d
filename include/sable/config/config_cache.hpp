#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"
#include "sable/config/config_locator.hpp"
#include "sable/config/config_merger.hpp"
#include "sable/config/resolved_config.hpp"

namespace sable::config {

// Configuration shared by every file under one project root.
struct ProjectConfig {
  LocatedConfig location;
  std::shared_ptr<const ResolvedConfig> config;
};

// Locates and merges configuration for one run: the explicit config path
// and override layer are fixed for the run.
class ConfigResolver {
 public:
  ConfigResolver(
      std::optional<std::filesystem::path> explicit_config,
      ConfigLayer overrides, EnvLookup env)
      : explicit_config_(std::move(explicit_config)),
        overrides_(std::move(overrides)),
        env_(std::move(env)) {
  }

  [[nodiscard]] auto Locate(const std::filesystem::path& start_dir) const
      -> Result<LocatedConfig>;

  // Merge built-in defaults, the located file (if any) and the overrides.
  [[nodiscard]] auto Load(const LocatedConfig& location) const
      -> Result<std::shared_ptr<const ResolvedConfig>>;

 private:
  std::optional<std::filesystem::path> explicit_config_;
  ConfigLayer overrides_;
  EnvLookup env_;
};

// Per-root configuration cache for one run. Thread-safe.
//
// Every directory seen on a walk is mapped to the root the walk stopped at,
// and every root to one ProjectConfig, so the filesystem is walked and the
// project file parsed at most once per root. A miss holds the cache lock
// while walking and parsing; a concurrent miss for the same root blocks on
// the lock and then finds the published entry. Failed walks and failed loads
// are published too.
class ConfigCache {
 public:
  explicit ConfigCache(const ConfigResolver& resolver) : resolver_(resolver) {
  }

  ConfigCache(const ConfigCache&) = delete;
  ConfigCache& operator=(const ConfigCache&) = delete;
  ConfigCache(ConfigCache&&) = delete;
  ConfigCache& operator=(ConfigCache&&) = delete;

  // Configuration for files in `dir` (absolute, canonical).
  auto Resolve(const std::filesystem::path& dir) -> Result<ProjectConfig>;

  // Number of upward walks / config loads performed so far.
  [[nodiscard]] auto WalkCount() const -> size_t;
  [[nodiscard]] auto LoadCount() const -> size_t;

 private:
  const ConfigResolver& resolver_;

  // Keyed by path string
  mutable std::mutex mutex_;
  absl::flat_hash_map<std::string, std::filesystem::path> dir_to_root_;
  absl::flat_hash_map<std::string, Result<ProjectConfig>> by_root_;
  // Start directories whose walk failed
  absl::flat_hash_map<std::string, Diagnostic> failed_walks_;
  size_t walks_ = 0;
  size_t loads_ = 0;
};

}  // namespace sable::config
