#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sable/config/option.hpp"
#include "sable/config/target_version.hpp"
#include "sable/filter/path_pattern.hpp"

namespace sable::config {

using EntryMap = std::map<std::string, ConfigEntry, std::less<>>;

// Effective configuration of one project. Immutable after construction;
// shared read-only between workers.
class ResolvedConfig {
 public:
  ResolvedConfig(
      EntryMap entries, std::vector<TargetVersion> target_versions,
      std::vector<filter::PathPattern> patterns,
      std::optional<std::filesystem::path> config_path)
      : entries_(std::move(entries)),
        target_versions_(std::move(target_versions)),
        patterns_(std::move(patterns)),
        config_path_(std::move(config_path)) {
  }

  // Returns nullptr for unknown option names.
  [[nodiscard]] auto Get(std::string_view name) const -> const ConfigEntry*;

  [[nodiscard]] auto Entries() const -> const EntryMap& {
    return entries_;
  }

  [[nodiscard]] auto LineLength() const -> int64_t;
  [[nodiscard]] auto SkipStringNormalization() const -> bool;
  [[nodiscard]] auto SkipMagicTrailingComma() const -> bool;

  // Empty means "auto-detect per file".
  [[nodiscard]] auto TargetVersions() const -> std::span<const TargetVersion> {
    return target_versions_;
  }

  // Compiled include/exclude patterns, sorted by rank.
  [[nodiscard]] auto Patterns() const -> std::span<const filter::PathPattern> {
    return patterns_;
  }

  // File the settings were loaded from; nullopt when only defaults and
  // overrides apply.
  [[nodiscard]] auto ConfigPath() const
      -> const std::optional<std::filesystem::path>& {
    return config_path_;
  }

 private:
  EntryMap entries_;
  std::vector<TargetVersion> target_versions_;
  std::vector<filter::PathPattern> patterns_;
  std::optional<std::filesystem::path> config_path_;
};

}  // namespace sable::config
