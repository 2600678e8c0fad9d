#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"

namespace sable::config {

// Why the upward walk stopped where it did.
enum class RootReason : uint8_t {
  kExplicitConfig,
  kProjectFile,
  kGitDirectory,
  kHgDirectory,
  kFilesystemRoot,
  kUnreadableDirectory,
};

// e.g. "a .git directory", "pyproject.toml"
auto RootReasonDescription(RootReason reason) -> std::string_view;

struct ProjectRoot {
  std::filesystem::path directory;
  RootReason reason;
  // Set iff reason == kProjectFile
  std::optional<std::filesystem::path> project_file;
};

struct LocatedConfig {
  std::filesystem::path project_root;
  RootReason reason;
  // Explicit, project-level or user-level configuration file, if any
  std::optional<std::filesystem::path> config_path;
  bool user_level = false;
};

// Deepest directory containing every path (a directory counts as its own
// ancestor). Relative paths are resolved against the current directory; an
// empty set yields the current directory.
// Returns error Diagnostic if a path cannot be canonicalized (e.g. a symlink
// loop).
auto CommonBase(std::span<const std::filesystem::path> paths)
    -> Result<std::filesystem::path>;

// Walk upward from `start` (an absolute directory) looking for a
// pyproject.toml with a [tool.sable] table. The walk stops early at a
// version-control marker (.git, .hg) or an unreadable directory, and ends at
// the filesystem root.
// Returns error Diagnostic if a pyproject.toml on the way cannot be parsed.
auto FindProjectRoot(const std::filesystem::path& start) -> Result<ProjectRoot>;

// The user-level configuration file location. Consults USERPROFILE on
// Windows, otherwise XDG_CONFIG_HOME then HOME. The file may not exist.
auto UserConfigPath(const EnvLookup& env)
    -> std::optional<std::filesystem::path>;

// Locate the configuration that applies to a directory. An explicit config
// path skips the walk entirely and must be readable. Without a project file,
// the user-level file is used when it exists; otherwise defaults apply.
auto LocateFrom(
    const std::filesystem::path& start_dir,
    const std::optional<std::filesystem::path>& explicit_config,
    const EnvLookup& env) -> Result<LocatedConfig>;

// LocateFrom(CommonBase(paths), ...)
auto Locate(
    std::span<const std::filesystem::path> paths,
    const std::optional<std::filesystem::path>& explicit_config,
    const EnvLookup& env) -> Result<LocatedConfig>;

}  // namespace sable::config
