#include "sable/config/config_locator.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"
#include "sable/config/project_file.hpp"

namespace sable::config {

namespace fs = std::filesystem;

namespace {

enum class Probe : uint8_t {
  kMissing,
  kFile,
  kDirectory,
  kOther,
  kError,
};

// Classify a path without following errors into exceptions. Permission
// problems and symlink loops report kError.
auto ProbePath(const fs::path& path) -> Probe {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    return Probe::kMissing;
  }
  if (ec) {
    return Probe::kError;
  }
  if (fs::is_regular_file(status)) {
    return Probe::kFile;
  }
  if (fs::is_directory(status)) {
    return Probe::kDirectory;
  }
  return Probe::kOther;
}

auto IsReadableFile(const fs::path& path) -> bool {
  std::ifstream in(path);
  return static_cast<bool>(in);
}

auto IsReadableDirectory(const fs::path& dir) -> bool {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  return !ec;
}

}  // namespace

auto RootReasonDescription(RootReason reason) -> std::string_view {
  switch (reason) {
    case RootReason::kExplicitConfig:
      return "an explicitly given configuration file";
    case RootReason::kProjectFile:
      return "pyproject.toml";
    case RootReason::kGitDirectory:
      return "a .git directory";
    case RootReason::kHgDirectory:
      return "a .hg directory";
    case RootReason::kFilesystemRoot:
      return "file system root";
    case RootReason::kUnreadableDirectory:
      return "an unreadable directory";
  }
  return "unknown";
}

auto CommonBase(std::span<const fs::path> paths) -> Result<fs::path> {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::PathError(
            ".", std::format("cannot determine current directory: {}",
                             ec.message())));
  }
  if (paths.empty()) {
    return cwd.lexically_normal();
  }

  std::optional<fs::path> common;
  for (const auto& path : paths) {
    fs::path resolved = fs::weakly_canonical(cwd / path, ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::PathError(
              path.string(),
              std::format("cannot resolve path: {}", ec.message())));
    }
    fs::path base = ProbePath(resolved) == Probe::kDirectory
                        ? resolved
                        : resolved.parent_path();
    if (!common) {
      common = base;
      continue;
    }

    fs::path prefix;
    auto a = common->begin();
    auto b = base.begin();
    for (; a != common->end() && b != base.end() && *a == *b; ++a, ++b) {
      prefix /= *a;
    }
    common = prefix;
  }
  return *common;
}

auto FindProjectRoot(const fs::path& start) -> Result<ProjectRoot> {
  fs::path dir = start;

  while (true) {
    if (ProbePath(dir) != Probe::kDirectory || !IsReadableDirectory(dir)) {
      return ProjectRoot{
          .directory = dir,
          .reason = RootReason::kUnreadableDirectory,
          .project_file = std::nullopt,
      };
    }

    fs::path project_file = dir / kProjectFileName;
    switch (ProbePath(project_file)) {
      case Probe::kFile: {
        if (!IsReadableFile(project_file)) {
          return ProjectRoot{
              .directory = dir,
              .reason = RootReason::kUnreadableDirectory,
              .project_file = std::nullopt,
          };
        }
        auto has_table = HasToolTable(project_file);
        if (!has_table) {
          return std::unexpected(has_table.error());
        }
        if (*has_table) {
          return ProjectRoot{
              .directory = dir,
              .reason = RootReason::kProjectFile,
              .project_file = project_file,
          };
        }
        break;
      }
      case Probe::kError:
        return ProjectRoot{
            .directory = dir,
            .reason = RootReason::kUnreadableDirectory,
            .project_file = std::nullopt,
        };
      case Probe::kMissing:
      case Probe::kDirectory:
      case Probe::kOther:
        break;
    }

    Probe git = ProbePath(dir / ".git");
    if (git == Probe::kFile || git == Probe::kDirectory ||
        git == Probe::kOther) {
      return ProjectRoot{
          .directory = dir,
          .reason = RootReason::kGitDirectory,
          .project_file = std::nullopt,
      };
    }
    if (ProbePath(dir / ".hg") == Probe::kDirectory) {
      return ProjectRoot{
          .directory = dir,
          .reason = RootReason::kHgDirectory,
          .project_file = std::nullopt,
      };
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return ProjectRoot{
          .directory = dir,
          .reason = RootReason::kFilesystemRoot,
          .project_file = std::nullopt,
      };
    }
    dir = parent;
  }
}

auto UserConfigPath(const EnvLookup& env) -> std::optional<fs::path> {
#if defined(_WIN32)
  if (auto profile = env("USERPROFILE")) {
    return fs::path(*profile) / ".sable";
  }
  return std::nullopt;
#else
  if (auto xdg = env("XDG_CONFIG_HOME")) {
    return fs::path(*xdg) / "sable";
  }
  if (auto home = env("HOME")) {
    return fs::path(*home) / ".config" / "sable";
  }
  return std::nullopt;
#endif
}

auto LocateFrom(
    const fs::path& start_dir, const std::optional<fs::path>& explicit_config,
    const EnvLookup& env) -> Result<LocatedConfig> {
  if (explicit_config) {
    fs::path config_path = fs::absolute(*explicit_config).lexically_normal();
    if (ProbePath(config_path) != Probe::kFile ||
        !IsReadableFile(config_path)) {
      return std::unexpected(
          Diagnostic::ConfigError(
              SourceLocation{.path = explicit_config->string()},
              "cannot read configuration file"));
    }
    return LocatedConfig{
        .project_root = config_path.parent_path(),
        .reason = RootReason::kExplicitConfig,
        .config_path = config_path,
        .user_level = false,
    };
  }

  auto root = FindProjectRoot(start_dir);
  if (!root) {
    return std::unexpected(root.error());
  }
  if (root->project_file) {
    return LocatedConfig{
        .project_root = root->directory,
        .reason = root->reason,
        .config_path = root->project_file,
        .user_level = false,
    };
  }

  // No project file: fall back to the user-level configuration
  if (auto user = UserConfigPath(env)) {
    if (ProbePath(*user) == Probe::kFile) {
      return LocatedConfig{
          .project_root = root->directory,
          .reason = root->reason,
          .config_path = *user,
          .user_level = true,
      };
    }
  }
  return LocatedConfig{
      .project_root = root->directory,
      .reason = root->reason,
      .config_path = std::nullopt,
      .user_level = false,
  };
}

auto Locate(
    std::span<const fs::path> paths,
    const std::optional<fs::path>& explicit_config, const EnvLookup& env)
    -> Result<LocatedConfig> {
  if (explicit_config) {
    return LocateFrom({}, explicit_config, env);
  }
  auto base = CommonBase(paths);
  if (!base) {
    return std::unexpected(base.error());
  }
  return LocateFrom(*base, explicit_config, env);
}

}  // namespace sable::config
