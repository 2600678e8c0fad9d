#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"

namespace sable::config {

inline constexpr std::string_view kVersion = "0.1.0";

inline constexpr std::string_view kNumWorkersVar = "SABLE_NUM_WORKERS";
inline constexpr std::string_view kCacheDirVar = "SABLE_CACHE_DIR";

// Worker pool size: `requested` (from --workers) if set, else
// SABLE_NUM_WORKERS, else the hardware concurrency (at least 1).
// Returns error Diagnostic if either setting is not a positive integer.
auto ResolveWorkerCount(std::optional<int64_t> requested, const EnvLookup& env)
    -> Result<size_t>;

// Per-user cache directory for this version: SABLE_CACHE_DIR if set, else
// $XDG_CACHE_HOME/sable/<version>, else $HOME/.cache/sable/<version>.
// Windows uses %LOCALAPPDATA%\sable\Cache\<version>. The directory is not
// created.
auto ResolveCacheDir(const EnvLookup& env)
    -> std::optional<std::filesystem::path>;

}  // namespace sable::config
