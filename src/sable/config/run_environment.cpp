#include "sable/config/run_environment.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/environment.hpp"

namespace sable::config {

namespace fs = std::filesystem;

auto ResolveWorkerCount(std::optional<int64_t> requested, const EnvLookup& env)
    -> Result<size_t> {
  if (requested) {
    if (*requested < 1) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "--workers must be a positive integer, got {}",
                  *requested)));
    }
    return static_cast<size_t>(*requested);
  }

  if (auto text = env(kNumWorkersVar)) {
    int64_t value = 0;
    const char* end = text->data() + text->size();
    auto result = std::from_chars(text->data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end || value < 1) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{} must be a positive integer, got '{}'", kNumWorkersVar,
                  *text)));
    }
    return static_cast<size_t>(value);
  }

  return std::max<size_t>(1, std::thread::hardware_concurrency());
}

auto ResolveCacheDir(const EnvLookup& env) -> std::optional<fs::path> {
  if (auto dir = env(kCacheDirVar)) {
    return fs::path(*dir);
  }
#if defined(_WIN32)
  if (auto local = env("LOCALAPPDATA")) {
    return fs::path(*local) / "sable" / "Cache" / std::string(kVersion);
  }
#else
  if (auto xdg = env("XDG_CACHE_HOME")) {
    return fs::path(*xdg) / "sable" / std::string(kVersion);
  }
  if (auto home = env("HOME")) {
    return fs::path(*home) / ".cache" / "sable" / std::string(kVersion);
  }
#endif
  return std::nullopt;
}

}  // namespace sable::config
