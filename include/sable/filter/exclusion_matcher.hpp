#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "sable/filter/path_pattern.hpp"

namespace sable::filter {

enum class PathKind : uint8_t {
  kFile,
  kDirectory,
};

struct MatchDecision {
  bool included = false;
  // Rule that decided: a pattern role name, or "default" when nothing
  // excluded the path.
  std::string_view rule;
  // The path string the patterns were matched against.
  std::string normalized;
};

// Path as seen by the patterns: relative to `root` with '/' separators and a
// leading '/', plus a trailing '/' for directories. Paths outside `root` keep
// their absolute form.
auto NormalizePath(
    const std::filesystem::path& path, const std::filesystem::path& root,
    PathKind kind) -> std::string;

// Decides inclusion of candidate paths against one project's patterns. Rules
// run in order and the first one that fires decides:
//   force-exclude matches          -> excluded
//   include misses (files only)    -> excluded
//   exclude or extend-exclude hit  -> excluded
//   otherwise                      -> included
//
// The patterns must outlive the matcher.
class ExclusionMatcher {
 public:
  explicit ExclusionMatcher(std::span<const PathPattern> patterns)
      : patterns_(patterns) {
  }

  [[nodiscard]] auto Decide(std::string normalized, PathKind kind) const
      -> MatchDecision;

  [[nodiscard]] auto Decide(
      const std::filesystem::path& path, const std::filesystem::path& root,
      PathKind kind) const -> MatchDecision {
    return Decide(NormalizePath(path, root, kind), kind);
  }

 private:
  std::span<const PathPattern> patterns_;
};

}  // namespace sable::filter
