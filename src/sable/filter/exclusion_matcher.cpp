#include "sable/filter/exclusion_matcher.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "sable/filter/path_pattern.hpp"

namespace sable::filter {

namespace fs = std::filesystem;

namespace {

enum class RuleEffect : uint8_t {
  kExcludeOnMatch,
  kExcludeOnMiss,
};

struct Rule {
  std::string_view name;
  uint8_t rank;
  RuleEffect effect;
  bool files_only;
};

constexpr std::array kRules = {
    Rule{
        .name = "force-exclude",
        .rank = 0,
        .effect = RuleEffect::kExcludeOnMatch,
        .files_only = false,
    },
    Rule{
        .name = "include",
        .rank = 1,
        .effect = RuleEffect::kExcludeOnMiss,
        .files_only = true,
    },
    Rule{
        .name = "exclude",
        .rank = 2,
        .effect = RuleEffect::kExcludeOnMatch,
        .files_only = false,
    },
};

constexpr std::string_view kDefaultRule = "default";

}  // namespace

auto NormalizePath(const fs::path& path, const fs::path& root, PathKind kind)
    -> std::string {
  fs::path relative = path.lexically_normal().lexically_relative(
      root.lexically_normal());

  std::string normalized;
  auto first = relative.begin();
  if (relative.empty() || (first != relative.end() && *first == "..")) {
    normalized = path.lexically_normal().generic_string();
    if (normalized.empty() || normalized.front() != '/') {
      normalized.insert(normalized.begin(), '/');
    }
  } else if (relative == ".") {
    normalized = "/";
  } else {
    normalized = "/" + relative.generic_string();
  }

  if (kind == PathKind::kDirectory && normalized.back() != '/') {
    normalized += '/';
  }
  return normalized;
}

auto ExclusionMatcher::Decide(std::string normalized, PathKind kind) const
    -> MatchDecision {
  for (const auto& rule : kRules) {
    if (rule.files_only && kind != PathKind::kFile) {
      continue;
    }

    const PathPattern* hit = nullptr;
    bool any_pattern = false;
    for (const auto& pattern : patterns_) {
      if (pattern.rank != rule.rank) {
        continue;
      }
      any_pattern = true;
      if (pattern.Search(normalized)) {
        hit = &pattern;
        break;
      }
    }

    switch (rule.effect) {
      case RuleEffect::kExcludeOnMatch:
        if (hit != nullptr) {
          return MatchDecision{
              .included = false,
              .rule = PatternRoleName(hit->role),
              .normalized = std::move(normalized),
          };
        }
        break;
      case RuleEffect::kExcludeOnMiss:
        if (any_pattern && hit == nullptr) {
          return MatchDecision{
              .included = false,
              .rule = rule.name,
              .normalized = std::move(normalized),
          };
        }
        break;
    }
  }

  return MatchDecision{
      .included = true,
      .rule = kDefaultRule,
      .normalized = std::move(normalized),
  };
}

}  // namespace sable::filter
