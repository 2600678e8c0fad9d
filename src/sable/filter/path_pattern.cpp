#include "sable/filter/path_pattern.hpp"

#include <cctype>
#include <cstdint>
#include <format>
#include <regex>
#include <string>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"

namespace sable::filter {

namespace {

constexpr std::string_view kVerboseFlag = "(?x)";

}  // namespace

auto PathPattern::Search(std::string_view path) const -> bool {
  return std::regex_search(path.begin(), path.end(), regex);
}

auto PatternRoleName(PatternRole role) -> std::string_view {
  switch (role) {
    case PatternRole::kForceExclude:
      return "force-exclude";
    case PatternRole::kInclude:
      return "include";
    case PatternRole::kExclude:
      return "exclude";
    case PatternRole::kExtendExclude:
      return "extend-exclude";
  }
  return "unknown";
}

auto PatternRoleRank(PatternRole role) -> uint8_t {
  switch (role) {
    case PatternRole::kForceExclude:
      return 0;
    case PatternRole::kInclude:
      return 1;
    case PatternRole::kExclude:
    case PatternRole::kExtendExclude:
      return 2;
  }
  return 3;
}

auto StripVerbose(std::string_view source) -> std::string {
  std::string out;
  out.reserve(source.size());
  bool in_class = false;

  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '\\' && i + 1 < source.size()) {
      out += c;
      out += source[++i];
      continue;
    }
    if (in_class) {
      out += c;
      if (c == ']') {
        in_class = false;
      }
      continue;
    }
    if (c == '[') {
      in_class = true;
      out += c;
      // A ']' right after '[' or '[^' is a literal member of the class.
      if (i + 1 < source.size() && source[i + 1] == '^') {
        out += source[++i];
      }
      if (i + 1 < source.size() && source[i + 1] == ']') {
        out += source[++i];
      }
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    if (c == '#') {
      while (i + 1 < source.size() && source[i + 1] != '\n') {
        ++i;
      }
      continue;
    }
    out += c;
  }
  return out;
}

auto CompilePattern(PatternRole role, std::string_view source)
    -> Result<PathPattern> {
  std::string effective(source);
  if (source.starts_with(kVerboseFlag)) {
    effective = StripVerbose(source.substr(kVerboseFlag.size()));
  } else if (source.find('\n') != std::string_view::npos) {
    effective = StripVerbose(source);
  }

  try {
    return PathPattern{
        .role = role,
        .rank = PatternRoleRank(role),
        .source = std::string(source),
        .regex = std::regex(effective, std::regex::ECMAScript),
    };
  } catch (const std::regex_error& e) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "invalid regular expression for '{}': {}: {}",
                PatternRoleName(role), source, e.what())));
  }
}

}  // namespace sable::filter
