#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"

namespace sable::filter {

enum class PatternRole : uint8_t {
  kForceExclude,
  kInclude,
  kExclude,
  kExtendExclude,
};

// A compiled path regex tagged with its role. Patterns are matched with
// search semantics: a match anywhere in the normalized path counts.
struct PathPattern {
  PatternRole role;
  // Evaluation order; patterns sharing a rank are OR-ed.
  uint8_t rank = 0;
  std::string source;
  std::regex regex;

  [[nodiscard]] auto Search(std::string_view path) const -> bool;
};

// Option name of the role, e.g. "force-exclude".
auto PatternRoleName(PatternRole role) -> std::string_view;

auto PatternRoleRank(PatternRole role) -> uint8_t;

// Compile `source` for `role`. A pattern that contains a newline or starts
// with "(?x)" is compiled in verbose mode (see StripVerbose).
auto CompilePattern(PatternRole role, std::string_view source)
    -> Result<PathPattern>;

// Drop unescaped whitespace and '#' comments outside character classes.
auto StripVerbose(std::string_view source) -> std::string;

}  // namespace sable::filter
