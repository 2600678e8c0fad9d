#pragma once

#include <cstdint>
#include <string>

namespace sable {

// A position in an input file. Lines are 1-indexed; line 0 means "whole
// file" (e.g. an unreadable path or a config file without line info).
struct SourceLocation {
  std::string path;
  uint32_t line = 0;

  auto operator==(const SourceLocation&) const -> bool = default;
};

// Format a SourceLocation as "path:line", or just "path" when line is 0.
auto FormatSourceLocation(const SourceLocation& loc) -> std::string;

}  // namespace sable
