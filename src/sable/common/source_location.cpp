#include "sable/common/source_location.hpp"

#include <format>
#include <string>

namespace sable {

auto FormatSourceLocation(const SourceLocation& loc) -> std::string {
  if (loc.line == 0) {
    return loc.path;
  }
  return std::format("{}:{}", loc.path, loc.line);
}

}  // namespace sable
