#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sable::directive {

// What the lexer learned about one physical line.
struct LineInfo {
  // Trailing comment including the leading '#', outside any string.
  std::optional<std::string_view> comment;
  // The line is only whitespace and a comment, and did not start inside a
  // string literal.
  bool standalone_comment = false;
  // The line started inside a bracket, string or backslash continuation.
  bool continues_statement = false;
  // A logical statement ends on this line.
  bool ends_statement = false;
};

// Minimal Python line lexer: tracks bracket depth, single and triple quoted
// strings and backslash continuations across lines, so that comments are only
// recognized outside strings. Lines are fed in order without their newline.
class LineLexer {
 public:
  auto Feed(std::string_view line) -> LineInfo;

  [[nodiscard]] auto InString() const -> bool {
    return quote_ != '\0';
  }

 private:
  uint32_t depth_ = 0;
  char quote_ = '\0';
  bool triple_ = false;
  bool continuation_ = false;
};

}  // namespace sable::directive
