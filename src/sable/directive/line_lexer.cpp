#include "sable/directive/line_lexer.hpp"

#include <cstddef>
#include <string_view>

namespace sable::directive {

namespace {

auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\f';
}

// line[i] is a quote character; true if it opens or closes a triple quote.
auto IsTripleQuote(std::string_view line, size_t i) -> bool {
  return i + 2 < line.size() && line[i + 1] == line[i] &&
         line[i + 2] == line[i];
}

}  // namespace

auto LineLexer::Feed(std::string_view line) -> LineInfo {
  LineInfo info;
  bool started_in_string = InString();
  info.continues_statement = started_in_string || depth_ > 0 || continuation_;
  continuation_ = false;

  bool only_blank = true;
  bool escaped_newline = false;
  size_t i = 0;
  while (i < line.size()) {
    char c = line[i];

    if (InString()) {
      if (c == '\\') {
        if (i + 1 == line.size()) {
          // Escaped newline keeps a single-quoted string open
          escaped_newline = true;
          break;
        }
        i += 2;
        continue;
      }
      if (c == quote_) {
        if (!triple_) {
          quote_ = '\0';
        } else if (IsTripleQuote(line, i)) {
          quote_ = '\0';
          triple_ = false;
          i += 3;
          continue;
        }
      }
      ++i;
      continue;
    }

    if (c == '#') {
      info.comment = line.substr(i);
      info.standalone_comment = only_blank && !started_in_string;
      break;
    }
    if (!IsBlank(c)) {
      only_blank = false;
    }

    switch (c) {
      case '\'':
      case '"':
        quote_ = c;
        if (IsTripleQuote(line, i)) {
          triple_ = true;
          i += 3;
          continue;
        }
        break;
      case '(':
      case '[':
      case '{':
        ++depth_;
        break;
      case ')':
      case ']':
      case '}':
        if (depth_ > 0) {
          --depth_;
        }
        break;
      case '\\':
        if (i + 1 == line.size()) {
          continuation_ = true;
        }
        break;
      default:
        break;
    }
    ++i;
  }

  // A single-quoted string cannot span lines without a backslash
  if (InString() && !triple_ && !escaped_newline) {
    quote_ = '\0';
  }

  info.ends_statement = depth_ == 0 && !InString() && !continuation_;
  return info;
}

}  // namespace sable::directive
