#include <gtest/gtest.h>

#include <string_view>

#include "sable/directive/line_lexer.hpp"

namespace sable::directive {
namespace {

class LineLexerTest : public ::testing::Test {
 protected:
  LineLexer lexer_;
};

TEST_F(LineLexerTest, TrailingComment) {
  LineInfo info = lexer_.Feed("x = 1  # note");
  ASSERT_TRUE(info.comment.has_value());
  EXPECT_EQ(*info.comment, "# note");
  EXPECT_FALSE(info.standalone_comment);
  EXPECT_FALSE(info.continues_statement);
  EXPECT_TRUE(info.ends_statement);
}

TEST_F(LineLexerTest, StandaloneComment) {
  LineInfo info = lexer_.Feed("    # fmt: off");
  ASSERT_TRUE(info.comment.has_value());
  EXPECT_EQ(*info.comment, "# fmt: off");
  EXPECT_TRUE(info.standalone_comment);
}

TEST_F(LineLexerTest, HashInsideStringIsNotComment) {
  LineInfo info = lexer_.Feed(R"(s = "a # b" + 'c # d')");
  EXPECT_FALSE(info.comment.has_value());
  EXPECT_FALSE(lexer_.InString());

  info = lexer_.Feed(R"(s = "say \"#\"" # real)");
  ASSERT_TRUE(info.comment.has_value());
  EXPECT_EQ(*info.comment, "# real");
}

TEST_F(LineLexerTest, TripleQuotedStringSpansLines) {
  LineInfo open = lexer_.Feed(R"(doc = """start)");
  EXPECT_TRUE(lexer_.InString());
  EXPECT_FALSE(open.ends_statement);

  LineInfo inside = lexer_.Feed("# fmt: off");
  EXPECT_FALSE(inside.comment.has_value());
  EXPECT_FALSE(inside.standalone_comment);
  EXPECT_TRUE(inside.continues_statement);

  LineInfo close = lexer_.Feed(R"(end""")");
  EXPECT_FALSE(lexer_.InString());
  EXPECT_TRUE(close.continues_statement);
  EXPECT_TRUE(close.ends_statement);
}

TEST_F(LineLexerTest, TripleQuotedOnOneLine) {
  LineInfo info = lexer_.Feed(R"(x = '''a ' b'''  # c)");
  EXPECT_FALSE(lexer_.InString());
  ASSERT_TRUE(info.comment.has_value());
  EXPECT_EQ(*info.comment, "# c");
}

TEST_F(LineLexerTest, BracketsContinueStatement) {
  LineInfo open = lexer_.Feed("call(");
  EXPECT_FALSE(open.ends_statement);

  LineInfo arg = lexer_.Feed("    [1, 2],  # inner");
  EXPECT_TRUE(arg.continues_statement);
  EXPECT_FALSE(arg.ends_statement);

  LineInfo comment = lexer_.Feed("    # standalone inside brackets");
  EXPECT_TRUE(comment.standalone_comment);
  EXPECT_TRUE(comment.continues_statement);

  LineInfo close = lexer_.Feed(")");
  EXPECT_TRUE(close.ends_statement);
}

TEST_F(LineLexerTest, UnbalancedCloserClampsAtZero) {
  LineInfo stray = lexer_.Feed(")]");
  EXPECT_TRUE(stray.ends_statement);

  // A later opener still has to be closed once
  lexer_.Feed("f(");
  EXPECT_TRUE(lexer_.Feed(")").ends_statement);
}

TEST_F(LineLexerTest, BackslashContinuation) {
  LineInfo first = lexer_.Feed("x = 1 + \\");
  EXPECT_FALSE(first.ends_statement);

  LineInfo second = lexer_.Feed("    2");
  EXPECT_TRUE(second.continues_statement);
  EXPECT_TRUE(second.ends_statement);
}

TEST_F(LineLexerTest, EscapedNewlineKeepsStringOpen) {
  lexer_.Feed("s = 'abc\\");
  EXPECT_TRUE(lexer_.InString());

  LineInfo next = lexer_.Feed("def' # c");
  EXPECT_FALSE(lexer_.InString());
  EXPECT_TRUE(next.continues_statement);
  ASSERT_TRUE(next.comment.has_value());
}

TEST_F(LineLexerTest, UnterminatedSingleQuoteClosesAtEndOfLine) {
  LineInfo info = lexer_.Feed("s = 'oops");
  EXPECT_FALSE(lexer_.InString());
  EXPECT_TRUE(info.ends_statement);

  LineInfo next = lexer_.Feed("# comment");
  EXPECT_TRUE(next.standalone_comment);
  EXPECT_FALSE(next.continues_statement);
}

TEST_F(LineLexerTest, EscapedBackslashBeforeQuote) {
  LineInfo info = lexer_.Feed(R"(s = 'a\\'  # c)");
  EXPECT_FALSE(lexer_.InString());
  ASSERT_TRUE(info.comment.has_value());
  EXPECT_EQ(*info.comment, "# c");
}

}  // namespace
}  // namespace sable::directive
