#include <gtest/gtest.h>

#include <string>

#include "sql_assist/basic/source_manager.hpp"
#include "sql_assist/basic/utf8.hpp"

using sql_assist::SourceFile;
using sql_assist::SourceRange;

TEST(BasicSourceFile, LineColumnIsOneBased)
{
  const SourceFile src("SELECT a\nFROM t\n");

  EXPECT_EQ(src.get_line_count(), 3U);

  auto lc = src.get_line_column(0);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = src.get_line_column(9);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 1U);

  // Past the end clamps to the end.
  lc = src.get_line_column(1000);
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 1U);
}

TEST(BasicSourceFile, GetLineStripsLineEndings)
{
  const SourceFile src("a\r\nbc\nd");

  EXPECT_EQ(src.get_line(0), "a");
  EXPECT_EQ(src.get_line(1), "bc");
  EXPECT_EQ(src.get_line(2), "d");
  EXPECT_EQ(src.get_line(3), "");
}

TEST(BasicSourceFile, FullRange)
{
  const SourceFile src("SELECT a\nFROM t");

  const auto fr = src.get_full_range(SourceRange(9, 13));
  EXPECT_EQ(fr.start_byte, 9U);
  EXPECT_EQ(fr.end_byte, 13U);
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 1U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 5U);

  EXPECT_FALSE(src.get_full_range(SourceRange{}).is_valid());
}

TEST(BasicSourceFile, SliceClampsToText)
{
  EXPECT_EQ(sql_assist::slice("abcdef", SourceRange(2, 4)), "cd");
  EXPECT_EQ(sql_assist::slice("abcdef", SourceRange(4, 100)), "ef");
  EXPECT_EQ(sql_assist::slice("abcdef", SourceRange(10, 12)), "");
  EXPECT_EQ(sql_assist::slice("abcdef", SourceRange{}), "");
}

TEST(BasicUtf8, DecodesMultiByteSequences)
{
  const std::string s = "a\xC3\xA9\xE6\x97\xA5";  // a, e-acute, CJK

  auto c = sql_assist::utf8::decode(s, 0);
  EXPECT_TRUE(c.valid);
  EXPECT_EQ(c.length, 1U);

  c = sql_assist::utf8::decode(s, 1);
  EXPECT_TRUE(c.valid);
  EXPECT_EQ(c.code_point, U'é');
  EXPECT_EQ(c.length, 2U);

  c = sql_assist::utf8::decode(s, 3);
  EXPECT_TRUE(c.valid);
  EXPECT_EQ(c.code_point, U'日');
  EXPECT_EQ(c.length, 3U);

  EXPECT_EQ(sql_assist::utf8::decode(s, 6).length, 0U);
}

TEST(BasicUtf8, MalformedBytesAdvanceByOne)
{
  const std::string s = "\xC3(";

  const auto c = sql_assist::utf8::decode(s, 0);
  EXPECT_FALSE(c.valid);
  EXPECT_EQ(c.length, 1U);
  EXPECT_EQ(sql_assist::utf8::count_code_points(s), 2U);
}

TEST(BasicUtf8, Classification)
{
  EXPECT_TRUE(sql_assist::utf8::is_letter(U'x'));
  EXPECT_TRUE(sql_assist::utf8::is_letter(U'é'));
  EXPECT_TRUE(sql_assist::utf8::is_letter(U'日'));
  EXPECT_FALSE(sql_assist::utf8::is_letter(U'_'));
  EXPECT_FALSE(sql_assist::utf8::is_letter(U'×'));

  EXPECT_TRUE(sql_assist::utf8::is_digit(U'7'));
  EXPECT_TRUE(sql_assist::utf8::is_digit(U'٣'));
  EXPECT_FALSE(sql_assist::utf8::is_digit(U'a'));
  EXPECT_FALSE(sql_assist::utf8::is_letter(U'٣'));
}

TEST(BasicUtf8, AdvanceByCodePoints)
{
  const std::string s = "\xC3\xA9x";

  EXPECT_EQ(sql_assist::utf8::advance(s, 0, 1), 2U);
  EXPECT_EQ(sql_assist::utf8::advance(s, 0, 2), 3U);
  EXPECT_EQ(sql_assist::utf8::advance(s, 0, 3), std::nullopt);
  EXPECT_EQ(sql_assist::utf8::advance(s, 0, 0), 0U);
}
