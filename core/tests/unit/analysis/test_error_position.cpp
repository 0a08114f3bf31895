#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "sql_assist/analysis/error_position.hpp"
#include "sql_assist/basic/diagnostic.hpp"

using sql_assist::DiagnosticBag;
using sql_assist::SourceRange;
using sql_assist::analysis::character_offset;
using sql_assist::analysis::error_highlight_range;
using sql_assist::analysis::ErrorPosition;
using sql_assist::analysis::parse_error_position;
using sql_assist::analysis::relay_remote_error;
using sql_assist::analysis::token_range_at_offset;

TEST(AnalysisErrorPosition, ParsesEngineMessage)
{
  const auto pos =
    parse_error_position("Expected: an expression, found: FROM at Line: 1, Column 15");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(*pos, (ErrorPosition{1, 15}));
}

TEST(AnalysisErrorPosition, ParsesColonAfterColumn)
{
  const auto pos = parse_error_position("sql parser error: Line:3,Column: 7 trailing");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->line, 3);
  EXPECT_EQ(pos->column, 7);
}

TEST(AnalysisErrorPosition, TakesFirstMarker)
{
  const auto pos = parse_error_position("Line: 2, Column 4 and Line: 9, Column 9");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(*pos, (ErrorPosition{2, 4}));
}

TEST(AnalysisErrorPosition, RejectsMessagesWithoutMarker)
{
  EXPECT_FALSE(parse_error_position("table not found").has_value());
  EXPECT_FALSE(parse_error_position("Line 1, Column 2").has_value());
  EXPECT_FALSE(parse_error_position("").has_value());
}

TEST(AnalysisErrorPosition, RejectsOverflowingNumbers)
{
  EXPECT_FALSE(parse_error_position("Line: 99999999999999999999999, Column 1").has_value());
}

TEST(AnalysisErrorPosition, CharacterOffsetBasics)
{
  const std::string_view sql = "SELECT a\nFROM t";
  EXPECT_EQ(character_offset(1, 1, sql), 0U);
  EXPECT_EQ(character_offset(1, 8, sql), 7U);
  EXPECT_EQ(character_offset(2, 1, sql), 9U);
  EXPECT_EQ(character_offset(2, 7, sql), sql.size());
  EXPECT_FALSE(character_offset(2, 8, sql).has_value());
  EXPECT_FALSE(character_offset(3, 1, sql).has_value());
  EXPECT_FALSE(character_offset(0, 1, sql).has_value());
  EXPECT_FALSE(character_offset(1, 0, sql).has_value());
}

TEST(AnalysisErrorPosition, CharacterOffsetCountsCharacters)
{
  // "é" is two bytes; column 5 is the 'x'.
  const std::string_view sql = "'\xC3\xA9' x";
  EXPECT_EQ(character_offset(1, 5, sql), 5U);
  EXPECT_EQ(character_offset(1, 4, sql), 4U);
  EXPECT_EQ(character_offset(1, 3, sql), 3U);
}

TEST(AnalysisErrorPosition, TokenRangeInsideToken)
{
  const std::string_view sql = "SELEC * FROM t";
  EXPECT_EQ(token_range_at_offset(0, sql), SourceRange(0, 5));
  EXPECT_EQ(token_range_at_offset(3, sql), SourceRange(0, 5));
}

TEST(AnalysisErrorPosition, TokenRangeSnapsForwardFromTrivia)
{
  const std::string_view sql = "SELECT a,   /* x */  FROM t";
  // Offset 10 is inside the whitespace after the comma.
  EXPECT_EQ(token_range_at_offset(10, sql), SourceRange(21, 25));
  EXPECT_FALSE(token_range_at_offset(3, "x   ").has_value());
}

TEST(AnalysisErrorPosition, TokenRangeAtEndSnapsBack)
{
  const std::string_view sql = "SELECT a FROM t  ";
  EXPECT_EQ(token_range_at_offset(static_cast<uint32_t>(sql.size()), sql), SourceRange(14, 15));
  EXPECT_FALSE(token_range_at_offset(0, "").has_value());
  EXPECT_FALSE(token_range_at_offset(2, "  ").has_value());
}

TEST(AnalysisErrorPosition, HighlightRangeForMisspelledKeyword)
{
  EXPECT_EQ(error_highlight_range(1, 1, "SELEC * FROM t"), SourceRange(0, 5));
  EXPECT_FALSE(error_highlight_range(5, 1, "SELEC * FROM t").has_value());
}

TEST(AnalysisErrorPosition, RelayAddsLabeledDiagnostic)
{
  DiagnosticBag diags;
  const std::string_view sql = "SELECT a, FROM t";
  const auto pos = relay_remote_error("Expected: an expression at Line: 1, Column 11", sql, diags);
  ASSERT_TRUE(pos.has_value());
  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.code, "E-REMOTE");
  EXPECT_EQ(d.message, "Expected: an expression at Line: 1, Column 11");
  EXPECT_EQ(d.range(), SourceRange(10, 14));
  ASSERT_TRUE(d.label.has_value());
  EXPECT_EQ(d.label->message, "reported here");
}

TEST(AnalysisErrorPosition, RelayWithoutPositionHasNoLabel)
{
  DiagnosticBag diags;
  EXPECT_FALSE(relay_remote_error("stream not found", "SELECT 1", diags).has_value());
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_FALSE(diags.all().front().label.has_value());
  EXPECT_FALSE(diags.all().front().help_message.has_value());
}

TEST(AnalysisErrorPosition, RelayWithUnmappablePositionAddsHelp)
{
  DiagnosticBag diags;
  EXPECT_TRUE(relay_remote_error("bad at Line: 7, Column 1", "SELECT 1", diags).has_value());
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_FALSE(diags.all().front().label.has_value());
  EXPECT_TRUE(diags.all().front().help_message.has_value());
}
