#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "sql_assist/analysis/column_list.hpp"

using sql_assist::analysis::replace_select_column_list;
using sql_assist::analysis::select_column_list_range;

namespace
{

std::optional<std::string> column_list(std::string_view sql)
{
  const auto range = select_column_list_range(sql);
  if (!range) {
    return std::nullopt;
  }
  return std::string(sql.substr(range->begin_offset(), range->size()));
}

}  // namespace

TEST(AnalysisColumnList, Star) { EXPECT_EQ(column_list("SELECT * FROM t"), "*"); }

TEST(AnalysisColumnList, SimpleColumns) { EXPECT_EQ(column_list("SELECT a, b FROM t"), "a, b"); }

TEST(AnalysisColumnList, SubqueryInListIsSkipped)
{
  EXPECT_EQ(
    column_list("SELECT (SELECT count(*) FROM x), col FROM main"),
    "(SELECT count(*) FROM x), col");
}

TEST(AnalysisColumnList, FromInsideStringIsIgnored)
{
  EXPECT_EQ(column_list("SELECT 'from' AS label FROM t"), "'from' AS label");
}

TEST(AnalysisColumnList, FromInsideQuotedIdentifierAndCommentIsIgnored)
{
  EXPECT_EQ(column_list("SELECT \"FROM\", a /* from */ FROM t"), "\"FROM\", a");
  EXPECT_EQ(column_list("SELECT a -- from here\nFROM t"), "a");
}

TEST(AnalysisColumnList, MissingFromYieldsNothing)
{
  EXPECT_EQ(column_list("SELECT a, b, c"), std::nullopt);
}

TEST(AnalysisColumnList, EmptyListYieldsNothing)
{
  EXPECT_EQ(column_list("SELECT FROM t"), std::nullopt);
  EXPECT_EQ(column_list("SELECT DISTINCT FROM t"), std::nullopt);
  EXPECT_EQ(column_list("SELECT"), std::nullopt);
  EXPECT_EQ(column_list(""), std::nullopt);
}

TEST(AnalysisColumnList, RequiresLeadingSelect)
{
  EXPECT_EQ(column_list("WITH x AS (SELECT 1) SELECT a FROM x"), std::nullopt);
  EXPECT_EQ(column_list("UPDATE t SET a = 1"), std::nullopt);
}

TEST(AnalysisColumnList, LeadingTriviaAndDistinct)
{
  EXPECT_EQ(column_list("  -- header\n select   distinct  a , b \n FROM t"), "a , b");
}

TEST(AnalysisColumnList, CaseInsensitiveKeywords)
{
  EXPECT_EQ(column_list("select x from y"), "x");
}

TEST(AnalysisColumnList, UnbalancedClosingParenIsFloored)
{
  EXPECT_EQ(column_list("SELECT a) FROM t"), "a)");
}

TEST(AnalysisColumnList, ReplacementKeepsEverythingElse)
{
  const std::string_view sql = "-- q\nSELECT  a, b  /* c */ FROM t WHERE x = 'y'";
  const auto out = replace_select_column_list(sql, "*");
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "-- q\nSELECT  *  /* c */ FROM t WHERE x = 'y'");
}

TEST(AnalysisColumnList, ReplacementRoundTrip)
{
  const std::string_view sql = "SELECT DISTINCT a, (SELECT 1 FROM z) FROM t";
  for (const std::string_view repl : {"*", "p_timestamp, level", "count(*) AS n", "'from'"}) {
    const auto out = replace_select_column_list(sql, repl);
    ASSERT_TRUE(out.has_value()) << repl;
    EXPECT_EQ(column_list(*out), std::string(repl));
  }
}

TEST(AnalysisColumnList, ReplacementWithoutListYieldsNothing)
{
  EXPECT_EQ(replace_select_column_list("SELECT 1", "*"), std::nullopt);
}
