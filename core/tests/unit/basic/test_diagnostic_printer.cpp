#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "sql_assist/basic/diagnostic.hpp"
#include "sql_assist/basic/diagnostic_printer.hpp"
#include "sql_assist/basic/source_manager.hpp"

using sql_assist::DiagnosticBag;
using sql_assist::DiagnosticPrinter;
using sql_assist::SourceFile;
using sql_assist::SourceRange;

namespace
{

std::string render(const DiagnosticBag & diags, const SourceFile & source)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(diags, source, "query.sql");
  return out.str();
}

}  // namespace

TEST(BasicDiagnosticPrinter, LabelledError)
{
  const SourceFile source("SELEC * FROM t");
  DiagnosticBag diags;
  diags.report_error(SourceRange(0, 5), "unexpected word at Line: 1, Column 1", "reported here")
    .with_code("E-REMOTE");

  EXPECT_EQ(
    render(diags, source),
    "error[E-REMOTE]: unexpected word at Line: 1, Column 1\n"
    "  --> query.sql:1:1\n"
    "      |\n"
    "    1 | SELEC * FROM t\n"
    "      | ^^^^^ reported here\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, ColumnsCountCharacters)
{
  const SourceFile source("SELECT 'é' x");
  DiagnosticBag diags;
  diags.report_error(SourceRange(12, 13), "bad", "here");

  EXPECT_EQ(
    render(diags, source),
    "error: bad\n"
    "  --> query.sql:1:12\n"
    "      |\n"
    "    1 | SELECT 'é' x\n"
    "      |            ^ here\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, SecondLine)
{
  const SourceFile source("SELECT a\nFROM");
  DiagnosticBag diags;
  diags.report_error(SourceRange(9, 13), "incomplete");

  EXPECT_EQ(
    render(diags, source),
    "error: incomplete\n"
    "  --> query.sql:2:1\n"
    "      |\n"
    "    2 | FROM\n"
    "      | ^^^^\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, NoPositionWithHelp)
{
  const SourceFile source("SELECT 1");
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "Line: 9, Column: 1")
    .with_code("E-REMOTE")
    .with_help("the reported position lies outside the query text");

  EXPECT_EQ(
    render(diags, source),
    "error[E-REMOTE]: Line: 9, Column: 1\n"
    "  --> query.sql\n"
    "      |\n"
    "      |\n"
    "   = help: the reported position lies outside the query text\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, PrintAllSortsBySourceOrder)
{
  const SourceFile source("a b");
  DiagnosticBag diags;
  diags.report_error(SourceRange(2, 3), "second", "");
  diags.report_error(SourceRange(0, 1), "first", "");

  const auto out = render(diags, source);
  EXPECT_LT(out.find("first"), out.find("second"));
}
