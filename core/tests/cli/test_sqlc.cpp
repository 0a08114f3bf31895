// test_sqlc.cpp - CLI integration tests for sqlc

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

#include "sql_assist/test_support/temp_dir.hpp"

namespace fs = std::filesystem;
using sql_assist::test_support::TempDir;

namespace
{

struct CliResult
{
  int exit_code = -1;
  std::string out;
  std::string err;
};

std::string read_all(const fs::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

// Run sqlc inside `dir` so config discovery starts there.
CliResult run_sqlc(const TempDir & dir, const std::string & args, const std::string & stdin_file = "")
{
  CliResult r;
#ifdef SQL_ASSIST_SQLC_PATH
  const fs::path out_path = dir.path / "stdout.txt";
  const fs::path err_path = dir.path / "stderr.txt";

  std::string cmd = "cd " + shell_quote(dir.path.string()) + " && " +
                    shell_quote(SQL_ASSIST_SQLC_PATH) + " " + args;
  if (!stdin_file.empty()) {
    cmd += " < " + shell_quote((dir.path / stdin_file).string());
  }
  cmd += " > " + shell_quote(out_path.string()) + " 2> " + shell_quote(err_path.string());

  const int rc = std::system(cmd.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    r.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    r.exit_code = WEXITSTATUS(rc);
  } else {
    r.exit_code = 128;
  }
#else
  r.exit_code = rc;
#endif
  r.out = read_all(out_path);
  r.err = read_all(err_path);
#else
  (void)dir;
  (void)args;
  (void)stdin_file;
#endif
  return r;
}

#ifndef SQL_ASSIST_SQLC_PATH
#define SKIP_WITHOUT_SQLC() GTEST_SKIP() << "SQL_ASSIST_SQLC_PATH is not configured"
#else
#define SKIP_WITHOUT_SQLC() (void)0
#endif

}  // namespace

TEST(CliSqlc, ColumnsPrintsSelectList)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_columns");
  dir.write("q.sql", "SELECT a, b FROM t");

  const auto r = run_sqlc(dir, "columns q.sql");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "a, b\n");
}

TEST(CliSqlc, ColumnsFailsWithoutFrom)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_columns_missing");
  dir.write("q.sql", "SELECT a, b, c");

  const auto r = run_sqlc(dir, "columns q.sql");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("no SELECT column list"), std::string::npos) << r.err;
}

TEST(CliSqlc, ReplaceColumns)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_replace");
  dir.write("q.sql", "SELECT * FROM t");

  const auto r = run_sqlc(dir, "replace-columns q.sql 'level, host'");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "SELECT level, host FROM t\n");
}

TEST(CliSqlc, ReadsStandardInput)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_stdin");
  dir.write("in.sql", "SELECT x FROM t");

  const auto r = run_sqlc(dir, "columns -", "in.sql");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "x\n");
}

TEST(CliSqlc, LocateErrorPrintsDiagnostic)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_locate");
  dir.write("q.sql", "SELEC * FROM t");

  const auto r =
    run_sqlc(dir, "locate-error q.sql --color never -m 'Expected: a statement at Line: 1, Column 1'");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.err.find("error[E-REMOTE]"), std::string::npos) << r.err;
  EXPECT_NE(r.err.find("  --> q.sql:1:1"), std::string::npos) << r.err;
  EXPECT_NE(r.err.find("^^^^^ reported here"), std::string::npos) << r.err;
}

TEST(CliSqlc, LocateErrorWithoutPositionFails)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_locate_none");
  dir.write("q.sql", "SELECT 1");

  const auto r = run_sqlc(dir, "locate-error q.sql --color never -m 'stream not found'");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("error[E-REMOTE]: stream not found"), std::string::npos) << r.err;
}

TEST(CliSqlc, CompleteUsesConfiguredCatalog)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_complete");
  dir.write(
    "sql_assist.yaml",
    "catalog:\n"
    "  tables: [access_logs, error_logs]\n"
    "  fields:\n"
    "    - { name: level, type: Utf8 }\n");
  dir.write("q.sql", "SELECT * FROM acc");

  const auto r = run_sqlc(dir, "complete q.sql");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "T  \"access_logs\"\n");
}

TEST(CliSqlc, CompleteAtOffset)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_complete_offset");
  dir.write("q.sql", "SELECT lev FROM t");
  dir.write("sql_assist.yaml", "catalog:\n  fields:\n    - { name: level, type: Utf8 }\n");

  const auto r = run_sqlc(dir, "complete q.sql --offset 10");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.out.find("C  level"), std::string::npos) << r.out;
  EXPECT_NE(r.out.find("Utf8"), std::string::npos) << r.out;
}

TEST(CliSqlc, TokenizeJson)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_tokenize_json");
  dir.write("q.sql", "select 1");

  const auto r = run_sqlc(dir, "tokenize q.sql --json");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.out.find("\"value\":\"SELECT\""), std::string::npos) << r.out;
  EXPECT_NE(r.out.find("\"kind\":\"number\""), std::string::npos) << r.out;
}

TEST(CliSqlc, HighlightWithoutColorEchoesText)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_highlight");
  dir.write("q.sql", "SELECT 'a' -- c\n");

  const auto r = run_sqlc(dir, "highlight q.sql --color never");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "SELECT 'a' -- c\n");
}

TEST(CliSqlc, InvalidConfigFails)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_bad_config");
  dir.write("sql_assist.yaml", "output:\n  color: sometimes\n");
  dir.write("q.sql", "SELECT 1");

  const auto r = run_sqlc(dir, "tokenize q.sql");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("output.color"), std::string::npos) << r.err;
}

TEST(CliSqlc, MissingFileAndUnknownCommand)
{
  SKIP_WITHOUT_SQLC();
  const TempDir dir("sqlc_cli_errors");

  auto r = run_sqlc(dir, "columns missing.sql");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("file not found"), std::string::npos) << r.err;

  r = run_sqlc(dir, "frobnicate q.sql");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("unknown command"), std::string::npos) << r.err;
}
