// sql_assist/basic/diagnostic_printer.hpp
//
// Prints diagnostics against a single SQL buffer with source context,
// line/column information, and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "sql_assist/basic/diagnostic.hpp"
#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E-REMOTE]: Expected: an expression, found: FROM at Line: 1, Column 15
 *     --> query.sql:1:15
 *      |
 *    1 | SELECT a, b, FROM t
 *      |              ^^^^ reported here
 *
 * Columns are counted in characters, not bytes.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source, std::string_view name);

  /// Print every diagnostic in source order.
  void print_all(const DiagnosticBag & diags, const SourceFile & source, std::string_view name);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceFile & source, std::string_view name);
  void print_label(const Label & label, const SourceFile & source);
  void print_help(std::string_view message);

  /// Write gutter text ("  -->", "      |", "   =") in the gutter style.
  void gutter(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace sql_assist
