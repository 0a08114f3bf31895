// sql_assist/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "sql_assist/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

#include "sql_assist/basic/utf8.hpp"

namespace sql_assist
{

namespace
{

/// 1-based character column of 1-based byte column `byte_column` within `line`.
uint32_t char_column(std::string_view line, uint32_t byte_column)
{
  const size_t prefix = std::min<size_t>(byte_column - 1, line.size());
  return static_cast<uint32_t>(utf8::count_code_points(line.substr(0, prefix))) + 1;
}

/// Tabs widen to four columns; carriage returns are dropped.
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r') {
      out += c;
    }
  }
  return out;
}

/// Blank run reaching character column `col` of `line`, tabs widened like expand_tabs().
std::string pad_to_column(std::string_view line, uint32_t col)
{
  std::string pad;
  size_t pos = 0;
  for (uint32_t c = 1; c < col && pos < line.size(); ++c) {
    const auto ch = utf8::decode(line, pos);
    pad += (ch.code_point == '\t') ? "    " : " ";
    pos += ch.length;
  }
  return pad;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(
  const Diagnostic & diag, const SourceFile & source, std::string_view name)
{
  print_header(diag);
  print_location(diag, source, name);

  gutter("      |");
  os_ << "\n";

  if (diag.label) {
    print_label(*diag.label, source);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  os_ << "\n";
}

void DiagnosticPrinter::print_all(
  const DiagnosticBag & diags, const SourceFile & source, std::string_view name)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->range().get_begin() < b->range().get_begin();
  });

  for (const auto * d : ordered) {
    print(*d, source, name);
  }
}

// =============================================================================
// Sections
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string head = diag.code.empty() ? "error" : fmt::format("error[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }
  os_ << rang::style::bold << rang::fg::red << head << rang::fg::reset << ": "
      << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_location(
  const Diagnostic & diag, const SourceFile & source, std::string_view name)
{
  gutter("  -->");

  const FullSourceRange fr = source.get_full_range(diag.range());
  if (!fr.is_valid()) {
    fmt::print(os_, " {}\n", name);
    return;
  }
  const auto line = source.get_line(fr.start_line - 1);
  fmt::print(os_, " {}:{}:{}\n", name, fr.start_line, char_column(line, fr.start_column));
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const std::string_view line = source.get_line(fr.start_line - 1);
  const uint32_t start_col = char_column(line, fr.start_column);

  // Labels spanning lines are underlined up to the end of the first line.
  uint32_t end_col = (fr.end_line == fr.start_line)
                       ? char_column(line, fr.end_column)
                       : static_cast<uint32_t>(utf8::count_code_points(line)) + 1;
  end_col = std::max(end_col, start_col + 1);

  // Source line
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold;
  }
  fmt::print(os_, " {:>4} |", fr.start_line);
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, " {}\n", expand_tabs(line));

  // Marker line
  gutter("      |");
  fmt::print(os_, " {}", pad_to_column(line, start_col));

  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red;
  }
  os_ << std::string(end_col - start_col, '^');
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  gutter("      |");
  os_ << "\n";
  gutter("   =");
  fmt::print(os_, " help: {}\n", message);
}

void DiagnosticPrinter::gutter(std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
  } else {
    os_ << text;
  }
}

}  // namespace sql_assist
