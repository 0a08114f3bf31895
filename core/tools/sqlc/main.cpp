// sqlc - SQL query assistant command line interface
//
// Usage:
//   sqlc tokenize <file.sql>
//   sqlc columns <file.sql>
//   sqlc replace-columns <file.sql> <text>
//   sqlc locate-error <file.sql> -m <message>
//   sqlc complete <file.sql> [--offset <n>]
//   sqlc highlight <file.sql>
//
#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "sql_assist/analysis/column_list.hpp"
#include "sql_assist/analysis/error_position.hpp"
#include "sql_assist/basic/diagnostic_printer.hpp"
#include "sql_assist/basic/source_manager.hpp"
#include "sql_assist/lsp/completion.hpp"
#include "sql_assist/lsp/editor_service.hpp"
#include "sql_assist/lsp/highlighter.hpp"
#include "sql_assist/project/project_config.hpp"
#include "sql_assist/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "SQL Assist v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.sql> [options]\n\n"
            << "Commands:\n"
            << "  tokenize <file.sql>              Print the token stream\n"
            << "  columns <file.sql>               Print the SELECT column list\n"
            << "  replace-columns <file.sql> <text>\n"
            << "                                   Print the query with the column list replaced\n"
            << "  locate-error <file.sql> -m <msg> Point at the position of a server error\n"
            << "  complete <file.sql>              Completion items at --offset\n"
            << "  highlight <file.sql>             Print the query with syntax colors\n\n"
            << "Options:\n"
            << "  --config <path>                  Use this sql_assist.yaml\n"
            << "  --json                           JSON output\n"
            << "  --color <auto|always|never>      Terminal colors\n"
            << "  -m, --message <text>             Server error message (locate-error)\n"
            << "  --offset <n>                     Cursor byte offset (complete, default: end)\n"
            << "  -v, --verbose                    Verbose output\n"
            << "  -h, --help                       Show this help message\n\n"
            << "Use '-' as the file name to read standard input.\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string config_path;
  std::string message;
  std::optional<uint32_t> offset;
  std::optional<sql_assist::ColorMode> color;
  bool json = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "-m" || arg == "--message") {
      if (i + 1 < argc) {
        args.message = argv[++i];
      }
    } else if (arg == "--offset") {
      if (i + 1 < argc) {
        const std::string value = argv[++i];
        uint32_t n = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
          args.error = "invalid --offset value '" + value + "'";
        } else {
          args.offset = n;
        }
      }
    } else if (arg == "--color") {
      if (i + 1 < argc) {
        const std::string value = argv[++i];
        args.color = sql_assist::parse_color_mode(value);
        if (!args.color) {
          args.error = "invalid --color value '" + value + "' (must be 'auto', 'always' or 'never')";
        }
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || arg[0] != '-') {
      args.positional.push_back(std::move(arg));
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Session: configuration, catalog and input text
// ============================================================================

struct Session
{
  sql_assist::ProjectConfig config;
  sql_assist::catalog::Catalog catalog;
  std::string input_name;
  std::string text;
  bool json = false;
  sql_assist::ColorMode color = sql_assist::ColorMode::Auto;
};

bool load_config(const CommandArgs & args, Session & session)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = sql_assist::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto result = sql_assist::load_project_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return false;
    }
    session.config = result.config;
    if (args.verbose) {
      std::cerr << "sqlc: using config " << config_path->string() << "\n";
    }

    const auto catalog = sql_assist::load_catalog(session.config);
    if (!catalog.success) {
      std::cerr << "error: " << catalog.error << "\n";
      return false;
    }
    session.catalog = catalog.value;
    if (args.verbose) {
      std::cerr << "sqlc: catalog has " << session.catalog.table_names.size() << " tables and "
                << session.catalog.fields.size() << " fields\n";
    }
  } else if (args.verbose) {
    std::cerr << "sqlc: no " << sql_assist::k_project_config_file_name << " found\n";
  }

  session.json = args.json || session.config.output.format == sql_assist::OutputFormat::Json;
  session.color = args.color.value_or(session.config.output.color);
  return true;
}

bool read_input(const std::string & name, Session & session)
{
  std::stringstream buffer;
  if (name == "-") {
    buffer << std::cin.rdbuf();
    session.input_name = "<stdin>";
  } else {
    const fs::path input_path = fs::absolute(name);
    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return false;
    }
    std::ifstream file(input_path);
    if (!file.is_open()) {
      std::cerr << "error: failed to open file: " << input_path.string() << "\n";
      return false;
    }
    buffer << file.rdbuf();
    session.input_name = name;
  }
  session.text = buffer.str();
  return true;
}

bool use_color_for(sql_assist::ColorMode mode, FILE * stream)
{
  switch (mode) {
    case sql_assist::ColorMode::Always:
      return true;
    case sql_assist::ColorMode::Never:
      return false;
    case sql_assist::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stream)) != 0;
}

sql_assist::lsp::EditorService make_service(const Session & session)
{
  sql_assist::lsp::EditorService svc;
  svc.set_catalog(session.catalog);
  svc.set_document(session.input_name, session.text);
  return svc;
}

// Render a token value on one line.
std::string escape_value(std::string_view value)
{
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  return out;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_tokenize(const Session & session)
{
  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.tokens_json(session.input_name) << "\n";
    return 0;
  }

  const sql_assist::SourceFile source(session.text);
  for (const auto & tok : sql_assist::syntax::tokenize(session.text)) {
    if (tok.kind == sql_assist::syntax::TokenKind::Whitespace) {
      continue;
    }
    const auto lc = source.get_line_column(tok.begin());
    fmt::print(
      "{:>4}:{:<4} {:<18} {}\n", lc.line, lc.column, sql_assist::syntax::to_string(tok.kind),
      escape_value(tok.value));
  }
  return 0;
}

int cmd_columns(const Session & session)
{
  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.column_list_json(session.input_name) << "\n";
    return sql_assist::analysis::select_column_list_range(session.text) ? 0 : 1;
  }

  const auto range = sql_assist::analysis::select_column_list_range(session.text);
  if (!range) {
    std::cerr << "error: no SELECT column list found\n";
    return 1;
  }
  std::cout << sql_assist::slice(session.text, *range) << "\n";
  return 0;
}

int cmd_replace_columns(const CommandArgs & args, const Session & session)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: replacement text required\n";
    std::cerr << "usage: sqlc replace-columns <file.sql> <text>\n";
    return 1;
  }
  const std::string & replacement = args.positional[1];

  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.replace_column_list_json(session.input_name, replacement) << "\n";
    return sql_assist::analysis::select_column_list_range(session.text) ? 0 : 1;
  }

  const auto replaced = sql_assist::analysis::replace_select_column_list(session.text, replacement);
  if (!replaced) {
    std::cerr << "error: no SELECT column list found\n";
    return 1;
  }
  std::cout << *replaced;
  if (replaced->empty() || replaced->back() != '\n') {
    std::cout << "\n";
  }
  return 0;
}

int cmd_locate_error(const CommandArgs & args, const Session & session)
{
  if (args.message.empty()) {
    std::cerr << "error: error message required\n";
    std::cerr << "usage: sqlc locate-error <file.sql> -m <message>\n";
    return 1;
  }

  sql_assist::DiagnosticBag diags;
  const auto pos = sql_assist::analysis::relay_remote_error(args.message, session.text, diags);
  const bool mapped = pos && !diags.empty() && diags.all().front().label.has_value();

  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.error_highlight_json(session.input_name, args.message) << "\n";
    return mapped ? 0 : 1;
  }

  if (args.verbose && pos) {
    std::cerr << "sqlc: server reported line " << pos->line << ", column " << pos->column
              << "\n";
  }

  const sql_assist::SourceFile source(session.text);
  sql_assist::DiagnosticPrinter printer(std::cerr, use_color_for(session.color, stderr));
  printer.print_all(diags, source, session.input_name);

  return mapped ? 0 : 1;
}

int cmd_complete(const CommandArgs & args, const Session & session)
{
  const auto cursor = args.offset.value_or(static_cast<uint32_t>(session.text.size()));

  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.completion_json(session.input_name, cursor) << "\n";
    return 0;
  }

  const auto result = sql_assist::lsp::completions(
    session.text, cursor, session.catalog.table_names, session.catalog.fields);
  for (const auto & item : result.items) {
    if (item.detail) {
      fmt::print("{}  {:<32} {}\n", item.kind_label(), item.display_text, *item.detail);
    } else {
      fmt::print("{}  {}\n", item.kind_label(), item.display_text);
    }
  }
  return 0;
}

void set_style_color(std::ostream & os, sql_assist::lsp::HighlightStyle style)
{
  using sql_assist::lsp::HighlightStyle;
  switch (style) {
    case HighlightStyle::Comment:
      os << rang::fgB::gray;
      break;
    case HighlightStyle::String:
      os << rang::fg::green;
      break;
    case HighlightStyle::QuotedIdentifier:
      os << rang::fg::yellow;
      break;
    case HighlightStyle::Number:
      os << rang::fg::magenta;
      break;
    case HighlightStyle::Keyword:
      os << rang::style::bold << rang::fg::blue;
      break;
    case HighlightStyle::Function:
      os << rang::fg::cyan;
      break;
  }
}

int cmd_highlight(const Session & session)
{
  if (session.json) {
    auto svc = make_service(session);
    std::cout << svc.highlight_json(session.input_name) << "\n";
    return 0;
  }

  if (!use_color_for(session.color, stdout)) {
    rang::setControlMode(rang::control::Off);
  } else {
    rang::setControlMode(rang::control::Force);
  }

  // Per-byte style; spans of a later style win where spans overlap.
  auto spans = sql_assist::lsp::classify(session.text);
  std::stable_sort(spans.begin(), spans.end(), [](const auto & a, const auto & b) {
    return static_cast<int>(a.style) < static_cast<int>(b.style);
  });

  std::vector<std::optional<sql_assist::lsp::HighlightStyle>> styles(session.text.size());
  for (const auto & span : spans) {
    const auto end = std::min<size_t>(span.range.end_offset(), styles.size());
    for (size_t i = span.range.begin_offset(); i < end; ++i) {
      styles[i] = span.style;
    }
  }

  size_t pos = 0;
  while (pos < session.text.size()) {
    size_t run_end = pos + 1;
    while (run_end < session.text.size() && styles[run_end] == styles[pos]) {
      ++run_end;
    }
    const std::string_view run = std::string_view(session.text).substr(pos, run_end - pos);
    if (styles[pos]) {
      set_style_color(std::cout, *styles[pos]);
      std::cout << run << rang::style::reset << rang::fg::reset;
    } else {
      std::cout << run;
    }
    pos = run_end;
  }
  if (session.text.empty() || session.text.back() != '\n') {
    std::cout << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  const bool known = args.command == "tokenize" || args.command == "columns" ||
                     args.command == "replace-columns" || args.command == "locate-error" ||
                     args.command == "complete" || args.command == "highlight";
  if (!known) {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: sqlc " << args.command << " <file.sql>\n";
    return 1;
  }

  Session session;
  if (!load_config(args, session)) {
    return 1;
  }
  if (!read_input(args.positional.front(), session)) {
    return 1;
  }
  if (args.verbose) {
    std::cerr << "sqlc: read " << session.text.size() << " bytes from " << session.input_name
              << "\n";
  }

  if (args.command == "tokenize") {
    return cmd_tokenize(session);
  }

  if (args.command == "columns") {
    return cmd_columns(session);
  }

  if (args.command == "replace-columns") {
    return cmd_replace_columns(args, session);
  }

  if (args.command == "locate-error") {
    return cmd_locate_error(args, session);
  }

  if (args.command == "complete") {
    return cmd_complete(args, session);
  }

  return cmd_highlight(session);
}
