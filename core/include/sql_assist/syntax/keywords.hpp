// sql_assist/syntax/keywords.hpp - Compiled-in SQL vocabularies
#pragma once

#include <array>
#include <string_view>

namespace sql_assist::syntax
{

// NOTE: Three independent lists. The lexer set decides Keyword vs
// Identifier; the editor set drives highlighting and completion together
// with the function list. The editor lists are kept in byte order.

/// Words the lexer classifies as Keyword (uppercase).
inline constexpr auto k_keywords = std::to_array<std::string_view>({
  "SELECT",    "DISTINCT",  "FROM",      "WHERE",     "GROUP",    "BY",       "HAVING",
  "ORDER",     "LIMIT",     "OFFSET",    "AS",        "AND",      "OR",       "NOT",
  "IN",        "IS",        "NULL",      "LIKE",      "BETWEEN",  "CASE",     "WHEN",
  "THEN",      "ELSE",      "END",       "JOIN",      "ON",       "LEFT",     "RIGHT",
  "INNER",     "OUTER",     "CROSS",     "FULL",      "UNION",    "ALL",      "INTERSECT",
  "EXCEPT",    "INSERT",    "UPDATE",    "DELETE",    "CREATE",   "DROP",     "ALTER",
  "SET",       "INTO",      "VALUES",    "ASC",       "DESC",     "EXISTS",   "TRUE",
  "FALSE",     "WITH",      "RECURSIVE", "OVER",      "PARTITION", "WINDOW",  "ROWS",
  "RANGE",     "UNBOUNDED", "PRECEDING", "FOLLOWING", "CURRENT",  "ROW",      "FILTER",
  "LATERAL",   "NATURAL",   "USING",     "FETCH",     "FIRST",    "LAST",     "NEXT",
  "ONLY",      "TIES",      "TOP",
});

/// Keywords offered by completion and painted by the highlighter.
inline constexpr auto k_editor_keywords = std::to_array<std::string_view>({
  "ADD",       "ALL",       "ALTER",     "AND",      "AS",        "ASC",       "BETWEEN",
  "BY",        "CASE",      "CAST",      "CREATE",   "CROSS",     "CUBE",      "CURRENT",
  "DELETE",    "DESC",      "DISTINCT",  "DROP",     "ELSE",      "END",       "EXCEPT",
  "EXISTS",    "EXTRACT",   "FALSE",     "FETCH",    "FILTER",    "FIRST",     "FOLLOWING",
  "FOR",       "FROM",      "FULL",      "GROUP",    "GROUPING",  "HAVING",    "IF",
  "IN",        "INNER",     "INSERT",    "INTERSECT", "INTERVAL", "INTO",      "IS",
  "JOIN",      "LATERAL",   "LEFT",      "LIKE",     "LIMIT",     "NATURAL",   "NEXT",
  "NOT",       "NULL",      "OFFSET",    "ON",       "ONLY",      "OR",        "ORDER",
  "OUTER",     "OVER",      "PARTITION", "PERCENT",  "PRECEDING", "RANGE",     "RECURSIVE",
  "RIGHT",     "ROLLUP",    "ROW",       "ROWS",     "SELECT",    "SET",       "SETS",
  "TABLE",     "THEN",      "TOP",       "TRUE",     "UNBOUNDED", "UNION",     "UPDATE",
  "USING",     "VALUES",    "WHEN",      "WHERE",    "WINDOW",    "WITH",
});

/// Built-in function names offered by completion and painted by the highlighter.
inline constexpr auto k_functions = std::to_array<std::string_view>({
  "ABS",          "ARRAY_AGG",  "AVG",        "CEIL",        "COALESCE",   "CONCAT",
  "COUNT",        "DATE",       "DATE_TRUNC", "DENSE_RANK",  "FIRST_VALUE", "FLOOR",
  "IFNULL",       "IIF",        "JSON_EXTRACT", "JSON_VALUE", "LAG",       "LAST_VALUE",
  "LEAD",         "LENGTH",     "LOWER",      "MAX",         "MIN",        "NOW",
  "NTH_VALUE",    "NTILE",      "NULLIF",     "RANK",        "REPLACE",    "ROUND",
  "ROW_NUMBER",   "STRING_AGG", "SUBSTRING",  "SUM",         "TIME",       "TIMESTAMP",
  "TO_CHAR",      "TO_DATE",    "TO_TIMESTAMP", "TRIM",      "UPPER",
});

/// True if `upper` (already uppercased) is in the lexer keyword set.
[[nodiscard]] bool is_keyword(std::string_view upper) noexcept;

}  // namespace sql_assist::syntax
