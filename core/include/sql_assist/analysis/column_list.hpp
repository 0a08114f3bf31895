// sql_assist/analysis/column_list.hpp - SELECT column list location
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist::analysis
{

/**
 * Locate the column list of a SELECT statement.
 *
 * The list is the text between `SELECT [DISTINCT]` and the first `FROM` at
 * parenthesis depth 0, with the trailing trivia before that `FROM`
 * excluded. `FROM` inside strings, quoted identifiers, comments and
 * subqueries does not count.
 *
 * @return std::nullopt when the text does not start with SELECT, has no
 *         top-level FROM, or the list is empty.
 */
[[nodiscard]] std::optional<SourceRange> select_column_list_range(std::string_view text);

/**
 * Replace the located column list with `replacement`, keeping every other
 * byte of `text` verbatim.
 *
 * @return The rewritten text, or std::nullopt when no column list is found.
 */
[[nodiscard]] std::optional<std::string> replace_select_column_list(
  std::string_view text, std::string_view replacement);

}  // namespace sql_assist::analysis
