// sql_assist/analysis/error_position.hpp - Remote error position mapping
//
// The remote query engine reports syntax errors as free text with an
// embedded "Line: <n>, Column <m>" marker. These helpers pull the position
// out of the message and map it back onto the token the user should see
// highlighted in the editor.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "sql_assist/basic/diagnostic.hpp"
#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist::analysis
{

/// 1-based position reported by the remote engine. Columns count characters.
struct ErrorPosition
{
  int64_t line = 0;
  int64_t column = 0;

  [[nodiscard]] bool operator==(const ErrorPosition & other) const = default;
};

/// Diagnostic code used for errors relayed from the remote engine.
inline constexpr std::string_view k_remote_error_code = "E-REMOTE";

/**
 * Find the first `Line: <int>, Column[:] <int>` marker in `message`.
 *
 * @return std::nullopt if no marker is present or a number does not fit.
 */
[[nodiscard]] std::optional<ErrorPosition> parse_error_position(std::string_view message);

/**
 * Convert a 1-based line/column into a byte offset within `text`.
 *
 * The column is advanced in characters from the line start and may run
 * past the end of the line. An offset equal to text.size() is valid.
 */
[[nodiscard]] std::optional<uint32_t> character_offset(
  int64_t line, int64_t column, std::string_view text);

/**
 * Range of the token covering `offset`.
 *
 * Offsets inside whitespace or comments snap forward to the next real
 * token. Offsets at or past the end snap back to the last real token.
 */
[[nodiscard]] std::optional<SourceRange> token_range_at_offset(
  uint32_t offset, std::string_view text);

/// character_offset() followed by token_range_at_offset().
[[nodiscard]] std::optional<SourceRange> error_highlight_range(
  int64_t line, int64_t column, std::string_view text);

/**
 * Report a remote error message as an error diagnostic.
 *
 * When the message carries a position that maps into `text`, the
 * diagnostic gets a primary label on the highlighted token.
 *
 * @return The parsed position, if any.
 */
std::optional<ErrorPosition> relay_remote_error(
  std::string_view message, std::string_view text, DiagnosticBag & diags);

}  // namespace sql_assist::analysis
