// sql_assist/basic/utf8.hpp - Minimal UTF-8 decoding helpers
//
// Offsets handed around the library are byte offsets. These helpers step
// through a buffer one code point at a time and classify code points the
// way the SQL lexer needs.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sql_assist::utf8
{

/// Result of decoding one code point at a byte position.
struct DecodedChar
{
  char32_t code_point = 0;
  uint32_t length = 0;  ///< Bytes consumed (always >= 1 when not at end)
  bool valid = false;   ///< false for malformed or truncated sequences
};

/**
 * Decode the code point starting at byte `pos`.
 *
 * Malformed input decodes as a single invalid byte so callers can always
 * make progress. At or past the end of `text` the result has length 0.
 */
[[nodiscard]] DecodedChar decode(std::string_view text, size_t pos) noexcept;

/// Letter test: Unicode general category L (Lu, Ll, Lt, Lm, Lo), via ICU.
[[nodiscard]] bool is_letter(char32_t cp) noexcept;

/// Decimal digit test: Unicode general category Nd, via ICU.
[[nodiscard]] bool is_digit(char32_t cp) noexcept;

/// Number of code points in `text` (malformed bytes count one each).
[[nodiscard]] size_t count_code_points(std::string_view text) noexcept;

/**
 * Advance `count` code points from byte `pos`.
 *
 * Returns the resulting byte offset, or std::nullopt when the text ends
 * before `count` code points have been consumed. Landing exactly on the
 * end of the text is allowed.
 */
[[nodiscard]] std::optional<size_t> advance(std::string_view text, size_t pos, size_t count) noexcept;

}  // namespace sql_assist::utf8
