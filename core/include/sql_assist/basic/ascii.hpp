// sql_assist/basic/ascii.hpp - ASCII case helpers
//
// SQL keywords and the completion vocabularies are ASCII, so case folding
// only touches ASCII letters and leaves other bytes alone.
//
#pragma once

#include <string>
#include <string_view>

namespace sql_assist::ascii
{

[[nodiscard]] constexpr char to_upper(char c) noexcept
{
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

[[nodiscard]] inline std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = to_upper(c);
  }
  return out;
}

/// True for the characters that make up a completion prefix: [A-Za-z0-9_].
[[nodiscard]] constexpr bool is_word_char(char c) noexcept
{
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

}  // namespace sql_assist::ascii
