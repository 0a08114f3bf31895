// sql_assist/basic/utf8.cpp - UTF-8 decoding helpers
#include "sql_assist/basic/utf8.hpp"

#include <unicode/uchar.h>

namespace sql_assist::utf8
{

namespace
{

bool is_continuation(unsigned char c) { return (c & 0xC0U) == 0x80U; }

}  // namespace

DecodedChar decode(std::string_view text, size_t pos) noexcept
{
  DecodedChar out;
  if (pos >= text.size()) {
    return out;
  }

  const auto c0 = static_cast<unsigned char>(text[pos]);
  if (c0 < 0x80U) {
    out.code_point = c0;
    out.length = 1;
    out.valid = true;
    return out;
  }

  uint32_t len = 0;
  char32_t cp = 0;
  char32_t min_cp = 0;
  if ((c0 & 0xE0U) == 0xC0U) {
    len = 2;
    cp = c0 & 0x1FU;
    min_cp = 0x80;
  } else if ((c0 & 0xF0U) == 0xE0U) {
    len = 3;
    cp = c0 & 0x0FU;
    min_cp = 0x800;
  } else if ((c0 & 0xF8U) == 0xF0U) {
    len = 4;
    cp = c0 & 0x07U;
    min_cp = 0x10000;
  } else {
    out.code_point = c0;
    out.length = 1;
    return out;
  }

  if (pos + len > text.size()) {
    out.code_point = c0;
    out.length = 1;
    return out;
  }

  for (uint32_t i = 1; i < len; ++i) {
    const auto c = static_cast<unsigned char>(text[pos + i]);
    if (!is_continuation(c)) {
      out.code_point = c0;
      out.length = 1;
      return out;
    }
    cp = (cp << 6U) | (c & 0x3FU);
  }

  if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    out.code_point = c0;
    out.length = 1;
    return out;
  }

  out.code_point = cp;
  out.length = len;
  out.valid = true;
  return out;
}

bool is_digit(char32_t cp) noexcept
{
  if (cp < 0x80) {
    return cp >= '0' && cp <= '9';
  }
  return u_isdigit(static_cast<UChar32>(cp)) != 0;
}

bool is_letter(char32_t cp) noexcept
{
  if (cp < 0x80) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  return u_isalpha(static_cast<UChar32>(cp)) != 0;
}

size_t count_code_points(std::string_view text) noexcept
{
  size_t count = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    pos += decode(text, pos).length;
    ++count;
  }
  return count;
}

std::optional<size_t> advance(std::string_view text, size_t pos, size_t count) noexcept
{
  for (size_t i = 0; i < count; ++i) {
    if (pos >= text.size()) {
      return std::nullopt;
    }
    pos += decode(text, pos).length;
  }
  if (pos > text.size()) {
    return std::nullopt;
  }
  return pos;
}

}  // namespace sql_assist::utf8
