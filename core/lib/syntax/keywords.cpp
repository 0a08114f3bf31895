// sql_assist/syntax/keywords.cpp
#include "sql_assist/syntax/keywords.hpp"

#include <algorithm>

namespace sql_assist::syntax
{

bool is_keyword(std::string_view upper) noexcept
{
  return std::find(k_keywords.begin(), k_keywords.end(), upper) != k_keywords.end();
}

}  // namespace sql_assist::syntax
