#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace util {

// Splits on every occurrence of sep. Empty fields are kept: split("B2,,A1", ',') has 3 entries.
std::vector<std::string> split(std::string_view s, char sep);

// Splits on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> splitlines(std::string_view s);

// ASCII case-insensitive equality.
bool iequals(std::string_view a, std::string_view b);

}  // namespace util

#include "inline/util/StringUtil.inl"
