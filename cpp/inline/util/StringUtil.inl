#include "util/StringUtil.hpp"

#include <algorithm>
#include <cctype>

namespace util {

inline std::vector<std::string> split(std::string_view s, char sep) {
  std::vector<std::string> fields;
  while (true) {
    size_t pos = s.find(sep);
    fields.emplace_back(s.substr(0, pos));
    if (pos == std::string_view::npos) break;
    s.remove_prefix(pos + 1);
  }
  return fields;
}

inline std::vector<std::string> splitlines(std::string_view s) {
  if (s.empty()) return {};
  if (s.back() == '\n') s.remove_suffix(1);
  return split(s, '\n');
}

inline bool iequals(std::string_view a, std::string_view b) {
  auto fold = [](unsigned char c) { return std::tolower(c); };
  return std::ranges::equal(a, b, {}, fold, fold);
}

}  // namespace util
