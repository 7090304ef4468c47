#include "vocab/token_pattern.h"

#include <algorithm>
#include <cctype>

namespace reentry {

bool MatchesTokenPattern(std::string_view value, std::string_view pattern) {
  if (pattern == "*") {
    return true;
  }
  if (!pattern.empty() && pattern.back() == '*') {
    const std::string_view prefix = pattern.substr(0, pattern.size() - 1);
    return value.size() >= prefix.size() &&
           value.substr(0, prefix.size()) == prefix;
  }
  if (!pattern.empty() && pattern.front() == '*') {
    const std::string_view suffix = pattern.substr(1);
    return value.size() >= suffix.size() &&
           value.substr(value.size() - suffix.size()) == suffix;
  }
  return value == pattern;
}

bool IsValidTokenPattern(std::string_view pattern, std::string* out_error) {
  auto fail = [&](const std::string& reason) {
    if (out_error != nullptr) {
      *out_error = "非法匹配模式 '" + std::string(pattern) + "': " + reason;
    }
    return false;
  };
  if (pattern.empty()) {
    return fail("模式为空");
  }
  const auto stars = std::count(pattern.begin(), pattern.end(), '*');
  if (stars > 1) {
    return fail("通配符 '*' 至多出现一次");
  }
  if (stars == 1 && pattern.front() != '*' && pattern.back() != '*') {
    return fail("通配符 '*' 只能位于首或尾");
  }
  for (const char ch : pattern) {
    if (ch == '*') {
      continue;
    }
    const bool allowed = std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
                         ch == '_' || ch == '.' || ch == '-';
    if (!allowed) {
      return fail(std::string("包含非法字符 '") + ch + "'");
    }
  }
  return true;
}

}  // namespace reentry
