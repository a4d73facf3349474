/** LICENSE TEMPLATE */
#pragma once
// stdlib
#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <vector>

namespace bidpop {

template <typename Delimiter = std::string_view>
constexpr std::vector<std::string_view>
SplitString(std::string_view str, Delimiter delim) noexcept
{
  std::vector<std::string_view> result{};
  auto last = false;
  for (auto i = str.find(delim); i != std::string_view::npos || !last; i = str.find(delim)) {
    last = (i == std::string_view::npos);
    auto sub = str.substr(0, i);
    if (!sub.empty()) {
      result.push_back(sub);
    }
    if (!last) {
      str.remove_prefix(i + 1);
    }
  }
  return result;
}

template <typename CA, typename CB = CA>
constexpr auto
CopyTo(const CA &c, CB &out)
{
  if constexpr (requires(CA i, CB o) {
                  i.size();
                  o.reserve(1024);
                  out.size();
                }) {
    out.reserve(c.size() + out.size());
    std::copy(c.begin(), c.end(), std::back_inserter(out));
  } else {
    auto index = 0;
    while (index < out.size() && index < c.size()) {
      out[index] = c[index];
      ++index;
    }
  }
}

constexpr std::string_view
TrimLeadingWhitespace(std::string_view str) noexcept
{
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  return str;
}

constexpr bool
IsHexDigit(char c) noexcept
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // namespace bidpop
