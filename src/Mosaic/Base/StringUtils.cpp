//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cctype>

#include <Mosaic/Base/StringUtils.h>

namespace mosaic::string_utils {

namespace {
  auto IsSpace(const char c) noexcept -> bool
  {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  }
} // namespace

auto Trim(std::string_view text) -> std::string_view
{
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto Split(std::string_view text, const char separator)
  -> std::vector<std::string_view>
{
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      fields.push_back(text.substr(start));
      break;
    }
    fields.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

auto IsAllDigits(std::string_view text) noexcept -> bool
{
  return !text.empty() && std::ranges::all_of(text, [](const char c) {
    return c >= '0' && c <= '9';
  });
}

auto ToLower(std::string_view text) -> std::string
{
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

auto Quote(std::string_view text) -> std::string
{
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (const char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

} // namespace mosaic::string_utils
