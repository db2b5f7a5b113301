//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/detail/string.hpp"

#include "pipeql/detail/assert.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace pipeql::detail {

std::vector<std::string_view>
split(std::string_view str, std::string_view sep, size_t max_splits) {
  PIPEQL_ASSERT(!sep.empty());
  if (str.empty())
    return {""};
  std::vector<std::string_view> out;
  auto it = str.begin();
  size_t splits = 0;
  while (it != str.end() && splits++ != max_splits) {
    auto next_sep = std::ranges::search(std::string_view{it, str.end()}, sep);
    out.emplace_back(it, next_sep.begin());
    it = next_sep.end();
    // Final char in `str` is a separator ->
    // add empty element
    if (!next_sep.empty() && it == str.end())
      out.emplace_back("");
  }
  if (it != str.end())
    out.emplace_back(it, str.end());
  return out;
}

std::string control_char_escape(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  auto out = std::back_inserter(result);
  for (auto c : str) {
    auto byte = static_cast<unsigned char>(c);
    switch (c) {
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\\':
        result += "\\\\";
        break;
      default:
        if (byte < 0x20 || byte >= 0x7f)
          fmt::format_to(out, "\\x{:02X}", byte);
        else
          result += c;
    }
  }
  return result;
}

std::string_view trim_back(std::string_view str, std::string_view chars) {
  auto last = str.find_last_not_of(chars);
  if (last == std::string_view::npos)
    return str.substr(0, 0);
  return str.substr(0, last + 1);
}

} // namespace pipeql::detail
