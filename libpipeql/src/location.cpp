//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/location.hpp"

namespace pipeql {

auto to_offset(std::string_view text, position pos) -> std::optional<size_t> {
  auto line_begin = size_t{0};
  for (auto line = size_t{0}; line < pos.line; ++line) {
    auto newline = text.find('\n', line_begin);
    if (newline == std::string_view::npos) {
      return std::nullopt;
    }
    line_begin = newline + 1;
  }
  auto line_end = text.find('\n', line_begin);
  if (line_end == std::string_view::npos) {
    line_end = text.size();
  }
  if (pos.column > line_end - line_begin) {
    return std::nullopt;
  }
  return line_begin + pos.column;
}

} // namespace pipeql
