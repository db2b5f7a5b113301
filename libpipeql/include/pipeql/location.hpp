//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include <fmt/format.h>

#include <compare>
#include <cstddef>
#include <optional>
#include <string_view>

namespace pipeql {

/// A zero-indexed position within a document. The column counts UTF-8 bytes
/// from the start of the line, which is the addressing convention of the
/// editor protocol.
struct position {
  size_t line = 0;
  size_t column = 0;

  auto operator<=>(const position&) const = default;

  friend auto inspect(auto& f, position& x) {
    return f.object(x)
      .pretty_name("position")
      .fields(f.field("line", x.line), f.field("column", x.column));
  }
};

/// A half-open range `[start, end)` of positions.
struct range {
  position start;
  position end;

  auto operator<=>(const range&) const = default;

  /// Returns true if the two ranges share at least one byte.
  auto overlaps(const range& other) const -> bool {
    return start < other.end && other.start < end;
  }

  friend auto inspect(auto& f, range& x) {
    return f.object(x)
      .pretty_name("range")
      .fields(f.field("start", x.start), f.field("end", x.end));
  }
};

/// Translates a position into a byte offset into *text*.
/// @returns `std::nullopt` if the line does not exist or the column lies past
/// the end of the line.
auto to_offset(std::string_view text, position pos) -> std::optional<size_t>;

} // namespace pipeql

template <>
struct fmt::formatter<pipeql::position> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const pipeql::position& x, format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}:{}", x.line, x.column);
  }
};

template <>
struct fmt::formatter<pipeql::range> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const pipeql::range& x, format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}-{}", x.start, x.end);
  }
};
