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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pipeql {

enum class token_kind : uint8_t {
  whitespace,
  newline,
  line_comment,
  delim_comment,
  string,
  regex,
  identifier,
  keyword,
  number,
  pipe,
  /// An operator of two or more characters, such as `::` or `...`.
  multi_char_operator,
  /// An operator of a single character, such as `+` or `/`.
  single_char_operator,
  /// Brackets and separators, and any byte that starts no other token.
  punctuation,
};

/// Returns a human-readable name of the kind.
auto describe(token_kind k) -> std::string_view;

template <class Inspector>
auto inspect(Inspector& f, token_kind& x) -> bool {
  auto get = [&x] {
    return static_cast<uint8_t>(x);
  };
  auto set = [&x](uint8_t value) {
    if (value > static_cast<uint8_t>(token_kind::punctuation)) {
      return false;
    }
    x = static_cast<token_kind>(value);
    return true;
  };
  return f.apply(get, set);
}

/// A classified slice of the source text.
struct token {
  token(token_kind kind, std::string literal)
    : kind{kind}, literal{std::move(literal)} {
  }

  token_kind kind;
  std::string literal;

  auto is_operator() const -> bool {
    return kind == token_kind::multi_char_operator
           || kind == token_kind::single_char_operator;
  }

  auto is_comment() const -> bool {
    return kind == token_kind::line_comment
           || kind == token_kind::delim_comment;
  }

  /// Returns true for punctuation or operator tokens with the given text.
  auto is(std::string_view text) const -> bool {
    return (kind == token_kind::punctuation || is_operator())
           && literal == text;
  }

  friend auto operator==(const token&, const token&) -> bool = default;

  friend auto inspect(auto& f, token& x) {
    return f.object(x)
      .pretty_name("token")
      .fields(f.field("kind", x.kind), f.field("literal", x.literal));
  }
};

/// Splits the content into tokens. The tokenization is total and lossless:
/// it never fails, and concatenating the literals of the result yields
/// `content` byte for byte, even for malformed input.
auto tokenize(std::string_view content) -> std::vector<token>;

/// Returns true if the word is a keyword, ignoring ASCII case.
auto is_keyword(std::string_view word) -> bool;

} // namespace pipeql

template <>
struct fmt::formatter<pipeql::token_kind> : fmt::formatter<std::string_view> {
  auto format(pipeql::token_kind x, format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(describe(x), ctx);
  }
};
