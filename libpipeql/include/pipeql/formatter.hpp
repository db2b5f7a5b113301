//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include "pipeql/defaults.hpp"

#include <span>
#include <string>
#include <string_view>

namespace pipeql {

/// Layout options of the formatter.
struct format_options {
  /// Number of spaces per indentation level when `use_spaces` is set.
  int indent_width = defaults::format::indent_width;
  /// Indent with spaces, otherwise with one tab per level.
  bool use_spaces = defaults::format::use_spaces;
  bool trim_trailing_whitespace = false;
  bool insert_final_newline = false;
  bool trim_final_newlines = false;

  friend auto operator==(const format_options&, const format_options&) -> bool
    = default;

  friend auto inspect(auto& f, format_options& x) {
    return f.object(x)
      .pretty_name("format_options")
      .fields(f.field("indent-width", x.indent_width),
              f.field("use-spaces", x.use_spaces),
              f.field("trim-trailing-whitespace", x.trim_trailing_whitespace),
              f.field("insert-final-newline", x.insert_final_newline),
              f.field("trim-final-newlines", x.trim_final_newlines));
  }
};

/// Renders a token sequence as a canonically laid out document. Formatting
/// never fails and is idempotent. The literal content of strings, comments
/// and regular expressions is emitted unchanged.
auto format_tokens(std::span<const token> tokens, const format_options& options)
  -> std::string;

/// Tokenizes and formats a document.
auto format_source(std::string_view source, const format_options& options = {})
  -> std::string;

} // namespace pipeql
