//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/formatter.hpp"

#include "pipeql/logger.hpp"
#include "pipeql/tokens.hpp"

#include <string>
#include <string_view>

namespace pipeql {

namespace {

/// Context for tracking formatting state during token processing.
class format_context {
public:
  explicit format_context(const format_options& options) : options_{options} {
  }

  auto options() const -> const format_options& {
    return options_;
  }

  /// Increase indentation by one level.
  auto indent() -> void {
    ++indent_level_;
  }

  /// Decrease indentation by one level.
  auto dedent() -> void {
    if (indent_level_ > 0) {
      --indent_level_;
    }
  }

  /// Get current indentation string.
  auto current_indent() const -> std::string {
    if (not options_.use_spaces) {
      return std::string(indent_level_, '\t');
    }
    auto width = options_.indent_width > 0
                   ? static_cast<size_t>(options_.indent_width)
                   : size_t{0};
    return std::string(indent_level_ * width, ' ');
  }

  /// Check if we're at the start of a line.
  auto at_line_start() const -> bool {
    return at_line_start_;
  }

  /// Mark that we're no longer at line start.
  auto mark_content() -> void {
    at_line_start_ = false;
  }

  /// Mark that we're at the start of a new line.
  auto mark_line_start() -> void {
    at_line_start_ = true;
  }

private:
  const format_options& options_;
  size_t indent_level_ = 0;
  bool at_line_start_ = true;
};

/// Helper class to build formatted output efficiently.
class output_builder {
public:
  explicit output_builder(format_context& ctx) : ctx_{ctx} {
  }

  /// Add text to output, indented if it starts a line.
  auto add(std::string_view text) -> void {
    if (text.empty()) {
      return;
    }
    if (ctx_.at_line_start()) {
      output_ += ctx_.current_indent();
      ctx_.mark_content();
    }
    output_ += text;
  }

  /// Add a newline and mark line start.
  auto newline() -> void {
    if (ctx_.options().trim_trailing_whitespace) {
      trim_line_end();
    }
    output_ += '\n';
    ctx_.mark_line_start();
  }

  /// Add a space unless at line start or right after another space.
  auto space() -> void {
    if (not ctx_.at_line_start() && not output_.ends_with(' ')) {
      output_ += ' ';
    }
  }

  /// Remove blanks at the end of the current line.
  auto trim_line_end() -> void {
    auto last = output_.find_last_not_of(" \t\r");
    output_.erase(last == std::string::npos ? 0 : last + 1);
  }

  /// Get the final formatted string.
  auto str() && -> std::string {
    return std::move(output_);
  }

private:
  std::string output_;
  format_context& ctx_;
};

auto opens_nesting(const token& tok) -> bool {
  return tok.kind == token_kind::punctuation
         && (tok.literal == "(" || tok.literal == "[" || tok.literal == "{");
}

auto closes_nesting(const token& tok) -> bool {
  return tok.kind == token_kind::punctuation
         && (tok.literal == ")" || tok.literal == "]" || tok.literal == "}");
}

/// Operators that bind their operands without surrounding space.
auto is_tight(const token& tok) -> bool {
  return tok.is(".") || tok.is("...") || tok.is("::") || tok.is("->");
}

/// A division keeps the blanks of the source around it. Adding a blank in
/// front of it would make the next tokenization read it as the start of a
/// regex.
auto is_division(const token& tok) -> bool {
  return tok.kind == token_kind::single_char_operator && tok.literal == "/";
}

/// Check if a value following `prev` is already separated from it.
auto suppresses_space_before_value(const token& prev) -> bool {
  using enum token_kind;
  switch (prev.kind) {
    case whitespace:
    case newline:
    case pipe:
      return true;
    default:
      return opens_nesting(prev) || prev.is(":") || is_tight(prev)
             || is_division(prev);
  }
}

/// Check if an operator followed by `next` should be followed by a space.
auto wants_space_after_operator(const token* next) -> bool {
  if (next == nullptr) {
    return false;
  }
  if (next->kind == token_kind::newline
      || next->kind == token_kind::whitespace) {
    return false;
  }
  return not closes_nesting(*next) && not next->is(",");
}

/// Normalizes the newlines at the end of the output.
auto finish(std::string output, const format_options& options)
  -> std::string {
  if (options.trim_final_newlines) {
    while (output.ends_with('\n')) {
      output.pop_back();
    }
  }
  if (options.insert_final_newline && not output.ends_with('\n')) {
    output += '\n';
  }
  return output;
}

} // namespace

auto format_tokens(std::span<const token> tokens, const format_options& options)
  -> std::string {
  auto ctx = format_context{options};
  auto builder = output_builder{ctx};
  for (auto i = size_t{0}; i < tokens.size(); ++i) {
    const auto& tok = tokens[i];
    const auto* prev = i > 0 ? &tokens[i - 1] : nullptr;
    const auto* next = i + 1 < tokens.size() ? &tokens[i + 1] : nullptr;
    using enum token_kind;
    switch (tok.kind) {
      case newline:
        builder.newline();
        continue;
      case whitespace: {
        // We control the layout, so every run of blanks becomes at most one
        // space. Indentation is recomputed and blanks at the end of a line
        // or around a pipe disappear.
        if (ctx.at_line_start() || next == nullptr) {
          continue;
        }
        if (prev != nullptr && prev->kind == pipe) {
          continue;
        }
        if (next->kind == newline || next->kind == pipe) {
          continue;
        }
        builder.space();
        continue;
      }
      case line_comment:
      case delim_comment:
        builder.add(tok.literal);
        continue;
      case pipe:
        if (not ctx.at_line_start()) {
          builder.newline();
        }
        builder.add(tok.literal);
        builder.space();
        continue;
      case identifier:
      case keyword:
      case number:
      case string:
      case regex:
        if (prev != nullptr && not suppresses_space_before_value(*prev)) {
          builder.space();
        }
        builder.add(tok.literal);
        continue;
      case multi_char_operator:
      case single_char_operator:
      case punctuation:
        break;
    }
    if (is_tight(tok) || is_division(tok)) {
      builder.add(tok.literal);
    } else if (tok.is_operator()) {
      if (prev == nullptr || not opens_nesting(*prev)) {
        builder.space();
      }
      builder.add(tok.literal);
      if (wants_space_after_operator(next)) {
        builder.space();
      }
    } else if (opens_nesting(tok)) {
      builder.add(tok.literal);
      ctx.indent();
    } else if (closes_nesting(tok)) {
      ctx.dedent();
      builder.add(tok.literal);
    } else if (tok.is(",")) {
      builder.add(tok.literal);
      if (next != nullptr && next->kind != newline) {
        builder.space();
      }
    } else if (tok.is(":")) {
      builder.add(tok.literal);
      // Record fields render as `name: value`.
      auto is_field_name = prev != nullptr
                           && (prev->kind == identifier || prev->kind == string);
      if (is_field_name && next != nullptr && next->kind != newline) {
        builder.space();
      }
    } else {
      builder.add(tok.literal);
    }
  }
  // Multi-line strings and block comments may end in blanks that are part of
  // their content.
  if (options.trim_trailing_whitespace
      && (tokens.empty()
          || (tokens.back().kind != token_kind::string
              && tokens.back().kind != token_kind::delim_comment))) {
    builder.trim_line_end();
  }
  auto result = finish(std::move(builder).str(), options);
  PIPEQL_DEBUG("formatter: rendered {} tokens into {} bytes", tokens.size(),
               result.size());
  return result;
}

auto format_source(std::string_view source, const format_options& options)
  -> std::string {
  auto tokens = tokenize(source);
  return format_tokens(tokens, options);
}

} // namespace pipeql
