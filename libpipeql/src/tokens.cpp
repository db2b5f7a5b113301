//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/tokens.hpp"

#include "pipeql/detail/assert.hpp"
#include "pipeql/logger.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <unordered_set>

namespace pipeql {

namespace {

using tk = token_kind;

auto is_digit(char c) -> bool {
  return c >= '0' && c <= '9';
}

auto is_hex_digit(char c) -> bool {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto is_letter(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_horizontal_space(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\r';
}

constexpr auto two_char_operators = std::array<std::string_view, 10>{
  ":=", "::", "->", "=>", "==", "!=", "<>", "<=", ">=", "!~",
};

constexpr auto single_char_operators = std::string_view{"+-*/%<>=!~"};

constexpr auto punctuation_chars = std::string_view{"()[]{},:;.?"};

/// A single left-to-right scan over the input. Every `scan_*` member either
/// consumes a prefix of the remaining input and appends exactly one token, or
/// consumes nothing and returns false.
class lexer {
public:
  explicit lexer(std::string_view content) : content_{content} {
  }

  auto run() && -> std::vector<token> {
    while (pos_ < content_.size()) {
      const auto start = pos_;
      auto matched = scan_newline() || scan_whitespace()
                     || scan_line_comment() || scan_delim_comment()
                     || scan_string() || scan_regex() || scan_pipe()
                     || scan_operator() || scan_number()
                     || scan_identifier();
      if (not matched) {
        // We could not classify the byte at `pos_`. Instead of failing, we
        // emit it as punctuation, which keeps the result lossless.
        emit(tk::punctuation, pos_ + 1);
      }
      PIPEQL_ASSERT(pos_ > start);
    }
    return std::move(result_);
  }

private:
  auto at(size_t offset = 0) const -> char {
    PIPEQL_ASSERT(pos_ + offset < content_.size());
    return content_[pos_ + offset];
  }

  auto remaining() const -> size_t {
    return content_.size() - pos_;
  }

  auto rest() const -> std::string_view {
    return content_.substr(pos_);
  }

  void emit(token_kind kind, size_t end) {
    result_.emplace_back(kind, std::string{content_.substr(pos_, end - pos_)});
    pos_ = end;
  }

  auto scan_newline() -> bool {
    if (at() != '\n') {
      return false;
    }
    emit(tk::newline, pos_ + 1);
    return true;
  }

  auto scan_whitespace() -> bool {
    auto end = pos_;
    while (end < content_.size() && is_horizontal_space(content_[end])) {
      ++end;
    }
    if (end == pos_) {
      return false;
    }
    emit(tk::whitespace, end);
    return true;
  }

  auto scan_line_comment() -> bool {
    if (not rest().starts_with("--")) {
      return false;
    }
    auto end = content_.find('\n', pos_);
    if (end == std::string_view::npos) {
      end = content_.size();
    }
    emit(tk::line_comment, end);
    return true;
  }

  auto scan_delim_comment() -> bool {
    if (not rest().starts_with("/*")) {
      return false;
    }
    auto close = content_.find("*/", pos_ + 2);
    // A non-terminated comment extends to the end of the input.
    auto end = close == std::string_view::npos ? content_.size() : close + 2;
    emit(tk::delim_comment, end);
    return true;
  }

  auto scan_string() -> bool {
    auto quote_offset = size_t{0};
    if ((at() == 'f' || at() == 'r') && remaining() > 1
        && (at(1) == '"' || at(1) == '\'')) {
      quote_offset = 1;
    } else if (at() != '"' && at() != '\'') {
      return false;
    }
    const auto quote = at(quote_offset);
    auto end = pos_ + quote_offset + 1;
    while (end < content_.size() && content_[end] != quote) {
      // A backslash escapes whatever byte follows it.
      end += content_[end] == '\\' && end + 1 < content_.size() ? 2 : 1;
    }
    // A non-terminated string extends to the end of the input.
    if (end < content_.size()) {
      ++end;
    }
    emit(tk::string, end);
    return true;
  }

  /// Returns true if a value may follow the last token, which makes a `/`
  /// the start of a regular expression rather than a division.
  auto can_start_regex() const -> bool {
    if (result_.empty()) {
      return true;
    }
    const auto& last = result_.back();
    switch (last.kind) {
      case tk::whitespace:
      case tk::newline:
      case tk::pipe:
      case tk::multi_char_operator:
      case tk::single_char_operator:
      case tk::keyword:
        return true;
      case tk::punctuation:
        return last.literal == "(" || last.literal == "["
               || last.literal == "," || last.literal == ":";
      default:
        return false;
    }
  }

  auto scan_regex() -> bool {
    if (at() != '/' || not can_start_regex()) {
      return false;
    }
    auto end = pos_ + 1;
    while (end < content_.size() && content_[end] != '/'
           && content_[end] != '\n') {
      end += content_[end] == '\\' && end + 1 < content_.size() ? 2 : 1;
    }
    if (end < content_.size() && content_[end] == '/') {
      emit(tk::regex, end + 1);
      return true;
    }
    // Without a closing slash on the same line, the `/` is a division. The
    // caller continues with the operator scanners at the same position.
    PIPEQL_TRACE("lexer: no regex terminator for `/` at offset {}", pos_);
    return false;
  }

  auto scan_pipe() -> bool {
    if (at() != '|') {
      return false;
    }
    if (rest().starts_with("|>")) {
      emit(tk::pipe, pos_ + 2);
    } else if (rest().starts_with("||")) {
      emit(tk::multi_char_operator, pos_ + 2);
    } else {
      emit(tk::pipe, pos_ + 1);
    }
    return true;
  }

  auto scan_operator() -> bool {
    if (rest().starts_with("...")) {
      emit(tk::multi_char_operator, pos_ + 3);
      return true;
    }
    const auto two = rest().substr(0, 2);
    if (std::ranges::find(two_char_operators, two)
        != two_char_operators.end()) {
      emit(tk::multi_char_operator, pos_ + 2);
      return true;
    }
    if (single_char_operators.find(at()) != std::string_view::npos) {
      emit(tk::single_char_operator, pos_ + 1);
      return true;
    }
    if (punctuation_chars.find(at()) != std::string_view::npos) {
      emit(tk::punctuation, pos_ + 1);
      return true;
    }
    return false;
  }

  auto scan_number() -> bool {
    if (not is_digit(at())) {
      return false;
    }
    auto end = pos_;
    auto current = [&] {
      return end < content_.size() ? content_[end] : '\0';
    };
    if (at() == '0' && remaining() > 1 && (at(1) == 'x' || at(1) == 'X')) {
      end += 2;
      while (end < content_.size() && is_hex_digit(content_[end])) {
        ++end;
      }
    } else {
      while (end < content_.size()
             && (is_digit(content_[end]) || content_[end] == '.')) {
        ++end;
      }
      if (current() == 'e' || current() == 'E') {
        ++end;
        if (current() == '+' || current() == '-') {
          ++end;
        }
        while (end < content_.size() && is_digit(content_[end])) {
          ++end;
        }
      }
    }
    // Unit suffixes such as in `10ms` or `5GiB` are part of the number.
    while (end < content_.size() && is_letter(content_[end])) {
      ++end;
    }
    emit(tk::number, end);
    return true;
  }

  auto scan_identifier() -> bool {
    auto end = pos_ + 1;
    if (at() == '`') {
      while (end < content_.size() && content_[end] != '`') {
        ++end;
      }
      if (end < content_.size()) {
        ++end;
      }
      emit(tk::identifier, end);
      return true;
    }
    if (not is_letter(at()) && at() != '_') {
      return false;
    }
    while (end < content_.size()
           && (is_letter(content_[end]) || is_digit(content_[end])
               || content_[end] == '_')) {
      ++end;
    }
    auto word = content_.substr(pos_, end - pos_);
    emit(is_keyword(word) ? tk::keyword : tk::identifier, end);
    return true;
  }

  std::string_view content_;
  size_t pos_ = 0;
  std::vector<token> result_;
};

} // namespace

auto tokenize(std::string_view content) -> std::vector<token> {
  auto result = lexer{content}.run();
  PIPEQL_DEBUG("lexer: split {} bytes into {} tokens", content.size(),
               result.size());
  return result;
}

auto is_keyword(std::string_view word) -> bool {
  static const auto keywords = std::unordered_set<std::string_view>{
    "select", "from",  "where", "group",    "by",     "having", "order",
    "limit",  "offset", "with", "join",     "inner",  "left",   "right",
    "outer",  "full",  "cross", "anti",     "on",     "using",  "and",
    "or",     "not",   "in",    "like",     "is",     "between", "case",
    "when",   "then",  "else",  "end",      "as",     "distinct", "all",
    "union",  "const", "fn",    "op",       "type",   "let",    "true",
    "false",  "null",  "asc",   "desc",
  };
  auto lower = std::string{word};
  std::ranges::transform(lower, lower.begin(), [](char c) {
    return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
  });
  return keywords.contains(lower);
}

auto describe(token_kind k) -> std::string_view {
  using enum token_kind;
#define X(x, y)                                                                \
  case x:                                                                      \
    return y
  switch (k) {
    X(whitespace, "whitespace");
    X(newline, "newline");
    X(line_comment, "line comment");
    X(delim_comment, "block comment");
    X(string, "string");
    X(regex, "regex");
    X(identifier, "identifier");
    X(keyword, "keyword");
    X(number, "number");
    X(pipe, "pipe");
    X(multi_char_operator, "operator");
    X(single_char_operator, "operator");
    X(punctuation, "punctuation");
  }
#undef X
  PIPEQL_UNREACHABLE();
}

} // namespace pipeql
