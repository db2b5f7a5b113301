//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/parser_error.hpp"

#include "pipeql/defaults.hpp"
#include "pipeql/detail/assert.hpp"
#include "pipeql/detail/string.hpp"
#include "pipeql/logger.hpp"
#include "pipeql/migration.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace pipeql {

namespace {

constexpr auto position_patterns = std::array<std::string_view, 4>{
  R"(parse error at line (\d+), column (\d+))",
  R"(line (\d+), column (\d+))",
  R"(line (\d+):(\d+))",
  R"((\d+):(\d+))",
};

constexpr auto prefix_patterns = std::array<std::string_view, 5>{
  R"(error parsing at line \d+, column \d+: )",
  R"(parse error at line \d+, column \d+: )",
  R"(parse error: )",
  R"(line \d+:\d+: )",
  R"(\d+:\d+: )",
};

template <size_t N>
auto compile(const std::array<std::string_view, N>& patterns)
  -> std::vector<std::unique_ptr<re2::RE2>> {
  auto opts = re2::RE2::Options{re2::RE2::CannedOptions::Quiet};
  auto result = std::vector<std::unique_ptr<re2::RE2>>{};
  for (auto pattern : patterns) {
    auto& regex
      = result.emplace_back(std::make_unique<re2::RE2>(pattern, opts));
    PIPEQL_ASSERT(regex->ok(), pattern);
  }
  return result;
}

/// Extracts the zero-based position that an error message refers to.
auto extract_position(std::string_view message) -> position {
  static const auto patterns = compile(position_patterns);
  for (const auto& regex : patterns) {
    auto line = 0;
    auto column = 0;
    if (re2::RE2::PartialMatch(message, *regex, &line, &column)) {
      return {static_cast<size_t>(std::max(line - 1, 0)),
              static_cast<size_t>(std::max(column - 1, 0))};
    }
  }
  return {};
}

/// Removes position information from an error message.
auto clean_message(std::string_view message) -> std::string {
  static const auto patterns = compile(prefix_patterns);
  auto result = std::string{message};
  for (const auto& regex : patterns) {
    re2::RE2::GlobalReplace(&result, *regex, "");
  }
  auto first = result.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  return std::string{detail::trim_back(result, " \t\r\n").substr(first)};
}

auto is_whitespace(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/// Clamps a position to the document and extends it to the end of the word
/// it points at.
auto word_range(std::string_view text, position pos) -> range {
  auto lines = detail::split(text, "\n");
  PIPEQL_ASSERT(not lines.empty());
  auto line = std::min(pos.line, lines.size() - 1);
  auto content = lines[line];
  auto begin = std::min(pos.column, content.size());
  auto end = begin;
  while (end < content.size() && not is_whitespace(content[end])) {
    ++end;
  }
  // Highlight at least one character.
  if (end == begin) {
    ++end;
  }
  return {{line, begin}, {line, end}};
}

} // namespace

auto parser_error_to_diagnostic(std::string_view text,
                                std::string_view message) -> diagnostic {
  auto pos = extract_position(message);
  PIPEQL_DEBUG("parser error: `{}` refers to {}",
               detail::control_char_escape(message), pos);
  return {
    .range = word_range(text, pos),
    .severity = severity::error,
    .code = {},
    .source = std::string{defaults::diagnostic_source},
    .message = clean_message(message),
  };
}

auto collect_diagnostics(std::string_view text,
                         std::optional<std::string_view> parser_error)
  -> std::vector<diagnostic> {
  auto result = std::vector<diagnostic>{};
  if (parser_error) {
    result.push_back(parser_error_to_diagnostic(text, *parser_error));
  }
  for (auto& x : scan_migrations(text)) {
    result.push_back(std::move(x.diagnostic));
  }
  return result;
}

} // namespace pipeql
