//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/formatter.hpp"

#include "pipeql/detail/string.hpp"
#include "pipeql/test/test.hpp"
#include "pipeql/tokens.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

using namespace pipeql;

namespace {

const auto corpus = std::vector<std::string>{
  "from test | where x > 1 | count()",
  "values {a:1,b:[1,2]}",
  "-- header\nfrom 'file.json'\n| put y := x * 2 -- trailing\n| sort y desc",
  "fn add(a, b): a + b",
  "op filter(): (\n  where x\n)",
  "select a, b from t where c like 'x%' order by a asc limit 10",
  "yield {x: 1} => out",
  "x::int64 | this.a.b",
  "f(\n  g(\n    1,\n    2\n  )\n)",
  "unknown @ # $ bytes",
  "from test\n    | where x\n    | head 10",
  "a+b*c-d/e",
  "  )) x",
  "search 'a   b' | grep(/x  y/) /* keep   this */",
  "where x/(y/2\n+ z)",
  "a/[b/c\nd]",
  "x/(y/2\n| z)",
  "f(a,/x\n)",
};

auto count_pipe_lines(std::string_view text) -> size_t {
  auto result = size_t{0};
  for (auto line : detail::split(text, "\n")) {
    auto first = line.find_first_not_of(" \t");
    if (first != std::string_view::npos && line[first] == '|') {
      ++result;
    }
  }
  return result;
}

} // namespace

TEST("pipes start a new line") {
  CHECK_EQUAL(format_source("from   test  |   count()"),
              "from test\n| count()");
}

TEST("comments are preserved") {
  CHECK_EQUAL(format_source("-- comment\nfrom test"), "-- comment\nfrom test");
  CHECK_EQUAL(format_source("from test    -- a  b"), "from test -- a  b");
}

TEST("records and lists") {
  CHECK_EQUAL(format_source("values {a:1,b:[1,2]}"),
              "values {a: 1, b: [1, 2]}");
  CHECK_EQUAL(format_source("values {\na: 1,\nb: 2\n}"),
              "values {\n  a: 1,\n  b: 2\n}");
}

TEST("operators") {
  CHECK_EQUAL(format_source("where x==1 and y>2"),
              "where x == 1 and y > 2");
  CHECK_EQUAL(format_source("a+b*c"), "a + b * c");
  CHECK_EQUAL(format_source("f(a ,b)"), "f(a , b)");
  CHECK_EQUAL(format_source("x :: int64"), "x :: int64");
  CHECK_EQUAL(format_source("x::int64"), "x::int64");
  CHECK_EQUAL(format_source("this.a.b"), "this.a.b");
}

TEST("division keeps its source spacing") {
  CHECK_EQUAL(format_source("where x/(y/2\n+ z)"), "where x/(y/2\n  + z)");
  CHECK_EQUAL(format_source("a/[b/c\nd]"), "a/[b/c\n  d]");
  CHECK_EQUAL(format_source("a / b"), "a / b");
  CHECK_EQUAL(format_source("a  /  b"), "a / b");
  // Spacing the first division would make the line lex as a regex.
  auto tokens = tokenize(format_source("x/(y/2\n| z)"));
  auto divisions = std::ranges::count_if(tokens, [](const token& tok) {
    return tok.kind == token_kind::single_char_operator && tok.literal == "/";
  });
  CHECK_EQUAL(divisions, std::ptrdiff_t{2});
  CHECK(std::ranges::none_of(tokens, [](const token& tok) {
    return tok.kind == token_kind::regex;
  }));
}

TEST("indentation with tabs") {
  auto options = format_options{};
  options.use_spaces = false;
  CHECK_EQUAL(format_source("f(\nx\n)", options), "f(\n\tx\n)");
}

TEST("indentation width") {
  auto options = format_options{};
  options.indent_width = 4;
  CHECK_EQUAL(format_source("f(\nx\n)", options), "f(\n    x\n)");
}

TEST("unmatched closing brackets") {
  CHECK_EQUAL(format_source("  )) x"), ")) x");
  CHECK_EQUAL(format_source("))\n(\nx"), "))\n(\n  x");
}

TEST("final newlines") {
  auto options = format_options{};
  options.trim_final_newlines = true;
  CHECK_EQUAL(format_source("from test\n\n\n", options), "from test");
  options.insert_final_newline = true;
  CHECK_EQUAL(format_source("from test\n\n\n", options), "from test\n");
  options.trim_final_newlines = false;
  CHECK_EQUAL(format_source("from test", options), "from test\n");
  CHECK_EQUAL(format_source("from test\n\n", options), "from test\n\n");
}

TEST("trailing whitespace") {
  auto options = format_options{};
  CHECK_EQUAL(format_source("a |\nb", options), "a\n| \nb");
  options.trim_trailing_whitespace = true;
  CHECK_EQUAL(format_source("a |\nb", options), "a\n|\nb");
  CHECK_EQUAL(format_source("-- x  \r\ny", options), "-- x\ny");
  CHECK_EQUAL(format_source("f(x  \n)", options), "f(x\n)");
}

TEST("trimming leaves multi-line literals alone") {
  auto options = format_options{};
  options.trim_trailing_whitespace = true;
  CHECK_EQUAL(format_source("x = 'a  \nb'", options), "x = 'a  \nb'");
  CHECK_EQUAL(format_source("/* a  \n b */", options), "/* a  \n b */");
  CHECK_EQUAL(format_source("x = 'a  \nb' |\ny", options),
              "x = 'a  \nb'\n|\ny");
}

TEST("empty input") {
  CHECK_EQUAL(format_source(""), "");
  auto options = format_options{};
  options.insert_final_newline = true;
  CHECK_EQUAL(format_source("", options), "\n");
}

TEST("formatting is idempotent") {
  for (const auto& input : corpus) {
    auto once = format_source(input);
    CHECK_EQUAL(format_source(once), once);
  }
}

TEST("every pipe starts a line") {
  for (const auto& input : corpus) {
    auto pipes = std::ranges::count_if(tokenize(input), [](const token& tok) {
      return tok.kind == token_kind::pipe;
    });
    auto lines = count_pipe_lines(format_source(input));
    CHECK_GREATER_EQUAL(lines, static_cast<size_t>(pipes));
  }
}

TEST("literals are never rewritten") {
  auto input
    = std::string{"search 'a   b' | grep(/x  y/) /* keep   this */ -- c   d"};
  auto output = format_source(input);
  for (const auto& tok : tokenize(input)) {
    if (tok.kind == token_kind::string || tok.kind == token_kind::regex
        || tok.is_comment()) {
      CHECK(output.find(tok.literal) != std::string::npos);
    }
  }
}

TEST("formatting tokens directly") {
  auto tokens = std::vector<token>{
    {token_kind::identifier, "a"},
    {token_kind::pipe, "|"},
    {token_kind::identifier, "b"},
  };
  CHECK_EQUAL(format_tokens(tokens, format_options{}), "a\n| b");
}
