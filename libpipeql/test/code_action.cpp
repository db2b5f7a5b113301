//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/code_action.hpp"

#include "pipeql/error.hpp"
#include "pipeql/migration.hpp"
#include "pipeql/test/test.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

using namespace pipeql;

namespace {

constexpr auto uri = std::string_view{"file:///tmp/pipeline.tql"};

auto make_range(size_t line, size_t begin, size_t end) -> range {
  return {{line, begin}, {line, end}};
}

auto request(std::string code, range where) -> diagnostic {
  return {
    .range = where,
    .severity = severity::warning,
    .code = std::move(code),
    .source = "pipeql",
    .message = "irrelevant",
  };
}

} // namespace

TEST("quick fix for a single diagnostic") {
  auto requested
    = std::vector{request("deprecated-yield", make_range(0, 0, 5))};
  auto actions = build_code_actions(uri, "yield x", requested);
  REQUIRE_EQUAL(actions.size(), 1u);
  const auto& action = actions[0];
  CHECK_EQUAL(action.title, "Replace with 'values'");
  CHECK_EQUAL(action.kind, code_action_kind::quick_fix);
  CHECK(action.is_preferred);
  REQUIRE_EQUAL(action.diagnostics.size(), 1u);
  CHECK_EQUAL(action.diagnostics[0].code, "deprecated-yield");
  REQUIRE_EQUAL(action.edit.changes.size(), 1u);
  auto it = action.edit.changes.find(std::string{uri});
  REQUIRE(it != action.edit.changes.end());
  REQUIRE_EQUAL(it->second.size(), 1u);
  CHECK_EQUAL(it->second[0].range, make_range(0, 0, 5));
  CHECK_EQUAL(it->second[0].new_text, "values");
}

TEST("diagnostics without a fix produce no action") {
  auto requested = std::vector{
    request("removed-crop", make_range(0, 0, 5)),
    request("deprecated-yield", make_range(0, 1, 6)),
    request("unknown", make_range(0, 0, 5)),
  };
  CHECK(build_code_actions(uri, "crop(x)", requested).empty());
}

TEST("fix-all action") {
  auto text = std::string_view{"yield x\nfunc f"};
  auto requested
    = std::vector{request("deprecated-func", make_range(1, 0, 4))};
  auto actions = build_code_actions(uri, text, requested);
  REQUIRE_EQUAL(actions.size(), 2u);
  CHECK_EQUAL(actions[0].kind, code_action_kind::quick_fix);
  CHECK_EQUAL(actions[0].title, "Replace with 'fn'");
  const auto& fix_all = actions[1];
  CHECK_EQUAL(fix_all.kind, code_action_kind::fix_all);
  CHECK_EQUAL(fix_all.title, "Fix all deprecated syntax");
  CHECK(not fix_all.is_preferred);
  REQUIRE_EQUAL(fix_all.diagnostics.size(), 2u);
  CHECK_EQUAL(fix_all.diagnostics[0].code, "deprecated-func");
  CHECK_EQUAL(fix_all.diagnostics[1].code, "deprecated-yield");
  const auto& edits = fix_all.edit.changes.at(std::string{uri});
  auto fixed = unbox(apply_edits(text, edits));
  CHECK_EQUAL(fixed, "values x\nfn f");
}

TEST("fix-all without requested diagnostics") {
  auto actions = build_code_actions(uri, "yield x\nyield y", {});
  REQUIRE_EQUAL(actions.size(), 1u);
  CHECK_EQUAL(actions[0].kind, code_action_kind::fix_all);
}

TEST("fix-all edits are ordered from the end of the document") {
  auto edits = fix_all_edits("yield a yield b\nfunc f");
  REQUIRE_EQUAL(edits.size(), 3u);
  CHECK_EQUAL(edits[0].range, make_range(1, 0, 4));
  CHECK_EQUAL(edits[1].range, make_range(0, 8, 13));
  CHECK_EQUAL(edits[2].range, make_range(0, 0, 5));
}

TEST("fix-all skips overlapping fixes") {
  auto text = std::string_view{"time('//x')"};
  auto scanned = scan_migrations(text);
  REQUIRE_EQUAL(scanned.size(), 2u);
  auto edits = fix_all_edits(text);
  REQUIRE_EQUAL(edits.size(), 1u);
  CHECK_EQUAL(edits[0].range, make_range(0, 6, 8));
  CHECK_EQUAL(edits[0].new_text, "--");
  CHECK_EQUAL(unbox(apply_edits(text, edits)), "time('--x')");
}

TEST("fix-all removes every fixable diagnostic") {
  auto text = std::string_view{
    "yield x\nfunc f => y // c\ngrep(/e/) | is(<int64>)\nparse_zson(s)"};
  auto fixed = unbox(apply_edits(text, fix_all_edits(text)));
  CHECK_EQUAL(fixed, "values x\nfn f into y -- c\ngrep('e', this) | "
                     "is(this, <int64>)\nparse_sup(s)");
  CHECK(scan_migrations(fixed).empty());
}

TEST("applying edits") {
  auto edits = std::vector<text_edit>{
    {make_range(1, 0, 1), "B"},
    {make_range(0, 1, 1), "x"},
  };
  CHECK_EQUAL(unbox(apply_edits("ab\ncd", edits)), "axb\nBd");
  CHECK_EQUAL(unbox(apply_edits("ab", {})), "ab");
}

TEST("applying invalid edits") {
  auto out_of_bounds = std::vector<text_edit>{{make_range(3, 0, 1), "x"}};
  auto result = apply_edits("ab", out_of_bounds);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::invalid_argument);
  auto past_end = std::vector<text_edit>{{make_range(0, 0, 3), "x"}};
  CHECK_ERROR(apply_edits("ab", past_end));
  auto inverted = std::vector<text_edit>{{make_range(0, 2, 1), "x"}};
  CHECK_ERROR(apply_edits("ab", inverted));
}

TEST("code action kinds") {
  CHECK_EQUAL(to_string(code_action_kind::quick_fix), "quickfix");
  CHECK_EQUAL(fmt::format("{}", code_action_kind::fix_all), "source.fixAll");
}
