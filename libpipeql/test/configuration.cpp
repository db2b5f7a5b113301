//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/configuration.hpp"

#include "pipeql/error.hpp"
#include "pipeql/test/test.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace pipeql;

namespace {

auto config_error(std::string_view yaml) -> caf::error {
  auto result = parse_configuration(yaml);
  if (result) {
    return {};
  }
  return result.error();
}

} // namespace

TEST("empty configuration") {
  auto config = unbox(parse_configuration(""));
  CHECK_EQUAL(config, configuration{});
  CHECK_EQUAL(config.format.indent_width, 2);
  CHECK(config.format.use_spaces);
  CHECK_EQUAL(config.console_verbosity, "warning");
  CHECK_EQUAL(unbox(parse_configuration("pipeql:")), configuration{});
}

TEST("full configuration") {
  auto config = unbox(parse_configuration(R"__(
pipeql:
  console-verbosity: info
  format:
    indent-width: 8
    use-spaces: false
    trim-trailing-whitespace: true
    insert-final-newline: true
    trim-final-newlines: true
)__"));
  CHECK_EQUAL(config.console_verbosity, "info");
  CHECK_EQUAL(config.format.indent_width, 8);
  CHECK(not config.format.use_spaces);
  CHECK(config.format.trim_trailing_whitespace);
  CHECK(config.format.insert_final_newline);
  CHECK(config.format.trim_final_newlines);
}

TEST("partial configuration keeps defaults") {
  auto config = unbox(parse_configuration("pipeql:\n"
                                          "  format:\n"
                                          "    insert-final-newline: yes\n"));
  auto expected = configuration{};
  expected.format.insert_final_newline = true;
  CHECK_EQUAL(config, expected);
}

TEST("invalid configuration") {
  CHECK_EQUAL(config_error("foo: 1"), ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  foo: 1"), ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  format:\n    tabs: 1"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  format:\n    indent-width: -1"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  format:\n    indent-width: two"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  format:\n    use-spaces: maybe"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  format: [1, 2]"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("pipeql:\n  console-verbosity: loud"),
              ec::invalid_configuration);
  CHECK_EQUAL(config_error("- pipeql"), ec::invalid_configuration);
}

TEST("malformed YAML") {
  auto err = config_error("pipeql: [");
  CHECK_EQUAL(err, ec::parse_error);
  CHECK(render(err).starts_with("parse_error: failed to parse YAML at"));
}

TEST("loading a configuration file") {
  auto path = std::filesystem::path{test::data_dir} / "pipeql.yaml";
  auto config = unbox(load_configuration(path));
  CHECK_EQUAL(config.console_verbosity, "debug");
  CHECK_EQUAL(config.format.indent_width, 4);
  CHECK(config.format.use_spaces);
  CHECK(config.format.trim_trailing_whitespace);
  CHECK(config.format.insert_final_newline);
  CHECK(not config.format.trim_final_newlines);
}

TEST("loading a missing configuration file") {
  auto path = std::filesystem::path{test::data_dir} / "missing.yaml";
  auto result = load_configuration(path);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::no_such_file);
  CHECK(render(result.error()).starts_with("no_such_file: failed to read"));
}

TEST("environment overrides the verbosity") {
  auto config = configuration{};
  REQUIRE_EQUAL(::setenv("PIPEQL_CONSOLE_VERBOSITY", "trace", 1), 0);
  CHECK_EQUAL(merge_environment(config), caf::error{});
  CHECK_EQUAL(config.console_verbosity, "trace");
  REQUIRE_EQUAL(::setenv("PIPEQL_CONSOLE_VERBOSITY", "loud", 1), 0);
  CHECK_EQUAL(merge_environment(config), ec::invalid_configuration);
  CHECK_EQUAL(config.console_verbosity, "trace");
  REQUIRE_EQUAL(::unsetenv("PIPEQL_CONSOLE_VERBOSITY"), 0);
  config = configuration{};
  CHECK_EQUAL(merge_environment(config), caf::error{});
  CHECK_EQUAL(config, configuration{});
}
