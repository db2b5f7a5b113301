//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/error.hpp"

#include "pipeql/test/test.hpp"

using namespace std::string_literals;
using namespace pipeql;

TEST("error to_string") {
  auto str = [](auto x) {
    return to_string(x);
  };
  CHECK_EQUAL(str(ec::no_error), "no_error"s);
  CHECK_EQUAL(str(ec::unspecified), "unspecified"s);
  CHECK_EQUAL(str(ec::no_such_file), "no_such_file"s);
  CHECK_EQUAL(str(ec::filesystem_error), "filesystem_error"s);
  CHECK_EQUAL(str(ec::parse_error), "parse_error"s);
  CHECK_EQUAL(str(ec::invalid_argument), "invalid_argument"s);
  CHECK_EQUAL(str(ec::invalid_configuration), "invalid_configuration"s);
  CHECK_EQUAL(str(ec::unrecognized_option), "unrecognized_option"s);
  CHECK_EQUAL(str(ec::invalid_subcommand), "invalid_subcommand"s);
  CHECK_EQUAL(str(ec::missing_subcommand), "missing_subcommand"s);
}

TEST("render") {
  CHECK_EQUAL(render(caf::error{}), "");
  CHECK_EQUAL(render(caf::make_error(ec::unspecified)), "unspecified");
  CHECK_EQUAL(render(caf::make_error(ec::missing_subcommand, "usage")),
              "missing_subcommand: usage");
}

TEST("add context") {
  auto err = caf::make_error(ec::no_such_file, "no such file x.tql");
  CHECK_EQUAL(render(add_context(err, "failed to read {}", "x.tql")),
              "no_such_file: failed to read x.tql: no such file x.tql");
  CHECK(not add_context(caf::error{}, "unused"));
}
