//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/detail/add_message_types.hpp"
#include "pipeql/error.hpp"
#include "pipeql/logger.hpp"
#include "pipeql/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <caf/test/runner.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  (void)::setenv("PIPEQL_ABORT_ON_PANIC", "1", 1);
  std::string pipeql_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(pipeql_loglevel, "pipeql-verbosity",
                          "console verbosity for libpipeql")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    pipeql::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
    // CAF must not see our own arguments.
    argc -= static_cast<int>(test_args.size()) + 1;
  }
  pipeql::detail::add_message_types();
  auto log_context = pipeql::create_log_context(pipeql_loglevel);
  if (!log_context) {
    std::cerr << pipeql::render(log_context.error()) << std::endl;
    return EXIT_FAILURE;
  }
  // Run the unit tests.
  return caf::test::runner{}.run(argc, argv);
}
