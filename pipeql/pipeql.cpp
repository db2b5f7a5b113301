//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/code_action.hpp"
#include "pipeql/configuration.hpp"
#include "pipeql/defaults.hpp"
#include "pipeql/detail/add_message_types.hpp"
#include "pipeql/detail/load_contents.hpp"
#include "pipeql/detail/string.hpp"
#include "pipeql/diagnostics.hpp"
#include "pipeql/error.hpp"
#include "pipeql/formatter.hpp"
#include "pipeql/logger.hpp"
#include "pipeql/parser_error.hpp"
#include "pipeql/tokens.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace pipeql;

constexpr auto usage
  = "usage: pipeql <tokenize|format|check|fix> [options] [<file>...]";

constexpr auto commands
  = std::array<std::string_view, 4>{"tokenize", "format", "check", "fix"};

/// A parsed command line.
struct invocation {
  std::string command;
  caf::settings options;
  /// The input files. A `-` stands for standard input.
  std::vector<std::string> files;
};

auto make_options() -> caf::config_option_set {
  return caf::config_option_set{}
    .add<std::string>("config", "path to a configuration file")
    .add<int64_t>("indent-width", "number of spaces per indentation level")
    .add<bool>("use-tabs", "indent with tabs instead of spaces")
    .add<bool>("in-place", "rewrite the input files instead of printing")
    .add<std::string>("verbosity", "console verbosity (quiet, error, "
                                   "warning, info, verbose, debug, trace)")
    .add<bool>("help", "print this help text");
}

auto parse_command_line(const caf::config_option_set& options,
                        std::vector<std::string> args)
  -> caf::expected<invocation> {
  auto result = invocation{};
  auto option_args = std::vector<std::string>{};
  auto only_files = false;
  for (auto& arg : args) {
    if (only_files || arg == "-" || not arg.starts_with("-")) {
      if (result.command.empty()) {
        result.command = std::move(arg);
      } else {
        result.files.push_back(std::move(arg));
      }
    } else if (arg == "--") {
      only_files = true;
    } else {
      option_args.push_back(std::move(arg));
    }
  }
  auto [state, position] = options.parse(result.options, option_args);
  if (state != caf::pec::success) {
    return caf::make_error(ec::unrecognized_option,
                           fmt::format("failed to parse option `{}`: {}",
                                       *position, to_string(state)));
  }
  if (caf::get_or(result.options, "help", false)) {
    return result;
  }
  if (result.command.empty()) {
    return caf::make_error(ec::missing_subcommand, std::string{usage});
  }
  if (std::find(commands.begin(), commands.end(), result.command)
      == commands.end()) {
    return caf::make_error(ec::invalid_subcommand,
                           fmt::format("unknown command `{}`; {}",
                                       result.command, usage));
  }
  if (result.files.empty()) {
    result.files.emplace_back("-");
  }
  return result;
}

/// Determines the effective configuration: defaults, then the configuration
/// file, then the environment, then the command line.
auto make_configuration(const caf::settings& options)
  -> caf::expected<configuration> {
  auto result = configuration{};
  if (auto path = caf::get_if<std::string>(&options, "config")) {
    auto config = load_configuration(*path);
    if (not config) {
      return std::move(config.error());
    }
    result = std::move(*config);
  } else if (std::filesystem::exists(defaults::config_file)) {
    auto config = load_configuration(defaults::config_file);
    if (not config) {
      return std::move(config.error());
    }
    result = std::move(*config);
  }
  if (auto err = merge_environment(result)) {
    return err;
  }
  if (auto verbosity = caf::get_if<std::string>(&options, "verbosity")) {
    if (loglevel_to_int(*verbosity) < 0) {
      return caf::make_error(ec::invalid_argument,
                             fmt::format("invalid verbosity `{}`",
                                         *verbosity));
    }
    result.console_verbosity = *verbosity;
  }
  if (auto width = caf::get_if<int64_t>(&options, "indent-width")) {
    if (*width < 0) {
      return caf::make_error(ec::invalid_argument,
                             "`--indent-width` must not be negative");
    }
    result.format.indent_width = static_cast<int>(*width);
  }
  if (caf::get_or(options, "use-tabs", false)) {
    result.format.use_spaces = false;
  }
  return result;
}

auto read_input(const std::string& file) -> caf::expected<std::string> {
  if (file == "-") {
    PIPEQL_VERBOSE("reading standard input");
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
  }
  PIPEQL_VERBOSE("reading {}", file);
  return detail::load_contents(file);
}

/// Prints the result of a transformation, or writes it back to its file.
auto write_output(const std::string& file, std::string_view text,
                  bool in_place) -> caf::error {
  if (not in_place) {
    fmt::print("{}", text);
    return {};
  }
  if (file == "-") {
    return caf::make_error(ec::invalid_argument,
                           "`--in-place` requires a file argument");
  }
  PIPEQL_VERBOSE("writing {}", file);
  return detail::save_contents(file, text);
}

void print_tokens(std::string_view text) {
  for (const auto& tok : tokenize(text)) {
    fmt::print("{} {}\n", tok.kind, detail::control_char_escape(tok.literal));
  }
}

/// Prints the diagnostics of a document.
/// @returns the number of error diagnostics.
auto print_diagnostics(const std::string& file, std::string_view text)
  -> size_t {
  auto errors = size_t{0};
  for (const auto& diag : collect_diagnostics(text, std::nullopt)) {
    if (diag.severity == severity::error) {
      ++errors;
    }
    auto name = file == "-" ? std::string_view{"<stdin>"} : file;
    fmt::print("{}:{}:{}: {}[{}]: {}\n", name, diag.range.start.line + 1,
               diag.range.start.column + 1, diag.severity, diag.code,
               diag.message);
  }
  return errors;
}

auto run(const invocation& inv, const configuration& config) -> int {
  auto in_place = caf::get_or(inv.options, "in-place", false);
  auto result = EXIT_SUCCESS;
  for (const auto& file : inv.files) {
    auto text = read_input(file);
    if (not text) {
      PIPEQL_ERROR("{}", render(text.error()));
      result = EXIT_FAILURE;
      continue;
    }
    auto err = caf::error{};
    if (inv.command == "tokenize") {
      print_tokens(*text);
    } else if (inv.command == "format") {
      err = write_output(file, format_source(*text, config.format), in_place);
    } else if (inv.command == "check") {
      if (print_diagnostics(file, *text) > 0) {
        result = EXIT_FAILURE;
      }
    } else if (inv.command == "fix") {
      auto fixed = apply_edits(*text, fix_all_edits(*text));
      if (not fixed) {
        err = std::move(fixed.error());
      } else {
        err = write_output(file, *fixed, in_place);
      }
    }
    if (err) {
      PIPEQL_ERROR("{}: {}", file, render(err));
      result = EXIT_FAILURE;
    }
  }
  return result;
}

} // namespace

int main(int argc, char** argv) {
  using namespace pipeql;
  // Errors render through the meta objects, so they must exist before the
  // first error is created.
  detail::add_message_types();
  auto options = make_options();
  auto inv = parse_command_line(options,
                                std::vector<std::string>(argv + 1, argv + argc));
  if (not inv) {
    std::cerr << render(inv.error()) << std::endl;
    return EXIT_FAILURE;
  }
  if (caf::get_or(inv->options, "help", false)) {
    std::cout << usage << "\n\n" << options.help_text() << std::endl;
    return EXIT_SUCCESS;
  }
  auto config = make_configuration(inv->options);
  if (not config) {
    std::cerr << render(config.error()) << std::endl;
    return EXIT_FAILURE;
  }
  // Create log context as soon as we know the correct configuration.
  auto log_context = create_log_context(config->console_verbosity);
  if (not log_context) {
    std::cerr << render(log_context.error()) << std::endl;
    return EXIT_FAILURE;
  }
  PIPEQL_DEBUG("running `{}` on {} inputs", inv->command, inv->files.size());
  return run(*inv, *config);
}
