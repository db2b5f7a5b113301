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
#include "pipeql/formatter.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace pipeql {

/// The settings of the `pipeql` tool.
struct configuration {
  format_options format = {};
  std::string console_verbosity
    = std::string{defaults::logger::console_verbosity};

  friend auto operator==(const configuration&, const configuration&) -> bool
    = default;

  friend auto inspect(auto& f, configuration& x) {
    return f.object(x)
      .pretty_name("configuration")
      .fields(f.field("format", x.format),
              f.field("console-verbosity", x.console_verbosity));
  }
};

/// Parses a configuration from YAML. All keys live below a top-level
/// `pipeql` key; keys that are missing keep their default value.
/// @returns the configuration, `ec::parse_error` for malformed YAML, or
/// `ec::invalid_configuration` for unknown keys and ill-typed values.
auto parse_configuration(std::string_view yaml) -> caf::expected<configuration>;

/// Loads and parses a configuration file.
auto load_configuration(const std::filesystem::path& path)
  -> caf::expected<configuration>;

/// Applies the `PIPEQL_CONSOLE_VERBOSITY` environment variable.
auto merge_environment(configuration& config) -> caf::error;

} // namespace pipeql
