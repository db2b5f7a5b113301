//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/configuration.hpp"

#include "pipeql/detail/load_contents.hpp"
#include "pipeql/error.hpp"
#include "pipeql/logger.hpp"

#include <caf/none.hpp>
#include <fmt/format.h>
#include <fmt/std.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace pipeql {

namespace {

template <class T>
auto get(const YAML::Node& node, std::string_view key) -> caf::expected<T> {
  if (not node.IsScalar()) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("`{}` must be a scalar value", key));
  }
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion&) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid value `{}` for `{}`",
                                       node.Scalar(), key));
  }
}

auto check_verbosity(const std::string& verbosity) -> caf::error {
  if (loglevel_to_int(verbosity) < 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid verbosity `{}`", verbosity));
  }
  return caf::none;
}

auto parse_format(const YAML::Node& node, format_options& result)
  -> caf::error {
  if (node.IsNull()) {
    return caf::none;
  }
  if (not node.IsMap()) {
    return caf::make_error(ec::invalid_configuration,
                           "`pipeql.format` must be a map");
  }
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    auto qualified = fmt::format("pipeql.format.{}", key);
    auto assign = [&]<class T>(T& field) -> caf::error {
      auto value = get<T>(pair.second, qualified);
      if (not value) {
        return std::move(value.error());
      }
      field = *value;
      return caf::none;
    };
    auto err = caf::error{};
    if (key == "indent-width") {
      err = assign(result.indent_width);
      if (not err && result.indent_width < 0) {
        err = caf::make_error(ec::invalid_configuration,
                              fmt::format("`{}` must not be negative",
                                          qualified));
      }
    } else if (key == "use-spaces") {
      err = assign(result.use_spaces);
    } else if (key == "trim-trailing-whitespace") {
      err = assign(result.trim_trailing_whitespace);
    } else if (key == "insert-final-newline") {
      err = assign(result.insert_final_newline);
    } else if (key == "trim-final-newlines") {
      err = assign(result.trim_final_newlines);
    } else {
      err = caf::make_error(ec::invalid_configuration,
                            fmt::format("unknown key `{}`", qualified));
    }
    if (err) {
      return err;
    }
  }
  return caf::none;
}

auto parse_root(const YAML::Node& root) -> caf::expected<configuration> {
  auto result = configuration{};
  // Skip empty documents.
  if (root.IsNull()) {
    return result;
  }
  if (not root.IsMap()) {
    return caf::make_error(ec::invalid_configuration,
                           "configuration is not a map of key-value pairs");
  }
  for (const auto& top : root) {
    auto key = top.first.as<std::string>();
    if (key != "pipeql") {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("unknown key `{}`", key));
    }
    const auto& node = top.second;
    if (node.IsNull()) {
      continue;
    }
    if (not node.IsMap()) {
      return caf::make_error(ec::invalid_configuration,
                             "`pipeql` must be a map");
    }
    for (const auto& pair : node) {
      auto name = pair.first.as<std::string>();
      if (name == "console-verbosity") {
        auto verbosity = get<std::string>(pair.second,
                                          "pipeql.console-verbosity");
        if (not verbosity) {
          return std::move(verbosity.error());
        }
        if (auto err = check_verbosity(*verbosity)) {
          return err;
        }
        result.console_verbosity = std::move(*verbosity);
      } else if (name == "format") {
        if (auto err = parse_format(pair.second, result.format)) {
          return err;
        }
      } else {
        return caf::make_error(ec::invalid_configuration,
                               fmt::format("unknown key `pipeql.{}`", name));
      }
    }
  }
  return result;
}

} // namespace

auto parse_configuration(std::string_view yaml)
  -> caf::expected<configuration> {
  try {
    auto node = YAML::Load(std::string{yaml});
    return parse_root(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at {}:{}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  }
}

auto load_configuration(const std::filesystem::path& path)
  -> caf::expected<configuration> {
  PIPEQL_VERBOSE("loading configuration from {}", path);
  auto contents = detail::load_contents(path);
  if (not contents) {
    return add_context(contents.error(), "failed to read config file {}",
                       path);
  }
  auto result = parse_configuration(*contents);
  if (not result) {
    return add_context(result.error(), "failed to load config file {}", path);
  }
  return result;
}

auto merge_environment(configuration& config) -> caf::error {
  const auto* verbosity = std::getenv("PIPEQL_CONSOLE_VERBOSITY");
  if (verbosity == nullptr || *verbosity == '\0') {
    return caf::none;
  }
  auto value = std::string{verbosity};
  if (auto err = check_verbosity(value)) {
    return add_context(err, "failed to apply PIPEQL_CONSOLE_VERBOSITY");
  }
  config.console_verbosity = std::move(value);
  return caf::none;
}

} // namespace pipeql
