//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/error.hpp"

#include "pipeql/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace pipeql {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "no_such_file",
  "filesystem_error",
  "parse_error",
  "invalid_argument",
  "invalid_configuration",
  "unrecognized_option",
  "invalid_subcommand",
  "missing_subcommand",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i))
        oss << ctx.get_as<std::string>(i);
      else
        oss << caf::deep_to_string(ctx);
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  PIPEQL_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return "";
  std::ostringstream oss;
  if (err.category() == caf::type_id_v<pipeql::ec>)
    oss << to_string(static_cast<pipeql::ec>(err.code()));
  else
    oss << caf::to_string(err);
  render_default_ctx(oss, err.context());
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str)
  -> caf::error {
  if (!error)
    return error;
  auto code = ec::unspecified;
  if (error.category() == caf::type_id_v<pipeql::ec>)
    code = static_cast<pipeql::ec>(error.code());
  auto ctx = error.context();
  if (ctx.size() == 1 && ctx.match_element<std::string>(0))
    return caf::make_error(
      code, fmt::format("{}: {}", str, ctx.get_as<std::string>(0)));
  return caf::make_error(code, std::move(str));
}

} // namespace pipeql
