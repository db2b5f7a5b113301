//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/detail/load_contents.hpp"

#include "pipeql/error.hpp"

#include <caf/expected.hpp>
#include <caf/fwd.hpp>
#include <caf/none.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace pipeql::detail {

caf::expected<std::string> load_contents(const std::filesystem::path& p) {
  auto err = std::error_code{};
  if (!std::filesystem::exists(p, err))
    return caf::make_error(ec::no_such_file,
                           "no such file " + p.string());
  std::ifstream in{p, std::ios::binary};
  std::stringstream ss;
  if (!in)
    return caf::make_error(ec::filesystem_error,
                           "failed to read from file " + p.string());
  ss << in.rdbuf();
  return ss.str();
}

caf::error save_contents(const std::filesystem::path& p,
                         std::string_view contents) {
  std::ofstream out{p, std::ios::binary | std::ios::trunc};
  if (!out)
    return caf::make_error(ec::filesystem_error,
                           "failed to open file for writing " + p.string());
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out)
    return caf::make_error(ec::filesystem_error,
                           "failed to write to file " + p.string());
  return caf::none;
}

} // namespace pipeql::detail
