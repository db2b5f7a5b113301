//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/diagnostics.hpp"

#include "pipeql/detail/assert.hpp"

namespace pipeql {

auto to_string(severity x) -> std::string_view {
  switch (x) {
    case severity::error:
      return "error";
    case severity::warning:
      return "warning";
    case severity::information:
      return "information";
    case severity::hint:
      return "hint";
  }
  PIPEQL_UNREACHABLE();
}

} // namespace pipeql
