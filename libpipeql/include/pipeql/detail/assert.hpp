//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <source_location>
#include <string>
#include <string_view>

namespace pipeql::detail {

[[noreturn]] void panic_impl(std::string message, std::source_location source);

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace pipeql::detail

/// Checks an internal invariant. A failing assertion is a bug in pipeql, not
/// in the analyzed document, and ends the program via `panic_impl`.
#define PIPEQL_ASSERT(expr, ...)                                               \
  do {                                                                         \
    if (!(expr)) [[unlikely]] {                                                \
      ::pipeql::detail::fail_assertion_impl(                                   \
        #expr, std::string_view{__VA_ARGS__},                                  \
        std::source_location::current());                                      \
    }                                                                          \
  } while (false)

#define PIPEQL_UNREACHABLE()                                                   \
  ::pipeql::detail::panic_impl("unreachable", std::source_location::current())
