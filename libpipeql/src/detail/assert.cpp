//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/detail/assert.hpp"

#include "pipeql/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace pipeql::detail {

void panic_impl(std::string message, std::source_location source) {
  PIPEQL_ERROR("panic: {}", message);
  PIPEQL_ERROR("source: {}:{}", source.file_name(), source.line());
  PIPEQL_ERROR("this is a bug, we would appreciate a report - thank you!");
  if (const auto* e = std::getenv("PIPEQL_ABORT_ON_PANIC");
      e != nullptr && *e != '\0' && std::string_view{e} != "0") {
    // Wait until `spdlog` flushed the logs.
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    std::_Exit(1);
  }
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace pipeql::detail
