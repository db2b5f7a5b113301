//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace pipeql::detail {

/// Sets up the console sink. Returns false if a logger is already active.
bool setup_spdlog(int level);

/// Flushes and drops the pipeql logger.
void shutdown_spdlog();

/// Returns the pipeql logger, or a logger writing to the null sink if none
/// was set up.
auto logger() -> std::shared_ptr<spdlog::logger>&;

} // namespace pipeql::detail

#define PIPEQL_LOG_INTERNAL(lvl, ...)                                          \
  SPDLOG_LOGGER_CALL(::pipeql::detail::logger(), lvl, __VA_ARGS__)

#define PIPEQL_ERROR(...) PIPEQL_LOG_INTERNAL(spdlog::level::err, __VA_ARGS__)
#define PIPEQL_WARN(...) PIPEQL_LOG_INTERNAL(spdlog::level::warn, __VA_ARGS__)
#define PIPEQL_INFO(...) PIPEQL_LOG_INTERNAL(spdlog::level::info, __VA_ARGS__)
#define PIPEQL_VERBOSE(...)                                                    \
  PIPEQL_LOG_INTERNAL(spdlog::level::debug, __VA_ARGS__)
#define PIPEQL_DEBUG(...) PIPEQL_LOG_INTERNAL(spdlog::level::trace, __VA_ARGS__)
#define PIPEQL_TRACE(...) PIPEQL_LOG_INTERNAL(spdlog::level::trace, __VA_ARGS__)
