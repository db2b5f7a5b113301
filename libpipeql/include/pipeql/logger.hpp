//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>

#include <string>
#include <string_view>

#define PIPEQL_LOG_LEVEL_QUIET 0
#define PIPEQL_LOG_LEVEL_ERROR 1
#define PIPEQL_LOG_LEVEL_WARNING 2
#define PIPEQL_LOG_LEVEL_INFO 3
#define PIPEQL_LOG_LEVEL_VERBOSE 4
#define PIPEQL_LOG_LEVEL_DEBUG 5
#define PIPEQL_LOG_LEVEL_TRACE 6

#ifndef PIPEQL_LOG_LEVEL
#  define PIPEQL_LOG_LEVEL PIPEQL_LOG_LEVEL_TRACE
#endif

// PIPEQL_INFO -> spdlog::info
// PIPEQL_VERBOSE -> spdlog::debug
// PIPEQL_DEBUG -> spdlog::trace
// PIPEQL_TRACE -> spdlog::trace

#if PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif PIPEQL_LOG_LEVEL == PIPEQL_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

namespace pipeql {

/// Convert a log level name to an int.
/// @returns *default_value* if *x* names no level.
auto loglevel_to_int(std::string x, int default_value = -1) -> int;

/// Installs the console logger at the given verbosity.
/// @param verbosity One of quiet, error, warning, info, verbose, debug, trace.
/// @returns a guard that shuts down the logger on destruction.
auto create_log_context(std::string_view verbosity)
  -> caf::expected<caf::detail::scope_guard<void (*)()>>;

} // namespace pipeql

// Important: keep that below the log level mapping
#include "pipeql/detail/logger.hpp"
