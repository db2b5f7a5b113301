//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/logger.hpp"

#include "pipeql/defaults.hpp"
#include "pipeql/detail/assert.hpp"
#include "pipeql/error.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <cctype>
#include <memory>

namespace pipeql {

auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return PIPEQL_LOG_LEVEL_QUIET;
  if (x == "error")
    return PIPEQL_LOG_LEVEL_ERROR;
  if (x == "warning")
    return PIPEQL_LOG_LEVEL_WARNING;
  if (x == "info")
    return PIPEQL_LOG_LEVEL_INFO;
  if (x == "verbose")
    return PIPEQL_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return PIPEQL_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return PIPEQL_LOG_LEVEL_TRACE;
  return default_value;
}

auto create_log_context(std::string_view verbosity)
  -> caf::expected<caf::detail::scope_guard<void (*)()>> {
  auto level = loglevel_to_int(std::string{verbosity});
  if (level < 0)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("unknown console verbosity '{}'",
                                       verbosity));
  if (!detail::setup_spdlog(level))
    return caf::make_error(ec::unspecified, "logger already initialized");
  return {caf::detail::make_scope_guard(
    std::addressof(pipeql::detail::shutdown_spdlog))};
}

namespace {

/// Converts a pipeql log level to spdlog level
auto pipeql_loglevel_to_spd(const int value) -> spdlog::level::level_enum {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case PIPEQL_LOG_LEVEL_QUIET:
      break;
    case PIPEQL_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case PIPEQL_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case PIPEQL_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case PIPEQL_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case PIPEQL_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case PIPEQL_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      PIPEQL_ASSERT(false, "unhandled log level");
  }
  return level;
}

} // namespace

namespace detail {

namespace {

auto make_null_logger() -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

bool setup_spdlog(int level) {
  if (logger()->name() != "/dev/null") {
    PIPEQL_ERROR("Log already up");
    return false;
  }
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
  sink->set_pattern(std::string{defaults::logger::console_format});
  auto result = std::make_shared<spdlog::logger>("pipeql", std::move(sink));
  result->set_level(pipeql_loglevel_to_spd(level));
  logger() = std::move(result);
  return true;
}

void shutdown_spdlog() {
  if (logger()->name() == "/dev/null")
    return;
  PIPEQL_DEBUG("shut down logging");
  logger()->flush();
  logger() = make_null_logger();
}

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static std::shared_ptr<spdlog::logger> result = make_null_logger();
  return result;
}

} // namespace detail

} // namespace pipeql
