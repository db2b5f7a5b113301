//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <string_view>

namespace pipeql::defaults {

// -- global constants ---------------------------------------------------------

/// The `source` attached to every diagnostic that pipeql produces.
inline constexpr std::string_view diagnostic_source = "pipeql";

/// The configuration file looked up in the working directory.
inline constexpr std::string_view config_file = "pipeql.yaml";

// -- constants for the formatter ----------------------------------------------

namespace format {

/// Number of spaces per indentation level.
inline constexpr int indent_width = 2;

/// Whether to indent with spaces instead of tabs.
inline constexpr bool use_spaces = true;

} // namespace format

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Verbosity of the console sink.
inline constexpr std::string_view console_verbosity = "warning";

/// Pattern of the console sink.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

} // namespace logger

} // namespace pipeql::defaults
