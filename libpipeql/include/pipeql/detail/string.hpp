//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace pipeql::detail {

/// Splits a string into a vector of substrings.
/// @param str The string to split.
/// @param sep The separator where to split.
/// @param max_splits The maximum number of splits to perform.
/// @returns The pieces between the separators. An empty input and a trailing
/// separator both produce an empty piece.
std::vector<std::string_view>
split(std::string_view str, std::string_view sep,
      size_t max_splits = std::numeric_limits<size_t>::max());

/// Escapes control characters, backslashes and non-ASCII bytes so that the
/// result fits on a single terminal line.
std::string control_char_escape(std::string_view str);

/// Removes trailing characters contained in *chars*.
std::string_view trim_back(std::string_view str, std::string_view chars);

} // namespace pipeql::detail
