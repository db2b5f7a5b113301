//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace pipeql::detail {

/// Loads file contents into a string.
/// @param p The path of the file to load.
/// @returns The contents of the file *p*.
caf::expected<std::string> load_contents(const std::filesystem::path& p);

/// Replaces the contents of a file.
/// @param p The path of the file to write.
/// @param contents The new contents of *p*.
caf::error save_contents(const std::filesystem::path& p,
                         std::string_view contents);

} // namespace pipeql::detail
