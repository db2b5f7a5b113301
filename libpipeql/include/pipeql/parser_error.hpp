//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include "pipeql/diagnostics.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace pipeql {

/// Turns the error message of an external parser into a diagnostic.
///
/// The position is taken from the first of the forms `parse error at line N,
/// column M`, `line N, column M`, `line N:M` and `N:M` found in the message,
/// where lines and columns count from 1. Without any of them, the diagnostic
/// points at the start of the document. The position is clamped to the
/// document and the range covers the rest of the word at that position.
/// @param text The document that the parser rejected.
/// @param message The error message of the parser.
auto parser_error_to_diagnostic(std::string_view text,
                                std::string_view message) -> diagnostic;

/// Collects all diagnostics of a document: the one of the external parser,
/// if it reported an error, followed by the migration diagnostics.
auto collect_diagnostics(std::string_view text,
                         std::optional<std::string_view> parser_error)
  -> std::vector<diagnostic>;

} // namespace pipeql
