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

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeql {

/// A deprecated construct, how to find it, and how to replace it.
struct migration_rule {
  /// The diagnostic code, e.g., `deprecated-yield`.
  std::string_view code;
  /// An RE2 pattern that is matched against every line of a document.
  std::string_view pattern;
  std::string_view message;
  enum severity severity = severity::warning;
  /// A fixed replacement for the reported range.
  std::optional<std::string_view> replacement = {};
  /// Computes the replacement from the first capture group of the pattern.
  /// Takes precedence over `replacement`.
  std::string (*rewrite)(std::string_view argument) = nullptr;
  /// If non-zero, only the last `report_suffix` bytes of a match are
  /// reported and replaced.
  size_t report_suffix = 0;
  /// Skip matches that look like part of a URL, i.e., contain `://`.
  bool url_guard = false;

  /// Returns true if matches of this rule come with an automatic fix.
  auto has_fix() const -> bool {
    return rewrite != nullptr || replacement.has_value();
  }
};

/// A diagnostic produced by a migration rule, with an optional fix that
/// replaces exactly the diagnostic's range.
struct migration_diagnostic {
  struct diagnostic diagnostic;
  std::optional<text_edit> fix;

  friend auto
  operator==(const migration_diagnostic&, const migration_diagnostic&) -> bool
    = default;
};

/// Returns the registry of all migration rules in match order.
auto migration_rules() -> std::span<const migration_rule>;

/// Scans a document line by line for deprecated constructs. Results are
/// ordered by line, then by rule, then by column.
auto scan_migrations(std::string_view text)
  -> std::vector<migration_diagnostic>;

} // namespace pipeql
