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

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeql {

enum class code_action_kind : uint8_t {
  /// Resolves a single diagnostic.
  quick_fix,
  /// Resolves every fixable diagnostic of a document at once.
  fix_all,
};

/// Returns the protocol name of the kind, i.e., `quickfix` or
/// `source.fixAll`.
auto to_string(code_action_kind x) -> std::string_view;

template <class Inspector>
auto inspect(Inspector& f, code_action_kind& x) -> bool {
  auto get = [&x] {
    return static_cast<uint8_t>(x);
  };
  auto set = [&x](uint8_t value) {
    if (value > static_cast<uint8_t>(code_action_kind::fix_all)) {
      return false;
    }
    x = static_cast<code_action_kind>(value);
    return true;
  };
  return f.apply(get, set);
}

/// A set of edits, grouped by document.
struct workspace_edit {
  std::map<std::string, std::vector<text_edit>> changes;

  friend auto operator==(const workspace_edit&, const workspace_edit&) -> bool
    = default;

  friend auto inspect(auto& f, workspace_edit& x) {
    return f.object(x)
      .pretty_name("workspace_edit")
      .fields(f.field("changes", x.changes));
  }
};

struct code_action {
  std::string title;
  code_action_kind kind = code_action_kind::quick_fix;
  /// The diagnostics that this action resolves.
  std::vector<diagnostic> diagnostics;
  bool is_preferred = false;
  workspace_edit edit;

  friend auto operator==(const code_action&, const code_action&) -> bool
    = default;

  friend auto inspect(auto& f, code_action& x) {
    return f.object(x)
      .pretty_name("code_action")
      .fields(f.field("title", x.title), f.field("kind", x.kind),
              f.field("diagnostics", x.diagnostics),
              f.field("is_preferred", x.is_preferred),
              f.field("edit", x.edit));
  }
};

/// Collects the fixes of all migration diagnostics of a document into one
/// batch. The batch is sorted by descending start position and its edits
/// never overlap, so applying it in order keeps every range valid.
auto fix_all_edits(std::string_view text) -> std::vector<text_edit>;

/// Creates the code actions for the diagnostics that an editor requested
/// actions for: one quick fix per requested diagnostic with a known fix,
/// followed by a fix-all action if the document has more than one fix.
/// @param document_id Identifies the document in the resulting edits.
/// @param text The current content of the document.
/// @param requested The diagnostics the editor asks actions for. Only
/// `code` and `range` are relevant.
auto build_code_actions(std::string_view document_id, std::string_view text,
                        std::span<const diagnostic> requested)
  -> std::vector<code_action>;

/// Applies edits one after the other. The range of each edit refers to the
/// text as modified by all previous edits.
/// @returns the modified text, or `ec::invalid_argument` if a range does not
/// exist in the text or ends before it starts.
auto apply_edits(std::string_view text, std::span<const text_edit> edits)
  -> caf::expected<std::string>;

} // namespace pipeql

template <>
struct fmt::formatter<pipeql::code_action_kind>
  : fmt::formatter<std::string_view> {
  auto format(pipeql::code_action_kind x, format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};
