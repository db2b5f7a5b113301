//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/code_action.hpp"

#include "pipeql/detail/assert.hpp"
#include "pipeql/error.hpp"
#include "pipeql/logger.hpp"
#include "pipeql/migration.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace pipeql {

namespace {

/// Identifies a diagnostic across separate scans of the same text.
using diagnostic_key
  = std::tuple<std::string_view, size_t, size_t, size_t, size_t>;

auto key_of(const diagnostic& x) -> diagnostic_key {
  return {x.code, x.range.start.line, x.range.start.column, x.range.end.line,
          x.range.end.column};
}

/// Selects the fixable diagnostics for a fix-all batch, in descending order
/// of their start position, skipping every fix that overlaps one that was
/// selected before.
auto select_batch(const std::vector<migration_diagnostic>& scanned)
  -> std::vector<const migration_diagnostic*> {
  auto candidates = std::vector<const migration_diagnostic*>{};
  for (const auto& x : scanned) {
    if (x.fix) {
      candidates.push_back(&x);
    }
  }
  std::ranges::stable_sort(candidates, [](const auto* lhs, const auto* rhs) {
    return lhs->fix->range.start > rhs->fix->range.start;
  });
  auto result = std::vector<const migration_diagnostic*>{};
  for (const auto* candidate : candidates) {
    // The selected fixes do not overlap and start at or after the candidate,
    // so only the last one can overlap it.
    if (not result.empty()
        && result.back()->fix->range.overlaps(candidate->fix->range)) {
      PIPEQL_DEBUG("code action: dropping `{}` at {} from batch",
                   candidate->diagnostic.code, candidate->fix->range);
      continue;
    }
    result.push_back(candidate);
  }
  return result;
}

} // namespace

auto to_string(code_action_kind x) -> std::string_view {
  switch (x) {
    case code_action_kind::quick_fix:
      return "quickfix";
    case code_action_kind::fix_all:
      return "source.fixAll";
  }
  PIPEQL_UNREACHABLE();
}

auto fix_all_edits(std::string_view text) -> std::vector<text_edit> {
  auto scanned = scan_migrations(text);
  auto result = std::vector<text_edit>{};
  for (const auto* x : select_batch(scanned)) {
    result.push_back(*x->fix);
  }
  return result;
}

auto build_code_actions(std::string_view document_id, std::string_view text,
                        std::span<const diagnostic> requested)
  -> std::vector<code_action> {
  auto scanned = scan_migrations(text);
  auto fixable = std::map<diagnostic_key, const migration_diagnostic*>{};
  for (const auto& x : scanned) {
    if (x.fix) {
      fixable.emplace(key_of(x.diagnostic), &x);
    }
  }
  auto result = std::vector<code_action>{};
  for (const auto& diag : requested) {
    auto it = fixable.find(key_of(diag));
    if (it == fixable.end()) {
      continue;
    }
    const auto& found = *it->second;
    auto& action = result.emplace_back();
    action.title = fmt::format("Replace with '{}'", found.fix->new_text);
    action.kind = code_action_kind::quick_fix;
    action.diagnostics.push_back(found.diagnostic);
    action.is_preferred = true;
    action.edit.changes[std::string{document_id}].push_back(*found.fix);
  }
  if (fixable.size() > 1) {
    auto& action = result.emplace_back();
    action.title = "Fix all deprecated syntax";
    action.kind = code_action_kind::fix_all;
    auto& edits = action.edit.changes[std::string{document_id}];
    for (const auto* x : select_batch(scanned)) {
      action.diagnostics.push_back(x->diagnostic);
      edits.push_back(*x->fix);
    }
  }
  PIPEQL_DEBUG("code action: created {} actions for {} requested diagnostics",
               result.size(), requested.size());
  return result;
}

auto apply_edits(std::string_view text, std::span<const text_edit> edits)
  -> caf::expected<std::string> {
  auto result = std::string{text};
  for (const auto& edit : edits) {
    auto begin = to_offset(result, edit.range.start);
    auto end = to_offset(result, edit.range.end);
    if (not begin || not end) {
      return caf::make_error(ec::invalid_argument,
                             fmt::format("edit range {} is out of bounds",
                                         edit.range));
    }
    if (*end < *begin) {
      return caf::make_error(ec::invalid_argument,
                             fmt::format("edit range {} ends before it starts",
                                         edit.range));
    }
    result.replace(*begin, *end - *begin, edit.new_text);
  }
  return result;
}

} // namespace pipeql
