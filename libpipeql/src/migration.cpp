//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/migration.hpp"

#include "pipeql/defaults.hpp"
#include "pipeql/detail/assert.hpp"
#include "pipeql/detail/string.hpp"
#include "pipeql/logger.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace pipeql {

namespace {

auto rewrite_grep(std::string_view argument) -> std::string {
  // A regex argument turns into a string argument.
  if (argument.size() >= 2 && argument.starts_with('/')
      && argument.ends_with('/')) {
    auto inner = argument.substr(1, argument.size() - 2);
    return fmt::format("grep('{}', this)", inner);
  }
  return fmt::format("grep({}, this)", argument);
}

auto rewrite_is(std::string_view argument) -> std::string {
  return fmt::format("is(this, {})", argument);
}

template <size_t N>
struct cast_name {
  constexpr cast_name(const char (&str)[N]) {
    std::copy_n(str, N, value);
  }

  char value[N];
};

template <cast_name Name>
auto rewrite_cast(std::string_view argument) -> std::string {
  return fmt::format("{}::{}", argument, Name.value);
}

auto make_rules() -> std::array<migration_rule, 17> {
  using enum severity;
  return {{
    // Keyword renames.
    {
      .code = "deprecated-yield",
      .pattern = R"(\byield\b)",
      .message = "'yield' is deprecated, use 'values'",
      .severity = warning,
      .replacement = "values",
    },
    {
      .code = "deprecated-func",
      .pattern = R"(\bfunc\b)",
      .message = "'func' is deprecated, use 'fn'",
      .severity = warning,
      .replacement = "fn",
    },
    {
      .code = "deprecated-arrow",
      .pattern = R"(=>)",
      .message = "'=>' is deprecated, use 'into'",
      .severity = warning,
      .replacement = "into",
    },
    // Only the `//` marker itself is reported and replaced, so that the
    // character in front of it stays available to other rules.
    {
      .code = "deprecated-comment-slash",
      .pattern = R"((^|[^:])//)",
      .message = "'//' comments are deprecated, use '--'",
      .severity = warning,
      .replacement = "--",
      .report_suffix = 2,
      .url_guard = true,
    },
    // Function renames.
    {
      .code = "deprecated-parse-zson",
      .pattern = R"(\bparse_zson\s*\()",
      .message = "'parse_zson' is deprecated, use 'parse_sup'",
      .severity = warning,
      .replacement = "parse_sup(",
    },
    // Functions that no longer take `this` implicitly.
    {
      .code = "implicit-this-grep",
      .pattern = R"(\bgrep\s*\(\s*(/[^/]*/|'[^']*'|"[^"]*")\s*\))",
      .message = "grep() requires explicit 'this' argument",
      .severity = warning,
      .rewrite = rewrite_grep,
    },
    {
      .code = "implicit-this-is",
      .pattern = R"(\bis\s*\(\s*(<[^>]+>)\s*\))",
      .message = "is() requires explicit 'this' argument",
      .severity = warning,
      .rewrite = rewrite_is,
    },
    {
      .code = "implicit-this-nest-dotted",
      .pattern = R"(\bnest_dotted\s*\(\s*\))",
      .message = "nest_dotted() requires explicit 'this' argument",
      .severity = warning,
      .replacement = "nest_dotted(this)",
    },
    // Function-style casts.
    {
      .code = "deprecated-cast-time",
      .pattern = R"(\btime\s*\(\s*('[^']*'|"[^"]*")\s*\))",
      .message = "Function-style cast deprecated, use '::time'",
      .severity = warning,
      .rewrite = rewrite_cast<"time">,
    },
    {
      .code = "deprecated-cast-duration",
      .pattern = R"(\bduration\s*\(\s*('[^']*'|"[^"]*")\s*\))",
      .message = "Function-style cast deprecated, use '::duration'",
      .severity = warning,
      .rewrite = rewrite_cast<"duration">,
    },
    {
      .code = "deprecated-cast-ip",
      .pattern = R"(\bip\s*\(\s*('[^']*'|"[^"]*")\s*\))",
      .message = "Function-style cast deprecated, use '::ip'",
      .severity = warning,
      .rewrite = rewrite_cast<"ip">,
    },
    {
      .code = "deprecated-cast-net",
      .pattern = R"(\bnet\s*\(\s*('[^']*'|"[^"]*")\s*\))",
      .message = "Function-style cast deprecated, use '::net'",
      .severity = warning,
      .rewrite = rewrite_cast<"net">,
    },
    // Removed functions have no automatic fix.
    {
      .code = "removed-crop",
      .pattern = R"(\bcrop\s*\()",
      .message = "'crop()' was removed, use explicit casting",
      .severity = error,
    },
    {
      .code = "removed-fill",
      .pattern = R"(\bfill\s*\()",
      .message = "'fill()' was removed, use explicit casting",
      .severity = error,
    },
    {
      .code = "removed-fit",
      .pattern = R"(\bfit\s*\()",
      .message = "'fit()' was removed, use explicit casting",
      .severity = error,
    },
    {
      .code = "removed-order",
      .pattern = R"(\border\s*\()",
      .message = "'order()' was removed, use explicit casting",
      .severity = error,
    },
    {
      .code = "removed-shape",
      .pattern = R"(\bshape\s*\()",
      .message = "'shape()' was removed, use explicit casting",
      .severity = error,
    },
  }};
}

/// The rule registry together with the compiled pattern of every rule.
struct registry {
  registry() : rules{make_rules()} {
    auto opts = re2::RE2::Options{re2::RE2::CannedOptions::Quiet};
    for (const auto& rule : rules) {
      auto& regex = patterns.emplace_back(
        std::make_unique<re2::RE2>(rule.pattern, opts));
      PIPEQL_ASSERT(regex->ok(), rule.code);
    }
  }

  std::array<migration_rule, 17> rules;
  std::vector<std::unique_ptr<re2::RE2>> patterns;
};

auto get_registry() -> const registry& {
  static const auto instance = registry{};
  return instance;
}

auto make_range(size_t line, size_t begin, size_t end) -> range {
  return {{line, begin}, {line, end}};
}

void scan_line(const registry& reg, std::string_view line, size_t line_number,
               std::vector<migration_diagnostic>& result) {
  // Matches after the start of a `--` comment are not reported. This is a
  // line-local heuristic that ignores string literals.
  const auto comment = line.find("--");
  for (auto i = size_t{0}; i < reg.rules.size(); ++i) {
    const auto& rule = reg.rules[i];
    const auto& regex = *reg.patterns[i];
    auto groups = std::array<re2::StringPiece, 2>{};
    auto pos = size_t{0};
    while (pos <= line.size()
           && regex.Match(line, pos, line.size(), re2::RE2::UNANCHORED,
                          groups.data(), static_cast<int>(groups.size()))) {
      const auto match = std::string_view{groups[0].data(), groups[0].size()};
      const auto begin = static_cast<size_t>(match.data() - line.data());
      const auto end = begin + match.size();
      pos = end > begin ? end : end + 1;
      if (comment != std::string_view::npos && begin > comment) {
        continue;
      }
      if (rule.url_guard && match.find("://") != std::string_view::npos) {
        continue;
      }
      auto reported_begin = begin;
      if (rule.report_suffix > 0 && match.size() > rule.report_suffix) {
        reported_begin = end - rule.report_suffix;
      }
      auto reported = make_range(line_number, reported_begin, end);
      PIPEQL_TRACE("migration: `{}` matched `{}` at {}", rule.code,
                   detail::control_char_escape(match), reported);
      auto& entry = result.emplace_back();
      entry.diagnostic = diagnostic{
        .range = reported,
        .severity = rule.severity,
        .code = std::string{rule.code},
        .source = std::string{defaults::diagnostic_source},
        .message = std::string{rule.message},
      };
      if (rule.rewrite != nullptr) {
        auto argument = std::string_view{groups[1].data(), groups[1].size()};
        entry.fix = text_edit{reported, rule.rewrite(argument)};
      } else if (rule.replacement) {
        entry.fix = text_edit{reported, std::string{*rule.replacement}};
      }
    }
  }
}

} // namespace

auto migration_rules() -> std::span<const migration_rule> {
  return get_registry().rules;
}

auto scan_migrations(std::string_view text)
  -> std::vector<migration_diagnostic> {
  const auto& reg = get_registry();
  auto result = std::vector<migration_diagnostic>{};
  auto lines = detail::split(text, "\n");
  for (auto i = size_t{0}; i < lines.size(); ++i) {
    scan_line(reg, lines[i], i, result);
  }
  PIPEQL_DEBUG("migration: found {} deprecated constructs in {} lines",
               result.size(), lines.size());
  return result;
}

} // namespace pipeql
