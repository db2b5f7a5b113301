//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include "pipeql/location.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace pipeql {

/// The severity of a diagnostic. The numeric values are the ones the editor
/// protocol puts on the wire.
enum class severity : uint8_t {
  error = 1,
  warning = 2,
  information = 3,
  hint = 4,
};

auto to_string(severity x) -> std::string_view;

/// A message attached to a range of a document.
struct diagnostic {
  struct range range;
  enum severity severity = severity::error;
  /// Identifies the check that produced the diagnostic, can be empty.
  std::string code;
  /// The tool that produced the diagnostic.
  std::string source;
  /// Description of the diagnostic, should not be empty.
  std::string message;

  friend auto operator==(const diagnostic&, const diagnostic&) -> bool
    = default;

  friend auto inspect(auto& f, diagnostic& x) {
    return f.object(x)
      .pretty_name("diagnostic")
      .fields(f.field("range", x.range), f.field("severity", x.severity),
              f.field("code", x.code), f.field("source", x.source),
              f.field("message", x.message));
  }
};

/// Replaces the text in `range` with `new_text`.
struct text_edit {
  struct range range;
  std::string new_text;

  friend auto operator==(const text_edit&, const text_edit&) -> bool
    = default;

  friend auto inspect(auto& f, text_edit& x) {
    return f.object(x)
      .pretty_name("text_edit")
      .fields(f.field("range", x.range), f.field("new_text", x.new_text));
  }
};

template <class Inspector>
auto inspect(Inspector& f, severity& x) -> bool {
  auto get = [&x] {
    return static_cast<uint8_t>(x);
  };
  auto set = [&x](uint8_t value) {
    if (value < 1 || value > 4) {
      return false;
    }
    x = static_cast<severity>(value);
    return true;
  };
  return f.apply(get, set);
}

} // namespace pipeql

template <>
struct fmt::formatter<pipeql::severity> : fmt::formatter<std::string_view> {
  auto format(pipeql::severity x, format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<pipeql::diagnostic> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const pipeql::diagnostic& x, format_context& ctx) const {
    if (x.code.empty()) {
      return fmt::format_to(ctx.out(), "{}: {}: {}", x.range.start,
                            x.severity, x.message);
    }
    return fmt::format_to(ctx.out(), "{}: {}[{}]: {}", x.range.start,
                          x.severity, x.code, x.message);
  }
};
