//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "pipeql/fwd.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pipeql {

/// The text of all documents that an editor currently has open, keyed by
/// document identifier. The store is not synchronized.
class document_store {
public:
  /// Adds a document, replacing the text of a document with the same id.
  void open(std::string id, std::string text);

  /// Replaces the full text of a document. Adds the document if it is not
  /// open yet.
  void change(std::string_view id, std::string text);

  /// Removes a document.
  /// @returns false if no such document was open.
  auto close(std::string_view id) -> bool;

  /// Returns the current text of a document, or `std::nullopt` if it is not
  /// open. The view is invalidated by the next modification of the document.
  auto lookup(std::string_view id) const -> std::optional<std::string_view>;

  /// Number of open documents.
  auto size() const -> size_t;

private:
  std::map<std::string, std::string, std::less<>> documents_;
};

} // namespace pipeql
