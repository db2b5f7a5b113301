//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/document_store.hpp"

#include "pipeql/logger.hpp"

namespace pipeql {

void document_store::open(std::string id, std::string text) {
  PIPEQL_DEBUG("document store: opening {} ({} bytes)", id, text.size());
  documents_.insert_or_assign(std::move(id), std::move(text));
}

void document_store::change(std::string_view id, std::string text) {
  PIPEQL_DEBUG("document store: changing {} ({} bytes)", id, text.size());
  if (auto it = documents_.find(id); it != documents_.end()) {
    it->second = std::move(text);
    return;
  }
  documents_.emplace(std::string{id}, std::move(text));
}

auto document_store::close(std::string_view id) -> bool {
  auto it = documents_.find(id);
  if (it == documents_.end()) {
    return false;
  }
  PIPEQL_DEBUG("document store: closing {}", id);
  documents_.erase(it);
  return true;
}

auto document_store::lookup(std::string_view id) const
  -> std::optional<std::string_view> {
  auto it = documents_.find(id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto document_store::size() const -> size_t {
  return documents_.size();
}

} // namespace pipeql
