//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "pipeql/detail/add_message_types.hpp"

#include "pipeql/error.hpp"
#include "pipeql/fwd.hpp"

#include <caf/init_global_meta_objects.hpp>
#include <caf/inspector_access.hpp>

namespace pipeql::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::pipeql_types>();
}

} // namespace pipeql::detail
