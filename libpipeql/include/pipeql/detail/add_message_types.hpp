//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace pipeql::detail {

/// Registers the CAF type IDs of pipeql, which makes `pipeql::ec` errors
/// renderable. Must be called once before the first error is rendered.
void add_message_types();

} // namespace pipeql::detail
