//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>

#define PIPEQL_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(pipeql_types, type)

namespace pipeql {

// -- classes ------------------------------------------------------------------

class document_store;

// -- structs ------------------------------------------------------------------

struct code_action;
struct configuration;
struct diagnostic;
struct format_options;
struct migration_diagnostic;
struct migration_rule;
struct position;
struct range;
struct text_edit;
struct token;
struct workspace_edit;

// -- enumerations -------------------------------------------------------------

enum class code_action_kind : uint8_t;
enum class ec : uint8_t;
enum class severity : uint8_t;
enum class token_kind : uint8_t;

} // namespace pipeql

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_pipeql_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(pipeql_types, first_pipeql_type_id)

  PIPEQL_ADD_TYPE_ID((pipeql::ec))

CAF_END_TYPE_ID_BLOCK(pipeql_types)

#undef PIPEQL_ADD_TYPE_ID
