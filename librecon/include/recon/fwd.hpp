//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/config.hpp"

#include <caf/type_id.hpp>

#include <cstdint>

namespace recon {

// -- classes ------------------------------------------------------------------

class active_database;
class backend;
class collection;
class configuration;
class data;
class database;
class expression;
class ip;
class memory_backend;
class memory_collection;
class nmap_database;
class passive_database;
class pattern;
class pseudo_field_registry;
class schema;
class subnet;
class view_database;

// -- structs ------------------------------------------------------------------

struct conjunction;
struct constant;
struct disjunction;
struct negation;
struct predicate;
struct pseudo_field;
struct quantifier;
struct sort_key;
struct value_count;
struct weighted_value;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;
enum class relational_operator : uint8_t;
enum class sort_order : uint8_t;
enum class quantifier_kind : uint8_t;

// -- aliases ------------------------------------------------------------------

/// Identifies a document within a collection.
using document_id = int64_t;

} // namespace recon

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_recon_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(recon_types, first_recon_type_id)

  CAF_ADD_TYPE_ID(recon_types, (recon::ec))

CAF_END_TYPE_ID_BLOCK(recon_types)
