//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/data.hpp"
#include "recon/expression.hpp"

#include <caf/expected.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace recon {

/// Interprets a user-supplied string: `/regex/flags` becomes a pattern,
/// anything else stays a literal string.
auto str_to_query_value(std::string_view str) -> data;

/// Compares a field with a literal, or searches a pattern in it.
auto search_string(std::string field, const data& value, bool neg = false)
  -> expression;

/// Tests a list field for a literal element, or for an element in which a
/// pattern occurs.
auto search_string_in_array(std::string field, const data& value,
                            bool neg = false) -> expression;

/// Maps a JA3 fingerprint to the key under which it is stored: a pattern
/// searches the raw fingerprint, a hex digest selects `md5`, `sha1` or
/// `sha256` by length, and any other string is a raw fingerprint that is
/// looked up by its MD5 digest.
auto ja3_key_value(const data& value_or_hash)
  -> caf::expected<std::pair<std::string, data>>;

/// Expands country aliases: `UK` is `GB`, and `EU` is the list of member
/// states. A list of countries expands element-wise into a flat list.
auto country_unalias(const data& country) -> data;

/// Returns the key under which a script stores its structured output. Scripts
/// that share an output structure share a key.
auto script_alias(std::string_view name) -> std::string_view;

} // namespace recon
