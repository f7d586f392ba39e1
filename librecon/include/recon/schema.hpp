//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include <tsl/robin_set.h>

#include <initializer_list>
#include <string>
#include <string_view>

namespace recon {

/// Declares which dotted paths of a document hold lists. Every traversal
/// consults the schema with the full path of the segment it visits; paths
/// that the schema does not know are plain values.
class schema {
public:
  schema() = default;

  schema(std::initializer_list<std::string_view> list_fields);

  /// The list fields of host records.
  static auto hosts() -> const schema&;

  /// The list fields of passive records.
  static auto passive() -> const schema&;

  /// Checks whether a dotted path refers to a list.
  [[nodiscard]] auto is_list(std::string_view path) const -> bool;

  [[nodiscard]] auto size() const -> size_t {
    return list_fields_.size();
  }

private:
  tsl::robin_set<std::string> list_fields_;
};

/// Joins a base path and a field name with a dot.
/// @relates schema
auto join_path(std::string_view base, std::string_view field) -> std::string;

} // namespace recon
