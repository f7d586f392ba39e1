//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace recon {

/// A (binary) relational operator.
enum class relational_operator : uint8_t {
  equal,
  not_equal,
  less,
  less_equal,
  greater,
  greater_equal,
  /// The LHS is an element of the list on the RHS.
  in,
  not_in,
  /// The LHS is a list that contains the RHS.
  ni,
  /// The RHS pattern occurs somewhere in the LHS string.
  match,
  /// The LHS resolves to a value at all; the RHS is ignored.
  exists,
};

/// @relates relational_operator
auto to_string(relational_operator op) noexcept -> std::string_view;

/// Parses one of the comparison operators `<`, `<=`, `>`, `>=`, `==` and
/// `!=`.
/// @relates relational_operator
auto parse_relational_operator(std::string_view str)
  -> caf::expected<relational_operator>;

/// Tests whether a relational operator is negated.
/// For example, `!=` is negated, but `==` is not.
/// @relates relational_operator
auto is_negated(relational_operator op) -> bool;

/// Evaluates a relational operator against a single resolved value.
/// Ordering operators only hold between comparable values.
/// @param lhs The value found in a document.
/// @param op The operator.
/// @param rhs The operand of the predicate.
auto evaluate(const data& lhs, relational_operator op, const data& rhs)
  -> bool;

} // namespace recon

template <>
struct fmt::formatter<recon::relational_operator>
  : fmt::formatter<std::string_view> {
  auto format(recon::relational_operator op, format_context& ctx) const
    -> format_context::iterator {
    return fmt::formatter<std::string_view>::format(recon::to_string(op), ctx);
  }
};
