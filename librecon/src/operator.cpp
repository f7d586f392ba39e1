//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/operator.hpp"

#include "recon/data.hpp"
#include "recon/error.hpp"

#include <algorithm>

namespace recon {

auto to_string(relational_operator op) noexcept -> std::string_view {
  switch (op) {
    case relational_operator::equal:
      return "==";
    case relational_operator::not_equal:
      return "!=";
    case relational_operator::less:
      return "<";
    case relational_operator::less_equal:
      return "<=";
    case relational_operator::greater:
      return ">";
    case relational_operator::greater_equal:
      return ">=";
    case relational_operator::in:
      return "in";
    case relational_operator::not_in:
      return "!in";
    case relational_operator::ni:
      return "ni";
    case relational_operator::match:
      return "~";
    case relational_operator::exists:
      return "exists";
  }
  return "<invalid>";
}

auto parse_relational_operator(std::string_view str)
  -> caf::expected<relational_operator> {
  if (str == "<") {
    return relational_operator::less;
  }
  if (str == "<=") {
    return relational_operator::less_equal;
  }
  if (str == ">") {
    return relational_operator::greater;
  }
  if (str == ">=") {
    return relational_operator::greater_equal;
  }
  if (str == "==") {
    return relational_operator::equal;
  }
  if (str == "!=") {
    return relational_operator::not_equal;
  }
  return caf::make_error(ec::invalid_argument,
                         fmt::format("unknown operator '{}'", str));
}

auto is_negated(relational_operator op) -> bool {
  switch (op) {
    case relational_operator::not_equal:
    case relational_operator::not_in:
      return true;
    default:
      return false;
  }
}

namespace {

auto contains(const list& xs, const data& x) -> bool {
  return std::find(xs.begin(), xs.end(), x) != xs.end();
}

auto search(const pattern& rx, const data& x) -> bool {
  if (const auto* str = try_as<std::string>(&x)) {
    return rx.search(*str);
  }
  if (const auto* xs = try_as<list>(&x)) {
    return std::any_of(xs->begin(), xs->end(), [&](const data& element) {
      const auto* str = try_as<std::string>(&element);
      return str && rx.search(*str);
    });
  }
  return false;
}

} // namespace

auto evaluate(const data& lhs, relational_operator op, const data& rhs)
  -> bool {
  switch (op) {
    case relational_operator::exists:
      return true;
    case relational_operator::equal:
      return lhs == rhs;
    case relational_operator::not_equal:
      return lhs != rhs;
    case relational_operator::less:
      return is_comparable(lhs, rhs) && lhs < rhs;
    case relational_operator::less_equal:
      return is_comparable(lhs, rhs) && lhs <= rhs;
    case relational_operator::greater:
      return is_comparable(lhs, rhs) && lhs > rhs;
    case relational_operator::greater_equal:
      return is_comparable(lhs, rhs) && lhs >= rhs;
    case relational_operator::in: {
      const auto* xs = try_as<list>(&rhs);
      return xs && contains(*xs, lhs);
    }
    case relational_operator::not_in: {
      const auto* xs = try_as<list>(&rhs);
      return xs && !contains(*xs, lhs);
    }
    case relational_operator::ni: {
      const auto* xs = try_as<list>(&lhs);
      return xs && contains(*xs, rhs);
    }
    case relational_operator::match: {
      const auto* rx = try_as<pattern>(&rhs);
      return rx && search(*rx, lhs);
    }
  }
  RECON_UNREACHABLE();
}

} // namespace recon
