//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/data.hpp"
#include "recon/operator.hpp"
#include "recon/variant.hpp"

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// An expression that always or never matches.
struct constant {
  bool value = true;

  friend auto operator==(const constant&, const constant&) -> bool = default;
};

/// Compares the values that a field path resolves to with an operand. The
/// predicate holds if any of the resolved values satisfies the operator.
struct predicate {
  predicate() = default;

  predicate(std::string field, relational_operator op, data rhs = {});

  std::string field;
  relational_operator op = relational_operator::equal;
  data rhs;

  friend auto operator==(const predicate&, const predicate&) -> bool = default;
};

/// The quantification of a quantifier.
enum class quantifier_kind : uint8_t {
  any,
  all,
};

/// A sequence of AND expressions.
struct conjunction : std::vector<expression> {
  using super = std::vector<expression>;
  using super::vector;
  explicit conjunction(const super& other);
  explicit conjunction(super&& other) noexcept;
};

/// A sequence of OR expressions.
struct disjunction : std::vector<expression> {
  using super = std::vector<expression>;
  using super::vector;
  explicit disjunction(const super& other);
  explicit disjunction(super&& other) noexcept;
};

/// A NOT expression.
struct negation {
  negation();
  explicit negation(expression expr);

  negation(const negation& other);
  negation(negation&& other) noexcept;

  negation& operator=(const negation& other);
  negation& operator=(negation&& other) noexcept;

  // Access the contained expression.
  [[nodiscard]] const expression& expr() const;
  expression& expr();

private:
  std::unique_ptr<expression> expr_;
};

/// @relates negation
auto operator==(const negation& x, const negation& y) -> bool;

/// Tests the elements of a list field against a nested expression. Field
/// paths in the nested expression are relative to the list elements.
struct quantifier {
  quantifier();
  quantifier(quantifier_kind kind, std::string field, expression inner);

  quantifier(const quantifier& other);
  quantifier(quantifier&& other) noexcept;

  quantifier& operator=(const quantifier& other);
  quantifier& operator=(quantifier&& other) noexcept;

  [[nodiscard]] const expression& inner() const;

  quantifier_kind kind = quantifier_kind::any;
  std::string field;

private:
  std::unique_ptr<expression> inner_;
};

/// @relates quantifier
auto operator==(const quantifier& x, const quantifier& y) -> bool;

/// A query expression. A default-constructed expression matches everything.
class expression {
public:
  using node = variant<constant, predicate, quantifier, conjunction,
                       disjunction, negation>;

  expression() = default;

  /// Constructs an expression.
  /// @param x The node to construct an expression from.
  /// @pre x must not be an empty connective.
  template <class T>
    requires(node::can_have<std::decay_t<T>>)
  expression(T&& x) : node_(std::forward<T>(x)) {
    if constexpr (std::same_as<std::decay_t<T>, conjunction>
                  || std::same_as<std::decay_t<T>, disjunction>) {
      RECON_ASSERT(!std::get<std::decay_t<T>>(node_).empty(),
                   "empty connective");
    }
  }

  /// @cond PRIVATE

  [[nodiscard]] const node& get_data() const;
  node& get_data();

  /// @endcond

private:
  node node_;
};

/// @relates expression
auto operator==(const expression& x, const expression& y) -> bool;

// -- combinators --------------------------------------------------------------

/// Combines expressions with AND. Nested conjunctions are flattened, `true`
/// constants dropped, and a `false` constant short-circuits the result.
auto conjoin(std::vector<expression> xs) -> expression;

/// Combines expressions with OR. Nested disjunctions are flattened, `false`
/// constants dropped, and a `true` constant short-circuits the result.
auto disjoin(std::vector<expression> xs) -> expression;

/// Negates an expression. Constants flip and double negations cancel out.
auto negate(expression x) -> expression;

/// Shorthand for a quantifier that needs one element to match.
auto any(std::string field, expression inner) -> expression;

/// Shorthand for a quantifier that needs every element to match.
auto all(std::string field, expression inner) -> expression;

/// Shorthand for a predicate that checks whether a path resolves.
auto exists(std::string field) -> expression;

// -- evaluation ---------------------------------------------------------------

/// Evaluates an expression against a document.
/// @param expr The expression to evaluate.
/// @param doc The document.
/// @param s The schema of *doc*, which decides which segments to map over.
/// @param base The full path of *doc* when evaluating in a quantifier scope.
auto evaluate(const expression& expr, const record& doc, const schema& s,
              std::string_view base = {}) -> bool;

} // namespace recon

template <>
struct fmt::formatter<recon::expression> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const recon::expression& x, fmt::format_context& ctx) const
    -> fmt::format_context::iterator;
};
