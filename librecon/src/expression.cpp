//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/expression.hpp"

#include "recon/field_values.hpp"
#include "recon/schema.hpp"

#include <algorithm>

namespace recon {

predicate::predicate(std::string field, relational_operator op, data rhs)
  : field{std::move(field)}, op{op}, rhs{std::move(rhs)} {
  // nop
}

conjunction::conjunction(const super& other) : super(other) {
  // nop
}

conjunction::conjunction(super&& other) noexcept : super(std::move(other)) {
  // nop
}

disjunction::disjunction(const super& other) : super(other) {
  // nop
}

disjunction::disjunction(super&& other) noexcept : super(std::move(other)) {
  // nop
}

negation::negation() : expr_{std::make_unique<expression>()} {
  // nop
}

negation::negation(expression expr)
  : expr_{std::make_unique<expression>(std::move(expr))} {
  // nop
}

negation::negation(const negation& other)
  : expr_{std::make_unique<expression>(*other.expr_)} {
  // nop
}

negation::negation(negation&& other) noexcept
  : expr_{std::move(other.expr_)} {
  // nop
}

negation& negation::operator=(const negation& other) {
  expr_ = std::make_unique<expression>(*other.expr_);
  return *this;
}

negation& negation::operator=(negation&& other) noexcept {
  expr_ = std::move(other.expr_);
  return *this;
}

const expression& negation::expr() const {
  return *expr_;
}

expression& negation::expr() {
  return *expr_;
}

auto operator==(const negation& x, const negation& y) -> bool {
  return x.expr() == y.expr();
}

quantifier::quantifier() : inner_{std::make_unique<expression>()} {
  // nop
}

quantifier::quantifier(quantifier_kind kind, std::string field,
                       expression inner)
  : kind{kind},
    field{std::move(field)},
    inner_{std::make_unique<expression>(std::move(inner))} {
  // nop
}

quantifier::quantifier(const quantifier& other)
  : kind{other.kind},
    field{other.field},
    inner_{std::make_unique<expression>(*other.inner_)} {
  // nop
}

quantifier::quantifier(quantifier&& other) noexcept
  : kind{other.kind},
    field{std::move(other.field)},
    inner_{std::move(other.inner_)} {
  // nop
}

quantifier& quantifier::operator=(const quantifier& other) {
  kind = other.kind;
  field = other.field;
  inner_ = std::make_unique<expression>(*other.inner_);
  return *this;
}

quantifier& quantifier::operator=(quantifier&& other) noexcept {
  kind = other.kind;
  field = std::move(other.field);
  inner_ = std::move(other.inner_);
  return *this;
}

const expression& quantifier::inner() const {
  return *inner_;
}

auto operator==(const quantifier& x, const quantifier& y) -> bool {
  return x.kind == y.kind && x.field == y.field && x.inner() == y.inner();
}

const expression::node& expression::get_data() const {
  return node_;
}

expression::node& expression::get_data() {
  return node_;
}

auto operator==(const expression& x, const expression& y) -> bool {
  return static_cast<const std::variant<constant, predicate, quantifier,
                                        conjunction, disjunction, negation>&>(
           x.get_data())
         == y.get_data();
}

// -- combinators --------------------------------------------------------------

namespace {

template <class Connective>
auto combine(std::vector<expression> xs, bool identity) -> expression {
  auto result = Connective{};
  result.reserve(xs.size());
  for (auto& x : xs) {
    if (auto* c = try_as<constant>(&x)) {
      if (c->value == identity) {
        continue;
      }
      return constant{!identity};
    }
    if (auto* nested = try_as<Connective>(&x)) {
      for (auto& y : *nested) {
        result.push_back(std::move(y));
      }
      continue;
    }
    result.push_back(std::move(x));
  }
  if (result.empty()) {
    return constant{identity};
  }
  if (result.size() == 1) {
    return std::move(result.front());
  }
  return result;
}

} // namespace

auto conjoin(std::vector<expression> xs) -> expression {
  return combine<conjunction>(std::move(xs), true);
}

auto disjoin(std::vector<expression> xs) -> expression {
  return combine<disjunction>(std::move(xs), false);
}

auto negate(expression x) -> expression {
  if (auto* c = try_as<constant>(&x)) {
    return constant{!c->value};
  }
  if (auto* n = try_as<negation>(&x)) {
    return std::move(n->expr());
  }
  return negation{std::move(x)};
}

auto any(std::string field, expression inner) -> expression {
  return quantifier{quantifier_kind::any, std::move(field), std::move(inner)};
}

auto all(std::string field, expression inner) -> expression {
  return quantifier{quantifier_kind::all, std::move(field), std::move(inner)};
}

auto exists(std::string field) -> expression {
  return predicate{std::move(field), relational_operator::exists};
}

// -- evaluation ---------------------------------------------------------------

namespace {

auto evaluate_predicate(const predicate& pred, const record& doc,
                        const schema& s, std::string_view base) -> bool {
  auto leaf_is_list = s.is_list(join_path(base, pred.field));
  auto maps_over_elements = pred.op != relational_operator::exists
                            && pred.op != relational_operator::ni
                            && pred.op != relational_operator::match;
  for (const auto* x : field_values(doc, pred.field, s, std::string{base},
                                    false)) {
    if (pred.op == relational_operator::exists) {
      return true;
    }
    const auto* xs = try_as<list>(x);
    if (xs && leaf_is_list && maps_over_elements) {
      auto hit = std::any_of(xs->begin(), xs->end(), [&](const data& element) {
        return evaluate(element, pred.op, pred.rhs);
      });
      if (hit) {
        return true;
      }
      continue;
    }
    if (evaluate(*x, pred.op, pred.rhs)) {
      return true;
    }
  }
  return false;
}

auto evaluate_quantifier(const quantifier& q, const record& doc,
                         const schema& s, std::string_view base) -> bool {
  auto scope = join_path(base, q.field);
  auto test = [&](const data& element) {
    const auto* nested = try_as<record>(&element);
    return nested && evaluate(q.inner(), *nested, s, scope);
  };
  for (const auto* x : field_values(doc, q.field, s, std::string{base},
                                    false)) {
    const auto* xs = try_as<list>(x);
    if (!xs) {
      continue;
    }
    auto hit = q.kind == quantifier_kind::any
                 ? std::any_of(xs->begin(), xs->end(), test)
                 : std::all_of(xs->begin(), xs->end(), test);
    if (hit) {
      return true;
    }
  }
  return false;
}

} // namespace

auto evaluate(const expression& expr, const record& doc, const schema& s,
              std::string_view base) -> bool {
  return match(
    expr,
    [](const constant& c) {
      return c.value;
    },
    [&](const predicate& pred) {
      return evaluate_predicate(pred, doc, s, base);
    },
    [&](const quantifier& q) {
      return evaluate_quantifier(q, doc, s, base);
    },
    [&](const conjunction& xs) {
      return std::all_of(xs.begin(), xs.end(), [&](const expression& x) {
        return evaluate(x, doc, s, base);
      });
    },
    [&](const disjunction& xs) {
      return std::any_of(xs.begin(), xs.end(), [&](const expression& x) {
        return evaluate(x, doc, s, base);
      });
    },
    [&](const negation& n) {
      return !evaluate(n.expr(), doc, s, base);
    });
}

} // namespace recon

auto fmt::formatter<recon::expression>::format(const recon::expression& x,
                                               fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  using namespace recon;
  auto out = ctx.out();
  auto join = [&](const auto& xs, std::string_view sep) {
    out = fmt::format_to(out, "(");
    for (auto i = size_t{0}; i < xs.size(); ++i) {
      if (i != 0) {
        out = fmt::format_to(out, " {} ", sep);
      }
      out = fmt::format_to(out, "{}", xs[i]);
    }
    return fmt::format_to(out, ")");
  };
  return match(
    x,
    [&](const constant& c) {
      return fmt::format_to(out, "{}", c.value);
    },
    [&](const predicate& pred) {
      if (pred.op == relational_operator::exists) {
        return fmt::format_to(out, "exists({})", pred.field);
      }
      return fmt::format_to(out, "{} {} {}", pred.field, pred.op, pred.rhs);
    },
    [&](const quantifier& q) {
      return fmt::format_to(out, "{}({}, {})",
                            q.kind == quantifier_kind::any ? "any" : "all",
                            q.field, q.inner());
    },
    [&](const conjunction& xs) {
      return join(xs, "&&");
    },
    [&](const disjunction& xs) {
      return join(xs, "||");
    },
    [&](const negation& n) {
      return fmt::format_to(out, "!{}", n.expr());
    });
}
