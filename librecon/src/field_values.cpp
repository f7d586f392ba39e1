//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/field_values.hpp"

#include "recon/schema.hpp"

#include <optional>
#include <utility>

namespace recon {

namespace {

struct weight_spec {
  std::string_view field = {};
  std::optional<int64_t> value = {};
};

auto weight_of(const record& doc, std::string_view count_field) -> int64_t {
  if (const auto* x = descend(doc, count_field)) {
    if (auto n = to_number(*x)) {
      return static_cast<int64_t>(*n);
    }
  }
  return 1;
}

auto resolve_weight(const record& doc, const weight_spec& weight) -> int64_t {
  if (weight.value) {
    return *weight.value;
  }
  if (weight.field.empty()) {
    return 1;
  }
  return weight_of(doc, weight.field);
}

using entry = std::pair<const data*, int64_t>;

auto walk(const record& doc, std::string_view path, const schema& s,
          std::string base, bool expand_leaf_lists, weight_spec weight)
  -> generator<entry> {
  auto dot = path.find('.');
  if (dot == std::string_view::npos) {
    auto it = doc.find(path);
    if (it == doc.end()) {
      co_return;
    }
    auto w = resolve_weight(doc, weight);
    const auto* xs = try_as<list>(&it->second);
    if (expand_leaf_lists && xs && s.is_list(join_path(base, path))) {
      for (const auto& x : *xs) {
        co_yield entry{&x, w};
      }
    } else {
      co_yield entry{&it->second, w};
    }
    co_return;
  }
  auto head = path.substr(0, dot);
  auto tail = path.substr(dot + 1);
  auto it = doc.find(head);
  if (it == doc.end()) {
    co_return;
  }
  // Once the traversal leaves the subtree that holds the count field, the
  // weight is fixed for everything below.
  if (!weight.value && !weight.field.empty()) {
    if (weight.field.size() > head.size() && weight.field.starts_with(head)
        && weight.field[head.size()] == '.') {
      weight.field = weight.field.substr(head.size() + 1);
    } else {
      weight.value = weight_of(doc, weight.field);
      weight.field = {};
    }
  }
  auto full = join_path(base, head);
  const auto* xs = try_as<list>(&it->second);
  if (xs && s.is_list(full)) {
    for (const auto& x : *xs) {
      if (const auto* nested = try_as<record>(&x)) {
        for (auto e : walk(*nested, tail, s, full, expand_leaf_lists, weight)) {
          co_yield e;
        }
      }
    }
  } else if (const auto* nested = try_as<record>(&it->second)) {
    for (auto e : walk(*nested, tail, s, full, expand_leaf_lists, weight)) {
      co_yield e;
    }
  }
}

} // namespace

auto field_values(const record& doc, std::string_view path, const schema& s,
                  std::string base, bool expand_leaf_lists)
  -> generator<const data*> {
  for (auto e : walk(doc, path, s, std::move(base), expand_leaf_lists, {})) {
    co_yield e.first;
  }
}

auto weighted_field_values(const record& doc, std::string_view path,
                           const schema& s, std::string_view count_field)
  -> generator<weighted_value> {
  for (auto e : walk(doc, path, s, {}, true, {count_field, std::nullopt})) {
    co_yield weighted_value{*e.first, e.second};
  }
}

auto weighted_field_values(const record& doc, std::string_view path,
                           const schema& s, int64_t weight)
  -> generator<weighted_value> {
  for (auto e : walk(doc, path, s, {}, true, {{}, weight})) {
    co_yield weighted_value{*e.first, e.second};
  }
}

} // namespace recon
