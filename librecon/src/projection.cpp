//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/projection.hpp"

#include "recon/defaults.hpp"
#include "recon/detail/string.hpp"
#include "recon/schema.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace recon {

namespace {

/// A prefix tree of requested path segments.
struct projection_node {
  std::string name;
  bool whole = false;
  std::vector<projection_node> children;

  auto child(std::string_view segment) -> projection_node& {
    auto it = std::find_if(children.begin(), children.end(),
                           [&](const projection_node& x) {
                             return x.name == segment;
                           });
    if (it != children.end()) {
      return *it;
    }
    children.push_back(projection_node{std::string{segment}});
    return children.back();
  }
};

auto make_tree(std::span<const std::string> fields) -> projection_node {
  auto root = projection_node{};
  for (const auto& field : fields) {
    auto* current = &root;
    for (auto segment : detail::split(field, ".")) {
      if (current->whole) {
        break;
      }
      current = &current->child(segment);
    }
    if (!current->whole && current != &root) {
      current->whole = true;
      current->children.clear();
    }
  }
  return root;
}

auto extract(const record& doc, const projection_node& wanted,
             const schema& s, const std::string& base) -> record {
  auto result = record{};
  for (const auto& node : wanted.children) {
    auto it = doc.find(node.name);
    if (it == doc.end()) {
      continue;
    }
    if (node.whole) {
      result.emplace(node.name, it->second);
      continue;
    }
    auto full = join_path(base, node.name);
    const auto* xs = try_as<list>(&it->second);
    if (xs && s.is_list(full)) {
      auto elements = list{};
      elements.reserve(xs->size());
      for (const auto& x : *xs) {
        if (const auto* nested = try_as<record>(&x)) {
          elements.emplace_back(extract(*nested, node, s, full));
        }
      }
      result.emplace(node.name, std::move(elements));
    } else if (const auto* nested = try_as<record>(&it->second)) {
      result.emplace(node.name, extract(*nested, node, s, full));
    }
  }
  return result;
}

} // namespace

auto project(const record& doc, std::span<const std::string> fields,
             const schema& s) -> record {
  auto tree = make_tree(fields);
  auto result = extract(doc, tree, s, {});
  auto id = doc.find(defaults::db::id_field);
  if (id != doc.end() && !result.contains(defaults::db::id_field)) {
    auto with_id = record{};
    with_id.reserve(result.size() + 1);
    with_id.emplace(id->first, id->second);
    for (auto& [k, v] : result) {
      with_id.emplace(std::move(k), std::move(v));
    }
    return with_id;
  }
  return result;
}

} // namespace recon
