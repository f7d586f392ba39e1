//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace recon::detail {

/// An associative container that keeps its entries in insertion order.
/// Lookup is linear, which beats hashing for the small documents we store.
template <class Key, class T>
class stable_map {
public:
  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;
  using size_type = typename vector_type::size_type;

  stable_map() = default;

  stable_map(std::initializer_list<value_type> xs) {
    xs_.reserve(xs.size());
    for (const auto& x : xs) {
      insert_or_assign(x.first, x.second);
    }
  }

  // -- iterators -------------------------------------------------------------

  auto begin() -> iterator {
    return xs_.begin();
  }

  auto begin() const -> const_iterator {
    return xs_.begin();
  }

  auto end() -> iterator {
    return xs_.end();
  }

  auto end() const -> const_iterator {
    return xs_.end();
  }

  // -- capacity --------------------------------------------------------------

  [[nodiscard]] auto empty() const -> bool {
    return xs_.empty();
  }

  [[nodiscard]] auto size() const -> size_type {
    return xs_.size();
  }

  void reserve(size_type n) {
    xs_.reserve(n);
  }

  // -- lookup ----------------------------------------------------------------

  template <class K>
  auto find(const K& key) -> iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const auto& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto find(const K& key) const -> const_iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const auto& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto contains(const K& key) const -> bool {
    return find(key) != end();
  }

  // -- modifiers -------------------------------------------------------------

  template <class K, class... Ts>
  auto emplace(K&& key, Ts&&... xs) -> std::pair<iterator, bool> {
    if (auto i = find(key); i != end()) {
      return {i, false};
    }
    xs_.emplace_back(std::piecewise_construct,
                     std::forward_as_tuple(std::forward<K>(key)),
                     std::forward_as_tuple(std::forward<Ts>(xs)...));
    return {std::prev(xs_.end()), true};
  }

  template <class K, class V>
  auto insert_or_assign(K&& key, V&& value) -> std::pair<iterator, bool> {
    if (auto i = find(key); i != end()) {
      i->second = std::forward<V>(value);
      return {i, false};
    }
    xs_.emplace_back(Key(std::forward<K>(key)), T(std::forward<V>(value)));
    return {std::prev(xs_.end()), true};
  }

  template <class K>
  auto operator[](K&& key) -> T& {
    return emplace(std::forward<K>(key)).first->second;
  }

  auto erase(const_iterator i) -> iterator {
    return xs_.erase(i);
  }

  template <class K>
  auto erase(const K& key) -> size_type {
    auto i = find(key);
    if (i == end()) {
      return 0;
    }
    xs_.erase(i);
    return 1;
  }

  void clear() {
    xs_.clear();
  }

  /// Compares as unordered sets of entries.
  friend auto operator==(const stable_map& x, const stable_map& y) -> bool {
    if (x.size() != y.size()) {
      return false;
    }
    return std::all_of(x.begin(), x.end(), [&](const auto& entry) {
      auto i = y.find(entry.first);
      return i != y.end() && i->second == entry.second;
    });
  }

  /// Orders lexicographically by entries in insertion order.
  friend auto operator<(const stable_map& x, const stable_map& y) -> bool {
    return x.xs_ < y.xs_;
  }

private:
  vector_type xs_;
};

} // namespace recon::detail
