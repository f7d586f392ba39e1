//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/sort.hpp"

#include "recon/data.hpp"

#include <algorithm>

namespace recon {

namespace {

auto lookup(const record& x, const std::string& field) -> const data* {
  const auto* result = descend(x, field);
  if (result && is<caf::none_t>(*result)) {
    return nullptr;
  }
  return result;
}

} // namespace

auto compare(const record& x, const record& y, std::span<const sort_key> keys)
  -> int {
  for (const auto& key : keys) {
    auto direction = key.order == sort_order::ascending ? 1 : -1;
    const auto* lhs = lookup(x, key.field);
    const auto* rhs = lookup(y, key.field);
    if (!lhs && !rhs) {
      continue;
    }
    if (!lhs) {
      return -direction;
    }
    if (!rhs) {
      return direction;
    }
    if (*lhs == *rhs) {
      continue;
    }
    return *lhs < *rhs ? -direction : direction;
  }
  return 0;
}

void sort(std::vector<record>& xs, std::span<const sort_key> keys) {
  std::stable_sort(xs.begin(), xs.end(),
                   [&](const record& lhs, const record& rhs) {
                     return compare(lhs, rhs, keys) < 0;
                   });
}

} // namespace recon
