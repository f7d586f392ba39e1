//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/sort.hpp"

#include "recon/test/test.hpp"

#include <algorithm>
#include <random>
#include <vector>

using namespace recon;

namespace {

auto doc(int64_t id, data key) -> record {
  return record{{"id", id}, {"key", std::move(key)}};
}

auto ids(const std::vector<record>& xs) -> std::vector<int64_t> {
  auto result = std::vector<int64_t>{};
  for (const auto& x : xs) {
    result.push_back(as<int64_t>(x.find("id")->second));
  }
  return result;
}

} // namespace

TEST("sorting is stable") {
  auto xs = std::vector<record>{};
  for (auto i = int64_t{0}; i < 20; ++i) {
    xs.push_back(doc(i, i % 3));
  }
  auto engine = std::mt19937{42};
  for (auto round = 0; round < 5; ++round) {
    auto shuffled = xs;
    std::shuffle(shuffled.begin(), shuffled.end(), engine);
    auto order = ids(shuffled);
    auto keys = std::vector<sort_key>{{"key", sort_order::ascending}};
    sort(shuffled, keys);
    // Within each key, the relative order of the input survives.
    for (auto k = int64_t{0}; k < 3; ++k) {
      auto expected = std::vector<int64_t>{};
      std::copy_if(order.begin(), order.end(), std::back_inserter(expected),
                   [&](int64_t id) {
                     return id % 3 == k;
                   });
      auto actual = std::vector<int64_t>{};
      for (const auto& x : shuffled) {
        if (x.find("key")->second == data{k}) {
          actual.push_back(as<int64_t>(x.find("id")->second));
        }
      }
      CHECK(actual == expected);
    }
  }
}

TEST("missing values rank first ascending and last descending") {
  auto xs = std::vector<record>{
    doc(1, int64_t{5}),
    record{{"id", int64_t{2}}},
    doc(3, int64_t{1}),
    doc(4, data{}),
  };
  auto ascending = std::vector<sort_key>{{"key", sort_order::ascending}};
  auto ys = xs;
  sort(ys, ascending);
  CHECK(ids(ys) == (std::vector<int64_t>{2, 4, 3, 1}));
  auto descending = std::vector<sort_key>{{"key", sort_order::descending}};
  ys = xs;
  sort(ys, descending);
  CHECK(ids(ys) == (std::vector<int64_t>{1, 3, 2, 4}));
}

TEST("later keys break ties") {
  auto xs = std::vector<record>{
    record{{"id", int64_t{1}}, {"a", int64_t{1}}, {"b", "y"}},
    record{{"id", int64_t{2}}, {"a", int64_t{0}}, {"b", "z"}},
    record{{"id", int64_t{3}}, {"a", int64_t{1}}, {"b", "x"}},
  };
  auto keys = std::vector<sort_key>{{"a", sort_order::descending},
                                    {"b", sort_order::ascending}};
  sort(xs, keys);
  CHECK(ids(xs) == (std::vector<int64_t>{3, 1, 2}));
  CHECK_EQUAL(compare(xs[0], xs[0], keys), 0);
  CHECK(compare(xs[0], xs[1], keys) < 0);
}

TEST("keys resolve nested paths") {
  auto xs = std::vector<record>{
    record{{"id", int64_t{1}}, {"infos", record{{"as_num", int64_t{9}}}}},
    record{{"id", int64_t{2}}, {"infos", record{{"as_num", int64_t{3}}}}},
  };
  auto keys = std::vector<sort_key>{{"infos.as_num"}};
  sort(xs, keys);
  CHECK(ids(xs) == (std::vector<int64_t>{2, 1}));
}
