//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/field_values.hpp"

#include "recon/schema.hpp"
#include "recon/test/test.hpp"

using namespace recon;

namespace {

const auto host = record{
  {"addr", "192.0.2.1"},
  {"categories", list{"web", "mail"}},
  {"ports",
   list{
     record{
       {"port", int64_t{80}},
       {"scripts", list{record{{"id", "http-title"}, {"output", "Welcome"}},
                        record{{"id", "http-server-header"},
                               {"output", "nginx"}}}},
     },
     record{{"port", int64_t{22}}},
     record{
       {"port", int64_t{443}},
       {"scripts", list{record{{"id", "ssl-cert"}, {"output", "CN=x"}}}},
     },
   }},
  {"infos", record{{"as_num", int64_t{15169}}}},
};

auto values(const record& doc, std::string_view path) -> list {
  auto result = list{};
  for (const auto* x : field_values(doc, path, schema::hosts())) {
    result.push_back(*x);
  }
  return result;
}

} // namespace

TEST("plain paths") {
  CHECK_EQUAL(values(host, "addr"), list{"192.0.2.1"});
  CHECK_EQUAL(values(host, "infos.as_num"), list{int64_t{15169}});
}

TEST("list fields flatten") {
  CHECK_EQUAL(values(host, "categories"), (list{"web", "mail"}));
  CHECK_EQUAL(values(host, "ports.port"),
              (list{int64_t{80}, int64_t{22}, int64_t{443}}));
  CHECK_EQUAL(values(host, "ports.scripts.id"),
              (list{"http-title", "http-server-header", "ssl-cert"}));
}

TEST("leaf lists stay whole on request") {
  auto n = 0;
  for (const auto* x : field_values(host, "categories", schema::hosts(), {},
                                    false)) {
    CHECK(is<list>(*x));
    ++n;
  }
  CHECK_EQUAL(n, 1);
}

TEST("missing paths yield nothing") {
  CHECK(values(host, "infos.as_name").empty());
  CHECK(values(host, "os.osclass.vendor").empty());
  CHECK(values(host, "addr.octet").empty());
  CHECK(values(record{}, "ports.port").empty());
}

TEST("weights come from the count field") {
  auto rec = record{{"value", "example.com"}, {"count", int64_t{7}}};
  auto n = 0;
  for (auto x : weighted_field_values(rec, "value", schema::passive(),
                                      "count")) {
    CHECK_EQUAL(x.value, data{"example.com"});
    CHECK_EQUAL(x.weight, 7);
    ++n;
  }
  CHECK_EQUAL(n, 1);
  auto uncounted = record{{"value", "x"}};
  for (auto x : weighted_field_values(uncounted, "value", schema::passive(),
                                      "count")) {
    CHECK_EQUAL(x.weight, 1);
  }
}

TEST("weights are local to list elements") {
  auto doc = record{
    {"ports", list{record{{"port", int64_t{80}}, {"n", int64_t{3}}},
                   record{{"port", int64_t{22}}, {"n", int64_t{5}}}}},
  };
  auto weights = std::vector<int64_t>{};
  for (auto x : weighted_field_values(doc, "ports.port", schema::hosts(),
                                      "ports.n")) {
    weights.push_back(x.weight);
  }
  CHECK(weights == (std::vector<int64_t>{3, 5}));
}

TEST("fixed weights") {
  for (auto x : weighted_field_values(host, "ports.port", schema::hosts(),
                                      int64_t{4})) {
    CHECK_EQUAL(x.weight, 4);
  }
}
