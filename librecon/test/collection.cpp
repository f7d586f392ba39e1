//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/collection.hpp"

#include "recon/error.hpp"
#include "recon/schema.hpp"
#include "recon/test/test.hpp"

#include <array>

using namespace recon;

namespace {

auto eq(std::string field, data rhs) -> expression {
  return predicate{std::move(field), relational_operator::equal,
                   std::move(rhs)};
}

struct fixture {
  fixture() {
    coll = unbox(store.open("things", schema::passive()));
    a = unbox(coll->insert(record{{"name", "a"}, {"n", int64_t{1}}}));
    b = unbox(coll->insert(record{{"name", "b"}, {"n", int64_t{2}}}));
    c = unbox(coll->insert(record{{"name", "c"}, {"n", int64_t{2}}}));
  }

  memory_backend store;
  std::shared_ptr<collection> coll;
  document_id a = 0;
  document_id b = 0;
  document_id c = 0;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("identifiers are unique and increasing") {
    CHECK(a < b);
    CHECK(b < c);
    CHECK_EQUAL(coll->name(), "things");
  }

  TEST("search keeps insertion order") {
    auto docs = unbox(coll->search(eq("n", int64_t{2})));
    REQUIRE_EQUAL(docs.size(), 2u);
    CHECK_EQUAL(docs[0].id, b);
    CHECK_EQUAL(docs[1].id, c);
    CHECK_EQUAL(unbox(coll->count(constant{true})), 3u);
  }

  TEST("removal by filter and by identifier") {
    CHECK_EQUAL(unbox(coll->remove(eq("name", "a"))), 1u);
    auto ids = std::array{c, document_id{4711}};
    CHECK_EQUAL(unbox(coll->remove(std::span<const document_id>{ids})), 1u);
    auto docs = unbox(coll->search(constant{true}));
    REQUIRE_EQUAL(docs.size(), 1u);
    CHECK_EQUAL(docs[0].id, b);
  }

  TEST("updates transform in place") {
    auto ids = std::array{a, b};
    auto err = coll->update(
      [](record& doc) {
        doc.insert_or_assign("seen", true);
      },
      std::span<const document_id>{ids});
    CHECK_SUCCESS(err);
    CHECK_EQUAL(unbox(coll->count(exists("seen"))), 2u);
    auto missing = std::array{document_id{4711}};
    err = coll->update([](record&) {}, std::span<const document_id>{missing});
    CHECK_EQUAL(err, caf::make_error(ec::lookup_error));
  }

  TEST("upserts merge or insert") {
    auto id = unbox(coll->upsert(record{{"n", int64_t{3}}}, eq("name", "b")));
    CHECK_EQUAL(id, b);
    CHECK_EQUAL(unbox(coll->count(eq("n", int64_t{3}))), 1u);
    id = unbox(coll->upsert(record{{"name", "d"}}, eq("name", "d")));
    CHECK(id > c);
    CHECK_EQUAL(unbox(coll->count(constant{true})), 4u);
  }

  TEST("documents outlive handles") {
    coll.reset();
    auto reopened = unbox(store.open("things", schema::passive()));
    CHECK_EQUAL(unbox(reopened->count(constant{true})), 3u);
    CHECK_EQUAL(store.opened(), 2u);
    CHECK_SUCCESS(reopened->purge());
    CHECK_EQUAL(unbox(reopened->count(constant{true})), 0u);
  }
}
