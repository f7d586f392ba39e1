//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/passive.hpp"

#include "recon/codec.hpp"
#include "recon/error.hpp"
#include "recon/query_value.hpp"
#include "recon/test/fixtures.hpp"
#include "recon/test/test.hpp"
#include "recon/time.hpp"

#include <limits>

using namespace recon;

namespace {

struct fixture : fixtures::databases {
  auto all() -> std::vector<record> {
    return unbox(passive.get(constant{true}));
  }

  auto count(caf::expected<expression> filter) -> size_t {
    return unbox(passive.count(unbox(std::move(filter))));
  }

  auto count(const expression& filter) -> size_t {
    return unbox(passive.count(filter));
  }
};

auto with_domains(std::initializer_list<std::string_view> domains)
  -> passive_database::info_resolver {
  auto xs = list{};
  for (auto x : domains) {
    xs.emplace_back(std::string{x});
  }
  return [xs = std::move(xs)](const record&) {
    return record{{"infos", record{{"domain", xs}}}};
  };
}

} // namespace

WITH_FIXTURE(fixture) {
  TEST("repeated observations fold into one record") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1", "192.0.2.1");
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{10}, answer));
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{5}, answer));
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{20}, answer));
    auto records = all();
    REQUIRE_EQUAL(records.size(), 1u);
    const auto& rec = records[0];
    CHECK_EQUAL(get_or_null(rec, "count"), data{int64_t{3}});
    CHECK_EQUAL(get_or_null(rec, "firstseen"), data{from_epoch(5)});
    CHECK_EQUAL(get_or_null(rec, "lastseen"), data{from_epoch(20)});
    CHECK_EQUAL(get_or_null(rec, "addr"), data{"192.0.2.1"});
  }

  TEST("observation counts add up") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    answer.insert_or_assign("count", int64_t{4});
    for (auto i = 0; i < 5; ++i) {
      REQUIRE_SUCCESS(passive.insert_or_update(int64_t{100 + i}, answer));
    }
    auto records = all();
    REQUIRE_EQUAL(records.size(), 1u);
    CHECK_EQUAL(get_or_null(records[0], "count"), data{int64_t{20}});
  }

  TEST("observed times do not split records") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    answer.insert_or_assign("firstseen", "2021-01-01");
    answer.insert_or_assign("lastseen", "2021-01-02");
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{10}, answer));
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{20}, answer));
    auto records = all();
    REQUIRE_EQUAL(records.size(), 1u);
    CHECK_EQUAL(get_or_null(records[0], "count"), data{int64_t{2}});
    CHECK_EQUAL(get_or_null(records[0], "firstseen"), data{from_epoch(10)});
    CHECK_EQUAL(get_or_null(records[0], "lastseen"), data{from_epoch(20)});
  }

  TEST("unusable counts are rejected") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    for (auto count : {data{std::numeric_limits<double>::quiet_NaN()},
                       data{1e300}, data{int64_t{-1}}, data{"many"}}) {
      MESSAGE("merging with count {}", count);
      answer.insert_or_assign("count", count);
      auto err = passive.insert_or_update(int64_t{1}, answer);
      REQUIRE(err);
      CHECK_EQUAL(err, caf::make_error(ec::invalid_argument));
    }
    CHECK(all().empty());
  }

  TEST("distinct observations stay apart") {
    for (auto [sensor, name] : {std::pair{"sensor1", "a.example.com"},
                                std::pair{"sensor2", "a.example.com"},
                                std::pair{"sensor1", "b.example.com"}}) {
      REQUIRE_SUCCESS(passive.insert_or_update(
        int64_t{1}, fixtures::dns_answer(sensor, name, "192.0.2.1")));
    }
    CHECK_EQUAL(all().size(), 3u);
    CHECK_EQUAL(count(passive.search_sensor(data{"sensor1"})), 2u);
    CHECK_EQUAL(count(passive.search_sensor(data{"sensor1"}, true)), 1u);
  }

  TEST("the explicit last-seen time") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{10}, answer, {},
                                             data{int64_t{30}}));
    auto rec = unbox(unbox(passive.get_one(constant{true})));
    CHECK_EQUAL(get_or_null(rec, "firstseen"), data{from_epoch(10)});
    CHECK_EQUAL(get_or_null(rec, "lastseen"), data{from_epoch(30)});
    auto invalid = passive.insert_or_update(data{"yesterday"}, answer);
    REQUIRE(invalid);
    CHECK_EQUAL(invalid, caf::make_error(ec::parse_error));
  }

  TEST("information resolves only on creation") {
    auto calls = 0;
    auto resolve = [&](const record& rec) {
      ++calls;
      CHECK_EQUAL(get_or_null(rec, "value"), data{"www.example.com"});
      return record{
        {"infos", record{{"domain", list{"example.com", "com"}}}},
      };
    };
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    for (auto i = 0; i < 3; ++i) {
      REQUIRE_SUCCESS(passive.insert_or_update(int64_t{i}, answer, resolve));
    }
    CHECK_EQUAL(calls, 1);
    auto rec = unbox(unbox(passive.get_one(constant{true})));
    CHECK_EQUAL(get_or_null(rec, "infos.domain"),
                (data{list{"example.com", "com"}}));
    CHECK_EQUAL(get_or_null(rec, "count"), data{int64_t{3}});
  }

  TEST("plain inserts do not fold") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1");
    answer.insert_or_assign("firstseen", "2021-03-01 10:00:00");
    answer.insert_or_assign("lastseen", "2021-03-01 10:00:00");
    auto first = unbox(passive.insert(answer));
    auto second = unbox(passive.insert(answer, with_domains({"example.com"})));
    CHECK_NOT_EQUAL(first, second);
    CHECK_EQUAL(all().size(), 2u);
    CHECK_EQUAL(count(passive.search_dns(data{"example.com"}, false,
                                         std::nullopt, true)),
                1u);
    auto rec = unbox(unbox(passive.get_one(
      passive.search_dns(data{"example.com"}, false, std::nullopt, true))));
    CHECK_EQUAL(get_or_null(rec, "firstseen"),
                data{unbox(parse_time("2021-03-01 10:00:00"))});
  }

  TEST("malformed records are rejected") {
    auto answer = fixtures::dns_answer("sensor1", "www.example.com",
                                       "192.0.2.1", "not-an-address");
    auto inserted = passive.insert(answer);
    REQUIRE(!inserted);
    CHECK_EQUAL(inserted.error(), caf::make_error(ec::parse_error));
    auto merged = passive.insert_or_update(int64_t{1}, answer);
    REQUIRE(merged);
    CHECK_EQUAL(merged, caf::make_error(ec::parse_error));
    CHECK(all().empty());
  }

  TEST("DNS answers") {
    REQUIRE(passive.insert(fixtures::dns_answer("s", "www.example.com",
                                                "192.0.2.1"),
                           with_domains({"example.com", "com"})));
    REQUIRE(passive.insert(fixtures::dns_answer("s", "mail.example.org",
                                                "192.0.2.2"),
                           with_domains({"example.org", "org"})));
    auto ptr = fixtures::dns_answer("s", "1.2.0.192.in-addr.arpa",
                                    "www.example.com");
    ptr.insert_or_assign("source", "PTR-127.0.0.1-53");
    REQUIRE(passive.insert(ptr));
    CHECK_EQUAL(count(passive.search_dns()), 3u);
    CHECK_EQUAL(count(passive.search_dns(data{"www.example.com"})), 1u);
    CHECK_EQUAL(count(passive.search_dns(data{"www.example.com"}, true)), 1u);
    CHECK_EQUAL(count(passive.search_dns(data{"example.com"}, false,
                                         std::nullopt, true)),
                1u);
    CHECK_EQUAL(count(passive.search_dns(data{list{"example.com", "org"}},
                                         false, std::nullopt, true)),
                2u);
    CHECK_EQUAL(count(passive.search_dns(std::nullopt, false, "a")), 2u);
    CHECK_EQUAL(count(passive.search_dns(std::nullopt, false, "ptr")), 1u);
  }

  TEST("ports and services") {
    auto banner = record{
      {"sensor", "s"},
      {"recontype", "TCP_SERVER_BANNER"},
      {"source", ""},
      {"value", "SSH-2.0-OpenSSH_8.4"},
      {"port", int64_t{22}},
      {"infos", record{{"service_name", "ssh"},
                       {"service_product", "OpenSSH"},
                       {"service_version", "8.4"}}},
    };
    REQUIRE(passive.insert(banner));
    CHECK_EQUAL(count(passive.search_port(22)), 1u);
    CHECK_EQUAL(count(passive.search_port(22, "tcp", "open", true)), 0u);
    auto udp = passive.search_port(53, "udp");
    REQUIRE(!udp);
    CHECK_EQUAL(udp.error(), caf::make_error(ec::invalid_argument));
    auto closed = passive.search_port(22, "tcp", "closed");
    REQUIRE(!closed);
    CHECK_EQUAL(closed.error(), caf::make_error(ec::invalid_argument));
    CHECK_EQUAL(count(passive.search_service(data{"ssh"}, 22)), 1u);
    CHECK_EQUAL(count(passive.search_product(data{"OpenSSH"}, data{"8.4"})),
                1u);
    CHECK_EQUAL(count(passive.search_tcp_srv_banner(
                  str_to_query_value("/^SSH-2\\.0/"))),
                1u);
    auto features
      = unbox(passive.features_port_list(constant{true}, false, true, true,
                                         false));
    CHECK_EQUAL(features, (list{list{int64_t{22}, "ssh", "OpenSSH"}}));
    CHECK_EQUAL(unbox(passive.features_port_list(constant{true}, false, false,
                                                 false, false)),
                (list{list{int64_t{22}}}));
  }

  TEST("user agents") {
    auto agent = record{
      {"sensor", "s"},
      {"recontype", "HTTP_CLIENT_HEADER"},
      {"source", "USER-AGENT"},
      {"value", "curl/7.74.0"},
    };
    REQUIRE(passive.insert(agent));
    CHECK_EQUAL(count(passive.search_user_agent()), 1u);
    CHECK_EQUAL(count(passive.search_user_agent(data{"curl/7.74.0"})), 1u);
    CHECK_EQUAL(count(passive.search_user_agent(data{"Wget"})), 0u);
    auto negated = passive.search_user_agent(data{"curl/7.74.0"}, true);
    REQUIRE(!negated);
    CHECK_EQUAL(negated.error(), caf::make_error(ec::invalid_argument));
  }

  TEST("first-seen and last-seen filters") {
    auto answer = fixtures::dns_answer("s", "old.example.com", "192.0.2.1");
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{1000}, answer));
    answer = fixtures::dns_answer("s", "new.example.com", "192.0.2.1");
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{5000}, answer, {},
                                             data{int64_t{9000}}));
    CHECK_EQUAL(count(passive.search_newer(int64_t{2000})), 1u);
    CHECK_EQUAL(count(passive.search_newer(int64_t{2000}, true)), 1u);
    CHECK_EQUAL(count(passive.search_newer(int64_t{6000}, false, false)), 1u);
    CHECK_EQUAL(count(passive.search_newer(int64_t{9000}, false, false)), 0u);
    CHECK_EQUAL(count(passive.search_time_ago(std::chrono::hours{1})), 0u);
    auto invalid = passive.search_newer(data{"tomorrow"});
    REQUIRE(!invalid);
    CHECK_EQUAL(invalid.error(), caf::make_error(ec::parse_error));
  }

  TEST("distinct and weighted top values") {
    auto popular
      = fixtures::dns_answer("s", "popular.example.com", "192.0.2.1");
    popular.insert_or_assign("count", int64_t{10});
    REQUIRE_SUCCESS(passive.insert_or_update(int64_t{1}, popular));
    for (auto sensor : {"s1", "s2", "s3"}) {
      REQUIRE_SUCCESS(passive.insert_or_update(
        int64_t{1}, fixtures::dns_answer(sensor, "rare.example.com",
                                         "192.0.2.2")));
    }
    auto distinct = unbox(passive.top_values("value"));
    REQUIRE_EQUAL(distinct.size(), 2u);
    CHECK_EQUAL(distinct[0], (value_count{"rare.example.com", 3}));
    CHECK_EQUAL(distinct[1], (value_count{"popular.example.com", 1}));
    auto weighted = unbox(passive.top_values("value", constant{true}, false));
    REQUIRE_EQUAL(weighted.size(), 2u);
    CHECK_EQUAL(weighted[0], (value_count{"popular.example.com", 10}));
    CHECK_EQUAL(weighted[1], (value_count{"rare.example.com", 3}));
  }

  TEST("networks of passive records") {
    for (auto addr : {"192.0.2.1", "192.0.2.2", "198.51.100.1"}) {
      REQUIRE_SUCCESS(passive.insert_or_update(
        int64_t{1}, fixtures::dns_answer("s", "x.example.com", addr, addr)));
    }
    auto nets = unbox(passive.top_values("net"));
    REQUIRE_EQUAL(nets.size(), 2u);
    CHECK_EQUAL(nets[0], (value_count{"192.0.2.0/24", 2}));
    CHECK_EQUAL(nets[1], (value_count{"198.51.100.0/24", 1}));
  }

  TEST("removal by filter") {
    REQUIRE_SUCCESS(passive.insert_or_update(
      int64_t{1}, fixtures::dns_answer("s1", "x.example.com", "192.0.2.1")));
    REQUIRE_SUCCESS(passive.insert_or_update(
      int64_t{1}, fixtures::dns_answer("s2", "x.example.com", "192.0.2.1")));
    CHECK_EQUAL(unbox(passive.remove(passive.search_sensor(data{"s1"}))), 1u);
    CHECK_EQUAL(all().size(), 1u);
    REQUIRE_SUCCESS(passive.init());
    CHECK(all().empty());
  }
}
