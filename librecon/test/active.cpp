//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/active.hpp"

#include "recon/error.hpp"
#include "recon/test/fixtures.hpp"
#include "recon/test/test.hpp"

#include <algorithm>

using namespace recon;
using namespace std::chrono_literals;

namespace {

struct fixture : fixtures::databases {
  fixture() {
    web = unbox(nmap.store_host(fixtures::host(
      "192.0.2.1",
      list{
        fixtures::port("tcp", 80, "open",
                       record{{"service_name", "http"},
                              {"service_product", "nginx"},
                              {"service_version", "1.18.0"}}),
        fixtures::port("tcp", 22, "closed"),
      },
      record{
        {"categories", list{"web"}},
        {"hostnames", list{record{{"name", "www.example.com"},
                                  {"domains", list{"example.com", "com"}}}}},
        {"infos", record{{"country_code", "DE"},
                         {"city", "Berlin"},
                         {"as_num", int64_t{15169}},
                         {"as_name", "GOOGLE"},
                         {"coordinates", list{52.5, 13.4}}}},
        {"openports", record{{"count", int64_t{1}}}},
      })));
    mail = unbox(nmap.store_host(fixtures::host(
      "192.0.2.2",
      list{
        fixtures::port("tcp", 25, "open", record{{"service_name", "smtp"}}),
        fixtures::port("tcp", 22, "open",
                       record{{"service_name", "ssh"},
                              {"service_product", "OpenSSH"}}),
      },
      record{
        {"categories", list{"mail"}},
        {"infos", record{{"country_code", "GB"},
                         {"as_num", int64_t{15169}},
                         {"as_name", "GOOGLE"},
                         {"coordinates", list{52.5, 13.4}}}},
        {"openports", record{{"count", int64_t{2}}}},
      })));
    dns = unbox(nmap.store_host(fixtures::host(
      "198.51.100.7",
      list{fixtures::port("udp", 53, "open",
                          record{{"service_name", "domain"}})},
      record{
        {"infos", record{{"country_code", "US"},
                         {"as_num", int64_t{8075}},
                         {"as_name", "MICROSOFT"}}},
        {"openports", record{{"count", int64_t{1}}}},
      })));
  }

  auto addrs(const expression& filter) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& host : unbox(nmap.get(filter))) {
      result.push_back(as<std::string>(host.find("addr")->second));
    }
    return result;
  }

  auto addrs(caf::expected<expression> filter) -> std::vector<std::string> {
    return addrs(unbox(std::move(filter)));
  }

  std::string web;
  std::string mail;
  std::string dns;
};

using strings = std::vector<std::string>;

} // namespace

WITH_FIXTURE(fixture) {
  TEST("hosts come back in external form") {
    auto hosts = unbox(nmap.get(constant{true}));
    REQUIRE_EQUAL(hosts.size(), 3u);
    const auto& host = hosts[0];
    CHECK_EQUAL(host.find("_id")->second, data{web});
    CHECK_EQUAL(host.find("addr")->second, data{"192.0.2.1"});
    CHECK_EQUAL(host.find("starttime")->second,
                data{unbox(parse_time("2021-03-01 10:00:00"))});
    CHECK_EQUAL(unbox(nmap.count(constant{true})), 3u);
  }

  TEST("hosts keep a given identifier") {
    auto host = fixtures::host("203.0.113.9");
    host.insert_or_assign("_id", "my-host");
    CHECK_EQUAL(unbox(nmap.store_host(host)), "my-host");
    CHECK_EQUAL(addrs(nmap.search_object_id(data{"my-host"})),
                strings{"203.0.113.9"});
  }

  TEST("malformed hosts are rejected") {
    auto stored = nmap.store_host(fixtures::host("not-an-address"));
    REQUIRE(!stored);
    CHECK_EQUAL(stored.error(), caf::make_error(ec::parse_error));
    CHECK_EQUAL(unbox(nmap.count(constant{true})), 3u);
  }

  TEST("port scenario") {
    CHECK_EQUAL(addrs(nmap.search_port(int64_t{80})), strings{"192.0.2.1"});
    CHECK(addrs(nmap.search_port(int64_t{80}, "tcp", "closed")).empty());
    auto negated = addrs(nmap.search_port(int64_t{80}, "tcp", "open", true));
    CHECK(std::find(negated.begin(), negated.end(), "192.0.2.1")
          == negated.end());
    CHECK_EQUAL(negated, (strings{"192.0.2.2", "198.51.100.7"}));
  }

  TEST("negated ports match other states") {
    // The web host has port 22 closed; the mail host has it open.
    CHECK_EQUAL(addrs(nmap.search_port(int64_t{22}, "tcp", "open", true)),
                (strings{"192.0.2.1", "198.51.100.7"}));
  }

  TEST("port lists") {
    CHECK_EQUAL(addrs(nmap.search_ports(list{int64_t{25}, int64_t{22}})),
                strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_ports(list{int64_t{25}, int64_t{80}}, "tcp",
                                        "open", true)),
                strings{"198.51.100.7"});
    CHECK_EQUAL(addrs(nmap.search_ports_other(list{int64_t{80}})),
                strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_open_port(true)), strings{});
  }

  TEST("open port counts") {
    CHECK_EQUAL(addrs(nmap.search_count_open_ports(2, std::nullopt)),
                strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_count_open_ports(1, 1)),
                (strings{"192.0.2.1", "198.51.100.7"}));
    CHECK_EQUAL(addrs(nmap.search_count_open_ports(2, 5, true)),
                (strings{"192.0.2.1", "198.51.100.7"}));
    auto unbounded = nmap.search_count_open_ports(std::nullopt, std::nullopt);
    REQUIRE(!unbounded);
    CHECK_EQUAL(unbounded.error(), caf::make_error(ec::invalid_argument));
  }

  TEST("addresses") {
    CHECK_EQUAL(addrs(nmap.search_host("192.0.2.2")), strings{"192.0.2.2"});
    auto xs = strings{"192.0.2.2", "198.51.100.7"};
    CHECK_EQUAL(addrs(nmap.search_hosts(xs)), xs);
    CHECK_EQUAL(addrs(nmap.search_hosts(xs, true)), strings{"192.0.2.1"});
    CHECK_EQUAL(addrs(nmap.search_net("192.0.2.0/24")),
                (strings{"192.0.2.1", "192.0.2.2"}));
    CHECK_EQUAL(addrs(nmap.search_net("192.0.2.0/24", true)),
                strings{"198.51.100.7"});
    CHECK_EQUAL(addrs(nmap.search_range("192.0.2.2", "198.51.100.7")),
                (strings{"192.0.2.2", "198.51.100.7"}));
    CHECK_EQUAL(addrs(nmap.search_ipv4()).size(), 3u);
    CHECK(addrs(nmap.search_ipv6()).empty());
    auto bad = nmap.search_host("192.0.2");
    REQUIRE(!bad);
    CHECK_EQUAL(bad.error(), caf::make_error(ec::parse_error));
  }

  TEST("geolocation and autonomous systems") {
    CHECK_EQUAL(addrs(nmap.search_country(data{"UK"})), strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_country(data{"EU"})),
                (strings{"192.0.2.1", "192.0.2.2"}));
    CHECK_EQUAL(addrs(nmap.search_country(data{"US"}, true)),
                (strings{"192.0.2.1", "192.0.2.2"}));
    CHECK_EQUAL(addrs(nmap.search_city(data{"Berlin"})), strings{"192.0.2.1"});
    CHECK_EQUAL(addrs(nmap.search_asnum(data{"AS8075"})),
                strings{"198.51.100.7"});
    auto both = data{list{int64_t{8075}, "15169"}};
    CHECK_EQUAL(addrs(nmap.search_asnum(both)).size(), 3u);
    CHECK_EQUAL(addrs(nmap.search_asname(str_to_query_value("/^micro/i"))),
                strings{"198.51.100.7"});
    CHECK_EQUAL(addrs(nmap.search_has_location(true)),
                strings{"198.51.100.7"});
    auto bad = nmap.search_asnum(data{"ASX"});
    CHECK(!bad);
  }

  TEST("names and categories") {
    CHECK_EQUAL(addrs(nmap.search_domain(data{"example.com"})),
                strings{"192.0.2.1"});
    CHECK_EQUAL(addrs(nmap.search_hostname(str_to_query_value("/^www\\./"))),
                strings{"192.0.2.1"});
    CHECK_EQUAL(addrs(nmap.search_category(data{"mail"})),
                strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_category(data{"mail"}, true)),
                (strings{"192.0.2.1", "198.51.100.7"}));
    CHECK_EQUAL(addrs(nmap.search_source(data{"test"})).size(), 3u);
  }

  TEST("services and products") {
    CHECK_EQUAL(addrs(nmap.search_service(data{"ssh"})), strings{"192.0.2.2"});
    CHECK_EQUAL(addrs(nmap.search_service(data{"domain"}, 53, "udp")),
                strings{"198.51.100.7"});
    CHECK(addrs(nmap.search_service(data{"domain"}, 53, "tcp")).empty());
    CHECK_EQUAL(addrs(nmap.search_product(data{"nginx"}, data{"1.18.0"})),
                strings{"192.0.2.1"});
    CHECK(addrs(nmap.search_product(data{"nginx"}, data{"1.19.0"})).empty());
  }

  TEST("time filters") {
    CHECK_EQUAL(addrs(nmap.search_time_range(data{"2021-03-01"},
                                             data{"2021-03-02"}))
                  .size(),
                3u);
    CHECK(addrs(nmap.search_time_range(data{"2021-03-02"},
                                       data{"2021-03-03"}))
            .empty());
    CHECK(addrs(nmap.search_time_ago(24h)).empty());
    CHECK_EQUAL(addrs(nmap.search_time_ago(24h, true)).size(), 3u);
  }

  TEST("comparisons") {
    CHECK_EQUAL(addrs(nmap.search_cmp("openports.count", int64_t{1}, ">")),
                strings{"192.0.2.2"});
    auto bad = nmap.search_cmp("openports.count", int64_t{1}, "==");
    REQUIRE(!bad);
    CHECK_EQUAL(bad.error(), caf::make_error(ec::invalid_argument));
    CHECK_EQUAL(addrs(nmap.search_val("infos.city", "Berlin")),
                strings{"192.0.2.1"});
    CHECK(addrs(nmap.search_nonexistent()).empty());
    auto either = nmap.flt_or({unbox(nmap.search_host("192.0.2.1")),
                               unbox(nmap.search_host("192.0.2.2"))});
    CHECK_EQUAL(addrs(either).size(), 2u);
    CHECK_EQUAL(nmap.flt2str(nmap.flt_and({})), "true");
  }

  TEST("query options") {
    auto opts = query_options{};
    opts.sort = {{"infos.as_num", sort_order::ascending},
                 {"addr", sort_order::descending}};
    opts.fields = std::vector<std::string>{"addr"};
    opts.limit = 2;
    auto hosts = unbox(nmap.get(constant{true}, opts));
    REQUIRE_EQUAL(hosts.size(), 2u);
    CHECK_EQUAL(hosts[0].find("addr")->second, data{"198.51.100.7"});
    CHECK_EQUAL(hosts[1].find("addr")->second, data{"192.0.2.2"});
    CHECK(!hosts[0].contains("ports"));
    CHECK(hosts[0].contains("_id"));
    opts.skip = 2;
    hosts = unbox(nmap.get(constant{true}, opts));
    REQUIRE_EQUAL(hosts.size(), 1u);
    CHECK_EQUAL(hosts[0].find("addr")->second, data{"192.0.2.1"});
  }

  TEST("distinct AS numbers") {
    auto xs = unbox(nmap.distinct("infos.as_num"));
    CHECK_EQUAL(xs, (list{int64_t{15169}, int64_t{8075}}));
    auto services = unbox(nmap.distinct("ports.service_name"));
    CHECK_EQUAL(services, (list{"http", "smtp", "ssh", "domain"}));
  }

  TEST("removal") {
    auto host = unbox(nmap.get(unbox(nmap.search_host("192.0.2.2"))));
    REQUIRE_EQUAL(host.size(), 1u);
    CHECK_EQUAL(unbox(nmap.remove(host.front())), 1u);
    CHECK_EQUAL(unbox(nmap.remove(std::string_view{dns})), 1u);
    CHECK_EQUAL(addrs(expression{constant{true}}), strings{"192.0.2.1"});
    auto anonymous = nmap.remove(record{{"addr", "192.0.2.1"}});
    REQUIRE(!anonymous);
    CHECK_EQUAL(anonymous.error(), caf::make_error(ec::invalid_argument));
  }

  TEST("feature helpers") {
    auto ips = unbox(nmap.get_ips(constant{true}, 2));
    CHECK_EQUAL(ips.count, 2u);
    CHECK_EQUAL(ips.hosts[0], (record{{"addr", "192.0.2.1"}}));
    auto ports = unbox(nmap.get_ips_ports(constant{true}));
    CHECK_EQUAL(ports.count, 5u);
    REQUIRE_EQUAL(ports.hosts.size(), 3u);
    auto open = unbox(nmap.get_open_port_count(constant{true}));
    REQUIRE_EQUAL(open.hosts.size(), 3u);
    CHECK_EQUAL(get_or_null(open.hosts[1], "openports.count"),
                data{int64_t{2}});
    auto locations = unbox(nmap.get_locations(constant{true}));
    REQUIRE_EQUAL(locations.size(), 1u);
    CHECK_EQUAL(locations[0].count, 2);
    auto features = unbox(nmap.features_port_list(constant{true}, false, true,
                                                  false, false));
    CHECK_EQUAL(features, (list{list{int64_t{22}, data{}},
                                list{int64_t{22}, "ssh"},
                                list{int64_t{25}, "smtp"},
                                list{int64_t{53}, "domain"},
                                list{int64_t{80}, "http"}}));
  }

  TEST("top values") {
    auto countries = unbox(nmap.top_values("country"));
    REQUIRE_EQUAL(countries.size(), 3u);
    auto ases = unbox(nmap.top_values("infos.as_num"));
    REQUIRE_EQUAL(ases.size(), 2u);
    CHECK_EQUAL(ases[0], (value_count{int64_t{15169}, 2}));
    CHECK_EQUAL(ases[1], (value_count{int64_t{8075}, 1}));
    auto limited = unbox(nmap.top_values("infos.as_num", constant{true}, 1));
    CHECK_EQUAL(limited.size(), 1u);
  }
}
