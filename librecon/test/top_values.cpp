//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/top_values.hpp"

#include "recon/active.hpp"
#include "recon/error.hpp"
#include "recon/schema.hpp"
#include "recon/test/fixtures.hpp"
#include "recon/test/test.hpp"

using namespace recon;

namespace {

auto http_title(std::string_view output) -> record {
  return record{
    {"scripts", list{record{{"id", "http-title"},
                            {"output", std::string{output}}}}},
    {"service_name", "http"},
  };
}

struct fixture : fixtures::databases {
  fixture() {
    store_hosts({
      fixtures::host("10.0.1.5",
                     list{
                       fixtures::port("tcp", 80, "open", http_title("Welcome")),
                       fixtures::port("tcp", 443, "open",
                                      record{{"service_name", "https"}}),
                       fixtures::port("tcp", 22, "filtered"),
                     }),
      fixtures::host("10.0.1.9", list{fixtures::port("tcp", 80, "open",
                                                     http_title("Welcome"))}),
      fixtures::host(
        "10.2.0.1",
        list{
          fixtures::port("tcp", 80, "open", http_title("It works!")),
          fixtures::port("udp", 53, "open", record{{"service_name", "domain"}}),
        },
        record{
          {"hostnames",
           list{record{{"name", "ns.example.org"},
                       {"domains", list{"example.org", "org"}}}}},
        }),
    });
  }

  auto ranked(std::string_view field, std::optional<size_t> top_n = {})
    -> std::vector<value_count> {
    return unbox(nmap.top_values(field, constant{true}, top_n));
  }
};

auto tcp(int64_t port) -> data {
  return list{"tcp", port};
}

} // namespace

TEST("the first matching registry entry wins") {
  const auto& registry = pseudo_field_registry::hosts();
  auto name_of = [&](std::string_view field) -> std::string {
    const auto* entry = registry.find(field);
    return entry ? entry->name : std::string{"<direct>"};
  };
  CHECK_EQUAL(name_of("net"), "net[:<bits>]");
  CHECK_EQUAL(name_of("net:16"), "net[:<bits>]");
  CHECK_EQUAL(name_of("network"), "<direct>");
  CHECK_EQUAL(name_of("port:open"), "port[:<state>|:<service>]");
  CHECK_EQUAL(name_of("portlist:open"), "portlist:<state>");
  CHECK_EQUAL(name_of("sshkey.bits"), "sshkey.bits");
  CHECK_EQUAL(name_of("sshkey.type"), "sshkey.<field>");
  CHECK_EQUAL(name_of("ports.port"), "<direct>");
}

TEST("unregistered names resolve to direct fields") {
  auto ctx = pseudo_field_context{};
  ctx.layout = &schema::hosts();
  auto field = unbox(pseudo_field_registry::hosts().resolve("infos.city", ctx));
  REQUIRE_EQUAL(field.fields.size(), 1u);
  CHECK_EQUAL(field.fields[0], "infos.city");
  CHECK_EQUAL(field.filter, exists("infos.city"));
  CHECK(!field.output);
}

TEST("malformed parameters are rejected") {
  auto ctx = pseudo_field_context{};
  ctx.layout = &schema::hosts();
  const auto& registry = pseudo_field_registry::hosts();
  for (auto name : {"net:33", "net:-1", "net:abc", "service:abc",
                    "domains:x", "script:abc:http-title"}) {
    MESSAGE("resolving {}", name);
    auto field = registry.resolve(name, ctx);
    REQUIRE(!field);
    CHECK_EQUAL(field.error(), caf::make_error(ec::invalid_argument));
  }
}

WITH_FIXTURE(fixture) {
  TEST("networks use the default mask") {
    auto nets = ranked("net");
    REQUIRE_EQUAL(nets.size(), 2u);
    CHECK_EQUAL(nets[0], (value_count{"10.0.1.0/24", 2}));
    CHECK_EQUAL(nets[1], (value_count{"10.2.0.0/24", 1}));
  }

  TEST("networks with an explicit mask") {
    auto nets = ranked("net:16");
    REQUIRE_EQUAL(nets.size(), 2u);
    CHECK_EQUAL(nets[0], (value_count{"10.0.0.0/16", 2}));
    CHECK_EQUAL(nets[1], (value_count{"10.2.0.0/16", 1}));
    nets = ranked("net:8");
    REQUIRE_EQUAL(nets.size(), 1u);
    CHECK_EQUAL(nets[0], (value_count{"10.0.0.0/8", 3}));
  }

  TEST("the configured mask applies to bare networks") {
    auto cfg = caf::settings{};
    caf::put(cfg, "recon.net-mask-default", 16);
    REQUIRE_SUCCESS(nmap.configure(cfg));
    auto nets = ranked("net");
    REQUIRE_EQUAL(nets.size(), 2u);
    CHECK_EQUAL(nets[0].value, data{"10.0.0.0/16"});
  }

  TEST("ports by state and by service") {
    auto open = ranked("port:open");
    REQUIRE_EQUAL(open.size(), 3u);
    CHECK_EQUAL(open[0], (value_count{tcp(80), 3}));
    CHECK_EQUAL(open[1], (value_count{tcp(443), 1}));
    CHECK_EQUAL(open[2], (value_count{list{"udp", int64_t{53}}, 1}));
    auto filtered = ranked("port:filtered");
    REQUIRE_EQUAL(filtered.size(), 1u);
    CHECK_EQUAL(filtered[0], (value_count{tcp(22), 1}));
    auto domain = ranked("port:domain");
    REQUIRE_EQUAL(domain.size(), 1u);
    CHECK_EQUAL(domain[0], (value_count{list{"udp", int64_t{53}}, 1}));
    auto any_state = ranked("port");
    CHECK_EQUAL(any_state.size(), 4u);
  }

  TEST("the number of values is bounded") {
    auto open = ranked("port:open", 2);
    REQUIRE_EQUAL(open.size(), 2u);
    CHECK_EQUAL(open[0].value, tcp(80));
    for (size_t i = 1; i < open.size(); ++i) {
      CHECK_LESS_EQUAL(open[i].count, open[i - 1].count);
    }
    auto cfg = caf::settings{};
    caf::put(cfg, "recon.top-values-default", 1);
    REQUIRE_SUCCESS(nmap.configure(cfg));
    CHECK_EQUAL(ranked("port:open").size(), 1u);
  }

  TEST("port counts and port lists") {
    auto counts = ranked("countports:open");
    REQUIRE_EQUAL(counts.size(), 2u);
    CHECK_EQUAL(counts[0], (value_count{int64_t{2}, 2}));
    CHECK_EQUAL(counts[1], (value_count{int64_t{1}, 1}));
    auto lists = ranked("portlist:open");
    REQUIRE_EQUAL(lists.size(), 3u);
    CHECK_EQUAL(lists[0], (value_count{list{tcp(80), tcp(443)}, 1}));
    CHECK_EQUAL(lists[1], (value_count{list{tcp(80)}, 1}));
    CHECK_EQUAL(lists[2],
                (value_count{list{tcp(80), list{"udp", int64_t{53}}}, 1}));
  }

  TEST("services") {
    auto services = ranked("service");
    REQUIRE_EQUAL(services.size(), 3u);
    CHECK_EQUAL(services[0], (value_count{"http", 3}));
    auto on_port = ranked("service:80");
    REQUIRE_EQUAL(on_port.size(), 1u);
    CHECK_EQUAL(on_port[0], (value_count{"http", 3}));
  }

  TEST("script outputs") {
    auto titles = ranked("script:http-title");
    REQUIRE_EQUAL(titles.size(), 2u);
    CHECK_EQUAL(titles[0], (value_count{"Welcome", 2}));
    CHECK_EQUAL(titles[1], (value_count{"It works!", 1}));
    auto on_port = ranked("script:80:http-title");
    REQUIRE_EQUAL(on_port.size(), 2u);
    CHECK_EQUAL(on_port[0], (value_count{"Welcome", 2}));
    CHECK(ranked("script:443:http-title").empty());
  }

  TEST("domains by level") {
    auto all = ranked("domains");
    CHECK_EQUAL(all.size(), 2u);
    auto second_level = ranked("domains:2");
    REQUIRE_EQUAL(second_level.size(), 1u);
    CHECK_EQUAL(second_level[0], (value_count{"example.org", 1}));
  }

  TEST("the filter restricts contributing hosts") {
    auto filter = nmap.search_net("10.0.0.0/16");
    auto nets = unbox(nmap.top_values("net", unbox(std::move(filter))));
    REQUIRE_EQUAL(nets.size(), 1u);
    CHECK_EQUAL(nets[0], (value_count{"10.0.1.0/24", 2}));
  }
}
