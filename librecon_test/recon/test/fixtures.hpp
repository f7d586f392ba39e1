//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/active.hpp"
#include "recon/collection.hpp"
#include "recon/data.hpp"
#include "recon/passive.hpp"
#include "recon/test/test.hpp"

#include <memory>
#include <string>
#include <utility>

namespace fixtures {

using namespace recon;

/// A port entry of a host record.
inline auto port(std::string_view protocol, int64_t number,
                 std::string_view state, record extra = {}) -> record {
  auto result = record{
    {"protocol", std::string{protocol}},
    {"port", number},
    {"state_state", std::string{state}},
  };
  for (auto& [key, value] : extra) {
    result.insert_or_assign(key, std::move(value));
  }
  return result;
}

/// A host record in external form.
inline auto host(std::string_view addr, list ports = {}, record extra = {})
  -> record {
  auto result = record{
    {"addr", std::string{addr}},
    {"starttime", "2021-03-01 10:00:00"},
    {"endtime", "2021-03-01 10:05:00"},
    {"source", "test"},
    {"ports", std::move(ports)},
  };
  for (auto& [key, value] : extra) {
    result.insert_or_assign(key, std::move(value));
  }
  return result;
}

/// A host in an autonomous system.
inline auto host_in_as(std::string_view addr, int64_t as_num,
                       std::string_view as_name) -> record {
  return host(addr, {},
              record{
                {"infos",
                 record{
                   {"as_num", as_num},
                   {"as_name", std::string{as_name}},
                 }},
              });
}

/// A passive DNS answer.
inline auto dns_answer(std::string_view sensor, std::string_view name,
                       std::string_view target, std::string_view addr = {})
  -> record {
  auto result = record{
    {"sensor", std::string{sensor}},
    {"recontype", "DNS_ANSWER"},
    {"source", "A-127.0.0.1-53"},
    {"value", std::string{name}},
    {"targetval", std::string{target}},
  };
  if (!addr.empty()) {
    result.emplace("addr", std::string{addr});
  }
  return result;
}

/// Databases that share one in-memory backend.
struct databases {
  databases()
    : store{std::make_shared<memory_backend>()},
      nmap{store},
      view{store},
      passive{store} {
    // nop
  }

  /// Stores hosts into the scanner database and requires success.
  void store_hosts(std::initializer_list<record> hosts) {
    for (const auto& x : hosts) {
      auto id = nmap.store_host(x);
      REQUIRE(id.has_value());
    }
  }

  std::shared_ptr<memory_backend> store;
  nmap_database nmap;
  view_database view;
  passive_database passive;
};

} // namespace fixtures
