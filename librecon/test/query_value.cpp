//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/query_value.hpp"

#include "recon/error.hpp"
#include "recon/pattern.hpp"
#include "recon/test/test.hpp"

using namespace recon;

TEST("pattern literals") {
  CHECK(pattern::is_literal("/^www\\./"));
  CHECK(pattern::is_literal("/foo/i"));
  CHECK(!pattern::is_literal("foo"));
  CHECK(!pattern::is_literal("/foo"));
  auto rx = unbox(pattern::parse_literal("/EXAMPLE\\.com$/i"));
  CHECK(rx.options().case_insensitive);
  CHECK(rx.search("www.example.com"));
  CHECK(!rx.search("example.com.evil"));
  CHECK(!rx.match("www.example.com"));
  CHECK(unbox(pattern::parse_literal("/example/")).match("example"));
}

TEST("invalid patterns") {
  auto rx = pattern::make("(unbalanced");
  REQUIRE(!rx);
  CHECK_EQUAL(rx.error(), caf::make_error(ec::parse_error));
}

TEST("query values") {
  CHECK(is<pattern>(str_to_query_value("/^ssh/")));
  CHECK_EQUAL(str_to_query_value("ssh"), data{"ssh"});
  CHECK_EQUAL(str_to_query_value("/etc/passwd"), data{"/etc/passwd"});
}

TEST("string searches") {
  auto literal = search_string("service_name", data{"http"});
  CHECK_EQUAL(literal, expression{predicate{"service_name",
                                            relational_operator::equal,
                                            "http"}});
  auto negated = search_string("service_name", data{"http"}, true);
  CHECK_EQUAL(negated, expression{predicate{"service_name",
                                            relational_operator::not_equal,
                                            "http"}});
  auto rx = str_to_query_value("/^http/");
  CHECK_EQUAL(search_string("service_name", rx, true),
              negate(predicate{"service_name", relational_operator::match,
                               rx}));
  CHECK_EQUAL(search_string_in_array("hostnames.domains", data{"x.org"}),
              expression{predicate{"hostnames.domains",
                                   relational_operator::ni, "x.org"}});
}

TEST("JA3 keys") {
  auto [key, value] = unbox(ja3_key_value(data{"abc"}));
  CHECK_EQUAL(key, "md5");
  CHECK_EQUAL(value, data{"900150983cd24fb0d6963f7d28e17f72"});
  auto md5 = unbox(ja3_key_value(data{"900150983CD24FB0D6963F7D28E17F72"}));
  CHECK_EQUAL(md5.first, "md5");
  CHECK_EQUAL(md5.second, data{"900150983cd24fb0d6963f7d28e17f72"});
  auto sha1 = unbox(
    ja3_key_value(data{"a9993e364706816aba3e25717850c26c9cd0d89d"}));
  CHECK_EQUAL(sha1.first, "sha1");
  auto raw = unbox(ja3_key_value(str_to_query_value("/^771,/")));
  CHECK_EQUAL(raw.first, "raw");
  auto bad = ja3_key_value(data{int64_t{42}});
  REQUIRE(!bad);
  CHECK_EQUAL(bad.error(), caf::make_error(ec::invalid_argument));
}

TEST("country aliases") {
  CHECK_EQUAL(country_unalias(data{"UK"}), data{"GB"});
  CHECK_EQUAL(country_unalias(data{"FR"}), data{"FR"});
  auto eu = country_unalias(data{"EU"});
  REQUIRE(is<list>(eu));
  CHECK_EQUAL(as<list>(eu).size(), 28u);
  auto xs = country_unalias(data{list{"UK", "US"}});
  CHECK_EQUAL(xs, data{list{"GB", "US"}});
}

TEST("script aliases") {
  CHECK_EQUAL(script_alias("ftp-anon"), "ls");
  CHECK_EQUAL(script_alias("ssl-heartbleed"), "vulns");
  CHECK_EQUAL(script_alias("http-title"), "http-title");
}
