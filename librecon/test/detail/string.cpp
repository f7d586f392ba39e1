//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/string.hpp"

#include "recon/detail/digest.hpp"
#include "recon/test/test.hpp"

using namespace recon;
using namespace recon::detail;

TEST("splitting") {
  auto xs = split("a:b::c", ":");
  REQUIRE_EQUAL(xs.size(), 4u);
  CHECK_EQUAL(xs[0], "a");
  CHECK_EQUAL(xs[2], "");
  CHECK_EQUAL(xs[3], "c");
  xs = split("a:b:c", ":", 1);
  REQUIRE_EQUAL(xs.size(), 2u);
  CHECK_EQUAL(xs[1], "b:c");
  xs = split("", ":");
  REQUIRE_EQUAL(xs.size(), 1u);
  CHECK_EQUAL(xs[0], "");
  xs = split("foo__bar_baz", "__");
  REQUIRE_EQUAL(xs.size(), 2u);
  CHECK_EQUAL(xs[1], "bar_baz");
}

TEST("joining") {
  CHECK_EQUAL(join(to_strings(split("a.b.c", ".")), "/"), "a/b/c");
  CHECK_EQUAL(join({}, ","), "");
}

TEST("case and numbers") {
  CHECK_EQUAL(to_lower("Server-HEADER"), "server-header");
  CHECK_EQUAL(unbox(to_int("42")), 42);
  CHECK_EQUAL(unbox(to_int("-7")), -7);
  CHECK(!to_int(""));
  CHECK(!to_int("4x"));
  CHECK(!to_int(" 4"));
}

TEST("MD5 digests") {
  // printf "abc" | md5sum
  CHECK_EQUAL(unbox(md5_hex("abc")), "900150983cd24fb0d6963f7d28e17f72");
  CHECK_EQUAL(unbox(md5_hex("")), "d41d8cd98f00b204e9800998ecf8427e");
}
