//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2019 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/base64.hpp"

#include "recon/test/test.hpp"

#include <string_view>

using namespace std::string_view_literals;
using namespace recon::detail;

namespace {

auto as_string(const std::vector<std::byte>& xs) -> std::string {
  return {reinterpret_cast<const char*>(xs.data()), xs.size()};
}

} // namespace

// Ground truth:
//
//   printf "The quick brown fox jumps over the lazy dog" | base64
//   VGhlIHF1aWNrIGJyb3duIGZveCBqdW1wcyBvdmVyIHRoZSBsYXp5IGRvZw==

TEST("encode") {
  auto dec = "The quick brown fox jumps over the lazy dog"sv;
  auto enc = "VGhlIHF1aWNrIGJyb3duIGZveCBqdW1wcyBvdmVyIHRoZSBsYXp5IGRvZw=="sv;
  CHECK_EQUAL(base64::encode(dec), enc);
  CHECK_EQUAL(base64::encode(""sv), "");
  CHECK_EQUAL(base64::encoded_size(dec.size()), enc.size());
}

TEST("decode") {
  auto enc = "VGhlIHF1aWNrIGJyb3duIGZveCBqdW1wcyBvdmVyIHRoZSBsYXp5IGRvZw=="sv;
  auto dec = "The quick brown fox jumps over the lazy dog"sv;
  const auto decoded = base64::try_decode(enc);
  REQUIRE(decoded.has_value());
  CHECK_EQUAL(as_string(*decoded), dec);
}

TEST("decode rejects invalid input") {
  CHECK(!base64::try_decode("AP9C!"));
  CHECK(!base64::try_decode("abc"));
}
