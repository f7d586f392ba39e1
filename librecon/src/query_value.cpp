//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/query_value.hpp"

#include "recon/detail/digest.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/pattern.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace recon {

auto str_to_query_value(std::string_view str) -> data {
  if (pattern::is_literal(str)) {
    if (auto result = pattern::parse_literal(str)) {
      return std::move(*result);
    }
  }
  return std::string{str};
}

auto search_string(std::string field, const data& value, bool neg)
  -> expression {
  if (is<pattern>(value)) {
    auto result = expression{
      predicate{std::move(field), relational_operator::match, value}};
    return neg ? negate(std::move(result)) : result;
  }
  return predicate{std::move(field),
                   neg ? relational_operator::not_equal
                       : relational_operator::equal,
                   value};
}

auto search_string_in_array(std::string field, const data& value, bool neg)
  -> expression {
  auto op = is<pattern>(value) ? relational_operator::match
                               : relational_operator::ni;
  auto result = expression{predicate{std::move(field), op, value}};
  return neg ? negate(std::move(result)) : result;
}

namespace {

auto is_hex(std::string_view str) -> bool {
  return std::all_of(str.begin(), str.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')
           || (c >= 'A' && c <= 'F');
  });
}

} // namespace

auto ja3_key_value(const data& value_or_hash)
  -> caf::expected<std::pair<std::string, data>> {
  if (is<pattern>(value_or_hash)) {
    return std::pair{std::string{"raw"}, value_or_hash};
  }
  const auto* str = try_as<std::string>(&value_or_hash);
  if (!str) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("expected a JA3 fingerprint or hash, "
                                       "got {}",
                                       value_or_hash));
  }
  if (is_hex(*str)) {
    switch (str->size()) {
      case 32:
        return std::pair{std::string{"md5"}, data{detail::to_lower(*str)}};
      case 40:
        return std::pair{std::string{"sha1"}, data{detail::to_lower(*str)}};
      case 64:
        return std::pair{std::string{"sha256"},
                         data{detail::to_lower(*str)}};
    }
  }
  auto digest = detail::md5_hex(*str);
  if (!digest) {
    return digest.error();
  }
  return std::pair{std::string{"md5"}, data{std::move(*digest)}};
}

namespace {

constexpr auto eu_members = std::array{
  "AT", "BE", "BG", "CY", "CZ", "DE", "DK", "EE", "ES", "FI",
  "FR", "GB", "GR", "HR", "HU", "IE", "IT", "LT", "LU", "LV",
  "MT", "NL", "PL", "PT", "RO", "SE", "SI", "SK",
};

void unalias_into(const data& country, list& out) {
  if (const auto* xs = try_as<list>(&country)) {
    for (const auto& x : *xs) {
      unalias_into(x, out);
    }
    return;
  }
  auto expanded = country_unalias(country);
  if (auto* xs = try_as<list>(&expanded)) {
    std::move(xs->begin(), xs->end(), std::back_inserter(out));
    return;
  }
  out.push_back(std::move(expanded));
}

} // namespace

auto country_unalias(const data& country) -> data {
  if (const auto* code = try_as<std::string>(&country)) {
    if (*code == "UK") {
      return std::string{"GB"};
    }
    if (*code == "EU") {
      auto result = list{};
      for (const auto* member : eu_members) {
        result.emplace_back(std::string{member});
      }
      return result;
    }
    return country;
  }
  if (is<list>(country)) {
    auto result = list{};
    unalias_into(country, result);
    return result;
  }
  return country;
}

auto script_alias(std::string_view name) -> std::string_view {
  constexpr auto aliases = std::array<std::pair<std::string_view,
                                                std::string_view>,
                                      18>{{
    {"afp-ls", "ls"},
    {"ftp-anon", "ls"},
    {"http-ls", "ls"},
    {"nfs-ls", "ls"},
    {"smb-ls", "ls"},
    {"http-vuln-cve2011-3192", "vulns"},
    {"http-vuln-cve2011-3368", "vulns"},
    {"http-vuln-cve2014-3704", "vulns"},
    {"mysql-vuln-cve2012-2122", "vulns"},
    {"rdp-vuln-ms12-020", "vulns"},
    {"smb-vuln-ms17-010", "vulns"},
    {"ssl-ccs-injection", "vulns"},
    {"ssl-dh-params", "vulns"},
    {"ssl-heartbleed", "vulns"},
    {"ssl-poodle", "vulns"},
    {"sslv2-drown", "vulns"},
    {"tls-ticketbleed", "vulns"},
    {"http-shellshock", "vulns"},
  }};
  auto it = std::find_if(aliases.begin(), aliases.end(), [&](const auto& x) {
    return x.first == name;
  });
  return it == aliases.end() ? name : it->second;
}

} // namespace recon
