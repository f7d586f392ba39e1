//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/codec.hpp"

#include "recon/detail/base64.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/ip.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace recon {

auto ip_to_internal(std::string_view text) -> caf::expected<ip> {
  return ip::parse(text);
}

auto internal_to_ip(const ip& x) -> std::string {
  return fmt::format("{}", x);
}

namespace {

/// Accepts an optional sign, digits with at most one decimal point, and an
/// optional decimal exponent.
auto is_decimal(std::string_view str) -> bool {
  auto i = size_t{0};
  auto digits = [&] {
    auto start = i;
    while (i < str.size()
           && std::isdigit(static_cast<unsigned char>(str[i]))) {
      ++i;
    }
    return i - start;
  };
  if (i < str.size() && (str[i] == '+' || str[i] == '-')) {
    ++i;
  }
  auto mantissa = digits();
  if (i < str.size() && str[i] == '.') {
    ++i;
    mantissa += digits();
  }
  if (mantissa == 0) {
    return false;
  }
  if (i < str.size() && (str[i] == 'e' || str[i] == 'E')) {
    ++i;
    if (i < str.size() && (str[i] == '+' || str[i] == '-')) {
      ++i;
    }
    if (digits() == 0) {
      return false;
    }
  }
  return i == str.size();
}

/// Rejects epochs that do not fit into `time`.
auto checked_epoch(double x) -> caf::expected<double> {
  constexpr auto limit = static_cast<double>(
    std::chrono::duration_cast<std::chrono::seconds>(duration::max()).count());
  if (!std::isfinite(x) || x >= limit || x <= -limit) {
    return caf::make_error(ec::parse_error,
                           fmt::format("timestamp {} out of range", x));
  }
  return x;
}

} // namespace

auto to_epoch(const data& x) -> caf::expected<double> {
  if (auto n = to_number(x)) {
    return checked_epoch(*n);
  }
  if (const auto* t = try_as<time>(&x)) {
    return to_epoch_seconds(*t);
  }
  if (const auto* str = try_as<std::string>(&x)) {
    if (auto i = detail::to_int(*str)) {
      return checked_epoch(static_cast<double>(*i));
    }
    if (is_decimal(*str)) {
      return checked_epoch(std::strtod(str->c_str(), nullptr));
    }
    auto parsed = parse_time(*str);
    if (!parsed) {
      return std::move(parsed.error());
    }
    return to_epoch_seconds(*parsed);
  }
  return caf::make_error(ec::parse_error,
                         fmt::format("cannot interpret {} as timestamp", x));
}

auto from_epoch(double x) -> time {
  return from_epoch_seconds(x);
}

auto to_binary(const blob& x) -> std::string {
  return detail::base64::encode(x);
}

auto from_binary(std::string_view x) -> caf::expected<blob> {
  if (auto result = detail::base64::try_decode(x)) {
    return std::move(*result);
  }
  return caf::make_error(ec::convert_error,
                         fmt::format("invalid Base64 payload: '{}'", x));
}

namespace {

/// Replaces a textual address in place.
auto address_to_internal(record& r, std::string_view field) -> caf::error {
  auto it = r.find(field);
  if (it == r.end()) {
    return caf::none;
  }
  const auto* text = try_as<std::string>(&it->second);
  if (!text) {
    return caf::none;
  }
  auto addr = ip_to_internal(*text);
  if (!addr) {
    return add_context(addr.error(), "field '{}'", field);
  }
  it->second = *addr;
  return caf::none;
}

void address_from_internal(record& r, std::string_view field) {
  auto it = r.find(field);
  if (it == r.end()) {
    return;
  }
  if (const auto* addr = try_as<ip>(&it->second)) {
    it->second = internal_to_ip(*addr);
  }
}

auto time_to_internal(record& r, std::string_view field) -> caf::error {
  auto it = r.find(field);
  if (it == r.end() || is<caf::none_t>(it->second)) {
    return caf::none;
  }
  auto epoch = to_epoch(it->second);
  if (!epoch) {
    return add_context(epoch.error(), "field '{}'", field);
  }
  it->second = *epoch;
  return caf::none;
}

void time_from_internal(record& r, std::string_view field) {
  auto it = r.find(field);
  if (it == r.end()) {
    return;
  }
  if (!to_number(it->second)) {
    return;
  }
  if (auto epoch = to_epoch(it->second)) {
    it->second = from_epoch(*epoch);
  }
}

/// Applies a function to every record in the list stored under a field.
template <class F>
auto for_each_nested(record& r, std::string_view field, F f) -> caf::error {
  auto it = r.find(field);
  if (it == r.end()) {
    return caf::none;
  }
  auto* xs = try_as<list>(&it->second);
  if (!xs) {
    return caf::none;
  }
  for (auto& x : *xs) {
    if (auto* nested = try_as<record>(&x)) {
      if (auto err = f(*nested)) {
        return err;
      }
    }
  }
  return caf::none;
}

auto is_certificate(const record& rec) -> bool {
  auto recontype = get_or_null(rec, "recontype");
  auto source = get_or_null(rec, "source");
  return recontype == data{"SSL_SERVER"} && source == data{"cert"};
}

} // namespace

auto host_to_internal(record host) -> caf::expected<record> {
  if (auto it = host.find("scanid"); it != host.end()) {
    if (is<std::string>(it->second)) {
      it->second = list{std::move(it->second)};
    }
  }
  if (auto err = address_to_internal(host, "addr")) {
    return err;
  }
  auto err = for_each_nested(host, "ports", [](record& port) {
    return address_to_internal(port, "state_reason_ip");
  });
  if (err) {
    return err;
  }
  err = for_each_nested(host, "traces", [](record& trace) {
    return for_each_nested(trace, "hops", [](record& hop) {
      return address_to_internal(hop, "ipaddr");
    });
  });
  if (err) {
    return err;
  }
  for (auto field : {"starttime", "endtime"}) {
    err = time_to_internal(host, field);
    if (err) {
      return err;
    }
  }
  return host;
}

auto host_from_internal(record host) -> record {
  address_from_internal(host, "addr");
  auto err = for_each_nested(host, "ports", [](record& port) -> caf::error {
    address_from_internal(port, "state_reason_ip");
    return caf::none;
  });
  RECON_ASSERT(!err);
  err = for_each_nested(host, "traces", [](record& trace) {
    return for_each_nested(trace, "hops", [](record& hop) -> caf::error {
      address_from_internal(hop, "ipaddr");
      return caf::none;
    });
  });
  RECON_ASSERT(!err);
  for (auto field : {"starttime", "endtime"}) {
    time_from_internal(host, field);
  }
  return host;
}

auto passive_to_internal(record rec) -> caf::expected<record> {
  if (auto err = address_to_internal(rec, "addr")) {
    return err;
  }
  for (auto field : {"firstseen", "lastseen"}) {
    if (auto err = time_to_internal(rec, field)) {
      return err;
    }
  }
  if (auto it = rec.find("value"); it != rec.end()) {
    if (const auto* payload = try_as<blob>(&it->second)) {
      it->second = to_binary(*payload);
    }
  }
  rec.erase(std::string_view{"_id"});
  return rec;
}

auto passive_from_internal(record rec) -> caf::expected<record> {
  address_from_internal(rec, "addr");
  for (auto field : {"firstseen", "lastseen"}) {
    time_from_internal(rec, field);
  }
  if (is_certificate(rec)) {
    if (auto it = rec.find("value"); it != rec.end()) {
      if (const auto* encoded = try_as<std::string>(&it->second)) {
        auto payload = from_binary(*encoded);
        if (!payload) {
          return std::move(payload.error());
        }
        it->second = std::move(*payload);
      }
    }
  }
  return rec;
}

} // namespace recon
