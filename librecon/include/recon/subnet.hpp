//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/detail/operators.hpp"
#include "recon/ip.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <string_view>

namespace recon {

/// Stores IPv4 and IPv6 prefixes, e.g., `192.168.1.1/16` and `FD00::/8`.
class subnet : detail::totally_ordered<subnet> {
public:
  /// Constructs the empty prefix, i.e., `::/0`.
  subnet();

  /// Constructs a prefix from an address.
  /// @param addr The address.
  /// @param length The prefix length, as specified for IPv6 addresses.
  subnet(ip addr, uint8_t length);

  /// Parses a prefix in CIDR notation. The length of an IPv4 prefix counts
  /// IPv4 bits, i.e., `10.0.0.0/8` has the IPv6 length 104. A bare address
  /// yields a host prefix.
  static auto parse(std::string_view str) -> caf::expected<subnet>;

  /// Checks whether this subnet includes a given address.
  /// @param addr The address to test for containment.
  /// @returns `true` if *addr* is an element of this subnet.
  [[nodiscard]] auto contains(const ip& addr) const -> bool;

  /// Retrieves the network address of the prefix.
  /// @returns The prefix address.
  [[nodiscard]] auto network() const -> const ip&;

  /// Retrieves the highest address within the prefix.
  [[nodiscard]] auto broadcast() const -> ip;

  /// Retrieves the prefix length.
  /// @returns The prefix length.
  [[nodiscard]] auto length() const -> uint8_t;

  friend auto operator==(const subnet& x, const subnet& y) -> bool;
  friend auto operator<(const subnet& x, const subnet& y) -> bool;

private:
  auto initialize() -> bool;

  ip network_;
  uint8_t length_;
};

} // namespace recon

template <>
struct fmt::formatter<recon::subnet> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const recon::subnet& sn, fmt::format_context& ctx) const {
    if (sn.network().is_v4()) {
      return fmt::format_to(ctx.out(), "{}/{}", sn.network(),
                            sn.length() - 96);
    }
    return fmt::format_to(ctx.out(), "{}/{}", sn.network(), sn.length());
  }
};
