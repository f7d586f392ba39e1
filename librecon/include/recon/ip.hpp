//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/detail/operators.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

namespace recon {

/// The 128-bit unsigned integer form of an address.
using uint128_t = unsigned __int128;

/// An IP address. IPv4 addresses live in the IPv4-mapped IPv6 range, so the
/// ordering of two addresses equals the ordering of their integer forms.
class ip : detail::totally_ordered<ip> {
public:
  using byte_type = uint8_t;
  using byte_array = std::array<byte_type, 16>;

  /// Top 96 bits of v4-mapped-addr.
  static constexpr std::array<byte_type, 12> v4_mapped_prefix
    = {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff}};

  /// Address family.
  enum family { ipv4, ipv6 };

  /// Constructs an IPv4 address from raw bytes in network byte order.
  /// @param bytes A pointer to 4 bytes.
  /// @returns An IPv4 address constructed from *bytes*.
  template <class Byte>
    requires(sizeof(Byte) == 1)
  static auto v4(std::span<Byte, 4> bytes) -> ip {
    ip result;
    std::memcpy(&result.bytes_[0], v4_mapped_prefix.data(), 12);
    std::memcpy(&result.bytes_[12], bytes.data(), 4);
    return result;
  }

  /// Constructs an IPv4 address from a 32-bit unsigned integer in host byte
  /// order.
  static auto v4(uint32_t value) -> ip;

  /// Parses the textual representation of an IPv4 or IPv6 address.
  /// @param str The address literal, e.g., `10.0.0.1` or `2001:db8::1`.
  /// @returns The address or `ec::parse_error`.
  static auto parse(std::string_view str) -> caf::expected<ip>;

  /// Constructs an address from its 128-bit integer form.
  static auto from_uint128(uint128_t value) -> ip;

  /// Default-constructs an (invalid) address.
  constexpr ip() {
    bytes_.fill(0);
  }

  /// Constructs an IP address from 16 bytes in network byte order.
  /// @param bytes The 16 bytes representing the IP address.
  constexpr explicit ip(byte_array bytes) : bytes_{bytes} {
  }

  /// Determines whether the address is IPv4.
  /// @returns @c true iff the address is an IPv4 address.
  [[nodiscard]] auto is_v4() const -> bool;

  /// Determines whether the address is IPv6.
  /// @returns `true` iff the address is an IPv6 address.
  [[nodiscard]] auto is_v6() const -> bool;

  /// Returns the 128-bit integer form of the address.
  [[nodiscard]] auto to_uint128() const -> uint128_t;

  /// Masks out lower bits of the address.
  /// @param top_bits_to_keep The number of bits *not* to mask out,
  ///                         counting from the highest order bit. The value is
  ///                         always interpreted relative to the IPv6 bit
  ///                         width, even if the address is IPv4. That means if
  ///                         we compute 192.168.1.2/16, we need to pass in
  ///                         112 (i.e., 96 + 16). The value must be in the
  ///                         range from 0 to 128.
  /// @returns `true` on success.
  auto mask(unsigned top_bits_to_keep) -> bool;

  /// Compares the top-k bits of this address with another one.
  /// @param other The other address.
  /// @param k The number of bits to compare, starting from the top.
  /// @returns `true` if the first *k* bits of both addresses are equal
  /// @pre `k <= 128`
  [[nodiscard]] auto compare(const ip& other, size_t k) const -> bool;

  explicit constexpr operator byte_array() const {
    return bytes_;
  }

  friend auto operator==(const ip& x, const ip& y) -> bool;
  friend auto operator<(const ip& x, const ip& y) -> bool;

  template <class Byte = std::byte>
  friend auto as_bytes(const ip& x) -> std::span<const Byte, 16> {
    auto ptr = reinterpret_cast<const Byte*>(x.bytes_.data());
    return std::span<const Byte, 16>{ptr, 16};
  }

private:
  byte_array bytes_;
};

} // namespace recon

template <>
struct fmt::formatter<recon::ip> : formatter<string_view> {
  auto format(const recon::ip& x, format_context& ctx) const
    -> format_context::iterator;
};

namespace std {

template <>
struct hash<recon::ip> {
  auto operator()(const recon::ip& x) const -> size_t {
    auto bytes = as_bytes<char>(x);
    return std::hash<std::string_view>{}(
      std::string_view{bytes.data(), bytes.size()});
  }
};

} // namespace std
