//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/ip.hpp"

#include "recon/detail/assert.hpp"
#include "recon/error.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdlib>
#include <string>

namespace recon {

auto ip::v4(uint32_t value) -> ip {
  auto bytes = std::array<byte_type, 4>{
    static_cast<byte_type>(value >> 24),
    static_cast<byte_type>(value >> 16),
    static_cast<byte_type>(value >> 8),
    static_cast<byte_type>(value),
  };
  return v4(std::span<const byte_type, 4>{bytes});
}

auto ip::parse(std::string_view str) -> caf::expected<ip> {
  // inet_pton needs a NUL-terminated string.
  auto buffer = std::string{str};
  if (buffer.find(':') == std::string::npos) {
    auto addr = std::array<byte_type, 4>{};
    if (inet_pton(AF_INET, buffer.c_str(), addr.data()) == 1) {
      return v4(std::span<const byte_type, 4>{addr});
    }
  } else {
    auto addr = byte_array{};
    if (inet_pton(AF_INET6, buffer.c_str(), addr.data()) == 1) {
      return ip{addr};
    }
  }
  return caf::make_error(ec::parse_error,
                         fmt::format("invalid IP address: '{}'", str));
}

auto ip::from_uint128(uint128_t value) -> ip {
  auto result = ip{};
  for (auto i = 15; i >= 0; --i) {
    result.bytes_[i] = static_cast<byte_type>(value & 0xff);
    value >>= 8;
  }
  return result;
}

auto ip::is_v4() const -> bool {
  return std::memcmp(bytes_.data(), v4_mapped_prefix.data(), 12) == 0;
}

auto ip::is_v6() const -> bool {
  return !is_v4();
}

auto ip::to_uint128() const -> uint128_t {
  auto result = uint128_t{0};
  for (auto byte : bytes_) {
    result = (result << 8) | byte;
  }
  return result;
}

auto ip::mask(unsigned top_bits_to_keep) -> bool {
  if (top_bits_to_keep > 128) {
    return false;
  }
  auto r = std::div(static_cast<int>(top_bits_to_keep), 8);
  if (r.quot < 16) {
    bytes_[r.quot] &= static_cast<byte_type>(0xff << (8 - r.rem));
  }
  for (auto i = r.quot + 1; i < 16; ++i) {
    bytes_[i] = 0;
  }
  return true;
}

auto ip::compare(const ip& other, size_t k) const -> bool {
  RECON_ASSERT(k <= 128);
  if (k == 0) { // trivially true
    return true;
  }
  auto x = bytes_.data();
  auto y = other.bytes_.data();
  for (; k > 8; k -= 8) {
    if (*x++ != *y++) {
      return false;
    }
  }
  auto mask = static_cast<byte_type>(0xff << (8 - k));
  return (*x & mask) == (*y & mask);
}

auto operator==(const ip& x, const ip& y) -> bool {
  return x.bytes_ == y.bytes_;
}

auto operator<(const ip& x, const ip& y) -> bool {
  return x.bytes_ < y.bytes_;
}

} // namespace recon

auto fmt::formatter<recon::ip>::format(const recon::ip& value,
                                       format_context& ctx) const
  -> format_context::iterator {
  auto buffer = std::array<char, INET6_ADDRSTRLEN>{};
  buffer.fill(0);
  auto bytes = as_bytes(value);
  if (value.is_v4()) {
    const auto* result
      = inet_ntop(AF_INET, &bytes[12], buffer.data(), INET_ADDRSTRLEN);
    RECON_ASSERT(result != nullptr);
  } else {
    const auto* result
      = inet_ntop(AF_INET6, bytes.data(), buffer.data(), INET6_ADDRSTRLEN);
    RECON_ASSERT(result != nullptr);
  }
  auto str = std::string_view{buffer.data()};
  return formatter<string_view>::format(str, ctx);
}
