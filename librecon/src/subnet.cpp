//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/subnet.hpp"

#include "recon/detail/string.hpp"
#include "recon/error.hpp"

#include <tuple>

namespace recon {

subnet::subnet() : length_{0u} {
}

subnet::subnet(ip addr, uint8_t length) : network_{addr}, length_{length} {
  if (!initialize()) {
    network_ = ip{};
    length_ = 0;
  }
}

auto subnet::parse(std::string_view str) -> caf::expected<subnet> {
  auto slash = str.find('/');
  auto addr = ip::parse(str.substr(0, slash));
  if (!addr) {
    return addr.error();
  }
  auto max_length = addr->is_v4() ? 32 : 128;
  auto length = int64_t{max_length};
  if (slash != std::string_view::npos) {
    auto parsed = detail::to_int(str.substr(slash + 1));
    if (!parsed || *parsed < 0 || *parsed > max_length) {
      return caf::make_error(ec::parse_error,
                             fmt::format("invalid prefix length in '{}'", str));
    }
    length = *parsed;
  }
  if (addr->is_v4()) {
    length += 96;
  }
  return subnet{*addr, static_cast<uint8_t>(length)};
}

auto subnet::contains(const ip& addr) const -> bool {
  return addr.compare(network_, length_);
}

auto subnet::network() const -> const ip& {
  return network_;
}

auto subnet::broadcast() const -> ip {
  auto host_bits = 128 - length_;
  if (host_bits == 0) {
    return network_;
  }
  auto host_mask = host_bits == 128 ? ~uint128_t{0}
                                    : (uint128_t{1} << host_bits) - 1;
  return ip::from_uint128(network_.to_uint128() | host_mask);
}

auto subnet::length() const -> uint8_t {
  return length_;
}

auto subnet::initialize() -> bool {
  if (length_ > 128) {
    return false;
  }
  network_.mask(length_);
  return true;
}

auto operator==(const subnet& x, const subnet& y) -> bool {
  return x.network_ == y.network_ && x.length_ == y.length_;
}

auto operator<(const subnet& x, const subnet& y) -> bool {
  return std::tie(x.network_, x.length_) < std::tie(y.network_, y.length_);
}

} // namespace recon
