//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/base64.hpp"

#include <array>
#include <cstdint>

namespace recon::detail::base64 {

namespace {

constexpr auto alphabet = std::string_view{
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

constexpr auto inverse = [] {
  auto result = std::array<int8_t, 256>{};
  result.fill(-1);
  for (auto i = size_t{0}; i < alphabet.size(); ++i) {
    result[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
  }
  return result;
}();

} // namespace

auto encode(std::span<const std::byte> bytes) -> std::string {
  auto result = std::string{};
  result.reserve(encoded_size(bytes.size()));
  auto i = size_t{0};
  for (; i + 2 < bytes.size(); i += 3) {
    auto x = (std::to_integer<uint32_t>(bytes[i]) << 16)
             | (std::to_integer<uint32_t>(bytes[i + 1]) << 8)
             | std::to_integer<uint32_t>(bytes[i + 2]);
    result += alphabet[(x >> 18) & 0x3f];
    result += alphabet[(x >> 12) & 0x3f];
    result += alphabet[(x >> 6) & 0x3f];
    result += alphabet[x & 0x3f];
  }
  switch (bytes.size() - i) {
    case 2: {
      auto x = (std::to_integer<uint32_t>(bytes[i]) << 16)
               | (std::to_integer<uint32_t>(bytes[i + 1]) << 8);
      result += alphabet[(x >> 18) & 0x3f];
      result += alphabet[(x >> 12) & 0x3f];
      result += alphabet[(x >> 6) & 0x3f];
      result += '=';
      break;
    }
    case 1: {
      auto x = std::to_integer<uint32_t>(bytes[i]) << 16;
      result += alphabet[(x >> 18) & 0x3f];
      result += alphabet[(x >> 12) & 0x3f];
      result += "==";
      break;
    }
    default:
      break;
  }
  return result;
}

auto encode(std::string_view str) -> std::string {
  return encode(std::as_bytes(std::span{str.data(), str.size()}));
}

auto try_decode(std::string_view str) -> std::optional<std::vector<std::byte>> {
  if (str.size() % 4 != 0) {
    return std::nullopt;
  }
  auto result = std::vector<std::byte>{};
  result.reserve(str.size() / 4 * 3);
  for (auto i = size_t{0}; i < str.size(); i += 4) {
    auto last = i + 4 == str.size();
    auto padding = size_t{0};
    auto x = uint32_t{0};
    for (auto j = size_t{0}; j < 4; ++j) {
      auto c = str[i + j];
      if (c == '=') {
        // Padding may only occur in the last two positions of the final group.
        if (!last || j < 2) {
          return std::nullopt;
        }
        ++padding;
        x <<= 6;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto value = inverse[static_cast<unsigned char>(c)];
      if (value < 0) {
        return std::nullopt;
      }
      x = (x << 6) | static_cast<uint32_t>(value);
    }
    result.push_back(static_cast<std::byte>((x >> 16) & 0xff));
    if (padding < 2) {
      result.push_back(static_cast<std::byte>((x >> 8) & 0xff));
    }
    if (padding < 1) {
      result.push_back(static_cast<std::byte>(x & 0xff));
    }
  }
  return result;
}

} // namespace recon::detail::base64
