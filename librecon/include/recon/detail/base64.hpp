//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace recon::detail::base64 {

/// Returns the number of characters needed to encode *n* bytes.
constexpr auto encoded_size(size_t n) -> size_t {
  return 4 * ((n + 2) / 3);
}

/// Encodes bytes with the standard alphabet, padded with `=`.
auto encode(std::span<const std::byte> bytes) -> std::string;

/// Encodes the bytes of a string.
auto encode(std::string_view str) -> std::string;

/// Decodes a base64 string. Returns `std::nullopt` if the input is not valid
/// padded base64.
auto try_decode(std::string_view str) -> std::optional<std::vector<std::byte>>;

} // namespace recon::detail::base64
