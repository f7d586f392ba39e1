//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/expected.hpp>

#include <string>
#include <string_view>

namespace recon::detail {

/// Computes the MD5 digest of a string.
/// @returns the digest as lowercase hex, or `ec::system_error` if OpenSSL
///          fails.
auto md5_hex(std::string_view str) -> caf::expected<std::string>;

} // namespace recon::detail
