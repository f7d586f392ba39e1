//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/digest.hpp"

#include "recon/error.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>

#include <array>
#include <functional>
#include <iterator>
#include <memory>

namespace recon::detail {

auto md5_hex(std::string_view str) -> caf::expected<std::string> {
  auto ctx = std::unique_ptr<EVP_MD_CTX, std::function<void(EVP_MD_CTX*)>>{
    EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return caf::make_error(ec::system_error, "failed to allocate a digest "
                                             "context");
  }
  auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE>{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1
      || EVP_DigestUpdate(ctx.get(), str.data(), str.size()) != 1
      || EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    return caf::make_error(ec::system_error, "failed to compute MD5 digest");
  }
  auto result = std::string{};
  result.reserve(length * 2);
  for (auto i = 0u; i < length; ++i) {
    fmt::format_to(std::back_inserter(result), "{:02x}", digest[i]);
  }
  return result;
}

} // namespace recon::detail
