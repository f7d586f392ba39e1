//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/assert.hpp"

#include "recon/detail/env.hpp"
#include "recon/logger.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace recon {

panic_exception::panic_exception(std::string message,
                                 std::source_location location)
  : message_{std::move(message)}, location_{location} {
}

auto panic_exception::what() const noexcept -> const char* {
  return message_.c_str();
}

namespace detail {

void panic_impl(std::string message, std::source_location location) {
  RECON_CRITICAL("{}:{}: {}", location.file_name(), location.line(), message);
  if (detail::getenv("RECON_ABORT_ON_PANIC")) {
    fmt::print(stderr, "{}:{}: {}\n", location.file_name(), location.line(),
               message);
    std::abort();
  }
  throw panic_exception{std::move(message), location};
}

} // namespace detail
} // namespace recon
