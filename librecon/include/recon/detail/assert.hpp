//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <exception>
#include <source_location>
#include <string>

namespace recon {

/// The exception thrown when an internal invariant does not hold.
class panic_exception : public std::exception {
public:
  panic_exception(std::string message, std::source_location location);

  auto what() const noexcept -> const char* override;

  auto location() const noexcept -> const std::source_location& {
    return location_;
  }

private:
  std::string message_;
  std::source_location location_;
};

namespace detail {

/// Logs the message and raises a `panic_exception`, or aborts the process if
/// `RECON_ABORT_ON_PANIC` is set in the environment.
[[noreturn]] void panic_impl(std::string message,
                             std::source_location location
                             = std::source_location::current());

} // namespace detail
} // namespace recon

#define RECON_ASSERT(expr, ...)                                                \
  do {                                                                         \
    if (!static_cast<bool>(expr)) [[unlikely]] {                               \
      ::recon::detail::panic_impl(                                             \
        "assertion `" #expr "` failed" __VA_OPT__(": " __VA_ARGS__));          \
    }                                                                          \
  } while (false)

#define RECON_UNREACHABLE()                                                    \
  ::recon::detail::panic_impl("internal error: reached unreachable code")
