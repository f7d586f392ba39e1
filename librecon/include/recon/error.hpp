//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/detail/assert.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <source_location>
#include <string>

namespace recon {

/// The error codes of the query engine.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// Expected a different type.
  type_clash,
  /// The operation does not support the given operator.
  unsupported_operator,
  /// Failure during parsing.
  parse_error,
  /// Failed to convert one type to another.
  convert_error,
  /// Malformed filter expression.
  invalid_query,
  /// A dictionary or table lookup failed to return a value.
  lookup_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// An operation received an invalid argument.
  invalid_argument,
  /// The configuration was invalid.
  invalid_configuration,
  /// A document with the same identifier already exists.
  duplicate_entry,
  /// The storage collaborator rejected an operation.
  storage_error,
  /// Requested file does not exist.
  no_such_file,
  /// An error from interacting with the operating system.
  system_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

/// @relates ec
template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  auto get = [&] {
    return static_cast<uint8_t>(x);
  };
  auto set = [&](uint8_t value) {
    if (value >= static_cast<uint8_t>(ec::ec_count)) {
      return false;
    }
    x = static_cast<ec>(value);
    return true;
  };
  return f.apply(get, set);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Appends a formatted note to the context of an error.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(
    error, fmt::format(std::move(fmt), std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    detail::panic_impl(render(err), location);
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    detail::panic_impl(render(result.error()), location);
  }
  return std::move(result.value());
}

} // namespace recon

CAF_ERROR_CODE_ENUM(recon::ec)

template <>
struct fmt::formatter<caf::error> : fmt::formatter<std::string_view> {
  auto format(const caf::error& err, format_context& ctx) const
    -> format_context::iterator {
    auto str = recon::render(err);
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};
