//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <compare>
#include <memory>
#include <string>
#include <string_view>

namespace recon {

struct regex_impl;

/// Flags that modify how a pattern matches.
struct pattern_options {
  bool case_insensitive = false;
  bool multi_line = false;
  bool dot_all = false;

  friend auto operator==(const pattern_options&, const pattern_options&)
    -> bool = default;
  friend auto operator<=>(const pattern_options&, const pattern_options&)
    = default;
};

/// A regular expression.
class pattern {
public:
  /// Compiles a regular expression.
  /// @param str The regex source.
  /// @param options The flags that modify matching.
  /// @returns The pattern, or `ec::parse_error` if *str* does not compile.
  static auto make(std::string str, pattern_options options = {}) noexcept
    -> caf::expected<pattern>;

  /// Parses a pattern written as `/regex/flags`, where the flags are any of
  /// `i` (case-insensitive), `m` (multi-line), and `s` (dot matches newline).
  /// @returns The pattern, or `ec::parse_error` if *str* is not in that form.
  static auto parse_literal(std::string_view str) -> caf::expected<pattern>;

  /// Checks whether a string has the `/regex/flags` form.
  static auto is_literal(std::string_view str) -> bool;

  pattern() = default;

  /// Matches a string against the pattern.
  /// @param str The string to match.
  /// @returns `true` if *str* matches the pattern entirely.
  [[nodiscard]] auto match(std::string_view str) const -> bool;

  /// Searches a pattern in a string.
  /// @param str The string to search.
  /// @returns `true` if the pattern matches anywhere within *str*.
  [[nodiscard]] auto search(std::string_view str) const -> bool;

  [[nodiscard]] auto string() const -> const std::string&;

  [[nodiscard]] auto options() const -> const pattern_options&;

  friend auto operator==(const pattern& lhs, const pattern& rhs) noexcept
    -> bool;

  friend auto operator<=>(const pattern& lhs, const pattern& rhs) noexcept
    -> std::strong_ordering;

private:
  std::string str_ = {};
  pattern_options options_ = {};
  std::shared_ptr<regex_impl> regex_ = {};
};

} // namespace recon

template <>
struct fmt::formatter<recon::pattern> : formatter<string_view> {
  auto format(const recon::pattern& x, format_context& ctx) const
    -> format_context::iterator {
    auto str = fmt::format("/{}/{}{}{}", x.string(),
                           x.options().case_insensitive ? "i" : "",
                           x.options().multi_line ? "m" : "",
                           x.options().dot_all ? "s" : "");
    return formatter<string_view>::format(str, ctx);
  }
};
