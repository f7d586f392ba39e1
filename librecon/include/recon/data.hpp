//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/aliases.hpp"
#include "recon/detail/operators.hpp"
#include "recon/ip.hpp"
#include "recon/pattern.hpp"
#include "recon/time.hpp"
#include "recon/variant.hpp"

#include <caf/config_value.hpp>
#include <caf/expected.hpp>
#include <caf/none.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace recon {

namespace detail {

struct invalid_data_type {};

template <class T>
constexpr auto to_data_type() {
  if constexpr (std::is_same_v<T, bool>) {
    return bool{};
  } else if constexpr (std::is_floating_point_v<T>) {
    return double{};
  } else if constexpr (std::is_integral_v<T>) {
    return int64_t{};
  } else if constexpr (std::is_convertible_v<T, std::string>
                       || std::is_same_v<T, std::string_view>) {
    return std::string{};
  } else if constexpr (std::is_same_v<T, caf::none_t> || std::is_same_v<T, time>
                       || std::is_same_v<T, pattern> || std::is_same_v<T, ip>
                       || std::is_same_v<T, blob> || std::is_same_v<T, list>
                       || std::is_same_v<T, record>) {
    return T{};
  } else {
    return invalid_data_type{};
  }
}

} // namespace detail

/// Converts a C++ type to the corresponding data type.
/// @relates data
template <class T>
using to_data_type = decltype(detail::to_data_type<std::decay_t<T>>());

/// A type-erased representation of the values stored in documents.
/// Integers and reals compare numerically, so `1 == 1.0` holds.
class data : detail::totally_ordered<data> {
public:
  /// The sum type of all possible builtin types.
  using variant = recon::variant<caf::none_t, bool, int64_t, double, time,
                                 std::string, pattern, ip, blob, list, record>;

  /// Default-constructs empty data.
  data() = default;

  data(const data&) = default;
  data& operator=(const data&) = default;
  data(data&&) noexcept = default;
  data& operator=(data&&) noexcept = default;
  ~data() noexcept = default;

  /// Constructs data from optional data.
  /// @param x The optional data instance.
  template <class T>
  data(std::optional<T> x) : data{x ? data{std::move(*x)} : data{}} {
    // nop
  }

  /// Constructs data.
  /// @param x The instance to construct data from.
  template <class T>
    requires(!std::same_as<to_data_type<T>, detail::invalid_data_type>
             && !std::same_as<std::decay_t<T>, data>)
  data(T&& x) : data_{to_data_type<T>(std::forward<T>(x))} {
    // nop
  }

  friend auto operator==(const data& lhs, const data& rhs) -> bool;
  friend auto operator<(const data& lhs, const data& rhs) -> bool;

  /// @cond PRIVATE

  [[nodiscard]] variant& get_data() {
    return data_;
  }

  [[nodiscard]] const variant& get_data() const {
    return data_;
  }

  /// @endcond

private:
  variant data_;
};

// -- helpers -----------------------------------------------------------------

/// @returns the numeric value of *x* if it holds an integer or a real.
/// @relates data
auto to_number(const data& x) -> std::optional<double>;

/// @returns the integral value of *x* if it holds an integer or a finite real
/// within the range of `int64_t`. Reals are truncated.
/// @relates data
auto to_integer(const data& x) -> std::optional<int64_t>;

/// @returns `true` if *x* and *y* can be ordered against each other, i.e.,
/// both are numbers, or both hold the same non-container type.
/// @relates data
auto is_comparable(const data& x, const data& y) -> bool;

/// Resolves a dot-separated path by plain record lookup. Lists are not
/// traversed.
/// @returns A pointer to the value, or `nullptr` if a segment is missing or
///          a non-record value sits on the path.
/// @relates data
auto descend(const record& r, std::string_view path) -> const data*;

/// Returns a copy of the dot-separated path, or null if it does not resolve.
/// @relates data
auto get_or_null(const record& r, std::string_view path) -> data;

/// Parses a YAML document into data.
auto from_yaml(std::string_view str) -> caf::expected<data>;

/// Converts a record into CAF settings, dropping null values.
auto convert(const record& xs, caf::settings& ys) -> caf::error;

/// Converts a CAF config value into data.
auto convert(const caf::config_value& x, data& y) -> bool;

} // namespace recon

template <>
struct fmt::formatter<recon::data> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const recon::data& x, fmt::format_context& ctx) const
    -> fmt::format_context::iterator;
};

namespace std {

template <>
struct hash<recon::data> {
  auto operator()(const recon::data& x) const -> size_t;
};

} // namespace std
