//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/detail/assert.hpp"
#include "recon/detail/overload.hpp"

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

namespace recon {

namespace detail {

template <class Result, class Variant, class... Fs>
auto match(Variant&& variant, Fs&&... fs) -> decltype(auto) {
  if constexpr (std::same_as<Result, void>) {
    return std::visit(detail::overload{std::forward<Fs>(fs)...},
                      std::forward<Variant>(variant));
  } else {
    return std::visit(
      [f = detail::overload{std::forward<Fs>(fs)...}](auto&& x) -> Result {
        return Result{f(std::forward<decltype(x)>(x))};
      },
      std::forward<Variant>(variant));
  }
}

} // namespace detail

/// A `std::variant` with pattern-matching support.
template <class... Ts>
class variant : public std::variant<Ts...> {
public:
  using std::variant<Ts...>::variant;

  template <class T>
  static constexpr auto can_have = (std::same_as<T, Ts> || ...);

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) & -> decltype(auto) {
    return detail::match<Result>(static_cast<std::variant<Ts...>&>(*this),
                                 std::forward<Fs>(fs)...);
  }

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) const& -> decltype(auto) {
    return detail::match<Result>(static_cast<const std::variant<Ts...>&>(*this),
                                 std::forward<Fs>(fs)...);
  }

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) && -> decltype(auto) {
    return detail::match<Result>(static_cast<std::variant<Ts...>&&>(*this),
                                 std::forward<Fs>(fs)...);
  }
};

/// Types that wrap a `recon::variant` expose it via `get_data()`. The helpers
/// below work uniformly on plain variants and on such wrappers.
template <class T>
concept has_variant_data = requires(const T& x) { x.get_data(); };

template <class V>
auto variant_of(V& x) -> decltype(auto) {
  if constexpr (has_variant_data<std::remove_const_t<V>>) {
    return (x.get_data());
  } else {
    return (x);
  }
}

/// Checks whether *x* currently holds a *T*.
template <class T, class V>
auto is(const V& x) -> bool {
  return std::holds_alternative<T>(variant_of(x));
}

/// Returns a pointer to the *T* in *x*, or `nullptr` if *x* holds another type.
template <class T, class V>
auto try_as(V* x) -> auto* {
  if (!x) {
    return static_cast<std::conditional_t<std::is_const_v<V>, const T*, T*>>(
      nullptr);
  }
  return std::get_if<T>(&variant_of(*x));
}

/// Returns the *T* in *x*.
/// @pre `is<T>(x)`
template <class T, class V>
auto as(V& x) -> auto& {
  auto* result = try_as<T>(&x);
  RECON_ASSERT(result != nullptr, "variant holds an unexpected type");
  return *result;
}

/// Visits the alternative in *x* with an overload set.
template <class V, class... Fs>
auto match(V&& x, Fs&&... fs) -> decltype(auto) {
  return std::visit(detail::overload{std::forward<Fs>(fs)...},
                    variant_of(x));
}

} // namespace recon
