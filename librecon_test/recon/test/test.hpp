//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include "recon/data.hpp"
#include "recon/error.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <optional>
#include <set>
#include <string>

namespace recon::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else if constexpr (fmt::is_formattable<T>::value) {
    return fmt::format("{}", value);
  } else if constexpr (std::is_same_v<T, record> || std::is_same_v<T, list>) {
    return fmt::format("{}", data{value});
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // end namespace recon::test::detail

// -- logging macros -----------------------------------------------------------

#define MESSAGE(...) fmt::print("{}\n", fmt::format(__VA_ARGS__))

// -- test setup macros --------------------------------------------------------

#define FIXTURE_SCOPE CAF_TEST_FIXTURE_SCOPE
#define FIXTURE_SCOPE_END CAF_TEST_FIXTURE_SCOPE_END

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define REQUIRE_NOT_EQUAL(x, y)                                                \
  ::caf::test::runnable::current().require_ne((x), (y))
#define REQUIRE_SUCCESS(x) REQUIRE(!(x))
#define REQUIRE_NOERROR(x)                                                     \
  do {                                                                         \
    if (!(x)) {                                                                \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            ::recon::render((x).error()),      \
                                            __FILE__);                         \
    }                                                                          \
  } while (false)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::recon::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y) CHECK(!((x) == (y)))
#define CHECK_LESS(x, y) CHECK((x) < (y))
#define CHECK_LESS_EQUAL(x, y) CHECK((x) <= (y))
#define CHECK_ERROR(x) CHECK(!(x))
#define CHECK_SUCCESS(x) CHECK(!(x))
#define CHECK_FAILURE(x) CHECK(static_cast<bool>(x))

// -- global state -------------------------------------------------------------

namespace recon::test {

template <class T>
T unbox(std::optional<T> x) {
  if (!x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
T unbox(caf::expected<T> x) {
  if (!x) {
    FAIL("expected<T> contains an error: {}", render(x.error()));
  }
  return std::move(*x);
}

template <class T>
T unbox(T* x) {
  if (!x) {
    FAIL("T* contains nullptr");
  }
  return std::move(*x);
}

// Holds global configuration options passed on the command line after the
// special -- delimiter.
extern std::set<std::string> config;

} // namespace recon::test

namespace recon {

using test::unbox;

} // namespace recon
