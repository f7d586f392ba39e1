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

#include <chrono>
#include <cstdint>
#include <string_view>

namespace recon {

/// A time duration with nanosecond granularity.
using duration = std::chrono::duration<int64_t, std::nano>;

/// An absolute point in time with nanosecond granularity. It is capable of
/// representing dates from 1677 to 2262.
using time = std::chrono::time_point<std::chrono::system_clock, duration>;

/// Parses an absolute point in time. Accepted forms are `YYYY-MM-DD`,
/// `YYYY-MM-DD HH:MM:SS`, and `YYYY-MM-DDTHH:MM:SS`, each optionally with
/// fractional seconds and a trailing `Z` or `+HH:MM` offset. Times without an
/// offset are UTC.
auto parse_time(std::string_view str) -> caf::expected<time>;

/// Converts a point in time to seconds since the epoch, rounded to
/// microseconds.
auto to_epoch_seconds(time x) -> double;

/// Converts seconds since the epoch to a point in time, rounded to
/// microseconds.
auto from_epoch_seconds(double x) -> time;

} // namespace recon

template <>
struct fmt::formatter<recon::time> : formatter<string_view> {
  auto format(const recon::time& x, format_context& ctx) const
    -> format_context::iterator;
};
