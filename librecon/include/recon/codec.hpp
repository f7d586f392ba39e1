//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/data.hpp"

#include <caf/expected.hpp>

#include <string>
#include <string_view>

namespace recon {

// -- addresses ----------------------------------------------------------------

/// Converts the textual form of an IPv4 or IPv6 address to the internal form.
/// @returns The address, or `ec::parse_error` for malformed input.
auto ip_to_internal(std::string_view text) -> caf::expected<ip>;

/// Renders an internal address canonically: dotted quad for IPv4 and the
/// compressed RFC 5952 form for IPv6.
auto internal_to_ip(const ip& x) -> std::string;

// -- timestamps ---------------------------------------------------------------

/// Normalizes a timestamp to seconds since the epoch. Accepts numbers, native
/// time values, numeric strings, and date/time strings.
/// @returns The epoch, or `ec::parse_error` for anything else.
auto to_epoch(const data& x) -> caf::expected<double>;

/// Converts seconds since the epoch to a time value with microsecond
/// resolution.
auto from_epoch(double x) -> time;

// -- binary payloads ----------------------------------------------------------

/// Encodes a binary payload as Base64.
auto to_binary(const blob& x) -> std::string;

/// Decodes a Base64 payload.
/// @returns The payload, or `ec::convert_error` for invalid Base64.
auto from_binary(std::string_view x) -> caf::expected<blob>;

// -- records ------------------------------------------------------------------

/// Converts a host record to its stored form: textual addresses in `addr`,
/// `ports.state_reason_ip` and `traces.hops.ipaddr` become internal
/// addresses, `starttime` and `endtime` become epochs, and a single `scanid`
/// becomes a list.
auto host_to_internal(record host) -> caf::expected<record>;

/// Reverts `host_to_internal`, turning epochs into time values.
auto host_from_internal(record host) -> record;

/// Converts a passive record to its stored form: `addr` becomes an internal
/// address, `firstseen` and `lastseen` become epochs, binary values become
/// Base64, and any `_id` is dropped.
auto passive_to_internal(record rec) -> caf::expected<record>;

/// Reverts `passive_to_internal`. The value of a certificate record is
/// decoded back to a binary payload.
auto passive_from_internal(record rec) -> caf::expected<record>;

} // namespace recon
