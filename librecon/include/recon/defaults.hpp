//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace recon::defaults {

// -- global constants ---------------------------------------------------------

/// Maximum depth in recursive function calls before bailing out.
/// Note: the value must be > 0.
inline constexpr size_t max_recursion = 100;

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Log filename; empty disables file logging.
inline constexpr const char* log_file = "";

/// Log format for file output.
inline constexpr const char* file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "info";

/// Verbosity for writing to file.
inline constexpr const char* file_verbosity = "debug";

} // namespace logger

// -- constants for the databases ----------------------------------------------

namespace db {

/// Collection holding host records of the active database.
inline constexpr std::string_view hosts_collection = "hosts";

/// Collection holding host records produced by a scanner run.
inline constexpr std::string_view nmap_collection = "nmap";

/// Collection holding scan documents referenced by `scanid`.
inline constexpr std::string_view scans_collection = "nmap_scans";

/// Collection holding merged host records of the view.
inline constexpr std::string_view view_collection = "view";

/// Collection holding passive observations.
inline constexpr std::string_view passive_collection = "passive";

/// The field holding the collection-assigned document identifier.
inline constexpr std::string_view id_field = "_id";

} // namespace db

// -- constants for the top-values aggregation ---------------------------------

namespace top_values {

/// Number of (value, count) pairs returned when the caller does not specify.
inline constexpr size_t top_n = 10;

/// Prefix length in bits for the `net` pseudo-field.
inline constexpr int net_mask = 24;

} // namespace top_values

} // namespace recon::defaults
