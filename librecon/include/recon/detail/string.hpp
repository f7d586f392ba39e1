//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recon::detail {

/// Splits a string at every occurrence of a separator.
/// @param str The string to split.
/// @param sep The separator.
/// @param max_splits The maximum number of splits to perform.
/// @returns The pieces as views into *str*; an empty input yields one empty
///          piece.
auto split(std::string_view str, std::string_view sep,
           size_t max_splits = std::string_view::npos)
  -> std::vector<std::string_view>;

/// Converts a sequence of string views into owned strings.
auto to_strings(const std::vector<std::string_view>& xs)
  -> std::vector<std::string>;

/// Joins a sequence of strings with a separator.
auto join(const std::vector<std::string>& xs, std::string_view sep)
  -> std::string;

/// Returns the ASCII-lowercase copy of a string.
auto to_lower(std::string_view str) -> std::string;

/// Parses a base-10 signed integer that must span the full input.
auto to_int(std::string_view str) -> std::optional<int64_t>;

} // namespace recon::detail
