//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/aliases.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace recon {

enum class sort_order : uint8_t {
  ascending,
  descending,
};

/// A field to sort by. The field is a plain dotted path; lists on the way
/// are not traversed.
struct sort_key {
  std::string field;
  sort_order order = sort_order::ascending;
};

/// Three-way comparison of two documents under a sequence of sort keys. The
/// first key on which the documents differ decides. A missing or null value
/// sorts before any other value in ascending order and after it in
/// descending order.
/// @returns A negative number, zero, or a positive number.
auto compare(const record& x, const record& y, std::span<const sort_key> keys)
  -> int;

/// Sorts documents stably, so that ties keep their relative order.
void sort(std::vector<record>& xs, std::span<const sort_key> keys);

} // namespace recon
