//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/detail/stable_map.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace recon {

/// A random-access sequence of data.
using list = std::vector<data>;

/// A nested document: field names to data, in insertion order.
using record = detail::stable_map<std::string, data>;

/// Opaque binary payload.
using blob = std::vector<std::byte>;

} // namespace recon
