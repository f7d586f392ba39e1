//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/expected.hpp>

#include <filesystem>
#include <string>

namespace recon::detail {

/// Reads a file into a string.
auto load_contents(const std::filesystem::path& p)
  -> caf::expected<std::string>;

} // namespace recon::detail
