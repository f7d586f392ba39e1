//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/load_contents.hpp"

#include "recon/error.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

namespace recon::detail {

auto load_contents(const std::filesystem::path& p)
  -> caf::expected<std::string> {
  auto in = std::ifstream{p};
  if (!in) {
    return caf::make_error(ec::no_such_file,
                           fmt::format("failed to read from file {}",
                                       p.string()));
  }
  auto ss = std::stringstream{};
  ss << in.rdbuf();
  return ss.str();
}

} // namespace recon::detail
