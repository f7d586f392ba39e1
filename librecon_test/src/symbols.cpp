//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#define CAF_TEST_NO_MAIN
#include <caf/test/test.hpp>

#include <set>
#include <string>

namespace recon::test {

std::set<std::string> config;

} // namespace recon::test
