//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/env.hpp"
#include "recon/fwd.hpp"
#include "recon/logger.hpp"
#include "recon/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace recon::test {

extern std::set<std::string> config;

} // namespace recon::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  (void)recon::detail::setenv("RECON_ABORT_ON_PANIC", "1");
  std::string recon_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(recon_loglevel, "recon-verbosity",
                          "console verbosity for librecon")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    recon::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  caf::settings log_settings;
  caf::put(log_settings, "recon.console-verbosity", recon_loglevel);
  caf::put(log_settings, "recon.console-format", "%^[%s:%#] %v%$");
  auto log_context = recon::create_log_context(log_settings);
  if (!log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n",
               recon::render(log_context.error()));
    return EXIT_FAILURE;
  }
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::recon_types>();
  // Run the unit tests.
  auto result = caf::test::main(argc, argv);
  return result;
}
