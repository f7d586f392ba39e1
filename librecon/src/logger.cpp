//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/logger.hpp"

#include "recon/defaults.hpp"
#include "recon/error.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

namespace recon {

auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)()>> {
  if (!recon::detail::setup_spdlog(cfg)) {
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  }
  return {caf::detail::make_scope_guard(
    std::addressof(recon::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (x == "quiet") {
    return RECON_LOG_LEVEL_QUIET;
  }
  if (x == "critical") {
    return RECON_LOG_LEVEL_CRITICAL;
  }
  if (x == "error") {
    return RECON_LOG_LEVEL_ERROR;
  }
  if (x == "warning") {
    return RECON_LOG_LEVEL_WARNING;
  }
  if (x == "info") {
    return RECON_LOG_LEVEL_INFO;
  }
  if (x == "verbose") {
    return RECON_LOG_LEVEL_VERBOSE;
  }
  if (x == "debug") {
    return RECON_LOG_LEVEL_DEBUG;
  }
  if (x == "trace") {
    return RECON_LOG_LEVEL_TRACE;
  }
  return default_value;
}

namespace {

/// Converts a recon log level to spdlog level
auto recon_loglevel_to_spd(const int value) -> spdlog::level::level_enum {
  switch (value) {
    case RECON_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case RECON_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case RECON_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case RECON_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case RECON_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case RECON_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case RECON_LOG_LEVEL_DEBUG:
    case RECON_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
    default:
      return spdlog::level::off;
  }
}

/// Reads a verbosity option, falling back to *fallback* if it is unset.
/// Returns a negative value if the option holds an unknown level.
auto get_verbosity(const caf::settings& cfg, std::string_view key,
                   const char* fallback) -> int {
  auto verbosity = std::string{fallback};
  if (auto x = caf::get_if<std::string>(&cfg, key)) {
    verbosity = *x;
  }
  auto result = loglevel_to_int(verbosity, -1);
  if (result < 0) {
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               verbosity);
  }
  return result;
}

} // namespace

namespace detail {

auto setup_spdlog(const caf::settings& cfg) -> bool try {
  if (logger()->name() != "/dev/null") {
    RECON_ERROR("Log already up");
    return false;
  }
  auto console_verbosity = get_verbosity(cfg, "recon.console-verbosity",
                                         defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg, "recon.file-verbosity",
                                      defaults::logger::file_verbosity);
  if (console_verbosity < 0 || file_verbosity < 0) {
    return false;
  }
  auto log_file = caf::get_or(cfg, "recon.log-file",
                              std::string{defaults::logger::log_file});
  if (log_file.empty()) {
    file_verbosity = RECON_LOG_LEVEL_QUIET;
  }
  auto verbosity = std::max(console_verbosity, file_verbosity);
  // Helper to set the color mode
  auto log_color = [&]() -> spdlog::color_mode {
    auto config_value = caf::get_or(cfg, "recon.console", "automatic");
    if (config_value == "automatic") {
      return spdlog::color_mode::automatic;
    }
    if (config_value == "always") {
      return spdlog::color_mode::always;
    }
    return spdlog::color_mode::never;
  }();
  auto sinks = std::vector<spdlog::sink_ptr>{};
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  console_sink->set_pattern(
    caf::get_or(cfg, "recon.console-format",
                std::string{defaults::logger::console_format}));
  console_sink->set_level(recon_loglevel_to_spd(console_verbosity));
  sinks.push_back(console_sink);
  if (file_verbosity != RECON_LOG_LEVEL_QUIET) {
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_pattern(
      caf::get_or(cfg, "recon.file-format",
                  std::string{defaults::logger::file_format}));
    file_sink->set_level(recon_loglevel_to_spd(file_verbosity));
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::logger>("recon", sinks.begin(),
                                              sinks.end());
  logger()->set_level(recon_loglevel_to_spd(verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  RECON_DEBUG("shut down logging");
  logger()->flush();
  spdlog::shutdown();
  logger() = std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto recon_logger = std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return recon_logger;
}

} // namespace detail
} // namespace recon
