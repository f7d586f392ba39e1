//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/config.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <memory>
#include <string>

// RECON_INFO -> spdlog::info
// RECON_VERBOSE -> spdlog::debug
// RECON_DEBUG -> spdlog::trace

#if RECON_LOG_LEVEL == RECON_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif RECON_LOG_LEVEL == RECON_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include <spdlog/spdlog.h>

namespace recon::detail {

/// Returns the process-wide logger. Until `create_log_context` runs, it
/// discards everything.
auto logger() -> std::shared_ptr<spdlog::logger>&;

/// Installs the configured sinks into the process-wide logger.
auto setup_spdlog(const caf::settings& cfg) -> bool;

/// Flushes and tears down all loggers.
void shutdown_spdlog();

} // namespace recon::detail

#define RECON_DISCARD_ARGS(...) static_cast<void>(0)

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_TRACE
#  define RECON_TRACE(...)                                                     \
    SPDLOG_LOGGER_TRACE(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_TRACE(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_DEBUG
#  define RECON_DEBUG(...)                                                     \
    SPDLOG_LOGGER_TRACE(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_DEBUG(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_VERBOSE
#  define RECON_VERBOSE(...)                                                   \
    SPDLOG_LOGGER_DEBUG(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_VERBOSE(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_INFO
#  define RECON_INFO(...)                                                      \
    SPDLOG_LOGGER_INFO(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_INFO(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_WARNING
#  define RECON_WARN(...)                                                      \
    SPDLOG_LOGGER_WARN(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_WARN(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_ERROR
#  define RECON_ERROR(...)                                                     \
    SPDLOG_LOGGER_ERROR(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_ERROR(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

#if RECON_LOG_LEVEL >= RECON_LOG_LEVEL_CRITICAL
#  define RECON_CRITICAL(...)                                                  \
    SPDLOG_LOGGER_CRITICAL(::recon::detail::logger(), __VA_ARGS__)
#else
#  define RECON_CRITICAL(...) RECON_DISCARD_ARGS(__VA_ARGS__)
#endif

namespace recon {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to turn log level strings from config, like 'debug', into an int.
auto loglevel_to_int(std::string x, int default_value = RECON_LOG_LEVEL_QUIET)
  -> int;

/// Sets up logging from the `recon.*` logger options in *cfg* and returns a
/// guard that shuts logging down when it goes out of scope.
[[nodiscard]] auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)()>>;

} // namespace recon
