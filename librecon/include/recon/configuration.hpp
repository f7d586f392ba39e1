//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include <caf/error.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recon {

/// Translates an environment variable to a config key. All keys follow the
/// pattern PREFIX_SUFFIX, where PREFIX is the application-specific prefix
/// that gets stripped. Thereafter, SUFFIX adheres to the following
/// substitution rules:
/// 1. A '_' translates into '-'
/// 2. A "__" translates into the record separator '.'
/// @pre `!prefix.empty()`
auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string>;

/// Bundles all configuration parameters of the databases and the logger.
///
/// Sources apply in the order they are merged: later files override earlier
/// ones, and the environment overrides all files.
class configuration {
public:
  /// Merges a YAML document.
  /// @returns `ec::parse_error` if the document is not a map of key-value
  ///          pairs.
  auto merge_yaml(std::string_view contents) -> caf::error;

  /// Merges the YAML files that exist among *paths*.
  auto merge_files(const std::vector<std::filesystem::path>& paths)
    -> caf::error;

  /// Merges all `RECON_*` variables of the process environment.
  auto merge_environment() -> caf::error;

  /// Merges all `RECON_*` variables among *env*.
  auto merge_environment(
    const std::vector<std::pair<std::string, std::string>>& env)
    -> caf::error;

  /// @returns the configuration files that were merged so far.
  [[nodiscard]] auto files() const
    -> const std::vector<std::filesystem::path>& {
    return files_;
  }

  [[nodiscard]] auto content() const -> const caf::settings& {
    return content_;
  }

private:
  caf::settings content_;
  std::vector<std::filesystem::path> files_;
};

} // namespace recon
