//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/configuration.hpp"

#include "recon/data.hpp"
#include "recon/detail/assert.hpp"
#include "recon/detail/env.hpp"
#include "recon/detail/load_contents.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/logger.hpp"

#include <caf/config_value.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>
#include <fmt/std.h>

#include <cctype>

namespace recon {

namespace {

/// Merges *src* into *dst*. Dictionaries merge recursively, all other values
/// replace the existing ones.
void merge_settings(const caf::settings& src, caf::settings& dst) {
  for (const auto& [key, value] : src) {
    if (const auto* src_dict = caf::get_if<caf::settings>(&value)) {
      auto& slot = dst[key];
      if (auto* dst_dict = caf::get_if<caf::settings>(&slot)) {
        merge_settings(*src_dict, *dst_dict);
        continue;
      }
      slot = value;
      continue;
    }
    dst[key] = value;
  }
}

} // namespace

auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string> {
  RECON_ASSERT(!prefix.empty());
  // PREFIX_X is the shortest allowed key.
  if (prefix.size() + 2 > key.size()) {
    return std::nullopt;
  }
  if (!key.starts_with(prefix) || key[prefix.size()] != '_') {
    return std::nullopt;
  }
  auto suffix = key.substr(prefix.size() + 1);
  // From here on, "__" is the record separator and '_' translates into '-'.
  auto xs = detail::to_strings(detail::split(suffix, "__"));
  for (auto& x : xs) {
    for (auto& c : x) {
      c = (c == '_')
            ? '-'
            : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return detail::join(xs, ".");
}

auto configuration::merge_yaml(std::string_view contents) -> caf::error {
  auto yaml = from_yaml(contents);
  if (!yaml) {
    return yaml.error();
  }
  if (is<caf::none_t>(*yaml)) {
    return caf::none;
  }
  const auto* rec = try_as<record>(&*yaml);
  if (!rec) {
    return caf::make_error(ec::parse_error,
                           "configuration must be a map of key-value pairs");
  }
  auto settings = caf::settings{};
  if (auto err = convert(*rec, settings)) {
    return err;
  }
  merge_settings(settings, content_);
  return caf::none;
}

auto configuration::merge_files(const std::vector<std::filesystem::path>& paths)
  -> caf::error {
  for (const auto& path : paths) {
    auto err = std::error_code{};
    if (!std::filesystem::exists(path, err)) {
      if (err) {
        return caf::make_error(ec::system_error,
                               fmt::format("failed to check if {} exists: {}",
                                           path, err.message()));
      }
      RECON_DEBUG("skipping missing configuration file {}", path);
      continue;
    }
    auto contents = detail::load_contents(path);
    if (!contents) {
      return contents.error();
    }
    if (auto err = merge_yaml(*contents)) {
      return caf::make_error(ec::parse_error,
                             fmt::format("failed to read {}: {}", path,
                                         render(err)));
    }
    RECON_VERBOSE("loaded configuration file {}", path);
    files_.push_back(path);
  }
  return caf::none;
}

auto configuration::merge_environment() -> caf::error {
  return merge_environment(detail::environment());
}

auto configuration::merge_environment(
  const std::vector<std::pair<std::string, std::string>>& env) -> caf::error {
  for (const auto& [key, value] : env) {
    if (value.empty()) {
      continue;
    }
    auto config_key = to_config_key(key, "RECON");
    if (!config_key) {
      continue;
    }
    config_key->insert(0, "recon.");
    if (auto x = caf::config_value::parse(value)) {
      caf::put(content_, *config_key, std::move(*x));
    } else {
      caf::put(content_, *config_key, value);
    }
    RECON_DEBUG("set {} from environment variable {}", *config_key, key);
  }
  return caf::none;
}

} // namespace recon
