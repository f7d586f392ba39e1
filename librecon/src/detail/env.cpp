//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/env.hpp"

#include "recon/error.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>

extern char** environ;

namespace recon::detail {

namespace {

// A mutex for locking calls to functions that mutate `environ`. Global to this
// translation unit.
auto env_mutex = std::mutex{};

} // namespace

auto getenv(std::string_view var) -> std::optional<std::string> {
  auto lock = std::scoped_lock{env_mutex};
  auto key = std::string{var};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (const char* result = ::getenv(key.c_str())) {
    return std::string{result};
  }
  return std::nullopt;
}

auto setenv(std::string_view key, std::string_view value, int overwrite)
  -> caf::error {
  auto lock = std::scoped_lock{env_mutex};
  auto k = std::string{key};
  auto v = std::string{value};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (::setenv(k.c_str(), v.c_str(), overwrite) == 0) {
    return {};
  }
  return caf::make_error(ec::system_error,
                         fmt::format("failed in setenv(3): {}",
                                     ::strerror(errno)));
}

auto environment() -> std::vector<std::pair<std::string, std::string>> {
  auto lock = std::scoped_lock{env_mutex};
  auto result = std::vector<std::pair<std::string, std::string>>{};
  // Environment variables come as "key=value" pair strings.
  for (auto env = environ; *env != nullptr; ++env) {
    auto str = std::string_view{*env};
    auto i = str.find('=');
    if (i == std::string_view::npos) {
      continue;
    }
    result.emplace_back(str.substr(0, i), str.substr(i + 1));
  }
  return result;
}

} // namespace recon::detail
