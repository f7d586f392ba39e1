//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/detail/string.hpp"

#include "recon/detail/assert.hpp"

#include <cctype>
#include <charconv>

namespace recon::detail {

auto split(std::string_view str, std::string_view sep, size_t max_splits)
  -> std::vector<std::string_view> {
  RECON_ASSERT(!sep.empty());
  auto result = std::vector<std::string_view>{};
  auto begin = size_t{0};
  while (result.size() < max_splits) {
    auto pos = str.find(sep, begin);
    if (pos == std::string_view::npos) {
      break;
    }
    result.push_back(str.substr(begin, pos - begin));
    begin = pos + sep.size();
  }
  result.push_back(str.substr(begin));
  return result;
}

auto to_strings(const std::vector<std::string_view>& xs)
  -> std::vector<std::string> {
  return {xs.begin(), xs.end()};
}

auto join(const std::vector<std::string>& xs, std::string_view sep)
  -> std::string {
  auto result = std::string{};
  for (auto i = size_t{0}; i < xs.size(); ++i) {
    if (i != 0) {
      result += sep;
    }
    result += xs[i];
  }
  return result;
}

auto to_lower(std::string_view str) -> std::string {
  auto result = std::string{str};
  for (auto& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

auto to_int(std::string_view str) -> std::optional<int64_t> {
  auto result = int64_t{0};
  auto begin = str.data();
  auto end = str.data() + str.size();
  if (begin != end && *begin == '+') {
    ++begin;
  }
  auto [ptr, ec] = std::from_chars(begin, end, result);
  if (ec != std::errc{} || ptr != end || begin == end) {
    return std::nullopt;
  }
  return result;
}

} // namespace recon::detail
