//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/pattern.hpp"

#include "recon/error.hpp"

#include <re2/re2.h>

#include <tuple>

namespace recon {

struct regex_impl : re2::RE2 {
  using RE2::RE2;
};

auto pattern::make(std::string str, pattern_options options) noexcept
  -> caf::expected<pattern> {
  auto opts = re2::RE2::Options(re2::RE2::CannedOptions::Quiet);
  opts.set_case_sensitive(!options.case_insensitive);
  opts.set_dot_nl(options.dot_all);
  // RE2 has no multi-line option; it takes the inline flag instead.
  auto source = options.multi_line ? "(?m)" + str : str;
  auto result = pattern{};
  result.str_ = std::move(str);
  result.options_ = options;
  result.regex_ = std::make_shared<regex_impl>(source, opts);
  if (!result.regex_->ok()) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to create regex from `{}`: {}",
                                       result.str_, result.regex_->error()));
  }
  return result;
}

auto pattern::is_literal(std::string_view str) -> bool {
  if (str.size() < 2 || str.front() != '/') {
    return false;
  }
  auto end = str.rfind('/');
  if (end == 0) {
    return false;
  }
  return str.substr(end + 1).find_first_not_of("ims") == std::string_view::npos;
}

auto pattern::parse_literal(std::string_view str) -> caf::expected<pattern> {
  if (!is_literal(str)) {
    return caf::make_error(ec::parse_error,
                           fmt::format("not a /regex/flags literal: '{}'",
                                       str));
  }
  auto end = str.rfind('/');
  auto options = pattern_options{};
  for (auto flag : str.substr(end + 1)) {
    switch (flag) {
      case 'i':
        options.case_insensitive = true;
        break;
      case 'm':
        options.multi_line = true;
        break;
      case 's':
        options.dot_all = true;
        break;
    }
  }
  return make(std::string{str.substr(1, end - 1)}, options);
}

auto pattern::match(std::string_view str) const -> bool {
  if (!regex_) {
    return false;
  }
  return re2::RE2::FullMatch(str, *regex_);
}

auto pattern::search(std::string_view str) const -> bool {
  if (!regex_) {
    return false;
  }
  return re2::RE2::PartialMatch(str, *regex_);
}

auto pattern::string() const -> const std::string& {
  return str_;
}

auto pattern::options() const -> const pattern_options& {
  return options_;
}

auto operator==(const pattern& lhs, const pattern& rhs) noexcept -> bool {
  return lhs.str_ == rhs.str_ && lhs.options_ == rhs.options_;
}

auto operator<=>(const pattern& lhs, const pattern& rhs) noexcept
  -> std::strong_ordering {
  if (auto cmp = lhs.str_ <=> rhs.str_; cmp != 0) {
    return cmp;
  }
  return lhs.options_ <=> rhs.options_;
}

} // namespace recon
