//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/time.hpp"

#include "recon/error.hpp"

#include <cctype>
#include <cmath>
#include <optional>
#include <string>

namespace recon {

namespace {

/// A minimal cursor over the input of `parse_time`.
class time_scanner {
public:
  explicit time_scanner(std::string_view str) : str_{str} {
  }

  auto digits(size_t n) -> std::optional<int> {
    if (str_.size() - pos_ < n) {
      return std::nullopt;
    }
    auto result = 0;
    for (auto i = size_t{0}; i < n; ++i) {
      auto c = str_[pos_ + i];
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
      result = result * 10 + (c - '0');
    }
    pos_ += n;
    return result;
  }

  auto accept(char c) -> bool {
    if (pos_ < str_.size() && str_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  auto peek() const -> char {
    return pos_ < str_.size() ? str_[pos_] : '\0';
  }

  auto done() const -> bool {
    return pos_ == str_.size();
  }

private:
  std::string_view str_;
  size_t pos_ = 0;
};

auto parse_error(std::string_view str) -> caf::error {
  return caf::make_error(ec::parse_error,
                         fmt::format("invalid timestamp: '{}'", str));
}

} // namespace

auto parse_time(std::string_view str) -> caf::expected<time> {
  using namespace std::chrono;
  auto s = time_scanner{str};
  auto y = s.digits(4);
  if (!y || !s.accept('-')) {
    return parse_error(str);
  }
  auto m = s.digits(2);
  if (!m || !s.accept('-')) {
    return parse_error(str);
  }
  auto d = s.digits(2);
  if (!d) {
    return parse_error(str);
  }
  auto ymd = year_month_day{year{*y}, month{static_cast<unsigned>(*m)},
                            day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) {
    return parse_error(str);
  }
  auto result = time{sys_days{ymd}.time_since_epoch()};
  if (s.done()) {
    return result;
  }
  if (!s.accept('T') && !s.accept(' ')) {
    return parse_error(str);
  }
  auto hh = s.digits(2);
  if (!hh || *hh > 23 || !s.accept(':')) {
    return parse_error(str);
  }
  auto mm = s.digits(2);
  if (!mm || *mm > 59) {
    return parse_error(str);
  }
  auto ss = std::optional<int>{0};
  if (s.accept(':')) {
    ss = s.digits(2);
    if (!ss || *ss > 60) {
      return parse_error(str);
    }
  }
  result += hours{*hh} + minutes{*mm} + seconds{*ss};
  if (s.accept('.')) {
    auto fraction = duration{0};
    auto scale = int64_t{100'000'000};
    auto count = 0;
    while (std::isdigit(static_cast<unsigned char>(s.peek()))) {
      auto digit = *s.digits(1);
      fraction += duration{digit * scale};
      scale /= 10;
      ++count;
    }
    if (count == 0) {
      return parse_error(str);
    }
    result += fraction;
  }
  if (s.accept('Z') || s.done()) {
    if (!s.done()) {
      return parse_error(str);
    }
    return result;
  }
  auto sign = s.peek();
  if (!s.accept('+') && !s.accept('-')) {
    return parse_error(str);
  }
  auto oh = s.digits(2);
  if (!oh) {
    return parse_error(str);
  }
  s.accept(':');
  auto om = s.digits(2);
  if (!om || !s.done()) {
    return parse_error(str);
  }
  auto offset = hours{*oh} + minutes{*om};
  return sign == '+' ? result - offset : result + offset;
}

auto to_epoch_seconds(time x) -> double {
  using namespace std::chrono;
  auto us = round<microseconds>(x.time_since_epoch());
  return static_cast<double>(us.count()) / 1e6;
}

auto from_epoch_seconds(double x) -> time {
  using namespace std::chrono;
  auto us = microseconds{static_cast<int64_t>(std::llround(x * 1e6))};
  return time{duration_cast<duration>(us)};
}

} // namespace recon

auto fmt::formatter<recon::time>::format(const recon::time& x,
                                         format_context& ctx) const
  -> format_context::iterator {
  using namespace std::chrono;
  auto since_epoch = x.time_since_epoch();
  auto days_since_epoch = floor<days>(since_epoch);
  auto ymd = year_month_day{sys_days{days_since_epoch}};
  auto hms = hh_mm_ss<microseconds>{
    floor<microseconds>(since_epoch - days_since_epoch)};
  auto str = fmt::format(
    "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}", static_cast<int>(ymd.year()),
    static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
    hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
    hms.subseconds().count());
  return formatter<string_view>::format(str, ctx);
}
