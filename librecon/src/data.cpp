//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/data.hpp"

#include "recon/defaults.hpp"
#include "recon/detail/base64.hpp"
#include "recon/detail/overload.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"

#include <caf/deep_to_string.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>

namespace recon {

auto operator==(const data& lhs, const data& rhs) -> bool {
  auto x = to_number(lhs);
  auto y = to_number(rhs);
  if (x && y) {
    return *x == *y;
  }
  return lhs.get_data() == rhs.get_data();
}

auto operator<(const data& lhs, const data& rhs) -> bool {
  auto x = to_number(lhs);
  auto y = to_number(rhs);
  if (x && y) {
    return *x < *y;
  }
  auto i = lhs.get_data().index();
  auto j = rhs.get_data().index();
  if (i != j) {
    // Numbers of different kinds were handled above, so this ordering by type
    // only separates unrelated types.
    return i < j;
  }
  return lhs.get_data() < rhs.get_data();
}

auto to_number(const data& x) -> std::optional<double> {
  if (const auto* i = try_as<int64_t>(&x)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = try_as<double>(&x)) {
    return *d;
  }
  return std::nullopt;
}

auto to_integer(const data& x) -> std::optional<int64_t> {
  if (const auto* i = try_as<int64_t>(&x)) {
    return *i;
  }
  if (const auto* d = try_as<double>(&x)) {
    // 2^63 is exactly representable, INT64_MAX is not.
    constexpr auto limit = 9223372036854775808.0;
    if (std::isfinite(*d) && *d > -limit && *d < limit) {
      return static_cast<int64_t>(*d);
    }
  }
  return std::nullopt;
}

auto is_comparable(const data& x, const data& y) -> bool {
  if (to_number(x) && to_number(y)) {
    return true;
  }
  if (x.get_data().index() != y.get_data().index()) {
    return false;
  }
  return is<bool>(x) || is<time>(x) || is<std::string>(x) || is<ip>(x)
         || is<blob>(x);
}

auto descend(const record& r, std::string_view path) -> const data* {
  auto current = &r;
  auto names = detail::split(path, ".");
  for (auto i = size_t{0}; i < names.size(); ++i) {
    auto it = current->find(names[i]);
    if (it == current->end()) {
      return nullptr;
    }
    if (i + 1 == names.size()) {
      return &it->second;
    }
    current = try_as<record>(&it->second);
    if (!current) {
      return nullptr;
    }
  }
  return nullptr;
}

auto get_or_null(const record& r, std::string_view path) -> data {
  if (const auto* x = descend(r, path)) {
    return *x;
  }
  return data{};
}

namespace {

auto parse_scalar(const std::string& str) -> data {
  if (str == "true" || str == "yes" || str == "on") {
    return true;
  }
  if (str == "false" || str == "no" || str == "off") {
    return false;
  }
  if (auto i = detail::to_int(str)) {
    return *i;
  }
  if (!str.empty()) {
    char* end = nullptr;
    auto d = std::strtod(str.c_str(), &end);
    if (end == str.c_str() + str.size()) {
      return d;
    }
  }
  return str;
}

auto parse(const YAML::Node& node, size_t depth = 0) -> data {
  if (depth > defaults::max_recursion) {
    throw std::runtime_error("nesting too deep");
  }
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return data{};
    case YAML::NodeType::Scalar:
      return parse_scalar(node.as<std::string>());
    case YAML::NodeType::Sequence: {
      list xs;
      xs.reserve(node.size());
      for (const auto& element : node) {
        xs.push_back(parse(element, depth + 1));
      }
      return xs;
    }
    case YAML::NodeType::Map: {
      record xs;
      xs.reserve(node.size());
      for (const auto& pair : node) {
        xs.emplace(pair.first.as<std::string>(),
                   parse(pair.second, depth + 1));
      }
      return xs;
    }
  }
  RECON_UNREACHABLE();
}

auto convert(const data& d, caf::config_value& cv) -> caf::error {
  auto f = detail::overload{
    [&](const auto& x) -> caf::error {
      cv = fmt::format("{}", data{x});
      return caf::none;
    },
    [&](caf::none_t) -> caf::error {
      // A caf::config_value has no notion of "null" value, callers skip nulls.
      return caf::make_error(ec::type_clash, "cannot convert null to "
                                             "config_value");
    },
    [&](bool x) -> caf::error {
      cv = x;
      return caf::none;
    },
    [&](int64_t x) -> caf::error {
      cv = x;
      return caf::none;
    },
    [&](double x) -> caf::error {
      cv = x;
      return caf::none;
    },
    [&](const std::string& x) -> caf::error {
      cv = x;
      return caf::none;
    },
    [&](const list& xs) -> caf::error {
      caf::config_value::list result;
      result.reserve(xs.size());
      for (const auto& x : xs) {
        caf::config_value y;
        if (auto err = convert(x, y)) {
          return err;
        }
        result.push_back(std::move(y));
      }
      cv = std::move(result);
      return caf::none;
    },
    [&](const record& xs) -> caf::error {
      caf::settings result;
      if (auto err = convert(xs, result)) {
        return err;
      }
      cv = std::move(result);
      return caf::none;
    },
  };
  return match(d, f);
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<data> {
  try {
    auto node = YAML::Load(std::string{str});
    return parse(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at {}:{}: {}",
                                       e.mark.line, e.mark.column, e.msg));
  } catch (const std::runtime_error& e) {
    return caf::make_error(ec::parse_error, e.what());
  }
}

auto convert(const record& xs, caf::settings& ys) -> caf::error {
  for (const auto& [k, v] : xs) {
    if (is<caf::none_t>(v)) {
      continue;
    }
    caf::config_value x;
    if (auto err = convert(v, x)) {
      return err;
    }
    ys[k] = std::move(x);
  }
  return caf::none;
}

auto convert(const caf::config_value& x, data& y) -> bool {
  auto f = detail::overload{
    [&](const auto& value) -> bool {
      y = caf::deep_to_string(value);
      return true;
    },
    [&](caf::none_t) -> bool {
      y = data{};
      return true;
    },
    [&](bool value) -> bool {
      y = value;
      return true;
    },
    [&](caf::config_value::integer value) -> bool {
      y = int64_t{value};
      return true;
    },
    [&](caf::config_value::real value) -> bool {
      y = value;
      return true;
    },
    [&](const std::string& value) -> bool {
      y = value;
      return true;
    },
    [&](const caf::config_value::list& xs) -> bool {
      list result;
      result.reserve(xs.size());
      for (const auto& x : xs) {
        data element;
        if (!convert(x, element)) {
          return false;
        }
        result.push_back(std::move(element));
      }
      y = std::move(result);
      return true;
    },
    [&](const caf::config_value::dictionary& xs) -> bool {
      record result;
      for (const auto& [k, v] : xs) {
        data element;
        if (!convert(v, element)) {
          return false;
        }
        result.emplace(k, std::move(element));
      }
      y = std::move(result);
      return true;
    },
  };
  return caf::visit(f, x.get_data());
}

} // namespace recon

auto fmt::formatter<recon::data>::format(const recon::data& x,
                                         fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  using namespace recon;
  auto out = ctx.out();
  return match(
    x,
    [&](caf::none_t) {
      return fmt::format_to(out, "null");
    },
    [&](bool y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](int64_t y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](double y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](const recon::time& y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](const std::string& y) {
      return fmt::format_to(out, "\"{}\"", y);
    },
    [&](const pattern& y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](const ip& y) {
      return fmt::format_to(out, "{}", y);
    },
    [&](const blob& y) {
      return fmt::format_to(out, "b64\"{}\"", detail::base64::encode(y));
    },
    [&](const list& xs) {
      out = fmt::format_to(out, "[");
      for (auto i = size_t{0}; i < xs.size(); ++i) {
        if (i != 0) {
          out = fmt::format_to(out, ", ");
        }
        out = fmt::format_to(out, "{}", xs[i]);
      }
      return fmt::format_to(out, "]");
    },
    [&](const record& xs) {
      out = fmt::format_to(out, "{{");
      auto first = true;
      for (const auto& [k, v] : xs) {
        if (!first) {
          out = fmt::format_to(out, ", ");
        }
        out = fmt::format_to(out, "{}: {}", k, v);
        first = false;
      }
      return fmt::format_to(out, "}}");
    });
}

namespace std {

auto hash<recon::data>::operator()(const recon::data& x) const -> size_t {
  using namespace recon;
  auto combine = [](size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
  };
  if (auto number = to_number(x)) {
    return std::hash<double>{}(*number);
  }
  auto seed = x.get_data().index();
  return match(
    x,
    [&](caf::none_t) -> size_t {
      return seed;
    },
    [&](int64_t) -> size_t {
      RECON_UNREACHABLE();
    },
    [&](double) -> size_t {
      RECON_UNREACHABLE();
    },
    [&](const recon::time& y) -> size_t {
      return combine(seed, std::hash<int64_t>{}(y.time_since_epoch().count()));
    },
    [&](const pattern& y) -> size_t {
      return combine(seed, std::hash<std::string>{}(y.string()));
    },
    [&](const blob& y) -> size_t {
      auto str = std::string_view{reinterpret_cast<const char*>(y.data()),
                                  y.size()};
      return combine(seed, std::hash<std::string_view>{}(str));
    },
    [&](const list& xs) -> size_t {
      auto result = seed;
      for (const auto& element : xs) {
        result = combine(result, (*this)(element));
      }
      return result;
    },
    [&](const record& xs) -> size_t {
      // Records compare independent of field order, so must their hashes.
      auto result = size_t{0};
      for (const auto& [k, v] : xs) {
        result += combine(std::hash<std::string>{}(k), (*this)(v));
      }
      return combine(seed, result);
    },
    [&](const auto& y) -> size_t {
      return combine(seed, std::hash<std::decay_t<decltype(y)>>{}(y));
    });
}

} // namespace std
