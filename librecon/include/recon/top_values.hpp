//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/data.hpp"
#include "recon/defaults.hpp"
#include "recon/expression.hpp"
#include "recon/field_values.hpp"
#include "recon/generator.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// A ranked value together with the number of times it occurred.
struct value_count {
  data value;
  int64_t count = 0;

  friend auto operator==(const value_count&, const value_count&) -> bool
    = default;
};

/// An aggregation dimension: which records contribute, which values each
/// record emits, and how a counted value is presented.
struct pseudo_field {
  /// The fields that the extractor reads; empty means the whole record.
  std::vector<std::string> fields;

  /// Conjoined with the caller's filter before any record is fetched.
  expression filter;

  /// Emits the values of one record in external form. Composite values are
  /// lists.
  std::function<generator<weighted_value>(const record&)> extractor;

  /// Post-processes a counted value; identity when unset.
  std::function<data(data)> output;
};

/// The parameters that shape how a pseudo-field is built.
struct pseudo_field_context {
  /// The layout of the records the extractor walks.
  const schema* layout = nullptr;

  /// If set, each value weighs the number stored in this field instead of 1.
  std::optional<std::string> count_field = {};

  /// The prefix length of `net` without an explicit mask.
  int net_mask = defaults::top_values::net_mask;
};

/// A table that maps pseudo-field names to their definitions. The first entry
/// whose matcher accepts a name wins; names that no entry accepts resolve to
/// the field at that path.
class pseudo_field_registry {
public:
  using matcher = std::function<bool(std::string_view)>;

  using factory = std::function<caf::expected<pseudo_field>(
    std::string_view, const pseudo_field_context&)>;

  struct entry {
    std::string name;
    matcher matches;
    factory make;
  };

  /// Registers a pseudo-field.
  /// @param name A human-readable name of the family, e.g., `port:<state>`.
  /// @param matches Decides whether a requested name belongs to the family.
  /// @param make Builds the pseudo-field from the requested name.
  void add(std::string name, matcher matches, factory make);

  /// Resolves a requested name.
  /// @returns the pseudo-field, or `ec::invalid_argument` if an embedded
  ///          parameter is malformed.
  [[nodiscard]] auto resolve(std::string_view name,
                             const pseudo_field_context& ctx) const
    -> caf::expected<pseudo_field>;

  /// @returns the entry that accepts *name*, or `nullptr`.
  [[nodiscard]] auto find(std::string_view name) const -> const entry*;

  [[nodiscard]] auto entries() const -> const std::vector<entry>& {
    return entries_;
  }

  /// The pseudo-fields of host records.
  static auto hosts() -> const pseudo_field_registry&;

  /// The pseudo-fields of passive records.
  static auto passive() -> const pseudo_field_registry&;

private:
  std::vector<entry> entries_;
};

/// The fallback pseudo-field: all values at a path, for records where the
/// path exists.
auto direct_field(std::string field, const pseudo_field_context& ctx)
  -> pseudo_field;

/// Matches exactly one name.
auto exactly(std::string_view name) -> pseudo_field_registry::matcher;

/// Matches names that start with a prefix.
auto prefixed(std::string_view prefix) -> pseudo_field_registry::matcher;

/// Matches a bare name and the name followed by one of the given separators,
/// e.g., `net` and `net:16`.
auto parameterized(std::string_view name, std::string_view separators)
  -> pseudo_field_registry::matcher;

} // namespace recon

template <>
struct fmt::formatter<recon::value_count> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const recon::value_count& x, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}: {}", x.value, x.count);
  }
};
