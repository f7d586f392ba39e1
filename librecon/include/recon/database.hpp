//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/collection.hpp"
#include "recon/data.hpp"
#include "recon/defaults.hpp"
#include "recon/expression.hpp"
#include "recon/sort.hpp"
#include "recon/top_values.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// The shaping of a result set: which fields to return, in which order, and
/// which window of the ordered matches.
struct query_options {
  std::optional<std::vector<std::string>> fields = {};
  std::vector<sort_key> sort = {};
  std::optional<size_t> limit = {};
  std::optional<size_t> skip = {};
};

/// Tunables that a database reads from the configuration.
struct database_options {
  size_t top_n = defaults::top_values::top_n;
  int net_mask = defaults::top_values::net_mask;
};

/// The operations common to all record databases. A database owns a lazily
/// opened handle to one collection of its backend.
class database {
public:
  database(std::shared_ptr<backend> store, std::string name, const schema& s);

  virtual ~database() noexcept = default;

  database(const database&) = delete;
  database& operator=(const database&) = delete;

  [[nodiscard]] auto name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto layout() const -> const schema& {
    return *schema_;
  }

  [[nodiscard]] auto options() const -> const database_options& {
    return options_;
  }

  /// Reads `recon.top-values-default` and `recon.net-mask-default`.
  /// @returns `ec::invalid_configuration` for out-of-range values.
  auto configure(const caf::settings& cfg) -> caf::error;

  /// Releases the collection handle. The next access reopens it.
  virtual void invalidate_cache();

  /// Removes all records.
  virtual auto init() -> caf::error;

  /// Counts the records that match a filter.
  auto count(const expression& filter) -> caf::expected<size_t>;

  /// Retrieves matching records in external form.
  /// @param filter The filter that selects records.
  /// @param opts Projection, ordering and paging of the result.
  auto get(const expression& filter, const query_options& opts = {})
    -> caf::expected<std::vector<record>>;

  /// Retrieves the unique values of a field among the matching records, in
  /// the order they are first seen.
  auto distinct(std::string_view field, const expression& filter = {},
                query_options opts = {}) -> caf::expected<list>;

  /// Removes a record by the identifier its collection assigned.
  auto remove(document_id id) -> caf::expected<size_t>;

  /// Removes all matching records.
  auto remove(const expression& filter) -> caf::expected<size_t>;

  // -- generic filters -------------------------------------------------------

  /// A filter that no record matches.
  static auto search_nonexistent() -> expression;

  /// Filters records by their `_id`: a single identifier or a list of them.
  static auto search_object_id(const data& oid, bool neg = false)
    -> expression;

  /// Filters records by their schema version, or records that carry one.
  static auto search_version(std::optional<int64_t> version) -> expression;

  static auto search_host(std::string_view addr, bool neg = false)
    -> caf::expected<expression>;

  static auto search_hosts(std::span<const std::string> addrs,
                           bool neg = false) -> caf::expected<expression>;

  /// Filters addresses within a closed interval.
  static auto search_range(std::string_view start, std::string_view stop,
                           bool neg = false) -> caf::expected<expression>;

  /// Filters addresses within a CIDR prefix.
  static auto search_net(std::string_view net, bool neg = false)
    -> caf::expected<expression>;

  static auto search_ipv4() -> expression;

  static auto search_ipv6() -> expression;

  static auto search_val(std::string field, data value) -> expression;

  /// Compares a field with a value.
  /// @param op One of `<`, `<=`, `>`, `>=`.
  /// @returns the filter, or `ec::invalid_argument` for another operator.
  static auto search_cmp(std::string field, data value, std::string_view op)
    -> caf::expected<expression>;

  static auto flt_and(std::vector<expression> xs) -> expression;

  static auto flt_or(std::vector<expression> xs) -> expression;

  static auto flt2str(const expression& x) -> std::string;

protected:
  [[nodiscard]] auto store() const -> const std::shared_ptr<backend>& {
    return backend_;
  }

  /// Returns the collection, opening it on first access.
  auto handle() -> caf::expected<std::shared_ptr<collection>>;

  /// Retrieves matching documents in internal form, ordered, paged and
  /// projected.
  auto fetch(const expression& filter, const query_options& opts)
    -> caf::expected<std::vector<document>>;

  /// Converts a stored document into the form handed to callers.
  virtual auto from_internal(document doc) const -> caf::expected<record>;

  /// Counts the values that a pseudo-field emits over the matching records.
  /// @returns at most *top_n* values, highest count first and ties in the
  ///          order they are first seen.
  auto top_values_impl(const pseudo_field& field, const expression& filter,
                       size_t top_n, const query_options& opts)
    -> caf::expected<std::vector<value_count>>;

  /// Collects the unique port tuples of the matching records.
  /// @param extract Maps a record to the tuples it contributes.
  /// @param yield_all Keeps first-seen order instead of sorting.
  auto port_tuples(const expression& filter, std::vector<std::string> fields,
                   const std::function<void(const record&, list&)>& extract,
                   bool yield_all) -> caf::expected<list>;

private:
  std::shared_ptr<backend> backend_;
  std::string name_;
  const schema* schema_;
  std::shared_ptr<collection> handle_;
  database_options options_;
};

} // namespace recon
