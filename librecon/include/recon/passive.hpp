//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/database.hpp"
#include "recon/time.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// A database of passive observations. Every record is one observed event;
/// identical events fold into one record that counts them and tracks when
/// they were first and last seen.
class passive_database final : public database {
public:
  /// Computes additional information for a record about to be created. The
  /// result is merged into the record.
  using info_resolver = std::function<record(const record&)>;

  explicit passive_database(std::shared_ptr<backend> store);

  /// @returns the first matching record, or `std::nullopt`.
  auto get_one(const expression& filter, const query_options& opts = {})
    -> caf::expected<std::optional<record>>;

  /// Stores a record as is, i.e., without folding it into an existing one.
  auto insert(record rec, const info_resolver& resolve = {})
    -> caf::expected<document_id>;

  /// Folds an observation into the record with the same key, or creates it.
  /// The key consists of all fields except `infos` and `count`.
  /// @param timestamp The time of the observation.
  /// @param rec The observation. Its `count` defaults to 1.
  /// @param resolve Runs only when the record is created.
  /// @param lastseen Overrides the last-seen time of the observation.
  auto insert_or_update(const data& timestamp, record rec,
                        const info_resolver& resolve = {},
                        std::optional<data> lastseen = {}) -> caf::error;

  /// Ranks the values of a field among the matching records.
  /// @param distinct Counts events if `true`, or sums their `count` field.
  auto top_values(std::string_view field, const expression& filter = {},
                  bool distinct = true, std::optional<size_t> top_n = {},
                  const query_options& opts = {})
    -> caf::expected<std::vector<value_count>>;

  /// Returns the unique port tuples of the matching records, see
  /// `active_database::features_port_list`.
  auto features_port_list(const expression& filter, bool yield_all,
                          bool use_service, bool use_product,
                          bool use_version) -> caf::expected<list>;

  // -- passive filters -------------------------------------------------------

  static auto search_recontype(const data& rectype) -> expression;

  static auto search_sensor(const data& sensor, bool neg = false)
    -> expression;

  /// @returns `ec::invalid_argument` unless *protocol* is `tcp` and *state*
  ///          is `open`; passive sensors only see open TCP ports.
  static auto search_port(int64_t port, std::string_view protocol = "tcp",
                          std::string_view state = "open", bool neg = false)
    -> caf::expected<expression>;

  static auto search_service(const data& srv,
                             std::optional<int64_t> port = {},
                             std::optional<std::string> protocol = {})
    -> caf::expected<expression>;

  static auto search_product(const data& product,
                             std::optional<data> version = {},
                             std::optional<data> service = {},
                             std::optional<int64_t> port = {},
                             std::optional<std::string> protocol = {})
    -> caf::expected<expression>;

  static auto search_svc_hostname(const data& hostname) -> expression;

  static auto search_mac(std::optional<data> mac = {}, bool neg = false)
    -> expression;

  /// @returns `ec::invalid_argument` if *neg* is set.
  static auto search_user_agent(std::optional<data> useragent = {},
                                bool neg = false) -> caf::expected<expression>;

  /// Filters DNS answers.
  /// @param name A name, a pattern or a list of names.
  /// @param reverse Searches the target of the answer instead of the name.
  /// @param dnstype The record type, e.g., `A` or `PTR`.
  /// @param subdomains Searches the name and its parent domains.
  static auto search_dns(std::optional<data> name = {}, bool reverse = false,
                         std::optional<std::string> dnstype = {},
                         bool subdomains = false) -> expression;

  static auto search_cert(std::optional<std::string> keytype = {})
    -> expression;

  static auto search_ja3_client(std::optional<data> value_or_hash = {})
    -> caf::expected<expression>;

  static auto search_ja3_server(std::optional<data> value_or_hash = {},
                                std::optional<data> client_value_or_hash = {})
    -> caf::expected<expression>;

  static auto search_ssh_key(std::optional<std::string> keytype = {})
    -> expression;

  static auto search_cert_subject(const data& expr,
                                  std::optional<data> issuer = {})
    -> expression;

  static auto search_cert_issuer(const data& expr) -> expression;

  static auto search_basic_auth() -> expression;

  static auto search_http_auth() -> expression;

  static auto search_ftp_auth() -> expression;

  static auto search_pop_auth() -> expression;

  static auto search_tcp_srv_banner(const data& banner) -> expression;

  /// Filters records first seen (or, unless *new_*, last seen) less than
  /// *delta* ago.
  static auto search_time_ago(duration delta, bool neg = false,
                              bool new_ = true) -> expression;

  /// Filters records first seen (or, unless *new_*, last seen) after a time.
  static auto search_newer(const data& timestamp, bool neg = false,
                           bool new_ = true) -> caf::expected<expression>;

protected:
  auto from_internal(document doc) const -> caf::expected<record> override;
};

} // namespace recon
