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

#include <caf/expected.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// A page of reduced host records, together with the number of items the
/// underlying query covered.
struct host_page {
  std::vector<record> hosts;
  size_t count = 0;
};

/// A database of host records, i.e., the results of active scans.
///
/// Host records are stored in internal form: addresses as `ip`, timestamps as
/// epoch seconds. Every host carries a textual `_id`.
class active_database : public database {
public:
  active_database(std::shared_ptr<backend> store, std::string name);

  /// Stores a host record.
  /// @returns the `_id` of the stored host, generated unless the host has
  ///          one, or the codec error for a malformed field.
  auto store_host(record host) -> caf::expected<std::string>;

  using database::remove;

  /// Removes the host with the given `_id`.
  virtual auto remove(std::string_view id) -> caf::expected<size_t>;

  /// Removes a host as returned by `get`.
  auto remove(const record& host) -> caf::expected<size_t>;

  /// Ranks the values of a field or pseudo-field among the matching hosts.
  /// @param field A field path or a registered pseudo-field.
  /// @param filter Restricts the hosts that contribute.
  /// @param top_n The maximum number of values; the configured default if
  ///        unset.
  /// @param opts Ordering and paging of the contributing hosts.
  auto top_values(std::string_view field, const expression& filter = {},
                  std::optional<size_t> top_n = {},
                  const query_options& opts = {})
    -> caf::expected<std::vector<value_count>>;

  /// Counts the hosts per coordinates.
  auto get_locations(const expression& filter)
    -> caf::expected<std::vector<value_count>>;

  /// Returns the addresses of the matching hosts.
  auto get_ips(const expression& filter, std::optional<size_t> limit = {},
               std::optional<size_t> skip = {}) -> caf::expected<host_page>;

  /// Returns the addresses and port states of the matching hosts; the count
  /// is the total number of ports.
  auto get_ips_ports(const expression& filter,
                     std::optional<size_t> limit = {},
                     std::optional<size_t> skip = {})
    -> caf::expected<host_page>;

  /// Returns the addresses and open port counts of the matching hosts.
  auto get_open_port_count(const expression& filter,
                           std::optional<size_t> limit = {},
                           std::optional<size_t> skip = {})
    -> caf::expected<host_page>;

  /// Returns the unique port tuples of the matching hosts, ignoring the host
  /// pseudo-port. A tuple holds the port and, in that order and as requested,
  /// the service name, product and version.
  /// @param yield_all Keeps first-seen order instead of sorting.
  auto features_port_list(const expression& filter, bool yield_all,
                          bool use_service, bool use_product,
                          bool use_version) -> caf::expected<list>;

  /// @returns the scan identifiers of a host.
  static auto get_scan_ids(const record& host) -> list;

  // -- host filters ----------------------------------------------------------

  // The filters take string-valued arguments as `data`: a pattern searches,
  // anything else compares literally.

  static auto search_domain(const data& name, bool neg = false) -> expression;

  static auto search_hostname(const data& name, bool neg = false)
    -> expression;

  static auto search_category(const data& cat, bool neg = false) -> expression;

  /// Filters one country code or a list of them, expanding aliases.
  static auto search_country(const data& country, bool neg = false)
    -> expression;

  static auto search_city(const data& city, bool neg = false) -> expression;

  static auto search_has_location(bool neg = false) -> expression;

  /// Filters one AS number or a list of them, given as numbers or strings.
  static auto search_asnum(const data& asnum, bool neg = false)
    -> caf::expected<expression>;

  static auto search_asname(const data& asname, bool neg = false)
    -> expression;

  static auto search_source(const data& src, bool neg = false) -> expression;

  /// Filters hosts with a port in a state. The port `"host"` stands for the
  /// host-level pseudo-port.
  ///
  /// The negation matches hosts where the port is in another state, or where
  /// no such port exists.
  static auto search_port(const data& port, std::string_view protocol = "tcp",
                          std::string_view state = "open", bool neg = false)
    -> expression;

  /// Filters hosts with a port in a state other than the listed ones.
  static auto search_ports_other(const list& ports,
                                 std::string_view protocol = "tcp",
                                 std::string_view state = "open")
    -> expression;

  /// Filters hosts with all the ports, or, negated, with none of them.
  static auto search_ports(const list& ports, std::string_view protocol = "tcp",
                           std::string_view state = "open", bool neg = false)
    -> expression;

  /// Filters hosts by the number of open ports.
  /// @returns `ec::invalid_argument` if neither bound is set.
  static auto search_count_open_ports(std::optional<int64_t> min,
                                      std::optional<int64_t> max,
                                      bool neg = false)
    -> caf::expected<expression>;

  static auto search_open_port(bool neg = false) -> expression;

  static auto search_service(const data& srv,
                             std::optional<int64_t> port = {},
                             std::optional<std::string> protocol = {})
    -> expression;

  static auto search_product(const data& product,
                             std::optional<data> version = {},
                             std::optional<data> service = {},
                             std::optional<int64_t> port = {},
                             std::optional<std::string> protocol = {})
    -> expression;

  /// Filters hosts by script results.
  /// @param name The script ID.
  /// @param output The script output.
  /// @param values Either a record of subfield values, or a value of the
  ///        structured output as a whole. Requires a string *name*.
  /// @returns the filter, or `ec::invalid_argument` if *values* comes without
  ///          a string *name*.
  static auto search_script(std::optional<data> name = {},
                            std::optional<data> output = {},
                            std::optional<data> values = {}, bool neg = false)
    -> caf::expected<expression>;

  static auto search_svc_hostname(const data& hostname) -> expression;

  static auto search_webmin() -> expression;

  static auto search_x11() -> expression;

  /// Filters hosts sharing a file, as reported by `ls`-like scripts.
  static auto search_file(std::optional<data> fname = {},
                          std::optional<std::vector<std::string>> scripts = {})
    -> expression;

  static auto search_http_title(const data& title) -> expression;

  static auto search_os(const data& txt) -> expression;

  static auto search_vsftpd_backdoor() -> expression;

  static auto search_vuln_intersil() -> expression;

  /// Filters by device type: a literal, a pattern or a list of literals.
  static auto search_device_type(const data& devtype) -> expression;

  static auto search_net_dev() -> expression;

  static auto search_phone_dev() -> expression;

  static auto search_ldap_anon() -> expression;

  static auto search_vuln(std::optional<data> vulnid = {},
                          std::optional<data> status = {}) -> expression;

  /// Filters hosts whose scan ended less than *delta* ago.
  static auto search_time_ago(duration delta, bool neg = false) -> expression;

  /// Filters hosts whose scan overlaps a time range.
  static auto search_time_range(const data& start, const data& stop,
                                bool neg = false) -> caf::expected<expression>;

  static auto search_hop(const data& hop, std::optional<int64_t> ttl = {},
                         bool neg = false) -> expression;

  static auto search_hop_domain(const data& hop, bool neg = false)
    -> expression;

  static auto search_hop_name(const data& hop, bool neg = false) -> expression;

  /// Filters hosts by CPE parts; without any part, hosts with a CPE.
  static auto search_cpe(std::optional<data> type = {},
                         std::optional<data> vendor = {},
                         std::optional<data> product = {},
                         std::optional<data> version = {}) -> expression;

  static auto search_ssh_key(std::optional<data> fingerprint = {},
                             std::optional<data> key = {},
                             std::optional<std::string> keytype = {},
                             std::optional<int64_t> bits = {})
    -> caf::expected<expression>;

  static auto search_ja3_client(std::optional<data> value_or_hash = {})
    -> caf::expected<expression>;

  static auto search_ja3_server(std::optional<data> value_or_hash = {},
                                std::optional<data> client_value_or_hash = {})
    -> caf::expected<expression>;

  static auto search_user_agent(std::optional<data> useragent = {},
                                bool neg = false) -> caf::expected<expression>;

  static auto search_cert(std::optional<std::string> keytype = {})
    -> caf::expected<expression>;

protected:
  auto from_internal(document doc) const -> caf::expected<record> override;
};

/// The host database of a scanner. Hosts reference the scan documents they
/// come from; removing the last host of a scan removes the scan document.
class nmap_database final : public active_database {
public:
  explicit nmap_database(std::shared_ptr<backend> store);

  /// Removes all hosts and scan documents.
  auto init() -> caf::error override;

  using active_database::remove;

  auto remove(std::string_view id) -> caf::expected<size_t> override;

  auto store_or_merge_host(record host) -> caf::expected<std::string>;

  /// Stores a scan document.
  /// @returns the `_id` of the scan, or `ec::duplicate_entry` if a scan with
  ///          the same `_id` exists; the existing scan is left untouched.
  auto store_scan_doc(record scan) -> caf::expected<std::string>;

  /// @returns the scan document, or `std::nullopt` if none has this `_id`.
  auto get_scan(std::string_view id) -> caf::expected<std::optional<record>>;

  auto is_scan_present(std::string_view id) -> caf::expected<bool>;

  /// Releases the handles of both collections.
  void invalidate_cache() override;

private:
  auto scans() -> caf::expected<std::shared_ptr<collection>>;

  std::shared_ptr<collection> scans_;
};

/// The host database that aggregates hosts from several sources. Storing a
/// host with a known address merges it into the known one.
class view_database final : public active_database {
public:
  /// Combines an existing host record with an incoming one.
  using merger = std::function<caf::expected<record>(const record& existing,
                                                     const record& incoming)>;

  explicit view_database(std::shared_ptr<backend> store);

  /// Stores a host, or merges it into the host with the same address.
  /// @returns the `_id` of the stored host.
  auto store_or_merge_host(record host, const merger& merge)
    -> caf::expected<std::string>;
};

} // namespace recon
