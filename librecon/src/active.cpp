//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/active.hpp"

#include "recon/codec.hpp"
#include "recon/defaults.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/logger.hpp"
#include "recon/query_value.hpp"
#include "recon/schema.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <tsl/robin_map.h>

#include <chrono>

namespace recon {

namespace {

auto eq(std::string field, data value) -> expression {
  return predicate{std::move(field), relational_operator::equal,
                   std::move(value)};
}

auto ne(std::string field, data value) -> expression {
  return predicate{std::move(field), relational_operator::not_equal,
                   std::move(value)};
}

auto one_of(std::string field, list values) -> expression {
  return predicate{std::move(field), relational_operator::in,
                   std::move(values)};
}

auto maybe_negate(expression x, bool neg) -> expression {
  return neg ? negate(std::move(x)) : x;
}

/// Filters hosts with a port that satisfies *inner*.
auto any_port(expression inner) -> expression {
  return any("ports", std::move(inner));
}

/// Filters hosts with a script result that satisfies *inner*.
auto any_script(expression inner) -> expression {
  return any_port(any("scripts", std::move(inner)));
}

auto string_list(std::initializer_list<std::string_view> xs) -> list {
  auto result = list{};
  result.reserve(xs.size());
  for (auto x : xs) {
    result.emplace_back(std::string{x});
  }
  return result;
}

auto to_asnum(const data& x) -> caf::expected<int64_t> {
  if (auto n = to_integer(x)) {
    return *n;
  }
  if (const auto* str = try_as<std::string>(&x)) {
    auto trimmed = std::string_view{*str};
    if (trimmed.starts_with("AS") || trimmed.starts_with("as")) {
      trimmed.remove_prefix(2);
    }
    if (auto n = detail::to_int(trimmed)) {
      return *n;
    }
  }
  return caf::make_error(ec::invalid_argument,
                         fmt::format("invalid AS number: {}", x));
}

} // namespace

// -- active_database ----------------------------------------------------------

active_database::active_database(std::shared_ptr<backend> store,
                                 std::string name)
  : database{std::move(store), std::move(name), schema::hosts()} {
  // nop
}

auto active_database::from_internal(document doc) const
  -> caf::expected<record> {
  return host_from_internal(std::move(doc.content));
}

auto active_database::store_host(record host) -> caf::expected<std::string> {
  auto internal = host_to_internal(std::move(host));
  if (!internal) {
    return add_context(internal.error(), "failed to store host in {}",
                       name());
  }
  auto id = std::string{};
  auto existing = internal->find(defaults::db::id_field);
  if (existing != internal->end() && is<std::string>(existing->second)) {
    id = as<std::string>(existing->second);
  } else {
    auto generator = boost::uuids::random_generator{};
    id = boost::uuids::to_string(generator());
    internal->insert_or_assign(std::string{defaults::db::id_field}, id);
  }
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  if (auto inserted = (*coll)->insert(std::move(*internal)); !inserted) {
    return inserted.error();
  }
  RECON_DEBUG("stored host {} in {}", id, name());
  return id;
}

auto active_database::remove(std::string_view id) -> caf::expected<size_t> {
  return database::remove(
    eq(std::string{defaults::db::id_field}, std::string{id}));
}

auto active_database::remove(const record& host) -> caf::expected<size_t> {
  const auto* id = try_as<std::string>(descend(host, defaults::db::id_field));
  if (!id) {
    return caf::make_error(ec::invalid_argument,
                           "cannot remove a host without _id");
  }
  return remove(std::string_view{*id});
}

auto active_database::top_values(std::string_view field,
                                 const expression& filter,
                                 std::optional<size_t> top_n,
                                 const query_options& opts)
  -> caf::expected<std::vector<value_count>> {
  auto ctx = pseudo_field_context{};
  ctx.layout = &layout();
  ctx.net_mask = options().net_mask;
  auto resolved = pseudo_field_registry::hosts().resolve(field, ctx);
  if (!resolved) {
    return add_context(resolved.error(), "failed to resolve '{}'", field);
  }
  RECON_VERBOSE("{} ranks '{}' with filter {}", name(), field,
                resolved->filter);
  return top_values_impl(*resolved, filter, top_n.value_or(options().top_n),
                         opts);
}

auto active_database::get_locations(const expression& filter)
  -> caf::expected<std::vector<value_count>> {
  auto opts = query_options{};
  opts.fields = std::vector<std::string>{"infos.coordinates"};
  auto hosts = get(conjoin({filter, exists("infos.coordinates")}), opts);
  if (!hosts) {
    return hosts.error();
  }
  auto index = tsl::robin_map<data, size_t>{};
  auto result = std::vector<value_count>{};
  for (const auto& host : *hosts) {
    const auto* coordinates = descend(host, "infos.coordinates");
    if (!coordinates || is<caf::none_t>(*coordinates)) {
      continue;
    }
    if (const auto* xs = try_as<list>(coordinates); xs && xs->empty()) {
      continue;
    }
    auto [it, inserted] = index.try_emplace(*coordinates, result.size());
    if (inserted) {
      result.push_back(value_count{*coordinates, 1});
    } else {
      ++result[it->second].count;
    }
  }
  return result;
}

namespace {

auto page_options(std::optional<size_t> limit, std::optional<size_t> skip)
  -> query_options {
  auto opts = query_options{};
  opts.limit = limit;
  opts.skip = skip;
  return opts;
}

} // namespace

auto active_database::get_ips(const expression& filter,
                              std::optional<size_t> limit,
                              std::optional<size_t> skip)
  -> caf::expected<host_page> {
  auto hosts = get(filter, page_options(limit, skip));
  if (!hosts) {
    return hosts.error();
  }
  auto result = host_page{};
  result.count = hosts->size();
  for (const auto& host : *hosts) {
    result.hosts.push_back(record{{"addr", get_or_null(host, "addr")}});
  }
  return result;
}

auto active_database::get_ips_ports(const expression& filter,
                                    std::optional<size_t> limit,
                                    std::optional<size_t> skip)
  -> caf::expected<host_page> {
  auto hosts = get(filter, page_options(limit, skip));
  if (!hosts) {
    return hosts.error();
  }
  auto result = host_page{};
  for (const auto& host : *hosts) {
    const auto* ports = try_as<list>(descend(host, "ports"));
    if (!ports || ports->empty()) {
      continue;
    }
    result.count += ports->size();
    auto states = list{};
    for (const auto& x : *ports) {
      const auto* port = try_as<record>(&x);
      if (!port || !port->contains("state_state")) {
        continue;
      }
      states.emplace_back(record{
        {"state_state", get_or_null(*port, "state_state")},
        {"port", get_or_null(*port, "port")},
      });
    }
    result.hosts.push_back(record{
      {"addr", get_or_null(host, "addr")},
      {"ports", std::move(states)},
    });
  }
  return result;
}

auto active_database::get_open_port_count(const expression& filter,
                                          std::optional<size_t> limit,
                                          std::optional<size_t> skip)
  -> caf::expected<host_page> {
  auto hosts = get(filter, page_options(limit, skip));
  if (!hosts) {
    return hosts.error();
  }
  auto result = host_page{};
  result.count = hosts->size();
  for (const auto& host : *hosts) {
    auto count = get_or_null(host, "openports.count");
    if (is<caf::none_t>(count)) {
      continue;
    }
    result.hosts.push_back(record{
      {"addr", get_or_null(host, "addr")},
      {"starttime", get_or_null(host, "starttime")},
      {"openports", record{{"count", std::move(count)}}},
    });
  }
  return result;
}

auto active_database::features_port_list(const expression& filter,
                                         bool yield_all, bool use_service,
                                         bool use_product, bool use_version)
  -> caf::expected<list> {
  auto fields = std::vector<std::string>{"ports.port"};
  if (use_service) {
    fields.emplace_back("ports.service_name");
    if (use_product) {
      fields.emplace_back("ports.service_product");
      if (use_version) {
        fields.emplace_back("ports.service_version");
      }
    }
  }
  auto extract = [&](const record& host, list& out) {
    const auto* ports = try_as<list>(descend(host, "ports"));
    if (!ports) {
      return;
    }
    for (const auto& x : *ports) {
      const auto* port = try_as<record>(&x);
      if (!port) {
        continue;
      }
      auto number = get_or_null(*port, "port");
      if (number == data{int64_t{-1}}) {
        continue;
      }
      auto tuple = list{std::move(number)};
      if (use_service) {
        tuple.push_back(get_or_null(*port, "service_name"));
        if (use_product) {
          tuple.push_back(get_or_null(*port, "service_product"));
          if (use_version) {
            tuple.push_back(get_or_null(*port, "service_version"));
          }
        }
      }
      out.emplace_back(std::move(tuple));
    }
  };
  return port_tuples(conjoin({filter, exists("ports.port")}),
                     std::move(fields), extract, yield_all);
}

auto active_database::get_scan_ids(const record& host) -> list {
  if (const auto* xs = try_as<list>(descend(host, "scanid"))) {
    return *xs;
  }
  return {};
}

// -- host filters -------------------------------------------------------------

auto active_database::search_domain(const data& name, bool neg) -> expression {
  return maybe_negate(any("hostnames", search_string_in_array("domains", name)),
                      neg);
}

auto active_database::search_hostname(const data& name, bool neg)
  -> expression {
  return maybe_negate(any("hostnames", search_string("name", name)), neg);
}

auto active_database::search_category(const data& cat, bool neg)
  -> expression {
  return search_string_in_array("categories", cat, neg);
}

auto active_database::search_country(const data& country, bool neg)
  -> expression {
  auto code = country_unalias(country);
  if (auto* xs = try_as<list>(&code)) {
    return maybe_negate(one_of("infos.country_code", std::move(*xs)), neg);
  }
  return neg ? ne("infos.country_code", std::move(code))
             : eq("infos.country_code", std::move(code));
}

auto active_database::search_city(const data& city, bool neg) -> expression {
  return search_string("infos.city", city, neg);
}

auto active_database::search_has_location(bool neg) -> expression {
  return maybe_negate(exists("infos.coordinates"), neg);
}

auto active_database::search_asnum(const data& asnum, bool neg)
  -> caf::expected<expression> {
  if (const auto* xs = try_as<list>(&asnum)) {
    auto numbers = list{};
    numbers.reserve(xs->size());
    for (const auto& x : *xs) {
      auto n = to_asnum(x);
      if (!n) {
        return n.error();
      }
      numbers.emplace_back(*n);
    }
    return maybe_negate(one_of("infos.as_num", std::move(numbers)), neg);
  }
  auto n = to_asnum(asnum);
  if (!n) {
    return n.error();
  }
  return neg ? ne("infos.as_num", *n) : eq("infos.as_num", *n);
}

auto active_database::search_asname(const data& asname, bool neg)
  -> expression {
  return search_string("infos.as_name", asname, neg);
}

auto active_database::search_source(const data& src, bool neg) -> expression {
  return search_string("source", src, neg);
}

auto active_database::search_port(const data& port, std::string_view protocol,
                                  std::string_view state, bool neg)
  -> expression {
  if (port == data{std::string{"host"}}) {
    if (neg) {
      return any_port(predicate{"port", relational_operator::greater,
                                int64_t{0}});
    }
    return any_port(eq("port", int64_t{-1}));
  }
  auto same_port = conjoin({
    eq("port", port),
    eq("protocol", std::string{protocol}),
  });
  if (neg) {
    return disjoin({
      any_port(conjoin({same_port, ne("state_state", std::string{state})})),
      all("ports", negate(same_port)),
    });
  }
  return any_port(
    conjoin({std::move(same_port), eq("state_state", std::string{state})}));
}

auto active_database::search_ports_other(const list& ports,
                                         std::string_view protocol,
                                         std::string_view state)
  -> expression {
  return any_port(conjoin({
    eq("protocol", std::string{protocol}),
    eq("state_state", std::string{state}),
    predicate{"port", relational_operator::not_in, ports},
  }));
}

auto active_database::search_ports(const list& ports,
                                   std::string_view protocol,
                                   std::string_view state, bool neg)
  -> expression {
  auto xs = std::vector<expression>{};
  xs.reserve(ports.size());
  for (const auto& port : ports) {
    xs.push_back(search_port(port, protocol, state));
  }
  if (neg) {
    return negate(disjoin(std::move(xs)));
  }
  return conjoin(std::move(xs));
}

auto active_database::search_count_open_ports(std::optional<int64_t> min,
                                              std::optional<int64_t> max,
                                              bool neg)
  -> caf::expected<expression> {
  if (!min && !max) {
    return caf::make_error(ec::invalid_argument,
                           "counting open ports requires a lower or an upper "
                           "bound");
  }
  constexpr auto field = "openports.count";
  if (min == max) {
    return neg ? ne(field, *min) : eq(field, *min);
  }
  auto xs = std::vector<expression>{};
  if (min) {
    xs.emplace_back(predicate{field,
                              neg ? relational_operator::less
                                  : relational_operator::greater_equal,
                              *min});
  }
  if (max) {
    xs.emplace_back(predicate{field,
                              neg ? relational_operator::greater
                                  : relational_operator::less_equal,
                              *max});
  }
  return neg ? disjoin(std::move(xs)) : conjoin(std::move(xs));
}

auto active_database::search_open_port(bool neg) -> expression {
  return maybe_negate(any_port(eq("state_state", std::string{"open"})), neg);
}

auto active_database::search_service(const data& srv,
                                     std::optional<int64_t> port,
                                     std::optional<std::string> protocol)
  -> expression {
  auto xs = std::vector<expression>{search_string("service_name", srv)};
  if (port) {
    xs.push_back(eq("port", *port));
  }
  if (protocol) {
    xs.push_back(eq("protocol", std::move(*protocol)));
  }
  return any_port(conjoin(std::move(xs)));
}

auto active_database::search_product(const data& product,
                                     std::optional<data> version,
                                     std::optional<data> service,
                                     std::optional<int64_t> port,
                                     std::optional<std::string> protocol)
  -> expression {
  auto xs = std::vector<expression>{search_string("service_product", product)};
  if (version) {
    xs.push_back(search_string("service_version", *version));
  }
  if (service) {
    xs.push_back(search_string("service_name", *service));
  }
  if (port) {
    xs.push_back(eq("port", *port));
  }
  if (protocol) {
    xs.push_back(eq("protocol", std::move(*protocol)));
  }
  return any_port(conjoin(std::move(xs)));
}

auto active_database::search_script(std::optional<data> name,
                                    std::optional<data> output,
                                    std::optional<data> values, bool neg)
  -> caf::expected<expression> {
  auto xs = std::vector<expression>{};
  if (name) {
    xs.push_back(search_string("id", *name));
  }
  if (output) {
    xs.push_back(search_string("output", *output));
  }
  if (values) {
    const auto* script = name ? try_as<std::string>(&*name) : nullptr;
    if (!script) {
      return caf::make_error(ec::invalid_argument,
                             "searching script values requires a script "
                             "name");
    }
    const auto& layout = schema::hosts();
    auto key = std::string{script_alias(*script)};
    auto key_path = join_path("ports.scripts", key);
    auto key_is_list = layout.is_list(key_path);
    if (const auto* fields = try_as<record>(&*values)) {
      for (const auto& [field, value] : *fields) {
        auto value_is_list = layout.is_list(join_path(key_path, field));
        // Inside a list of structured outputs, subfields are relative to
        // each element.
        auto path = key_is_list ? field : join_path(key, field);
        auto test = value_is_list ? search_string_in_array(path, value)
                                  : search_string(path, value);
        xs.push_back(key_is_list ? any(key, std::move(test))
                                 : std::move(test));
      }
    } else if (key_is_list) {
      xs.push_back(search_string_in_array(key, *values));
    } else {
      xs.push_back(search_string(key, *values));
    }
  }
  auto result = xs.empty() ? any_port(exists("scripts"))
                           : any_script(conjoin(std::move(xs)));
  return maybe_negate(std::move(result), neg);
}

auto active_database::search_svc_hostname(const data& hostname)
  -> expression {
  return any_port(search_string("service_hostname", hostname));
}

auto active_database::search_webmin() -> expression {
  return any_port(conjoin({
    eq("service_name", std::string{"http"}),
    eq("service_product", std::string{"MiniServ"}),
    ne("service_extrainfo", std::string{"Webmin httpd"}),
  }));
}

auto active_database::search_x11() -> expression {
  return any_port(conjoin({
    eq("service_name", std::string{"X11"}),
    ne("service_extrainfo", std::string{"access denied"}),
  }));
}

auto active_database::search_file(std::optional<data> fname,
                                  std::optional<std::vector<std::string>>
                                    scripts) -> expression {
  auto file = fname ? search_string("filename", *fname) : exists("filename");
  auto shared = any("ls.volumes", any("files", std::move(file)));
  if (!scripts) {
    return any_script(std::move(shared));
  }
  if (scripts->size() == 1) {
    return any_script(
      conjoin({eq("id", scripts->front()), std::move(shared)}));
  }
  auto ids = list{};
  for (auto& script : *scripts) {
    ids.emplace_back(std::move(script));
  }
  return any_script(conjoin({one_of("id", std::move(ids)), std::move(shared)}));
}

auto active_database::search_http_title(const data& title) -> expression {
  return any_script(conjoin({
    one_of("id", string_list({"http-title", "html-title"})),
    search_string("output", title),
  }));
}

auto active_database::search_os(const data& txt) -> expression {
  return any("os.osclass", disjoin({
                             search_string("vendor", txt),
                             search_string("osfamily", txt),
                             search_string("osclass", txt),
                           }));
}

auto active_database::search_vsftpd_backdoor() -> expression {
  return any_port(conjoin({
    eq("protocol", std::string{"tcp"}),
    eq("state_state", std::string{"open"}),
    eq("service_product", std::string{"vsftpd"}),
    eq("service_version", std::string{"2.3.4"}),
  }));
}

auto active_database::search_vuln_intersil() -> expression {
  // Boa HTTPd 0.93 and 0.94.0 through 0.94.11 allow resetting the password.
  auto versions = check(pattern::make("^0\\.9(3([^0-9]|$)|4\\.([0-9]|0[0-9]|"
                                      "1[0-1])([^0-9]|$))"));
  return any_port(conjoin({
    eq("protocol", std::string{"tcp"}),
    eq("state_state", std::string{"open"}),
    eq("service_product", std::string{"Boa HTTPd"}),
    predicate{"service_version", relational_operator::match,
              std::move(versions)},
  }));
}

auto active_database::search_device_type(const data& devtype) -> expression {
  if (const auto* xs = try_as<list>(&devtype)) {
    return any_port(one_of("service_devicetype", *xs));
  }
  return any_port(search_string("service_devicetype", devtype));
}

auto active_database::search_net_dev() -> expression {
  return search_device_type(string_list({
    "bridge",
    "broadband router",
    "firewall",
    "hub",
    "load balancer",
    "proxy server",
    "router",
    "switch",
    "WAP",
  }));
}

auto active_database::search_phone_dev() -> expression {
  return search_device_type(string_list({
    "PBX",
    "phone",
    "telecom-misc",
    "VoIP adapter",
    "VoIP phone",
  }));
}

auto active_database::search_ldap_anon() -> expression {
  return any_port(
    eq("service_extrainfo", std::string{"Anonymous bind OK"}));
}

auto active_database::search_vuln(std::optional<data> vulnid,
                                  std::optional<data> status) -> expression {
  auto xs = std::vector<expression>{};
  if (status) {
    xs.push_back(search_string("vulns.status", *status));
  }
  if (vulnid) {
    xs.push_back(search_string("vulns.id", *vulnid));
  }
  if (xs.empty()) {
    return any_script(exists("vulns.id"));
  }
  return any_script(conjoin(std::move(xs)));
}

auto active_database::search_time_ago(duration delta, bool neg)
  -> expression {
  auto now = std::chrono::time_point_cast<duration>(
    std::chrono::system_clock::now());
  auto threshold = to_epoch_seconds(now - delta);
  return predicate{"endtime",
                   neg ? relational_operator::less
                       : relational_operator::greater_equal,
                   threshold};
}

auto active_database::search_time_range(const data& start, const data& stop,
                                        bool neg)
  -> caf::expected<expression> {
  auto first = to_epoch(start);
  if (!first) {
    return first.error();
  }
  auto last = to_epoch(stop);
  if (!last) {
    return last.error();
  }
  if (neg) {
    return disjoin({
      predicate{"endtime", relational_operator::less, *first},
      predicate{"starttime", relational_operator::greater, *last},
    });
  }
  return conjoin({
    predicate{"endtime", relational_operator::greater_equal, *first},
    predicate{"starttime", relational_operator::less_equal, *last},
  });
}

auto active_database::search_hop(const data& hop, std::optional<int64_t> ttl,
                                 bool neg) -> expression {
  auto addr = hop;
  if (const auto* text = try_as<std::string>(&hop)) {
    if (auto x = ip_to_internal(*text)) {
      addr = *x;
    }
  }
  auto xs = std::vector<expression>{eq("ipaddr", std::move(addr))};
  if (ttl) {
    xs.push_back(eq("ttl", *ttl));
  }
  return maybe_negate(any("traces", any("hops", conjoin(std::move(xs)))), neg);
}

auto active_database::search_hop_domain(const data& hop, bool neg)
  -> expression {
  return maybe_negate(
    any("traces", any("hops", search_string_in_array("domains", hop))), neg);
}

auto active_database::search_hop_name(const data& hop, bool neg)
  -> expression {
  return maybe_negate(any("traces", any("hops", search_string("host", hop))),
                      neg);
}

auto active_database::search_cpe(std::optional<data> type,
                                 std::optional<data> vendor,
                                 std::optional<data> product,
                                 std::optional<data> version) -> expression {
  auto xs = std::vector<expression>{};
  auto add = [&](std::string_view field, const std::optional<data>& value) {
    if (value) {
      xs.push_back(search_string(std::string{field}, *value));
    }
  };
  add("type", type);
  add("vendor", vendor);
  add("product", product);
  add("version", version);
  if (xs.empty()) {
    return exists("cpes");
  }
  return any("cpes", conjoin(std::move(xs)));
}

auto active_database::search_ssh_key(std::optional<data> fingerprint,
                                     std::optional<data> key,
                                     std::optional<std::string> keytype,
                                     std::optional<int64_t> bits)
  -> caf::expected<expression> {
  auto values = record{};
  if (fingerprint) {
    if (const auto* str = try_as<std::string>(&*fingerprint)) {
      auto normalized = detail::to_lower(*str);
      std::erase(normalized, ':');
      values.emplace("fingerprint", std::move(normalized));
    } else {
      values.emplace("fingerprint", *fingerprint);
    }
  }
  if (key) {
    values.emplace("key", *key);
  }
  if (keytype) {
    values.emplace("type", "ssh-" + *keytype);
  }
  if (bits) {
    values.emplace("bits", *bits);
  }
  if (values.empty()) {
    return search_script(std::string{"ssh-hostkey"});
  }
  return search_script(std::string{"ssh-hostkey"}, std::nullopt,
                       std::move(values));
}

auto active_database::search_ja3_client(std::optional<data> value_or_hash)
  -> caf::expected<expression> {
  if (!value_or_hash) {
    return search_script(std::string{"ssl-ja3-client"});
  }
  auto kv = ja3_key_value(*value_or_hash);
  if (!kv) {
    return kv.error();
  }
  return search_script(std::string{"ssl-ja3-client"}, std::nullopt,
                       record{{kv->first, kv->second}});
}

auto active_database::search_ja3_server(
  std::optional<data> value_or_hash, std::optional<data> client_value_or_hash)
  -> caf::expected<expression> {
  auto values = record{};
  if (value_or_hash) {
    auto kv = ja3_key_value(*value_or_hash);
    if (!kv) {
      return kv.error();
    }
    values.emplace(kv->first, kv->second);
  }
  if (client_value_or_hash) {
    auto kv = ja3_key_value(*client_value_or_hash);
    if (!kv) {
      return kv.error();
    }
    values.emplace(join_path("client", kv->first), kv->second);
  }
  if (values.empty()) {
    return search_script(std::string{"ssl-ja3-server"});
  }
  return search_script(std::string{"ssl-ja3-server"}, std::nullopt,
                       std::move(values));
}

auto active_database::search_user_agent(std::optional<data> useragent,
                                        bool neg)
  -> caf::expected<expression> {
  if (!useragent) {
    return search_script(std::string{"http-user-agent"}, std::nullopt,
                         std::nullopt, neg);
  }
  return search_script(std::string{"http-user-agent"}, std::nullopt,
                       *useragent, neg);
}

auto active_database::search_cert(std::optional<std::string> keytype)
  -> caf::expected<expression> {
  if (!keytype) {
    return search_script(std::string{"ssl-cert"});
  }
  return search_script(std::string{"ssl-cert"}, std::nullopt,
                       record{{"pubkey.type", std::move(*keytype)}});
}

// -- nmap_database ------------------------------------------------------------

namespace {

auto scan_layout() -> const schema& {
  static const auto result = schema{};
  return result;
}

} // namespace

nmap_database::nmap_database(std::shared_ptr<backend> store)
  : active_database{std::move(store),
                    std::string{defaults::db::nmap_collection}} {
  // nop
}

auto nmap_database::scans() -> caf::expected<std::shared_ptr<collection>> {
  if (!scans_) {
    auto opened = store()->open(defaults::db::scans_collection, scan_layout());
    if (!opened) {
      return add_context(opened.error(), "failed to open collection {}",
                         defaults::db::scans_collection);
    }
    scans_ = std::move(*opened);
  }
  return scans_;
}

void nmap_database::invalidate_cache() {
  active_database::invalidate_cache();
  scans_.reset();
}

auto nmap_database::init() -> caf::error {
  if (auto err = active_database::init()) {
    return err;
  }
  auto coll = scans();
  if (!coll) {
    return coll.error();
  }
  return (*coll)->purge();
}

auto nmap_database::remove(std::string_view id) -> caf::expected<size_t> {
  auto id_field = std::string{defaults::db::id_field};
  auto opts = query_options{};
  opts.fields = std::vector<std::string>{"scanid"};
  auto hosts = get(eq(id_field, std::string{id}), opts);
  if (!hosts) {
    return hosts.error();
  }
  auto scan_ids = list{};
  for (const auto& host : *hosts) {
    auto xs = get_scan_ids(host);
    scan_ids.insert(scan_ids.end(), xs.begin(), xs.end());
  }
  auto removed = active_database::remove(id);
  if (!removed) {
    return removed.error();
  }
  auto coll = scans();
  if (!coll) {
    return coll.error();
  }
  for (const auto& scan_id : scan_ids) {
    auto referencing
      = count(predicate{"scanid", relational_operator::ni, scan_id});
    if (!referencing) {
      return referencing.error();
    }
    if (*referencing > 0) {
      continue;
    }
    auto orphaned = (*coll)->remove(eq(id_field, scan_id));
    if (!orphaned) {
      return orphaned.error();
    }
    RECON_DEBUG("removed orphaned scan {}", scan_id);
  }
  return removed;
}

auto nmap_database::store_or_merge_host(record host)
  -> caf::expected<std::string> {
  return store_host(std::move(host));
}

auto nmap_database::store_scan_doc(record scan) -> caf::expected<std::string> {
  auto it = scan.find(defaults::db::id_field);
  if (it == scan.end() || !is<std::string>(it->second)) {
    return caf::make_error(ec::invalid_argument,
                           "a scan document requires a string _id");
  }
  auto id = as<std::string>(it->second);
  auto coll = scans();
  if (!coll) {
    return coll.error();
  }
  auto existing
    = (*coll)->count(eq(std::string{defaults::db::id_field}, id));
  if (!existing) {
    return existing.error();
  }
  if (*existing > 0) {
    return caf::make_error(ec::duplicate_entry,
                           fmt::format("duplicate entry for id '{}'", id));
  }
  if (auto inserted = (*coll)->insert(std::move(scan)); !inserted) {
    return inserted.error();
  }
  RECON_DEBUG("stored scan {} in {}", id, defaults::db::scans_collection);
  return id;
}

auto nmap_database::get_scan(std::string_view id)
  -> caf::expected<std::optional<record>> {
  auto coll = scans();
  if (!coll) {
    return coll.error();
  }
  auto docs = (*coll)->search(
    eq(std::string{defaults::db::id_field}, std::string{id}));
  if (!docs) {
    return docs.error();
  }
  if (docs->empty()) {
    return std::optional<record>{};
  }
  return std::optional<record>{std::move(docs->front().content)};
}

auto nmap_database::is_scan_present(std::string_view id)
  -> caf::expected<bool> {
  auto scan = get_scan(id);
  if (!scan) {
    return scan.error();
  }
  return scan->has_value();
}

// -- view_database ------------------------------------------------------------

view_database::view_database(std::shared_ptr<backend> store)
  : active_database{std::move(store),
                    std::string{defaults::db::view_collection}} {
  // nop
}

auto view_database::store_or_merge_host(record host, const merger& merge)
  -> caf::expected<std::string> {
  const auto* addr = try_as<std::string>(descend(host, "addr"));
  if (!addr) {
    return store_host(std::move(host));
  }
  auto filter = search_host(*addr);
  if (!filter) {
    return filter.error();
  }
  auto existing = get(*filter);
  if (!existing) {
    return existing.error();
  }
  if (existing->empty()) {
    return store_host(std::move(host));
  }
  auto merged = merge(existing->front(), host);
  if (!merged) {
    return add_context(merged.error(), "failed to merge host {}", *addr);
  }
  if (auto removed = remove(existing->front()); !removed) {
    return removed.error();
  }
  RECON_DEBUG("merged host {} in {}", *addr, name());
  return store_host(std::move(*merged));
}

} // namespace recon
