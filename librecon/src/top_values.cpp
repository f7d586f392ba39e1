//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2023 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/top_values.hpp"

#include "recon/active.hpp"
#include "recon/detail/assert.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/logger.hpp"
#include "recon/query_value.hpp"
#include "recon/schema.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <utility>

namespace recon {

void pseudo_field_registry::add(std::string name, matcher matches,
                                factory make) {
  entries_.push_back(entry{std::move(name), std::move(matches),
                           std::move(make)});
}

auto pseudo_field_registry::find(std::string_view name) const
  -> const entry* {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const entry& x) {
                           return x.matches(name);
                         });
  return it == entries_.end() ? nullptr : &*it;
}

auto pseudo_field_registry::resolve(std::string_view name,
                                    const pseudo_field_context& ctx) const
  -> caf::expected<pseudo_field> {
  RECON_ASSERT(ctx.layout != nullptr);
  if (const auto* x = find(name)) {
    RECON_TRACE("resolving '{}' as {}", name, x->name);
    return x->make(name, ctx);
  }
  return direct_field(std::string{name}, ctx);
}

auto exactly(std::string_view name) -> pseudo_field_registry::matcher {
  return [name = std::string{name}](std::string_view x) {
    return x == name;
  };
}

auto prefixed(std::string_view prefix) -> pseudo_field_registry::matcher {
  return [prefix = std::string{prefix}](std::string_view x) {
    return x.starts_with(prefix);
  };
}

auto parameterized(std::string_view name, std::string_view separators)
  -> pseudo_field_registry::matcher {
  return [name = std::string{name},
          separators = std::string{separators}](std::string_view x) {
    if (!x.starts_with(name)) {
      return false;
    }
    return x.size() == name.size()
           || separators.find(x[name.size()]) != std::string::npos;
  };
}

namespace {

/// Collects the values of one element reached by a pseudo-field's path.
using collector = std::function<void(const record&, list&)>;

auto weight_of(const record& rec, const std::optional<std::string>& field)
  -> int64_t {
  if (!field) {
    return 1;
  }
  if (const auto* x = descend(rec, *field)) {
    if (auto n = to_number(*x)) {
      return static_cast<int64_t>(*n);
    }
  }
  return 1;
}

/// Runs a collector for every record at *path*, or for the record itself if
/// *path* is empty.
auto collect_each(const record& rec, std::string path, const schema& layout,
                  collector collect, int64_t weight)
  -> generator<weighted_value> {
  auto out = list{};
  if (path.empty()) {
    collect(rec, out);
    for (auto& x : out) {
      co_yield weighted_value{std::move(x), weight};
    }
    co_return;
  }
  for (const auto* element : field_values(rec, path, layout)) {
    const auto* nested = try_as<record>(element);
    if (!nested) {
      continue;
    }
    out.clear();
    collect(*nested, out);
    for (auto& x : out) {
      co_yield weighted_value{std::move(x), weight};
    }
  }
}

auto derived_field(std::vector<std::string> fields, expression filter,
                   std::string path, collector collect,
                   const pseudo_field_context& ctx) -> pseudo_field {
  if (ctx.count_field) {
    fields.push_back(*ctx.count_field);
  }
  auto result = pseudo_field{};
  result.fields = std::move(fields);
  result.filter = std::move(filter);
  result.extractor = [layout = ctx.layout, count_field = ctx.count_field,
                      path = std::move(path),
                      collect = std::move(collect)](const record& rec) {
    return collect_each(rec, path, *layout, collect,
                        weight_of(rec, count_field));
  };
  return result;
}

/// A direct field under another filter.
auto filtered_field(std::string field, expression filter,
                    const pseudo_field_context& ctx) -> pseudo_field {
  auto result = direct_field(std::move(field), ctx);
  result.filter = std::move(filter);
  return result;
}

auto parse_number(std::string_view text, std::string_view what)
  -> caf::expected<int64_t> {
  if (auto n = detail::to_int(text)) {
    return *n;
  }
  return caf::make_error(ec::invalid_argument,
                         fmt::format("invalid {} '{}'", what, text));
}

/// Returns the parameter after the first occurrence of *sep*.
auto parameter(std::string_view name, char sep) -> std::string_view {
  auto pos = name.find(sep);
  return pos == std::string_view::npos ? std::string_view{}
                                       : name.substr(pos + 1);
}

auto has(const record& r, std::string_view field, const data& value)
  -> bool {
  const auto* x = descend(r, field);
  return x && *x == value;
}

/// Matches a value against a query value: a pattern searches strings,
/// anything else compares equal.
auto matches(const data& wanted, const data* actual) -> bool {
  if (const auto* re = try_as<pattern>(&wanted)) {
    const auto* str = try_as<std::string>(actual);
    return re->search(str ? std::string_view{*str} : std::string_view{});
  }
  return actual && *actual == wanted;
}

auto sorted_record(const record& r) -> record {
  auto entries
    = std::vector<std::pair<std::string, data>>(r.begin(), r.end());
  std::sort(entries.begin(), entries.end(), [](const auto& x, const auto& y) {
    return x.first < y.first;
  });
  auto result = record{};
  result.reserve(entries.size());
  for (auto& [key, value] : entries) {
    result.emplace(std::move(key), std::move(value));
  }
  return result;
}

const auto open_state = data{std::string{"open"}};

auto port_protocol(const record& port) -> list {
  auto protocol = get_or_null(port, "protocol");
  if (is<caf::none_t>(protocol)) {
    protocol = std::string{"?"};
  }
  return list{std::move(protocol), get_or_null(port, "port")};
}

auto any_port_state() -> expression {
  return any("ports", exists("state_state"));
}

/// The service tuple of a port: name, then product, then version.
auto service_tuple(const record& port, size_t width) -> data {
  if (width == 1) {
    return get_or_null(port, "service_name");
  }
  auto result = list{get_or_null(port, "service_name"),
                     get_or_null(port, "service_product")};
  if (width == 3) {
    result.push_back(get_or_null(port, "service_version"));
  }
  return result;
}

auto service_fields(size_t width) -> std::vector<std::string> {
  auto result = std::vector<std::string>{"ports.port", "ports.state_state",
                                         "ports.service_name"};
  if (width > 1) {
    result.emplace_back("ports.service_product");
  }
  if (width > 2) {
    result.emplace_back("ports.service_version");
  }
  return result;
}

/// Builds `service`, `product` and `version`, optionally restricted to a
/// port number, a service or a service and product.
auto make_service_field(std::string_view name, size_t width,
                        const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto arg = parameter(name, ':');
  auto fields = service_fields(width);
  if (arg.empty()) {
    return derived_field(std::move(fields),
                         active_database::search_open_port(), "ports",
                         [width](const record& port, list& out) {
                           if (has(port, "state_state", open_state)) {
                             out.push_back(service_tuple(port, width));
                           }
                         },
                         ctx);
  }
  if (std::all_of(arg.begin(), arg.end(), [](char c) {
        return c >= '0' && c <= '9';
      })) {
    auto portnum = parse_number(arg, "port number");
    if (!portnum) {
      return portnum.error();
    }
    return derived_field(std::move(fields),
                         active_database::search_port(*portnum), "ports",
                         [width, number = data{*portnum}](const record& port,
                                                          list& out) {
                           if (has(port, "port", number)
                               && has(port, "state_state", open_state)) {
                             out.push_back(service_tuple(port, width));
                           }
                         },
                         ctx);
  }
  if (width == 1) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("invalid port number in '{}'", name));
  }
  auto parts = detail::split(arg, ":", 1);
  auto service = data{std::string{parts[0]}};
  if (width == 3 && parts.size() == 2) {
    auto product = data{std::string{parts[1]}};
    return derived_field(
      std::move(fields),
      active_database::search_product(product, std::nullopt, service), "ports",
      [width, service, product](const record& port, list& out) {
        if (has(port, "state_state", open_state)
            && has(port, "service_name", service)
            && has(port, "service_product", product)) {
          out.push_back(service_tuple(port, width));
        }
      },
      ctx);
  }
  return derived_field(std::move(fields),
                       active_database::search_service(service), "ports",
                       [width, service](const record& port, list& out) {
                         if (has(port, "state_state", open_state)
                             && has(port, "service_name", service)) {
                           out.push_back(service_tuple(port, width));
                         }
                       },
                       ctx);
}

auto make_port_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto info = parameter(name, ':');
  auto fields
    = std::vector<std::string>{"ports.port", "ports.protocol"};
  auto keep = std::function<bool(const record&)>{};
  if (info.empty()) {
    fields.emplace_back("ports.state_state");
    keep = [](const record& port) {
      return port.contains(std::string_view{"state_state"});
    };
  } else if (info == "open" || info == "filtered" || info == "closed") {
    fields.emplace_back("ports.state_state");
    keep = [state = data{std::string{info}}](const record& port) {
      return has(port, "state_state", state);
    };
  } else {
    fields.emplace_back("ports.service_name");
    keep = [service = data{std::string{info}}](const record& port) {
      return has(port, "service_name", service);
    };
  }
  return derived_field(std::move(fields), any_port_state(), "ports",
                       [keep](const record& port, list& out) {
                         if (keep(port)) {
                           out.emplace_back(port_protocol(port));
                         }
                       },
                       ctx);
}

auto make_net_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto bits = int64_t{ctx.net_mask};
  if (auto arg = parameter(name, ':'); !arg.empty()) {
    auto parsed = parse_number(arg, "net mask");
    if (!parsed) {
      return parsed.error();
    }
    bits = *parsed;
  }
  if (bits < 0 || bits > 32) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("net mask out of range in '{}'", name));
  }
  return derived_field(
    {"addr"}, database::search_ipv4(), "",
    [bits](const record& rec, list& out) {
      const auto* text = try_as<std::string>(descend(rec, "addr"));
      if (!text) {
        return;
      }
      auto addr = ip::parse(*text);
      if (!addr) {
        RECON_DEBUG("skipping unparsable address {}: {}", *text,
                    addr.error());
        return;
      }
      addr->mask(static_cast<unsigned>(96 + bits));
      out.emplace_back(fmt::format("{}/{}", *addr, bits));
    },
    ctx);
}

auto make_cpe_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  static constexpr auto parts
    = std::array<std::string_view, 4>{"type", "vendor", "product", "version"};
  auto head = name;
  auto spec = std::vector<data>{};
  if (auto colon = name.find(':'); colon != std::string_view::npos) {
    head = name.substr(0, colon);
    for (auto x : detail::split(name.substr(colon + 1), ":", 3)) {
      spec.push_back(str_to_query_value(x));
    }
  }
  auto level = size_t{3};
  if (auto dot = head.find('.'); dot != std::string_view::npos) {
    auto part = head.substr(dot + 1);
    auto it = std::find(parts.begin(), parts.end(), part);
    if (it != parts.end()) {
      level = static_cast<size_t>(it - parts.begin());
    } else if (auto n = detail::to_int(part); n && *n >= 1 && *n <= 4) {
      level = static_cast<size_t>(*n - 1);
    }
  }
  auto at = [&](size_t i) -> std::optional<data> {
    if (i < spec.size()) {
      return spec[i];
    }
    return std::nullopt;
  };
  auto filter = active_database::search_cpe(at(0), at(1), at(2), at(3));
  return derived_field(
    {"cpes"}, std::move(filter), "cpes",
    [spec, level](const record& cpe, list& out) {
      for (size_t i = 0; i < spec.size(); ++i) {
        if (!matches(spec[i], descend(cpe, parts[i]))) {
          return;
        }
      }
      auto result = list{};
      for (size_t i = 0; i <= level; ++i) {
        result.push_back(get_or_null(cpe, parts[i]));
      }
      out.emplace_back(std::move(result));
    },
    ctx);
}

auto make_script_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto arg = parameter(name, ':');
  auto parts = detail::split(arg, ":", 1);
  if (parts.size() == 1) {
    auto filter = active_database::search_script(std::string{arg});
    if (!filter) {
      return filter.error();
    }
    return derived_field({"ports.scripts.id", "ports.scripts.output"},
                         std::move(*filter), "ports.scripts",
                         [id = data{std::string{arg}}](const record& script,
                                                       list& out) {
                           if (has(script, "id", id)) {
                             out.push_back(get_or_null(script, "output"));
                           }
                         },
                         ctx);
  }
  auto portnum = int64_t{-1};
  if (parts[0] != "host") {
    auto parsed = parse_number(parts[0], "port number");
    if (!parsed) {
      return parsed.error();
    }
    portnum = *parsed;
  }
  auto id = std::string{parts[1]};
  auto script = active_database::search_script(id);
  if (!script) {
    return script.error();
  }
  auto port = portnum == -1 ? active_database::search_port(std::string{"host"})
                            : active_database::search_port(portnum);
  return derived_field(
    {"ports.port", "ports.scripts.id", "ports.scripts.output"},
    conjoin({std::move(*script), std::move(port)}), "ports",
    [number = data{portnum}, id = data{id}](const record& port, list& out) {
      if (!has(port, "port", number)) {
        return;
      }
      if (const auto* scripts = try_as<list>(descend(port, "scripts"))) {
        for (const auto& x : *scripts) {
          const auto* script = try_as<record>(&x);
          if (script && has(*script, "id", id)) {
            out.push_back(get_or_null(*script, "output"));
          }
        }
      }
    },
    ctx);
}

auto make_domains_field(std::string_view name,
                        const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto arg = parameter(name, ':');
  if (arg.empty()) {
    return direct_field("hostnames.domains", ctx);
  }
  auto level = parse_number(arg, "domain level");
  if (!level) {
    return level.error();
  }
  return derived_field(
    {"hostnames.domains"}, exists("hostnames.domains"), "hostnames",
    [dots = *level - 1](const record& hostname, list& out) {
      const auto* domains = try_as<list>(descend(hostname, "domains"));
      if (!domains) {
        return;
      }
      for (const auto& x : *domains) {
        const auto* domain = try_as<std::string>(&x);
        if (domain && std::count(domain->begin(), domain->end(), '.') == dots) {
          out.push_back(x);
        }
      }
    },
    ctx);
}

auto make_cert_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto sub = name.substr(5);
  auto field = join_path("ports.scripts.ssl-cert", sub);
  if (sub != "issuer" && sub != "subject") {
    return direct_field(std::move(field), ctx);
  }
  // Names are records; their keys are sorted so equal names count as one.
  return derived_field({field}, exists(field), "ports.scripts",
                       [key = std::string{sub}](const record& script,
                                                list& out) {
                         const auto* cert
                           = try_as<record>(descend(script, "ssl-cert"));
                         if (!cert) {
                           return;
                         }
                         if (const auto* x
                             = try_as<record>(descend(*cert, key))) {
                           out.emplace_back(sorted_record(*x));
                         }
                       },
                       ctx);
}

auto make_useragent_field(std::string_view name,
                          const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto arg = parameter(name, ':');
  if (arg.empty()) {
    auto filter = active_database::search_user_agent();
    if (!filter) {
      return filter.error();
    }
    return filtered_field("ports.scripts.http-user-agent", std::move(*filter),
                          ctx);
  }
  auto value = str_to_query_value(arg);
  auto filter = active_database::search_user_agent(value);
  if (!filter) {
    return filter.error();
  }
  return derived_field({"ports.scripts.http-user-agent"}, std::move(*filter),
                       "ports.scripts",
                       [value](const record& script, list& out) {
                         const auto* uas = try_as<list>(
                           descend(script, "http-user-agent"));
                         if (!uas) {
                           return;
                         }
                         for (const auto& ua : *uas) {
                           if (matches(value, &ua)) {
                             out.push_back(ua);
                           }
                         }
                       },
                       ctx);
}

/// A JA3 query parameter: the key it applies to and the value it matches.
struct ja3_query {
  std::string key;
  data value;
};

auto parse_ja3_query(std::string_view text)
  -> caf::expected<std::optional<ja3_query>> {
  if (text.empty()) {
    return std::optional<ja3_query>{};
  }
  auto kv = ja3_key_value(str_to_query_value(text));
  if (!kv) {
    return kv.error();
  }
  return std::optional<ja3_query>{ja3_query{kv->first, kv->second}};
}

auto ja3_matches(const std::optional<ja3_query>& query, const record& x)
  -> bool {
  return !query || matches(query->value, descend(x, query->key));
}

auto ja3_value(const std::optional<ja3_query>& query) -> std::optional<data> {
  if (!query) {
    return std::nullopt;
  }
  return query->value;
}

/// Splits `ja3-client.sha1:value` into the subfield and the parameters.
auto split_ja3_name(std::string_view name)
  -> std::pair<std::string, std::string_view> {
  auto head = name;
  auto params = std::string_view{};
  if (auto colon = name.find(':'); colon != std::string_view::npos) {
    head = name.substr(0, colon);
    params = name.substr(colon + 1);
  }
  auto subfield = std::string{"md5"};
  if (auto dot = head.find('.'); dot != std::string_view::npos) {
    subfield = std::string{head.substr(dot + 1)};
  }
  return {std::move(subfield), params};
}

auto make_ja3_client_field(std::string_view name,
                           const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto [subfield, params] = split_ja3_name(name);
  auto query = parse_ja3_query(params);
  if (!query) {
    return query.error();
  }
  auto filter = active_database::search_ja3_client(ja3_value(*query));
  if (!filter) {
    return filter.error();
  }
  return derived_field({"ports.scripts.ssl-ja3-client"}, std::move(*filter),
                       "ports.scripts.ssl-ja3-client",
                       [query = *query, subfield = subfield](
                         const record& ja3, list& out) {
                         if (ja3_matches(query, ja3)) {
                           out.push_back(get_or_null(ja3, subfield));
                         }
                       },
                       ctx);
}

auto make_ja3_server_field(std::string_view name,
                           const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto [subfield, params] = split_ja3_name(name);
  auto parts = detail::split(params, ":", 1);
  auto server = parse_ja3_query(params.empty() ? params : parts[0]);
  if (!server) {
    return server.error();
  }
  auto client = parse_ja3_query(parts.size() == 2 ? parts[1]
                                                  : std::string_view{});
  if (!client) {
    return client.error();
  }
  auto filter = active_database::search_ja3_server(ja3_value(*server),
                                                   ja3_value(*client));
  if (!filter) {
    return filter.error();
  }
  return derived_field(
    {"ports.scripts.ssl-ja3-server"}, std::move(*filter),
    "ports.scripts.ssl-ja3-server",
    [server = *server, client = *client,
     subfield = subfield](const record& ja3, list& out) {
      static const auto no_client = record{};
      const auto* cli = try_as<record>(descend(ja3, "client"));
      if (!cli) {
        cli = &no_client;
      }
      if (ja3_matches(server, ja3) && ja3_matches(client, *cli)) {
        out.emplace_back(
          list{get_or_null(ja3, subfield), get_or_null(*cli, subfield)});
      }
    },
    ctx);
}

/// Emits a tuple of subfields for every record at *path*.
auto make_tuple_field(std::string path, std::vector<std::string> subfields,
                      expression filter, const pseudo_field_context& ctx)
  -> pseudo_field {
  return derived_field({path}, std::move(filter), path,
                       [subfields = std::move(subfields)](const record& x,
                                                          list& out) {
                         auto result = list{};
                         result.reserve(subfields.size());
                         for (const auto& field : subfields) {
                           result.push_back(get_or_null(x, field));
                         }
                         out.emplace_back(std::move(result));
                       },
                       ctx);
}

auto search_script_named(std::string_view name)
  -> caf::expected<expression> {
  return active_database::search_script(std::string{name});
}

auto make_httphdr_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto header = detail::to_lower(name.substr(8));
  auto filter = active_database::search_script(std::string{"http-headers"},
                                               std::nullopt,
                                               record{{"name", header}});
  if (!filter) {
    return filter.error();
  }
  return derived_field({"ports.scripts.http-headers"}, std::move(*filter),
                       "ports.scripts.http-headers",
                       [header](const record& hdr, list& out) {
                         const auto* x
                           = try_as<std::string>(descend(hdr, "name"));
                         if (x && detail::to_lower(*x) == header) {
                           out.push_back(get_or_null(hdr, "value"));
                         }
                       },
                       ctx);
}

auto make_enip_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  static constexpr auto names = std::array<std::pair<std::string_view,
                                                     std::string_view>,
                                           7>{{
    {"vendor", "Vendor"},
    {"product", "Product Name"},
    {"serial", "Serial Number"},
    {"devtype", "Device Type"},
    {"prodcode", "Product Code"},
    {"rev", "Revision"},
    {"ip", "Device IP"},
  }};
  auto sub = name.substr(5);
  auto it = std::find_if(names.begin(), names.end(), [&](const auto& x) {
    return x.first == sub;
  });
  if (it != names.end()) {
    sub = it->second;
  }
  return direct_field(join_path("ports.scripts.enip-info", sub), ctx);
}

auto make_vulns_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto sub = std::string{name.substr(6)};
  auto field = join_path("ports.scripts.vulns", sub);
  if (sub == "id") {
    return direct_field(std::move(field), ctx);
  }
  return make_tuple_field("ports.scripts.vulns", {"id", sub}, exists(field),
                          ctx);
}

auto make_file_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  auto fieldname = std::string{"filename"};
  auto scripts = std::optional<std::vector<std::string>>{};
  if (name.starts_with("file:")) {
    auto arg = name.substr(5);
    auto parts = detail::split(arg, ".", 1);
    if (parts.size() == 2) {
      fieldname = std::string{parts[1]};
    }
    scripts = detail::to_strings(detail::split(parts[0], ","));
  } else if (name.size() > 5) {
    fieldname = std::string{name.substr(5)};
  }
  auto filter = active_database::search_file(std::nullopt, scripts);
  return derived_field(
    {"ports.scripts.id", "ports.scripts.ls"}, std::move(filter),
    "ports.scripts",
    [scripts, fieldname](const record& script, list& out) {
      if (scripts) {
        const auto* id = try_as<std::string>(descend(script, "id"));
        if (!id
            || std::find(scripts->begin(), scripts->end(), *id)
                 == scripts->end()) {
          return;
        }
      }
      const auto* volumes = try_as<list>(descend(script, "ls.volumes"));
      if (!volumes) {
        return;
      }
      for (const auto& volume : *volumes) {
        const auto* vol = try_as<record>(&volume);
        const auto* files
          = vol ? try_as<list>(descend(*vol, "files")) : nullptr;
        if (!files) {
          continue;
        }
        for (const auto& file : *files) {
          if (const auto* x = try_as<record>(&file)) {
            out.push_back(get_or_null(*x, fieldname));
          }
        }
      }
    },
    ctx);
}

auto make_hop_field(std::string_view name, const pseudo_field_context& ctx)
  -> caf::expected<pseudo_field> {
  if (name == "hop") {
    return direct_field("traces.hops.ipaddr", ctx);
  }
  auto ttl = parse_number(name.substr(4), "TTL");
  if (!ttl) {
    return ttl.error();
  }
  auto deeper = name[3] == '>';
  return derived_field({"traces.hops.ipaddr", "traces.hops.ttl"},
                       exists("traces.hops.ipaddr"), "traces.hops",
                       [ttl = *ttl, deeper](const record& hop, list& out) {
                         auto n = to_number(get_or_null(hop, "ttl"))
                                    .value_or(0);
                         auto keep = deeper ? n > static_cast<double>(ttl)
                                            : n == static_cast<double>(ttl);
                         if (keep) {
                           out.push_back(get_or_null(hop, "ipaddr"));
                         }
                       },
                       ctx);
}

/// Wraps a factory that rewrites the requested name into a field path.
auto renamed(std::function<std::string(std::string_view)> rename)
  -> pseudo_field_registry::factory {
  return [rename = std::move(rename)](std::string_view name,
                                      const pseudo_field_context& ctx)
           -> caf::expected<pseudo_field> {
    return direct_field(rename(name), ctx);
  };
}

/// Rewrites a prefix of the requested name.
auto rebased(std::string_view prefix, std::string_view base)
  -> pseudo_field_registry::factory {
  return renamed([n = prefix.size(), base = std::string{base}](
                   std::string_view name) {
    return join_path(base, name.substr(n));
  });
}

auto make_hosts_registry() -> pseudo_field_registry {
  auto r = pseudo_field_registry{};
  r.add("category", exactly("category"), renamed([](std::string_view) {
          return std::string{"categories"};
        }));
  r.add("country", exactly("country"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          return derived_field({"infos.country_code", "infos.country_name"},
                               exists("infos.country_code"), "infos",
                               [](const record& infos, list& out) {
                                 auto name = get_or_null(infos,
                                                         "country_name");
                                 if (is<caf::none_t>(name)) {
                                   name = std::string{"?"};
                                 }
                                 out.emplace_back(list{
                                   get_or_null(infos, "country_code"),
                                   std::move(name)});
                               },
                               ctx);
        });
  r.add("city", exactly("city"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          return make_tuple_field(
            "infos", {"country_code", "city"},
            conjoin({exists("infos.country_code"), exists("infos.city")}),
            ctx);
        });
  r.add("asnum", exactly("asnum"), renamed([](std::string_view) {
          return std::string{"infos.as_num"};
        }));
  r.add("as", exactly("as"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          return derived_field({"infos.as_num", "infos.as_name"},
                               exists("infos.as_num"), "infos",
                               [](const record& infos, list& out) {
                                 auto name = get_or_null(infos, "as_name");
                                 if (is<caf::none_t>(name)) {
                                   name = std::string{"?"};
                                 }
                                 out.emplace_back(list{
                                   get_or_null(infos, "as_num"),
                                   std::move(name)});
                               },
                               ctx);
        });
  r.add("net[:<bits>]", parameterized("net", ":"), make_net_field);
  r.add("port[:<state>|:<service>]", parameterized("port", ":"),
        make_port_field);
  r.add("portlist:<state>", prefixed("portlist:"),
        [](std::string_view name, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          return derived_field(
            {"ports.port", "ports.protocol", "ports.state_state"},
            any_port_state(), "",
            [state = data{std::string{parameter(name, ':')}}](
              const record& host, list& out) {
              auto result = list{};
              if (const auto* ports = try_as<list>(descend(host, "ports"))) {
                for (const auto& x : *ports) {
                  const auto* port = try_as<record>(&x);
                  if (port && has(*port, "state_state", state)) {
                    result.emplace_back(port_protocol(*port));
                  }
                }
              }
              std::sort(result.begin(), result.end());
              out.emplace_back(std::move(result));
            },
            ctx);
        });
  r.add("countports:<state>", prefixed("countports:"),
        [](std::string_view name, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          return derived_field(
            {"ports.state_state"}, any_port_state(), "",
            [state = data{std::string{parameter(name, ':')}}](
              const record& host, list& out) {
              auto n = int64_t{0};
              for (const auto* x :
                   field_values(host, "ports.state_state", schema::hosts())) {
                if (*x == state) {
                  ++n;
                }
              }
              out.emplace_back(n);
            },
            ctx);
        });
  r.add("service[:<port>]", parameterized("service", ":"),
        [](std::string_view name, const pseudo_field_context& ctx) {
          return make_service_field(name, 1, ctx);
        });
  r.add("product[:<port>|:<service>]", parameterized("product", ":"),
        [](std::string_view name, const pseudo_field_context& ctx) {
          return make_service_field(name, 2, ctx);
        });
  r.add("version[:<port>|:<service>[:<product>]]",
        parameterized("version", ":"),
        [](std::string_view name, const pseudo_field_context& ctx) {
          return make_service_field(name, 3, ctx);
        });
  r.add("cpe[.<part>][:<spec>]", prefixed("cpe"), make_cpe_field);
  r.add("devicetype[:<port>]", parameterized("devicetype", ":"),
        [](std::string_view name, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto arg = parameter(name, ':');
          if (arg.empty()) {
            return direct_field("ports.service_devicetype", ctx);
          }
          auto portnum = parse_number(arg, "port number");
          if (!portnum) {
            return portnum.error();
          }
          return derived_field(
            {"ports.port", "ports.state_state", "ports.service_devicetype"},
            active_database::search_port(*portnum), "ports",
            [number = data{*portnum}](const record& port, list& out) {
              if (has(port, "port", number)
                  && has(port, "state_state", open_state)) {
                out.push_back(get_or_null(port, "service_devicetype"));
              }
            },
            ctx);
        });
  r.add("smb.<field>", prefixed("smb."),
        [](std::string_view name, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto sub = name.substr(4);
          if (sub == "dnsdomain") {
            sub = "domain_dns";
          } else if (sub == "forest") {
            sub = "forest_dns";
          }
          auto filter = search_script_named("smb-os-discovery");
          if (!filter) {
            return filter.error();
          }
          return filtered_field(
            join_path("ports.scripts.smb-os-discovery", sub),
            std::move(*filter), ctx);
        });
  r.add("script", exactly("script"), renamed([](std::string_view) {
          return std::string{"ports.scripts.id"};
        }));
  r.add("script:[<port>:]<id>", prefixed("script:"), make_script_field);
  r.add("domains[:<level>]", parameterized("domains", ":"),
        make_domains_field);
  r.add("cert.<field>", prefixed("cert."), make_cert_field);
  r.add("useragent[:<value>]", parameterized("useragent", ":"),
        make_useragent_field);
  r.add("ja3-client[.<field>][:<value>]", parameterized("ja3-client", ":."),
        make_ja3_client_field);
  r.add("ja3-server[.<field>][:<value>[:<client>]]",
        parameterized("ja3-server", ":."), make_ja3_server_field);
  r.add("sshkey.bits", exactly("sshkey.bits"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto filter = active_database::search_ssh_key();
          if (!filter) {
            return filter.error();
          }
          return make_tuple_field("ports.scripts.ssh-hostkey",
                                  {"type", "bits"}, std::move(*filter), ctx);
        });
  r.add("sshkey.<field>", prefixed("sshkey."),
        [](std::string_view name, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto filter = active_database::search_ssh_key();
          if (!filter) {
            return filter.error();
          }
          return filtered_field(
            join_path("ports.scripts.ssh-hostkey", name.substr(7)),
            std::move(*filter), ctx);
        });
  r.add("ike.vendor_ids", exactly("ike.vendor_ids"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto filter = search_script_named("ike-info");
          if (!filter) {
            return filter.error();
          }
          return make_tuple_field("ports.scripts.ike-info.vendor_ids",
                                  {"value", "name"}, std::move(*filter), ctx);
        });
  r.add("ike.transforms", exactly("ike.transforms"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto filter = search_script_named("ike-info");
          if (!filter) {
            return filter.error();
          }
          return make_tuple_field("ports.scripts.ike-info.transforms",
                                  {"Authentication", "Encryption", "GroupDesc",
                                   "Hash", "LifeDuration", "LifeType"},
                                  std::move(*filter), ctx);
        });
  r.add("ike.notification", exactly("ike.notification"),
        renamed([](std::string_view) {
          return std::string{"ports.scripts.ike-info.notification_type"};
        }));
  r.add("ike.<field>", prefixed("ike."),
        rebased("ike.", "ports.scripts.ike-info"));
  r.add("httphdr", exactly("httphdr"),
        [](std::string_view, const pseudo_field_context& ctx)
          -> caf::expected<pseudo_field> {
          auto filter = search_script_named("http-headers");
          if (!filter) {
            return filter.error();
          }
          return make_tuple_field("ports.scripts.http-headers",
                                  {"name", "value"}, std::move(*filter), ctx);
        });
  r.add("httphdr.<field>", prefixed("httphdr."),
        rebased("httphdr.", "ports.scripts.http-headers"));
  r.add("httphdr:<name>", prefixed("httphdr:"), make_httphdr_field);
  r.add("modbus.<field>", prefixed("modbus."),
        rebased("modbus.", "ports.scripts.modbus-discover"));
  r.add("s7.<field>", prefixed("s7."), rebased("s7.", "ports.scripts.s7-info"));
  r.add("enip.<field>", prefixed("enip."), make_enip_field);
  r.add("mongo.dbs.<field>", prefixed("mongo.dbs."),
        rebased("mongo.dbs.", "ports.scripts.mongodb-databases"));
  r.add("vulns.<field>", prefixed("vulns."), make_vulns_field);
  r.add("file[.<field>]|file:<scripts>[.<field>]", parameterized("file", ".:"),
        make_file_field);
  r.add("screenwords", exactly("screenwords"), renamed([](std::string_view) {
          return std::string{"ports.screenwords"};
        }));
  r.add("hop[:<ttl>|><ttl>]", parameterized("hop", ":>"), make_hop_field);
  return r;
}

auto make_passive_registry() -> pseudo_field_registry {
  auto r = pseudo_field_registry{};
  r.add("net[:<bits>]", parameterized("net", ":"), make_net_field);
  return r;
}

} // namespace

auto direct_field(std::string field, const pseudo_field_context& ctx)
  -> pseudo_field {
  RECON_ASSERT(ctx.layout != nullptr);
  auto result = pseudo_field{};
  result.fields.push_back(field);
  if (ctx.count_field) {
    result.fields.push_back(*ctx.count_field);
  }
  result.filter = exists(field);
  result.extractor = [layout = ctx.layout, count_field = ctx.count_field,
                      field = std::move(field)](const record& rec) {
    if (count_field) {
      return weighted_field_values(rec, field, *layout, *count_field);
    }
    return weighted_field_values(rec, field, *layout, int64_t{1});
  };
  return result;
}

auto pseudo_field_registry::hosts() -> const pseudo_field_registry& {
  static const auto result = make_hosts_registry();
  return result;
}

auto pseudo_field_registry::passive() -> const pseudo_field_registry& {
  static const auto result = make_passive_registry();
  return result;
}

} // namespace recon
