//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/passive.hpp"

#include "recon/codec.hpp"
#include "recon/defaults.hpp"
#include "recon/detail/string.hpp"
#include "recon/error.hpp"
#include "recon/logger.hpp"
#include "recon/query_value.hpp"
#include "recon/schema.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <span>

namespace recon {

namespace {

auto eq(std::string field, data value) -> expression {
  return predicate{std::move(field), relational_operator::equal,
                   std::move(value)};
}

auto one_of(std::string field, std::initializer_list<std::string_view> xs)
  -> expression {
  auto values = list{};
  for (auto x : xs) {
    values.emplace_back(std::string{x});
  }
  return predicate{std::move(field), relational_operator::in,
                   std::move(values)};
}

auto prefix_match(std::string field, std::string_view prefix,
                  pattern_options options = {}) -> expression {
  auto re = check(pattern::make(fmt::format("^{}", prefix), options));
  return predicate{std::move(field), relational_operator::match,
                   std::move(re)};
}

auto require_tcp(std::optional<std::string_view> protocol) -> caf::error {
  if (protocol && *protocol != "tcp") {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("protocols other than TCP are not "
                                       "supported in passive, got {}",
                                       *protocol));
  }
  return caf::none;
}

auto is_event_of(std::string_view recontype, std::string_view source)
  -> expression {
  return conjoin({
    eq("recontype", std::string{recontype}),
    eq("source", std::string{source}),
  });
}

auto certificate() -> expression {
  return is_event_of("SSL_SERVER", "cert");
}

/// Searches the JA3 hash in the value, or another digest in the infos.
auto search_ja3(const data& value_or_hash) -> caf::expected<expression> {
  auto kv = ja3_key_value(value_or_hash);
  if (!kv) {
    return kv.error();
  }
  auto& [key, value] = *kv;
  return search_string(key == "md5" ? std::string{"value"}
                                    : join_path("infos", key),
                       value);
}

} // namespace

passive_database::passive_database(std::shared_ptr<backend> store)
  : database{std::move(store), std::string{defaults::db::passive_collection},
             schema::passive()} {
  // nop
}

auto passive_database::from_internal(document doc) const
  -> caf::expected<record> {
  auto rec = passive_from_internal(std::move(doc.content));
  if (!rec) {
    return rec.error();
  }
  rec->insert_or_assign(std::string{defaults::db::id_field}, doc.id);
  return rec;
}

auto passive_database::get_one(const expression& filter,
                               const query_options& opts)
  -> caf::expected<std::optional<record>> {
  auto shaped = opts;
  shaped.limit = 1;
  auto records = get(filter, shaped);
  if (!records) {
    return records.error();
  }
  if (records->empty()) {
    return std::optional<record>{};
  }
  return std::optional<record>{std::move(records->front())};
}

auto passive_database::insert(record rec, const info_resolver& resolve)
  -> caf::expected<document_id> {
  if (resolve) {
    for (auto& [key, value] : resolve(rec)) {
      rec.insert_or_assign(key, std::move(value));
    }
  }
  auto internal = passive_to_internal(std::move(rec));
  if (!internal) {
    return add_context(internal.error(), "failed to insert into {}", name());
  }
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  return (*coll)->insert(std::move(*internal));
}

auto passive_database::insert_or_update(const data& timestamp, record rec,
                                        const info_resolver& resolve,
                                        std::optional<data> lastseen)
  -> caf::error {
  auto internal = passive_to_internal(rec);
  if (!internal) {
    return add_context(internal.error(), "failed to merge into {}", name());
  }
  internal->erase(std::string_view{"infos"});
  internal->erase(std::string_view{"firstseen"});
  internal->erase(std::string_view{"lastseen"});
  auto count = int64_t{1};
  if (auto it = internal->find(std::string_view{"count"});
      it != internal->end()) {
    if (!is<caf::none_t>(it->second)) {
      auto n = to_integer(it->second);
      if (!n || *n < 0) {
        return caf::make_error(ec::invalid_argument,
                               fmt::format("invalid count {}", it->second));
      }
      count = *n;
    }
    internal->erase(it);
  }
  auto key = std::vector<expression>{};
  key.reserve(internal->size());
  for (const auto& [field, value] : *internal) {
    key.push_back(eq(field, value));
  }
  auto match = conjoin(std::move(key));
  auto first = to_epoch(timestamp);
  if (!first) {
    return add_context(first.error(), "invalid timestamp {}", timestamp);
  }
  auto last = *first;
  if (lastseen) {
    auto x = to_epoch(*lastseen);
    if (!x) {
      return add_context(x.error(), "invalid last-seen time {}", *lastseen);
    }
    last = *x;
  }
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  auto current = (*coll)->search(match);
  if (!current) {
    return current.error();
  }
  if (!current->empty()) {
    auto id = current->front().id;
    auto fold = [&](record& doc) {
      auto previous = to_integer(get_or_null(doc, "count")).value_or(0);
      doc.insert_or_assign(std::string{"count"}, previous + count);
      auto seen = to_number(get_or_null(doc, "firstseen"));
      doc.insert_or_assign(std::string{"firstseen"},
                           seen ? std::min(*seen, *first) : *first);
      seen = to_number(get_or_null(doc, "lastseen"));
      doc.insert_or_assign(std::string{"lastseen"},
                           seen ? std::max(*seen, last) : last);
    };
    auto ids = std::array{id};
    if (auto err = (*coll)->update(fold, std::span<const document_id>{ids})) {
      return err;
    }
    RECON_TRACE("{} folded {} events into document {}", name(), count, id);
    return caf::none;
  }
  auto doc = std::move(*internal);
  doc.insert_or_assign(std::string{"count"}, count);
  doc.insert_or_assign(std::string{"firstseen"}, *first);
  doc.insert_or_assign(std::string{"lastseen"}, last);
  if (resolve) {
    auto extra = resolve(rec);
    if (auto it = extra.find(std::string_view{"infos"}); it != extra.end()) {
      doc.insert_or_assign(std::string{"infos"}, std::move(it->second));
    }
  }
  auto id = (*coll)->upsert(std::move(doc), match);
  if (!id) {
    return id.error();
  }
  RECON_TRACE("{} created document {}", name(), *id);
  return caf::none;
}

auto passive_database::top_values(std::string_view field,
                                  const expression& filter, bool distinct,
                                  std::optional<size_t> top_n,
                                  const query_options& opts)
  -> caf::expected<std::vector<value_count>> {
  auto ctx = pseudo_field_context{};
  ctx.layout = &layout();
  ctx.net_mask = options().net_mask;
  if (!distinct) {
    ctx.count_field = "count";
  }
  auto resolved = pseudo_field_registry::passive().resolve(field, ctx);
  if (!resolved) {
    return add_context(resolved.error(), "failed to resolve '{}'", field);
  }
  return top_values_impl(*resolved, filter, top_n.value_or(options().top_n),
                         opts);
}

auto passive_database::features_port_list(const expression& filter,
                                          bool yield_all, bool use_service,
                                          bool use_product, bool use_version)
  -> caf::expected<list> {
  auto fields = std::vector<std::string>{"port"};
  if (use_service) {
    fields.emplace_back("infos.service_name");
    if (use_product) {
      fields.emplace_back("infos.service_product");
      if (use_version) {
        fields.emplace_back("infos.service_version");
      }
    }
  }
  auto extract = [&](const record& rec, list& out) {
    auto tuple = list{get_or_null(rec, "port")};
    if (use_service) {
      tuple.push_back(get_or_null(rec, "infos.service_name"));
      if (use_product) {
        tuple.push_back(get_or_null(rec, "infos.service_product"));
        if (use_version) {
          tuple.push_back(get_or_null(rec, "infos.service_version"));
        }
      }
    }
    out.emplace_back(std::move(tuple));
  };
  return port_tuples(conjoin({filter, exists("port")}), std::move(fields),
                     extract, yield_all);
}

// -- passive filters ----------------------------------------------------------

auto passive_database::search_recontype(const data& rectype) -> expression {
  return search_string("recontype", rectype);
}

auto passive_database::search_sensor(const data& sensor, bool neg)
  -> expression {
  return search_string("sensor", sensor, neg);
}

auto passive_database::search_port(int64_t port, std::string_view protocol,
                                   std::string_view state, bool neg)
  -> caf::expected<expression> {
  if (auto err = require_tcp(protocol)) {
    return err;
  }
  if (state != "open") {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("only open ports can be found in "
                                       "passive, got {}",
                                       state));
  }
  return predicate{"port",
                   neg ? relational_operator::not_equal
                       : relational_operator::equal,
                   port};
}

auto passive_database::search_service(const data& srv,
                                      std::optional<int64_t> port,
                                      std::optional<std::string> protocol)
  -> caf::expected<expression> {
  if (auto err = require_tcp(protocol)) {
    return err;
  }
  auto xs = std::vector<expression>{search_string("infos.service_name", srv)};
  if (port) {
    xs.push_back(eq("port", *port));
  }
  return conjoin(std::move(xs));
}

auto passive_database::search_product(const data& product,
                                      std::optional<data> version,
                                      std::optional<data> service,
                                      std::optional<int64_t> port,
                                      std::optional<std::string> protocol)
  -> caf::expected<expression> {
  if (auto err = require_tcp(protocol)) {
    return err;
  }
  auto xs
    = std::vector<expression>{search_string("infos.service_product", product)};
  if (version) {
    xs.push_back(search_string("infos.service_version", *version));
  }
  if (service) {
    xs.push_back(search_string("infos.service_name", *service));
  }
  if (port) {
    xs.push_back(eq("port", *port));
  }
  return conjoin(std::move(xs));
}

auto passive_database::search_svc_hostname(const data& hostname)
  -> expression {
  return search_string("infos.service_hostname", hostname);
}

auto passive_database::search_mac(std::optional<data> mac, bool neg)
  -> expression {
  if (!mac) {
    auto result = eq("recontype", std::string{"MAC_ADDRESS"});
    return neg ? negate(std::move(result)) : result;
  }
  return conjoin({
    eq("recontype", std::string{"MAC_ADDRESS"}),
    search_string("value", *mac, neg),
  });
}

auto passive_database::search_user_agent(std::optional<data> useragent,
                                         bool neg)
  -> caf::expected<expression> {
  if (neg) {
    return caf::make_error(ec::invalid_argument,
                           "negated user-agent searches are not supported in "
                           "passive");
  }
  auto result = is_event_of("HTTP_CLIENT_HEADER", "USER-AGENT");
  if (!useragent) {
    return result;
  }
  return conjoin({std::move(result), search_string("value", *useragent)});
}

auto passive_database::search_dns(std::optional<data> name, bool reverse,
                                  std::optional<std::string> dnstype,
                                  bool subdomains) -> expression {
  auto xs = std::vector<expression>{eq("recontype", std::string{"DNS_ANSWER"})};
  if (name) {
    auto field = std::string{};
    if (subdomains) {
      field = reverse ? "infos.domaintarget" : "infos.domain";
    } else {
      field = reverse ? "targetval" : "value";
    }
    if (is<list>(*name)) {
      // The subdomain fields are lists, whose elements `in` tests one by one.
      xs.emplace_back(
        predicate{std::move(field), relational_operator::in, *name});
    } else if (subdomains) {
      xs.push_back(search_string_in_array(std::move(field), *name));
    } else {
      xs.push_back(search_string(std::move(field), *name));
    }
  }
  if (dnstype) {
    auto type = *dnstype;
    std::transform(type.begin(), type.end(), type.begin(), [](char c) {
      return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    xs.push_back(prefix_match("source", fmt::format("{}-", type)));
  }
  return conjoin(std::move(xs));
}

auto passive_database::search_cert(std::optional<std::string> keytype)
  -> expression {
  if (!keytype) {
    return certificate();
  }
  return conjoin({
    certificate(),
    eq("infos.pubkeyalgo", *keytype + "Encryption"),
  });
}

auto passive_database::search_ja3_client(std::optional<data> value_or_hash)
  -> caf::expected<expression> {
  auto base = is_event_of("SSL_CLIENT", "ja3");
  if (!value_or_hash) {
    return base;
  }
  auto hash = search_ja3(*value_or_hash);
  if (!hash) {
    return hash.error();
  }
  return conjoin({std::move(base), std::move(*hash)});
}

auto passive_database::search_ja3_server(
  std::optional<data> value_or_hash, std::optional<data> client_value_or_hash)
  -> caf::expected<expression> {
  auto xs = std::vector<expression>{eq("recontype", std::string{"SSL_SERVER"})};
  if (value_or_hash) {
    auto hash = search_ja3(*value_or_hash);
    if (!hash) {
      return hash.error();
    }
    xs.push_back(std::move(*hash));
  }
  if (!client_value_or_hash) {
    xs.push_back(prefix_match("source", "ja3-"));
    return conjoin(std::move(xs));
  }
  auto kv = ja3_key_value(*client_value_or_hash);
  if (!kv) {
    return kv.error();
  }
  auto& [key, value] = *kv;
  if (key == "md5") {
    xs.push_back(eq("source", fmt::format("ja3-{}", as<std::string>(value))));
    return conjoin(std::move(xs));
  }
  xs.push_back(prefix_match("source", "ja3-"));
  xs.push_back(search_string(join_path("infos.client", key), value));
  return conjoin(std::move(xs));
}

auto passive_database::search_ssh_key(std::optional<std::string> keytype)
  -> expression {
  auto base = is_event_of("SSH_SERVER_HOSTKEY", "SSHv2");
  if (!keytype) {
    return base;
  }
  return conjoin({std::move(base), eq("infos.algo", "ssh-" + *keytype)});
}

auto passive_database::search_cert_subject(const data& expr,
                                           std::optional<data> issuer)
  -> expression {
  auto xs = std::vector<expression>{
    certificate(),
    search_string("infos.subject_text", expr),
  };
  if (issuer) {
    xs.push_back(search_string("infos.issuer_text", *issuer));
  }
  return conjoin(std::move(xs));
}

auto passive_database::search_cert_issuer(const data& expr) -> expression {
  return conjoin({certificate(), search_string("infos.issuer_text", expr)});
}

auto passive_database::search_basic_auth() -> expression {
  return conjoin({
    search_http_auth(),
    prefix_match("value", "Basic", pattern_options{.case_insensitive = true}),
  });
}

auto passive_database::search_http_auth() -> expression {
  return conjoin({
    one_of("recontype", {"HTTP_CLIENT_HEADER", "HTTP_CLIENT_HEADER_SERVER"}),
    one_of("source", {"AUTHORIZATION", "PROXY-AUTHORIZATION"}),
  });
}

auto passive_database::search_ftp_auth() -> expression {
  return one_of("recontype", {"FTP_CLIENT", "FTP_SERVER"});
}

auto passive_database::search_pop_auth() -> expression {
  return one_of("recontype", {"POP_CLIENT", "POP_SERVER"});
}

auto passive_database::search_tcp_srv_banner(const data& banner)
  -> expression {
  return conjoin({
    eq("recontype", std::string{"TCP_SERVER_BANNER"}),
    search_string("value", banner),
  });
}

auto passive_database::search_time_ago(duration delta, bool neg, bool new_)
  -> expression {
  auto now = std::chrono::time_point_cast<duration>(
    std::chrono::system_clock::now());
  return predicate{new_ ? "firstseen" : "lastseen",
                   neg ? relational_operator::less
                       : relational_operator::greater_equal,
                   to_epoch_seconds(now - delta)};
}

auto passive_database::search_newer(const data& timestamp, bool neg,
                                    bool new_) -> caf::expected<expression> {
  auto epoch = to_epoch(timestamp);
  if (!epoch) {
    return epoch.error();
  }
  return predicate{new_ ? "firstseen" : "lastseen",
                   neg ? relational_operator::less_equal
                       : relational_operator::greater,
                   *epoch};
}

} // namespace recon
