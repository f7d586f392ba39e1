//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/database.hpp"

#include "recon/codec.hpp"
#include "recon/error.hpp"
#include "recon/field_values.hpp"
#include "recon/logger.hpp"
#include "recon/projection.hpp"
#include "recon/schema.hpp"
#include "recon/subnet.hpp"

#include <caf/settings.hpp>
#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <algorithm>
#include <array>

namespace recon {

database::database(std::shared_ptr<backend> store, std::string name,
                   const schema& s)
  : backend_{std::move(store)}, name_{std::move(name)}, schema_{&s} {
  RECON_ASSERT(backend_ != nullptr);
}

auto database::configure(const caf::settings& cfg) -> caf::error {
  if (auto x = caf::get_if<caf::config_value::integer>(
        &cfg, "recon.top-values-default")) {
    if (*x <= 0) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("recon.top-values-default must be "
                                         "positive, got {}",
                                         *x));
    }
    options_.top_n = static_cast<size_t>(*x);
  }
  if (auto x = caf::get_if<caf::config_value::integer>(
        &cfg, "recon.net-mask-default")) {
    if (*x < 0 || *x > 32) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("recon.net-mask-default must be "
                                         "within [0, 32], got {}",
                                         *x));
    }
    options_.net_mask = static_cast<int>(*x);
  }
  RECON_VERBOSE("{} uses top-n {} and net mask {}", name_, options_.top_n,
                options_.net_mask);
  return caf::none;
}

auto database::handle() -> caf::expected<std::shared_ptr<collection>> {
  if (!handle_) {
    auto opened = backend_->open(name_, *schema_);
    if (!opened) {
      return add_context(opened.error(), "failed to open collection {}",
                         name_);
    }
    handle_ = std::move(*opened);
  }
  return handle_;
}

void database::invalidate_cache() {
  RECON_DEBUG("{} releases its collection handle", name_);
  handle_.reset();
}

auto database::init() -> caf::error {
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  return (*coll)->purge();
}

auto database::count(const expression& filter) -> caf::expected<size_t> {
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  return (*coll)->count(filter);
}

auto database::fetch(const expression& filter, const query_options& opts)
  -> caf::expected<std::vector<document>> {
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  auto docs = (*coll)->search(filter);
  if (!docs) {
    return docs.error();
  }
  if (!opts.sort.empty()) {
    std::stable_sort(docs->begin(), docs->end(),
                     [&](const document& x, const document& y) {
                       return compare(x.content, y.content, opts.sort) < 0;
                     });
  }
  auto skip = std::min(opts.skip.value_or(0), docs->size());
  docs->erase(docs->begin(),
              docs->begin() + static_cast<std::ptrdiff_t>(skip));
  if (opts.limit && *opts.limit < docs->size()) {
    docs->erase(docs->begin() + static_cast<std::ptrdiff_t>(*opts.limit),
                docs->end());
  }
  if (opts.fields) {
    for (auto& doc : *docs) {
      doc.content = project(doc.content, *opts.fields, *schema_);
    }
  }
  return docs;
}

auto database::from_internal(document doc) const -> caf::expected<record> {
  return std::move(doc.content);
}

auto database::get(const expression& filter, const query_options& opts)
  -> caf::expected<std::vector<record>> {
  auto docs = fetch(filter, opts);
  if (!docs) {
    return docs.error();
  }
  auto result = std::vector<record>{};
  result.reserve(docs->size());
  for (auto& doc : *docs) {
    auto rec = from_internal(std::move(doc));
    if (!rec) {
      return rec.error();
    }
    result.push_back(std::move(*rec));
  }
  RECON_TRACE("{} returns {} records for {}", name_, result.size(), filter);
  return result;
}

auto database::distinct(std::string_view field, const expression& filter,
                        query_options opts) -> caf::expected<list> {
  opts.fields = std::vector<std::string>{std::string{field}};
  auto records = get(conjoin({filter, exists(std::string{field})}), opts);
  if (!records) {
    return records.error();
  }
  auto seen = tsl::robin_set<data>{};
  auto result = list{};
  for (const auto& rec : *records) {
    for (const auto* x : field_values(rec, field, *schema_)) {
      if (seen.insert(*x).second) {
        result.push_back(*x);
      }
    }
  }
  return result;
}

auto database::remove(document_id id) -> caf::expected<size_t> {
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  auto ids = std::array{id};
  auto removed = (*coll)->remove(std::span<const document_id>{ids});
  if (removed) {
    RECON_DEBUG("{} removed document {}", name_, id);
  }
  return removed;
}

auto database::remove(const expression& filter) -> caf::expected<size_t> {
  auto coll = handle();
  if (!coll) {
    return coll.error();
  }
  auto removed = (*coll)->remove(filter);
  if (removed) {
    RECON_DEBUG("{} removed {} documents matching {}", name_, *removed,
                filter);
  }
  return removed;
}

auto database::top_values_impl(const pseudo_field& field,
                               const expression& filter, size_t top_n,
                               const query_options& opts)
  -> caf::expected<std::vector<value_count>> {
  auto shaped = opts;
  if (!field.fields.empty()) {
    shaped.fields = field.fields;
  }
  auto records = get(conjoin({filter, field.filter}), shaped);
  if (!records) {
    return records.error();
  }
  auto index = tsl::robin_map<data, size_t>{};
  auto result = std::vector<value_count>{};
  for (const auto& rec : *records) {
    for (auto& x : field.extractor(rec)) {
      auto [it, inserted] = index.try_emplace(x.value, result.size());
      if (inserted) {
        result.push_back(value_count{x.value, x.weight});
      } else {
        result[it->second].count += x.weight;
      }
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const value_count& x, const value_count& y) {
                     return x.count > y.count;
                   });
  if (result.size() > top_n) {
    result.erase(result.begin() + static_cast<std::ptrdiff_t>(top_n),
                 result.end());
  }
  if (field.output) {
    for (auto& x : result) {
      x.value = field.output(std::move(x.value));
    }
  }
  RECON_DEBUG("{} counted {} top values", name_, result.size());
  return result;
}

auto database::port_tuples(
  const expression& filter, std::vector<std::string> fields,
  const std::function<void(const record&, list&)>& extract, bool yield_all)
  -> caf::expected<list> {
  auto opts = query_options{};
  opts.fields = std::move(fields);
  auto records = get(filter, opts);
  if (!records) {
    return records.error();
  }
  auto seen = tsl::robin_set<data>{};
  auto result = list{};
  auto tuples = list{};
  for (const auto& rec : *records) {
    tuples.clear();
    extract(rec, tuples);
    for (auto& tuple : tuples) {
      if (seen.insert(tuple).second) {
        result.push_back(std::move(tuple));
      }
    }
  }
  if (!yield_all) {
    std::sort(result.begin(), result.end());
  }
  return result;
}

// -- generic filters ----------------------------------------------------------

auto database::search_nonexistent() -> expression {
  return constant{false};
}

auto database::search_object_id(const data& oid, bool neg) -> expression {
  auto id = std::string{defaults::db::id_field};
  if (is<list>(oid)) {
    return predicate{std::move(id),
                     neg ? relational_operator::not_in
                         : relational_operator::in,
                     oid};
  }
  return predicate{std::move(id),
                   neg ? relational_operator::not_equal
                       : relational_operator::equal,
                   oid};
}

auto database::search_version(std::optional<int64_t> version) -> expression {
  if (!version) {
    return exists("schema_version");
  }
  return predicate{"schema_version", relational_operator::equal, *version};
}

auto database::search_host(std::string_view addr, bool neg)
  -> caf::expected<expression> {
  auto x = ip_to_internal(addr);
  if (!x) {
    return x.error();
  }
  return predicate{"addr",
                   neg ? relational_operator::not_equal
                       : relational_operator::equal,
                   *x};
}

auto database::search_hosts(std::span<const std::string> addrs, bool neg)
  -> caf::expected<expression> {
  auto xs = list{};
  xs.reserve(addrs.size());
  for (const auto& addr : addrs) {
    auto x = ip_to_internal(addr);
    if (!x) {
      return x.error();
    }
    xs.emplace_back(*x);
  }
  auto result = expression{
    predicate{"addr", relational_operator::in, std::move(xs)}};
  return neg ? negate(std::move(result)) : result;
}

namespace {

auto address_range(ip start, ip stop, bool neg) -> expression {
  auto result = conjoin({
    predicate{"addr", relational_operator::greater_equal, start},
    predicate{"addr", relational_operator::less_equal, stop},
  });
  return neg ? negate(std::move(result)) : result;
}

} // namespace

auto database::search_range(std::string_view start, std::string_view stop,
                            bool neg) -> caf::expected<expression> {
  auto first = ip_to_internal(start);
  if (!first) {
    return first.error();
  }
  auto last = ip_to_internal(stop);
  if (!last) {
    return last.error();
  }
  return address_range(*first, *last, neg);
}

auto database::search_net(std::string_view net, bool neg)
  -> caf::expected<expression> {
  auto sn = subnet::parse(net);
  if (!sn) {
    return sn.error();
  }
  return address_range(sn->network(), sn->broadcast(), neg);
}

auto database::search_ipv4() -> expression {
  return address_range(ip::v4(uint32_t{0}), ip::v4(uint32_t{0xffffffff}),
                       false);
}

auto database::search_ipv6() -> expression {
  return conjoin({exists("addr"), negate(search_ipv4())});
}

auto database::search_val(std::string field, data value) -> expression {
  return predicate{std::move(field), relational_operator::equal,
                   std::move(value)};
}

auto database::search_cmp(std::string field, data value, std::string_view op)
  -> caf::expected<expression> {
  auto parsed = parse_relational_operator(op);
  if (!parsed || *parsed == relational_operator::equal
      || *parsed == relational_operator::not_equal) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("unknown operator '{}' for key '{}' "
                                       "and value {}",
                                       op, field, value));
  }
  return predicate{std::move(field), *parsed, std::move(value)};
}

auto database::flt_and(std::vector<expression> xs) -> expression {
  return conjoin(std::move(xs));
}

auto database::flt_or(std::vector<expression> xs) -> expression {
  return disjoin(std::move(xs));
}

auto database::flt2str(const expression& x) -> std::string {
  return fmt::format("{}", x);
}

} // namespace recon
