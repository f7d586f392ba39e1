//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/collection.hpp"

#include "recon/error.hpp"
#include "recon/logger.hpp"
#include "recon/schema.hpp"

#include <algorithm>

namespace recon {

memory_collection::memory_collection(std::string name, const schema& s,
                                     std::shared_ptr<storage> store)
  : name_{std::move(name)}, schema_{&s}, store_{std::move(store)} {
  RECON_ASSERT(store_ != nullptr);
}

auto memory_collection::name() const -> std::string_view {
  return name_;
}

auto memory_collection::search(const expression& filter)
  -> caf::expected<std::vector<document>> {
  auto result = std::vector<document>{};
  for (const auto& doc : store_->documents) {
    if (evaluate(filter, doc.content, *schema_)) {
      result.push_back(doc);
    }
  }
  RECON_TRACE("{} found {} documents matching {}", name_, result.size(),
              filter);
  return result;
}

auto memory_collection::count(const expression& filter)
  -> caf::expected<size_t> {
  return static_cast<size_t>(
    std::count_if(store_->documents.begin(), store_->documents.end(),
                  [&](const document& doc) {
                    return evaluate(filter, doc.content, *schema_);
                  }));
}

auto memory_collection::insert(record doc) -> caf::expected<document_id> {
  auto id = store_->next_id++;
  store_->documents.push_back(document{id, std::move(doc)});
  RECON_TRACE("{} inserted document {}", name_, id);
  return id;
}

auto memory_collection::remove(const expression& filter)
  -> caf::expected<size_t> {
  auto& docs = store_->documents;
  auto n = docs.size();
  std::erase_if(docs, [&](const document& doc) {
    return evaluate(filter, doc.content, *schema_);
  });
  return n - docs.size();
}

auto memory_collection::remove(std::span<const document_id> ids)
  -> caf::expected<size_t> {
  auto& docs = store_->documents;
  auto n = docs.size();
  std::erase_if(docs, [&](const document& doc) {
    return std::find(ids.begin(), ids.end(), doc.id) != ids.end();
  });
  return n - docs.size();
}

auto memory_collection::update(const std::function<void(record&)>& transform,
                               std::span<const document_id> ids)
  -> caf::error {
  for (auto id : ids) {
    auto it = std::find_if(store_->documents.begin(), store_->documents.end(),
                           [&](const document& doc) {
                             return doc.id == id;
                           });
    if (it == store_->documents.end()) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("{} has no document {}", name_, id));
    }
    transform(it->content);
  }
  return caf::none;
}

auto memory_collection::upsert(record doc, const expression& match)
  -> caf::expected<document_id> {
  auto first = std::optional<document_id>{};
  for (auto& existing : store_->documents) {
    if (!evaluate(match, existing.content, *schema_)) {
      continue;
    }
    for (const auto& [k, v] : doc) {
      existing.content.insert_or_assign(k, v);
    }
    if (!first) {
      first = existing.id;
    }
  }
  if (first) {
    return *first;
  }
  return insert(std::move(doc));
}

auto memory_collection::purge() -> caf::error {
  RECON_DEBUG("{} purges {} documents", name_, store_->documents.size());
  store_->documents.clear();
  return caf::none;
}

auto memory_backend::open(std::string_view name, const schema& s)
  -> caf::expected<std::shared_ptr<collection>> {
  auto key = std::string{name};
  auto it = stores_.find(key);
  if (it == stores_.end()) {
    it = stores_
           .emplace(key, std::make_shared<memory_collection::storage>())
           .first;
  }
  ++opened_;
  RECON_DEBUG("opened collection {}", name);
  return std::make_shared<memory_collection>(std::move(key), s, it->second);
}

} // namespace recon
