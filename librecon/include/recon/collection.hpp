//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/aliases.hpp"
#include "recon/data.hpp"
#include "recon/expression.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <tsl/robin_map.h>

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/// A stored document together with the identifier that its collection
/// assigned on insertion.
struct document {
  document_id id = 0;
  record content;
};

/// The storage collaborator: a named set of documents that evaluates
/// expressions. Implementations decide how and where documents persist.
class collection {
public:
  virtual ~collection() noexcept = default;

  /// @returns the name of the collection.
  [[nodiscard]] virtual auto name() const -> std::string_view = 0;

  /// Returns all documents that match a filter, in insertion order.
  virtual auto search(const expression& filter)
    -> caf::expected<std::vector<document>>
    = 0;

  /// Counts the documents that match a filter.
  virtual auto count(const expression& filter) -> caf::expected<size_t> = 0;

  /// Stores a new document.
  /// @returns the identifier of the new document.
  virtual auto insert(record doc) -> caf::expected<document_id> = 0;

  /// Removes all documents that match a filter.
  /// @returns the number of removed documents.
  virtual auto remove(const expression& filter) -> caf::expected<size_t> = 0;

  /// Removes documents by identifier.
  /// @returns the number of removed documents.
  virtual auto remove(std::span<const document_id> ids)
    -> caf::expected<size_t>
    = 0;

  /// Applies a transformation in place to the given documents.
  virtual auto update(const std::function<void(record&)>& transform,
                      std::span<const document_id> ids) -> caf::error
    = 0;

  /// Merges the fields of *doc* into every document that matches *match*, or
  /// inserts *doc* if none does.
  /// @returns the identifier of the first updated or the inserted document.
  virtual auto upsert(record doc, const expression& match)
    -> caf::expected<document_id>
    = 0;

  /// Removes all documents.
  virtual auto purge() -> caf::error = 0;
};

/// A collection that keeps its documents in memory and evaluates filters
/// with the schema-aware evaluator.
class memory_collection final : public collection {
public:
  /// The documents behind a collection. Handles to the same collection share
  /// the storage.
  struct storage {
    std::vector<document> documents;
    document_id next_id = 1;
  };

  memory_collection(std::string name, const schema& s,
                    std::shared_ptr<storage> store);

  [[nodiscard]] auto name() const -> std::string_view override;

  auto search(const expression& filter)
    -> caf::expected<std::vector<document>> override;

  auto count(const expression& filter) -> caf::expected<size_t> override;

  auto insert(record doc) -> caf::expected<document_id> override;

  auto remove(const expression& filter) -> caf::expected<size_t> override;

  auto remove(std::span<const document_id> ids)
    -> caf::expected<size_t> override;

  auto update(const std::function<void(record&)>& transform,
              std::span<const document_id> ids) -> caf::error override;

  auto upsert(record doc, const expression& match)
    -> caf::expected<document_id> override;

  auto purge() -> caf::error override;

private:
  std::string name_;
  const schema* schema_;
  std::shared_ptr<storage> store_;
};

/// Hands out collections by name.
class backend {
public:
  virtual ~backend() noexcept = default;

  /// Opens a handle to the named collection.
  /// @param name The collection name.
  /// @param s The schema of the documents in the collection.
  virtual auto open(std::string_view name, const schema& s)
    -> caf::expected<std::shared_ptr<collection>>
    = 0;
};

/// A backend that keeps collections in memory. The documents outlive the
/// handles, so a reopened collection sees everything stored before.
class memory_backend final : public backend {
public:
  auto open(std::string_view name, const schema& s)
    -> caf::expected<std::shared_ptr<collection>> override;

  /// @returns the number of handles opened so far.
  [[nodiscard]] auto opened() const -> size_t {
    return opened_;
  }

private:
  tsl::robin_map<std::string, std::shared_ptr<memory_collection::storage>>
    stores_;
  size_t opened_ = 0;
};

} // namespace recon
