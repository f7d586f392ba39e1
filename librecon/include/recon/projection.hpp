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

#include <span>
#include <string>

namespace recon {

/// Prunes a document to the requested dotted paths. A request for a field
/// copies its whole subtree and absorbs requests for paths below it. Lists
/// that the schema declares are projected element by element. Fields that do
/// not exist are omitted, and the document's `_id` is always kept.
/// @param doc The document to project.
/// @param fields The requested dotted paths.
/// @param s The schema of *doc*.
auto project(const record& doc, std::span<const std::string> fields,
             const schema& s) -> record;

} // namespace recon
