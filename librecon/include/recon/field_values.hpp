//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "recon/fwd.hpp"

#include "recon/data.hpp"
#include "recon/generator.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace recon {

/// A value extracted from a document together with the number of times it
/// counts towards an aggregation.
struct weighted_value {
  data value;
  int64_t weight = 1;
};

/// Resolves a dotted path against a document. Whenever the schema flags a
/// visited segment as a list, the traversal maps over its elements and
/// flattens the results into one sequence. Missing fields contribute nothing.
/// @param doc The document to traverse.
/// @param path The dotted path relative to *doc*.
/// @param s The schema that declares the list fields.
/// @param base The full path of *doc* within its top-level document.
/// @param expand_leaf_lists Whether a list at the end of the path yields its
///        elements rather than the list itself.
/// @returns A single-pass sequence of pointers into *doc*. *doc* and *path*
///          must outlive the returned generator.
auto field_values(const record& doc, std::string_view path, const schema& s,
                  std::string base = {}, bool expand_leaf_lists = true)
  -> generator<const data*>;

/// Like `field_values`, but pairs each value with the numeric value of
/// *count_field* (1 if absent). When *count_field* lies inside a list that the
/// traversal descends into, the weight comes from the same list element.
auto weighted_field_values(const record& doc, std::string_view path,
                           const schema& s, std::string_view count_field)
  -> generator<weighted_value>;

/// Like `field_values`, but pairs each value with a fixed weight.
auto weighted_field_values(const record& doc, std::string_view path,
                           const schema& s, int64_t weight)
  -> generator<weighted_value>;

} // namespace recon
