//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace recon::detail {

// Mixins that derive the remaining relational operators from `operator<`. The
// inequality operator comes for free with C++20 rewritten candidates.

template <class T, class U = T>
struct less_than_comparable {
  friend auto operator>(const T& x, const U& y) -> bool {
    return y < x;
  }

  friend auto operator<=(const T& x, const U& y) -> bool {
    return !(y < x);
  }

  friend auto operator>=(const T& x, const U& y) -> bool {
    return !(x < y);
  }
};

template <class T, class U = T>
struct totally_ordered : less_than_comparable<T, U> {};

} // namespace recon::detail
