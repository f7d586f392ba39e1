//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/error.hpp"

#include "recon/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace recon {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "type_clash",
  "unsupported_operator",
  "parse_error",
  "convert_error",
  "invalid_query",
  "lookup_error",
  "logic_error",
  "invalid_argument",
  "invalid_configuration",
  "duplicate_entry",
  "storage_error",
  "no_such_file",
  "system_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i)) {
        oss << ctx.get_as<std::string>(i);
      } else {
        oss << caf::deep_to_string(ctx);
      }
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  RECON_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (!err) {
    return "";
  }
  std::ostringstream oss;
  oss << "!! ";
  switch (err.category()) {
    default:
      oss << "unknown";
      break;
    case caf::type_id_v<recon::ec>:
      oss << to_string(static_cast<recon::ec>(err.code()));
      break;
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      break;
  }
  render_default_ctx(oss, err.context());
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error) {
    return error;
  }
  if (!error.context()) {
    return caf::error{
      error.code(),
      error.category(),
      caf::make_message(std::move(str)),
    };
  }
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(error.context(), caf::make_message(std::move(str))),
  };
}

} // namespace recon
