//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2021 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/schema.hpp"

namespace recon {

schema::schema(std::initializer_list<std::string_view> list_fields) {
  list_fields_.reserve(list_fields.size());
  for (auto field : list_fields) {
    list_fields_.emplace(field);
  }
}

auto schema::hosts() -> const schema& {
  static const auto result = schema{
    "categories",
    "cpes",
    "hostnames",
    "hostnames.domains",
    "openports.tcp.ports",
    "openports.udp.ports",
    "os.osclass",
    "os.osclass.cpe",
    "os.osmatch",
    "os.portsused",
    "ports",
    "ports.screenwords",
    "ports.scripts",
    "ports.scripts.http-headers",
    "ports.scripts.http-user-agent",
    "ports.scripts.ike-info.transforms",
    "ports.scripts.ike-info.vendor_ids",
    "ports.scripts.ls.volumes",
    "ports.scripts.ls.volumes.files",
    "ports.scripts.mongodb-databases.databases",
    "ports.scripts.mongodb-databases.databases.shards",
    "ports.scripts.rpcinfo",
    "ports.scripts.rpcinfo.version",
    "ports.scripts.smb-enum-shares.shares",
    "ports.scripts.ssh-hostkey",
    "ports.scripts.ssl-ja3-client",
    "ports.scripts.ssl-ja3-server",
    "ports.scripts.vulns",
    "ports.scripts.vulns.check_results",
    "ports.scripts.vulns.description",
    "ports.scripts.vulns.extra_info",
    "ports.scripts.vulns.ids",
    "ports.scripts.vulns.refs",
    "scanid",
    "traces",
    "traces.hops",
  };
  return result;
}

auto schema::passive() -> const schema& {
  static const auto result = schema{
    "infos.domain",
    "infos.domaintarget",
    "infos.san",
  };
  return result;
}

auto schema::is_list(std::string_view path) const -> bool {
  return list_fields_.find(std::string{path}) != list_fields_.end();
}

auto join_path(std::string_view base, std::string_view field) -> std::string {
  if (base.empty()) {
    return std::string{field};
  }
  auto result = std::string{base};
  result += '.';
  result += field;
  return result;
}

} // namespace recon
