//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "recon/configuration.hpp"

#include "recon/active.hpp"
#include "recon/error.hpp"
#include "recon/test/fixtures.hpp"
#include "recon/test/test.hpp"

#include <caf/settings.hpp>

#include <filesystem>
#include <fstream>

using namespace recon;

namespace {

auto get_int(const configuration& cfg, std::string_view key)
  -> std::optional<int64_t> {
  if (auto x = caf::get_if<caf::config_value::integer>(&cfg.content(), key)) {
    return *x;
  }
  return std::nullopt;
}

auto get_str(const configuration& cfg, std::string_view key)
  -> std::optional<std::string> {
  if (auto x = caf::get_if<std::string>(&cfg.content(), key)) {
    return *x;
  }
  return std::nullopt;
}

} // namespace

TEST("environment keys") {
  CHECK_EQUAL(unbox(to_config_key("RECON_FOO", "RECON")), "foo");
  CHECK_EQUAL(unbox(to_config_key("RECON_FOO_BAR", "RECON")), "foo-bar");
  CHECK_EQUAL(unbox(to_config_key("RECON_FOO__BAR", "RECON")), "foo.bar");
  CHECK_EQUAL(unbox(to_config_key("RECON_NET_MASK_DEFAULT", "RECON")),
              "net-mask-default");
  CHECK(!to_config_key("RECON_", "RECON"));
  CHECK(!to_config_key("RECONFOO", "RECON"));
  CHECK(!to_config_key("HOME", "RECON"));
}

TEST("YAML documents merge recursively") {
  auto cfg = configuration{};
  REQUIRE_SUCCESS(cfg.merge_yaml(R"__(
recon:
  top-values-default: 5
  console-verbosity: debug
)__"));
  REQUIRE_SUCCESS(cfg.merge_yaml(R"__(
recon:
  top-values-default: 20
)__"));
  CHECK_EQUAL(unbox(get_int(cfg, "recon.top-values-default")), int64_t{20});
  CHECK_EQUAL(unbox(get_str(cfg, "recon.console-verbosity")), "debug");
}

TEST("empty YAML documents change nothing") {
  auto cfg = configuration{};
  REQUIRE_SUCCESS(cfg.merge_yaml(""));
  CHECK(cfg.content().empty());
}

TEST("YAML documents must be maps") {
  auto cfg = configuration{};
  auto err = cfg.merge_yaml("- a\n- b\n");
  REQUIRE(err);
  CHECK_EQUAL(err, caf::make_error(ec::parse_error));
  err = cfg.merge_yaml("recon: [");
  CHECK(err);
}

TEST("the environment overrides files") {
  auto dir = std::filesystem::temp_directory_path() / "recon-config-test";
  std::filesystem::create_directories(dir);
  auto path = dir / "recon.yaml";
  {
    auto out = std::ofstream{path};
    out << "recon:\n  net-mask-default: 16\n  top-values-default: 5\n";
  }
  auto cfg = configuration{};
  REQUIRE_SUCCESS(cfg.merge_files({dir / "missing.yaml", path}));
  REQUIRE_EQUAL(cfg.files().size(), 1u);
  CHECK_EQUAL(cfg.files()[0], path);
  CHECK_EQUAL(unbox(get_int(cfg, "recon.net-mask-default")), int64_t{16});
  REQUIRE_SUCCESS(cfg.merge_environment({
    {"RECON_NET_MASK_DEFAULT", "20"},
    {"RECON_CONSOLE_VERBOSITY", "trace"},
    {"RECON_FILE_VERBOSITY", ""},
    {"PATH", "/usr/bin"},
  }));
  CHECK_EQUAL(unbox(get_int(cfg, "recon.net-mask-default")), int64_t{20});
  CHECK_EQUAL(unbox(get_int(cfg, "recon.top-values-default")), int64_t{5});
  CHECK_EQUAL(unbox(get_str(cfg, "recon.console-verbosity")), "trace");
  CHECK(!get_str(cfg, "recon.file-verbosity"));
  std::filesystem::remove_all(dir);
}

TEST("databases read their tunables") {
  auto db = nmap_database{std::make_shared<memory_backend>()};
  CHECK_EQUAL(db.options().top_n, 10u);
  CHECK_EQUAL(db.options().net_mask, 24);
  auto cfg = configuration{};
  REQUIRE_SUCCESS(cfg.merge_environment({
    {"RECON_TOP_VALUES_DEFAULT", "3"},
    {"RECON_NET_MASK_DEFAULT", "8"},
  }));
  REQUIRE_SUCCESS(db.configure(cfg.content()));
  CHECK_EQUAL(db.options().top_n, 3u);
  CHECK_EQUAL(db.options().net_mask, 8);
}

TEST("databases reject out-of-range tunables") {
  auto db = passive_database{std::make_shared<memory_backend>()};
  for (auto [key, value] : {std::pair{"RECON_TOP_VALUES_DEFAULT", "0"},
                            std::pair{"RECON_NET_MASK_DEFAULT", "40"},
                            std::pair{"RECON_NET_MASK_DEFAULT", "-1"}}) {
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.merge_environment({{key, value}}));
    auto err = db.configure(cfg.content());
    REQUIRE(err);
    CHECK_EQUAL(err, caf::make_error(ec::invalid_configuration));
  }
  CHECK_EQUAL(db.options().top_n, 10u);
}
