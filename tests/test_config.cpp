/**
 * @file test_config.cpp
 * @brief Tests for the `key = value` configuration loader.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "poolsync/config/config_loader.hpp"
#include "poolsync/config/constants.hpp"

using namespace std::chrono_literals;
using poolsync::config::ConfigErrc;
using poolsync::config::Loader;
namespace constants = poolsync::config::constants;

TEST(ConfigLoader, Defaults_FromConstants) {
  const auto cfg = Loader::defaults();
  EXPECT_EQ(cfg.updater.drain_interval, std::chrono::milliseconds(constants::DRAIN_INTERVAL_MS_DEFAULT));
  EXPECT_EQ(cfg.updater.drain_interval, 30s);
  EXPECT_EQ(cfg.updater.skip_unchanged_pools, constants::SKIP_UNCHANGED_POOLS_DEFAULT);
  EXPECT_EQ(cfg.updater.validate_routes, constants::VALIDATE_ROUTES_DEFAULT);
  EXPECT_EQ(cfg.emit_events, constants::EMIT_EVENTS_DEFAULT);
}

TEST(ConfigLoader, Parse_EmptyText_IsDefaults) {
  const auto cfg = Loader::parse("");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->updater.drain_interval, 30s);
}

TEST(ConfigLoader, Parse_AllKeys_WithComments) {
  const auto cfg = Loader::parse(
      "# reconciler settings\n"
      "drain_interval_ms = 250\n"
      "\n"
      "skip_unchanged_pools = no   # always write\n"
      "  validate_routes=false\r\n"
      "emit_events = 0\n");
  ASSERT_TRUE(cfg.has_value()) << cfg.error().to_string();
  EXPECT_EQ(cfg->updater.drain_interval, 250ms);
  EXPECT_FALSE(cfg->updater.skip_unchanged_pools);
  EXPECT_FALSE(cfg->updater.validate_routes);
  EXPECT_FALSE(cfg->emit_events);
}

TEST(ConfigLoader, Parse_UnknownKey_ReportsLine) {
  const auto cfg = Loader::parse("emit_events = yes\nretry_count = 3\n");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::UnknownKey);
  EXPECT_EQ(cfg.error().line, 2u);
  EXPECT_EQ(cfg.error().to_string(), "unknown key at line 2: retry_count");
}

TEST(ConfigLoader, Parse_InvalidValues) {
  for (const char* text : {"drain_interval_ms = 0", "drain_interval_ms = -5", "drain_interval_ms = 10x",
                           "drain_interval_ms =", "validate_routes = maybe"}) {
    const auto cfg = Loader::parse(text);
    ASSERT_FALSE(cfg.has_value()) << text;
    EXPECT_EQ(cfg.error().code, ConfigErrc::InvalidValue) << text;
    EXPECT_EQ(cfg.error().line, 1u);
  }
}

TEST(ConfigLoader, Parse_MalformedLines) {
  auto cfg = Loader::parse("drain_interval_ms 100\n");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::MalformedLine);

  cfg = Loader::parse("# ok\n = 5\n");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::MalformedLine);
  EXPECT_EQ(cfg.error().line, 2u);
}

TEST(ConfigLoader, LoadFromFile_Missing) {
  const auto cfg = Loader::load_from_file("/nonexistent/poolsync.conf");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::FileUnreadable);
  EXPECT_EQ(cfg.error().line, 0u);
}

TEST(ConfigLoader, LoadFromFile_ReadsKeys) {
  const std::string path = ::testing::TempDir() + "poolsync_test.conf";
  {
    std::ofstream out(path);
    ASSERT_TRUE(out.good());
    out << "drain_interval_ms = 1500\nvalidate_routes = true\n";
  }
  const auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());

  ASSERT_TRUE(cfg.has_value()) << cfg.error().to_string();
  EXPECT_EQ(cfg->updater.drain_interval, 1500ms);
  EXPECT_TRUE(cfg->updater.validate_routes);
}
