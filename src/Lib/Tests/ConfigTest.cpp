#include <chrono>        // std::chrono::{hours, seconds}
#include <filesystem>    // std::filesystem::{exists, path, remove_all, temp_directory_path}
#include <toml++/toml.h> // toml::{parse, parse_result}

#include <BucketCache/Config/Config.hpp>

#include <BucketCache/Utils/Env.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Logging.hpp>
#include <BucketCache/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using namespace bucketcache::config;
using namespace bucketcache::utils::types;
using bucketcache::utils::env::GetEnv;
using bucketcache::utils::env::SetEnv;
using bucketcache::utils::env::UnsetEnv;
using bucketcache::utils::logging::LogLevel;

namespace fs = std::filesystem;

class ConfigTest : public Test {
 protected:
  fn SetUp() -> Unit override {
    ASSERT_TRUE(UnsetEnv("BKC_DATA_PATH"));
    ASSERT_TRUE(UnsetEnv("BKC_LOG_LEVEL"));
  }

  fn TearDown() -> Unit override {
    EXPECT_TRUE(UnsetEnv("BKC_DATA_PATH"));
    EXPECT_TRUE(UnsetEnv("BKC_LOG_LEVEL"));
  }
};

TEST_F(ConfigTest, Env_SetReadAndUnset) {
  ASSERT_TRUE(SetEnv("BKC_DATA_PATH", "/tmp/bucketcache"));

  const Result<String> value = GetEnv("BKC_DATA_PATH");
  ASSERT_TRUE(value);
  EXPECT_EQ(*value, "/tmp/bucketcache");

  ASSERT_TRUE(UnsetEnv("BKC_DATA_PATH"));

  const Result<String> unset = GetEnv("BKC_DATA_PATH");
  ASSERT_FALSE(unset);
  EXPECT_EQ(unset.error().code, bucketcache::utils::error::BkcErrorCode::NotFound);
}

TEST_F(ConfigTest, CacheFromToml_AllKeys) {
  toml::parse_result tbl = toml::parse(R"(
    data_path = "/var/lib/bucketcache"
    default_ttl = 600
    property_prefix = "addon"
    list_types = ["queue", "recommendations"]
  )");

  ASSERT_TRUE(tbl.is_table());
  const CacheSettings settings = CacheSettings::fromToml(*tbl.as_table());

  EXPECT_EQ(settings.dataPath, fs::path("/var/lib/bucketcache"));
  EXPECT_EQ(settings.defaultTtl, std::chrono::seconds(600));
  EXPECT_EQ(settings.propertyPrefix, "addon");
  ASSERT_EQ(settings.listTypes.size(), 2);
  EXPECT_EQ(settings.listTypes[1], "recommendations");
}

TEST_F(ConfigTest, CacheFromToml_Defaults) {
  toml::parse_result tbl = toml::parse(R"(
    # Nothing set
  )");

  ASSERT_TRUE(tbl.is_table());
  const CacheSettings settings = CacheSettings::fromToml(*tbl.as_table());

  EXPECT_EQ(settings.defaultTtl, std::chrono::hours(2));
  EXPECT_EQ(settings.propertyPrefix, "bkcmemcache");
  EXPECT_EQ(settings.listTypes, bucketcache::cache::DEFAULT_LIST_TYPES);
  EXPECT_FALSE(settings.dataPath.empty());
}

TEST_F(ConfigTest, CacheFromToml_NonPositiveTtlIsIgnored) {
  toml::parse_result tbl = toml::parse(R"(
    default_ttl = 0
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_EQ(CacheSettings::fromToml(*tbl.as_table()).defaultTtl, std::chrono::hours(2));
}

TEST_F(ConfigTest, CacheFromToml_NonStringListTypesAreSkipped) {
  toml::parse_result tbl = toml::parse(R"(
    list_types = ["queue", 42, "topTen"]
  )");

  ASSERT_TRUE(tbl.is_table());
  const CacheSettings settings = CacheSettings::fromToml(*tbl.as_table());

  EXPECT_EQ(settings.listTypes, (Vec<String> { "queue", "topTen" }));
}

TEST_F(ConfigTest, CacheFromToml_TildeExpandsToHome) {
  const Result<String> home = GetEnv("HOME");

  if (!home)
    GTEST_SKIP() << "HOME is not set";

  toml::parse_result tbl = toml::parse(R"(
    data_path = "~/.cache/bucketcache"
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_EQ(CacheSettings::fromToml(*tbl.as_table()).dataPath, fs::path(*home) / ".cache/bucketcache");
}

TEST_F(ConfigTest, LoggingFromToml_Level) {
  toml::parse_result tbl = toml::parse(R"(
    level = "debug"
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_EQ(LoggingSettings::fromToml(*tbl.as_table()).level, LogLevel::Debug);
}

TEST_F(ConfigTest, LoggingFromToml_UnknownLevelKeepsInfo) {
  toml::parse_result tbl = toml::parse(R"(
    level = "verbose"
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_EQ(LoggingSettings::fromToml(*tbl.as_table()).level, LogLevel::Info);
}

TEST_F(ConfigTest, Config_ParsesSections) {
  toml::parse_result tbl = toml::parse(R"(
    [cache]
    default_ttl = 30

    [logging]
    level = "warn"
  )");

  ASSERT_TRUE(tbl.is_table());
  const Config cfg(*tbl.as_table());

  EXPECT_EQ(cfg.cache.defaultTtl, std::chrono::seconds(30));
  EXPECT_EQ(cfg.logging.level, LogLevel::Warn);
}

TEST_F(ConfigTest, Config_EnvironmentOverrides) {
  toml::parse_result tbl = toml::parse(R"(
    [cache]
    data_path = "/from/file"

    [logging]
    level = "info"
  )");

  ASSERT_TRUE(tbl.is_table());
  Config cfg(*tbl.as_table());

  ASSERT_TRUE(SetEnv("BKC_DATA_PATH", "/from/env"));
  ASSERT_TRUE(SetEnv("BKC_LOG_LEVEL", "error"));

  cfg.applyEnvironment();

  EXPECT_EQ(cfg.cache.dataPath, fs::path("/from/env"));
  EXPECT_EQ(cfg.logging.level, LogLevel::Error);
}

TEST_F(ConfigTest, Config_UnknownEnvironmentLevelIsIgnored) {
  Config cfg;
  cfg.logging.level = LogLevel::Warn;

  ASSERT_TRUE(SetEnv("BKC_LOG_LEVEL", "loud"));

  cfg.applyEnvironment();

  EXPECT_EQ(cfg.logging.level, LogLevel::Warn);
}

TEST_F(ConfigTest, Config_ToCacheOptions) {
  toml::parse_result tbl = toml::parse(R"(
    [cache]
    data_path = "/srv/cache"
    default_ttl = 90
    property_prefix = "addon"
  )");

  ASSERT_TRUE(tbl.is_table());
  const bucketcache::cache::CacheOptions options = Config(*tbl.as_table()).toCacheOptions();

  EXPECT_EQ(options.dataPath, fs::path("/srv/cache"));
  EXPECT_EQ(options.defaultTtl, std::chrono::seconds(90));
  EXPECT_EQ(options.propertyPrefix, "addon");
  EXPECT_TRUE(options.clock);
}

TEST_F(ConfigTest, Config_ApplyLogLevel) {
  Config cfg;
  cfg.logging.level = LogLevel::Error;

  cfg.applyLogLevel();
  EXPECT_EQ(bucketcache::utils::logging::GetRuntimeLogLevel(), LogLevel::Error);

  bucketcache::utils::logging::SetRuntimeLogLevel(LogLevel::Info);
}

TEST_F(ConfigTest, GetInstance_CreatesDefaultFile) {
  const fs::path configHome = fs::temp_directory_path() / "bucketcache_config_home";
  fs::remove_all(configHome);

  const Result<String> previous = GetEnv("XDG_CONFIG_HOME");
  ASSERT_TRUE(SetEnv("XDG_CONFIG_HOME", configHome.string().c_str()));

  const Config cfg = Config::getInstance();

  EXPECT_TRUE(fs::exists(configHome / "bucketcache" / "config.toml"));
  EXPECT_EQ(cfg.cache.defaultTtl, std::chrono::hours(2));
  EXPECT_EQ(cfg.cache.propertyPrefix, "bkcmemcache");
  EXPECT_EQ(cfg.logging.level, LogLevel::Info);

  if (previous)
    EXPECT_TRUE(SetEnv("XDG_CONFIG_HOME", previous->c_str()));
  else
    EXPECT_TRUE(UnsetEnv("XDG_CONFIG_HOME"));

  fs::remove_all(configHome);
}
