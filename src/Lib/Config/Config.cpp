#include <BucketCache/Config/Config.hpp>

#include <format>                    // std::{format, vformat, make_format_args}
#include <fstream>                   // std::ofstream
#include <system_error>              // std::error_code
#include <toml++/impl/array.hpp>     // toml::array
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/parser.hpp>    // toml::parse_file
#include <utility>                   // std::move

#include <BucketCache/Utils/Env.hpp>
#include <BucketCache/Utils/Error.hpp>

namespace bucketcache::config {
  namespace {
    using utils::env::GetEnv;
    using utils::logging::ParseLogLevel;
    using utils::types::Err;
    using utils::types::Exception;
    using utils::types::i64;
    using utils::types::Option;
    using utils::types::PCStr;
    using utils::types::Result;

    using enum utils::error::BkcErrorCode;

    constexpr PCStr CONFIG_FILE_NAME = "config.toml";

    constexpr PCStr DEFAULT_CONFIG_TEMPLATE = R"toml(# BucketCache Configuration File

[cache]
data_path = "{}"           # Root of the cache/ directory tree and library.ndb
default_ttl = {}           # Seconds an entry lives when added without a TTL
property_prefix = "{}"     # Prefix of the persisted bucket slots
# list_types = ["queue", "topTen", "netflixOriginals", "trendingNow", "newRelease", "popularTitles"]

[logging]
level = "info"             # debug | info | warn | error
)toml";

    fn ExpandHome(const String& path) -> fs::path {
      if (!path.starts_with("~/") && path != "~")
        return path;

      Result<String> home = GetEnv("HOME");

      if (!home) {
        warn_log("Cannot expand '~' in {}: HOME is not set", path);
        return path;
      }

      return fs::path(*home) / path.substr(path.size() > 1 ? 2 : 1);
    }

    fn GetConfigPath() -> fs::path {
      Vec<fs::path> possiblePaths;

#ifdef _WIN32
      if (Result<String> result = GetEnv("LOCALAPPDATA"))
        possiblePaths.emplace_back(fs::path(*result) / BKC_APP_DIR_NAME / CONFIG_FILE_NAME);

      if (Result<String> result = GetEnv("APPDATA"))
        possiblePaths.emplace_back(fs::path(*result) / BKC_APP_DIR_NAME / CONFIG_FILE_NAME);
#else
      if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
        possiblePaths.emplace_back(fs::path(*result) / BKC_APP_DIR_NAME / CONFIG_FILE_NAME);

      if (Result<String> result = GetEnv("HOME"))
        possiblePaths.emplace_back(fs::path(*result) / ".config" / BKC_APP_DIR_NAME / CONFIG_FILE_NAME);
#endif

      possiblePaths.emplace_back(fs::path(".") / CONFIG_FILE_NAME);

      for (const fs::path& path : possiblePaths)
        if (std::error_code errc; fs::exists(path, errc) && !errc)
          return path;

      return possiblePaths.front();
    }

    fn CreateDefaultConfig(const fs::path& configPath) -> Result<> {
      if (std::error_code errc; !fs::create_directories(configPath.parent_path(), errc) && errc)
        ERR_FROM(utils::error::BkcError(std::format("Failed to create config directory '{}'", configPath.parent_path().string()), errc));

      std::ofstream file(configPath);
      if (!file)
        ERR_FMT(IoError, "Failed to open config file for writing: {}", configPath.string());

      const CacheSettings defaults;

      const String dataPath = defaults.dataPath.generic_string();
      const i64    ttl      = defaults.defaultTtl.count();

      file << std::vformat(DEFAULT_CONFIG_TEMPLATE, std::make_format_args(dataPath, ttl, defaults.propertyPrefix));

      if (!file)
        ERR_FMT(IoError, "Failed to write to config file: {}", configPath.string());

      info_log("Created default config file at {}", configPath.string());
      return {};
    }
  } // namespace

  fn CacheSettings::getDefaultDataPath() -> fs::path {
#ifdef _WIN32
    if (Result<String> result = GetEnv("LOCALAPPDATA"))
      return fs::path(*result) / BKC_APP_DIR_NAME;
#else
    if (Result<String> result = GetEnv("XDG_DATA_HOME"))
      return fs::path(*result) / BKC_APP_DIR_NAME;

    if (Result<String> result = GetEnv("HOME"))
      return fs::path(*result) / ".local" / "share" / BKC_APP_DIR_NAME;
#endif

    return fs::path(".") / BKC_APP_DIR_NAME;
  }

  fn CacheSettings::fromToml(const toml::table& tbl) -> CacheSettings {
    CacheSettings settings;

    if (Option<String> dataPath = tbl["data_path"].value<String>(); dataPath && !dataPath->empty())
      settings.dataPath = ExpandHome(*dataPath);

    if (Option<i64> ttl = tbl["default_ttl"].value<i64>()) {
      if (*ttl > 0)
        settings.defaultTtl = std::chrono::seconds(*ttl);
      else
        warn_log("Ignoring non-positive default_ttl {}", *ttl);
    }

    if (Option<String> prefix = tbl["property_prefix"].value<String>(); prefix && !prefix->empty())
      settings.propertyPrefix = std::move(*prefix);

    if (const toml::array* listTypes = tbl["list_types"].as_array()) {
      Vec<String> parsed;

      for (const toml::node& node : *listTypes)
        if (Option<String> listType = node.value<String>())
          parsed.push_back(std::move(*listType));
        else
          warn_log("Ignoring non-string entry in list_types");

      settings.listTypes = std::move(parsed);
    }

    return settings;
  }

  fn LoggingSettings::fromToml(const toml::table& tbl) -> LoggingSettings {
    LoggingSettings settings;

    if (Option<String> level = tbl["level"].value<String>()) {
      if (Option<LogLevel> parsed = ParseLogLevel(*level))
        settings.level = *parsed;
      else
        warn_log("Unknown log level '{}', using info", *level);
    }

    return settings;
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view cacheTbl   = tbl["cache"];
    const toml::node_view loggingTbl = tbl["logging"];

    this->cache   = cacheTbl.is_table() ? CacheSettings::fromToml(*cacheTbl.as_table()) : CacheSettings {};
    this->logging = loggingTbl.is_table() ? LoggingSettings::fromToml(*loggingTbl.as_table()) : LoggingSettings {};
  }

  fn Config::applyEnvironment() -> Unit {
    if (Result<String> dataPath = GetEnv("BKC_DATA_PATH"); dataPath && !dataPath->empty()) {
      debug_log("Using data path {} from BKC_DATA_PATH", *dataPath);
      cache.dataPath = ExpandHome(*dataPath);
    }

    if (Result<String> level = GetEnv("BKC_LOG_LEVEL")) {
      if (Option<LogLevel> parsed = ParseLogLevel(*level))
        logging.level = *parsed;
      else
        warn_log("Ignoring unknown BKC_LOG_LEVEL '{}'", *level);
    }
  }

  fn Config::applyLogLevel() const -> Unit {
    utils::logging::SetRuntimeLogLevel(logging.level);
  }

  fn Config::toCacheOptions() const -> ::bucketcache::cache::CacheOptions {
    return {
      .dataPath       = cache.dataPath,
      .defaultTtl     = cache.defaultTtl,
      .propertyPrefix = cache.propertyPrefix,
    };
  }

  fn Config::getInstance() -> Config {
    Config cfg;

    const fs::path configPath = GetConfigPath();

    if (std::error_code errc; !fs::exists(configPath, errc) || errc) {
      info_log("Config file not found at {}, creating defaults.", configPath.string());

      if (Result<> created = CreateDefaultConfig(configPath); !created) {
        error_at(created.error());
        cfg.applyEnvironment();
        return cfg;
      }
    }

    try {
      const toml::table parsed = toml::parse_file(configPath.string());

      debug_log("Config loaded from {}", configPath.string());

      cfg = Config(parsed);
    } catch (const Exception& e) {
      error_log("Config loading failed: {}, using defaults", e.what());
    }

    cfg.applyEnvironment();
    return cfg;
  }
} // namespace bucketcache::config
