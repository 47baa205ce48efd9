#pragma once

#include <chrono>                // std::chrono::seconds
#include <filesystem>            // std::filesystem::path
#include <toml++/impl/table.hpp> // toml::table

#include <BucketCache/Cache/CacheEngine.hpp>
#include <BucketCache/Cache/LocationInvalidator.hpp>
#include <BucketCache/Utils/Definitions.hpp>
#include <BucketCache/Utils/Logging.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::config {
  namespace {
    using utils::logging::LogLevel;
    using utils::types::String;
    using utils::types::Unit;
    using utils::types::Vec;

    namespace fs = std::filesystem;
  } // namespace

  /**
   * @struct CacheSettings
   * @brief Holds the [cache] configuration settings.
   */
  struct CacheSettings {
    fs::path             dataPath       = getDefaultDataPath();                         ///< Root of the cache directory tree.
    std::chrono::seconds defaultTtl     = cache::DEFAULT_TTL;                           ///< Lifetime of entries added without a TTL.
    String               propertyPrefix = String(cache::PropertyLayer::DEFAULT_PREFIX); ///< Prefix of the property slot names.
    Vec<String>          listTypes      = cache::DEFAULT_LIST_TYPES;                    ///< List types resolved to list ids on invalidation.

    /**
     * @brief Retrieves the default data directory.
     * @return `$XDG_DATA_HOME/bucketcache`, `$HOME/.local/share/bucketcache`
     * (`%LOCALAPPDATA%\bucketcache` on Windows), or `./bucketcache`.
     */
    static fn getDefaultDataPath() -> fs::path;

    /**
     * @brief Parses a TOML table to create a CacheSettings instance.
     * @param tbl The TOML table to parse, containing [cache].
     * @return A CacheSettings instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> CacheSettings;
  };

  /**
   * @struct LoggingSettings
   * @brief Holds the [logging] configuration settings.
   */
  struct LoggingSettings {
    LogLevel level = LogLevel::Info; ///< Minimum level that gets printed.

    static fn fromToml(const toml::table& tbl) -> LoggingSettings;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    CacheSettings   cache;
    LoggingSettings logging;

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The TOML table to parse, containing [cache] and [logging].
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Applies the BKC_DATA_PATH and BKC_LOG_LEVEL environment overrides.
     */
    fn applyEnvironment() -> Unit;

    /// Sets the runtime log level from the [logging] settings.
    fn applyLogLevel() const -> Unit;

    [[nodiscard]] fn toCacheOptions() const -> ::bucketcache::cache::CacheOptions;

    /**
     * @brief Loads the configuration from the first config.toml found.
     * @return The parsed configuration with environment overrides applied.
     *
     * Searches `$XDG_CONFIG_HOME/bucketcache/`, `$HOME/.config/bucketcache/`
     * and the working directory. When none exists a commented default file
     * is created in the first location. Parse failures fall back to defaults.
     */
    static fn getInstance() -> Config;
  };
} // namespace bucketcache::config
