#pragma once

#include <chrono>      // std::chrono::{hours, seconds, system_clock}
#include <filesystem>  // std::filesystem::path
#include <type_traits> // std::type_identity_t

#include <BucketCache/Cache/BucketStore.hpp>
#include <BucketCache/Cache/Codec.hpp>
#include <BucketCache/Cache/DiskStore.hpp>
#include <BucketCache/Cache/Entry.hpp>
#include <BucketCache/Cache/PropertyStore.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Logging.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Fn;
    using utils::types::i64;
    using utils::types::Mutex;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
    using utils::types::Vec;

    using std::chrono::seconds;
    using std::chrono::system_clock;

    namespace fs = std::filesystem;
  } // namespace

  /// Default entry lifetime when neither the caller nor the config supplies one.
  inline constexpr seconds DEFAULT_TTL = std::chrono::hours(2);

  using ClockFn = Fn<system_clock::time_point()>;

  /**
   * @struct CacheOptions
   * @brief Construction parameters of a CacheEngine.
   */
  struct CacheOptions {
    fs::path dataPath;                                                 ///< Root of the cache/ tree and of library.ndb.
    seconds  defaultTtl     = DEFAULT_TTL;                             ///< TTL used when add() gets none.
    String   propertyPrefix = String(PropertyLayer::DEFAULT_PREFIX); ///< Prefix of the property slot names.
    ClockFn  clock          = [] { return system_clock::now(); };     ///< Source of the current time.
  };

  /**
   * @class CacheEngine
   * @brief Two-tier TTL cache over named buckets.
   *
   * Entries live in resident in-memory buckets and, when added with `toDisk`,
   * in one file per entry. Whole buckets are written to the host property
   * store only by commit(). Construct one engine per process, call init()
   * at startup and commit() at shutdown.
   *
   * Storage faults never surface as errors from get() or add(): failed reads
   * are misses and failed writes are logged.
   */
  class CacheEngine {
   public:
    CacheEngine(CacheOptions options, IPropertyStore& properties);

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine(CacheEngine&&)      = delete;

    fn operator=(const CacheEngine&)->CacheEngine& = delete;
    fn operator=(CacheEngine&&)->CacheEngine&      = delete;

    ~CacheEngine() = default;

    /**
     * @brief Creates the on-disk directory layout.
     * @return The first directory that could not be created, if any.
     */
    fn init() -> Result<>;

    /**
     * @brief Retrieves the serialized content of an entry.
     *
     * Looks in the resident bucket first, then on disk; entries found on disk
     * are promoted into memory with their stored end of life. Expired entries
     * are purged from both tiers.
     *
     * @return The content, CacheMiss, or UnknownCacheBucket.
     */
    fn getRaw(StringView bucket, StringView identifier) -> Result<String>;

    /**
     * @brief Retrieves and decodes an entry.
     * @tparam T The type the content was added as.
     * @return The value, CacheMiss, or UnknownCacheBucket. Content that does
     * not decode as T is dropped from memory and reported as CacheMiss; its
     * disk file is left in place.
     */
    template <typename T>
    fn get(const StringView bucket, const StringView identifier) -> Result<T> {
      using enum utils::error::BkcErrorCode;

      Result<String> content = getRaw(bucket, identifier);
      if (!content)
        ERR_FROM(content.error());

      Result<T> decoded = Decode<T>(*content);

      if (!decoded) {
        warn_log("Cache entry {} in {} is unreadable: {}", identifier, bucket, decoded.error().message);
        forget(bucket, identifier);
        ERR_FMT(CacheMiss, "Cache entry {} in {} is unreadable", identifier, bucket);
      }

      return decoded;
    }

    /**
     * @brief Inserts or overwrites an entry with already-serialized content.
     * @param ttl Lifetime of the entry; None or zero selects the default TTL.
     * @param toDisk Whether to also write the entry file.
     * @return UnknownCacheBucket for unregistered buckets. Disk failures are logged only.
     */
    fn addRaw(StringView bucket, StringView identifier, String content, Option<seconds> ttl = None, bool toDisk = false) -> Result<>;

    template <typename T>
    fn add(
      const StringView      bucket,
      const StringView      identifier,
      const T&              content,
      const Option<seconds> ttl    = None,
      const bool            toDisk = false
    ) -> Result<> {
      Result<String> encoded = Encode(content);
      if (!encoded)
        ERR_FROM(encoded.error());

      return addRaw(bucket, identifier, std::move(*encoded), ttl, toDisk);
    }

    /**
     * @brief Returns the cached value or computes, stores and returns it.
     * @param fetcher Called on CacheMiss only. Its errors are returned as-is and nothing is stored.
     */
    template <typename T>
    fn getOrSet(
      const StringView                      bucket,
      const StringView                      identifier,
      const std::type_identity_t<Fn<Result<T>()>>& fetcher,
      const Option<seconds>                 ttl    = None,
      const bool                            toDisk = false
    ) -> Result<T> {
      using enum utils::error::BkcErrorCode;

      if (Result<T> cached = get<T>(bucket, identifier))
        return cached;
      else if (cached.error().code != CacheMiss)
        ERR_FROM(cached.error());

      Result<T> fetched = fetcher();

      if (!fetched)
        return fetched;

      if (Result<> stored = add(bucket, identifier, *fetched, ttl, toDisk); !stored)
        warn_at(stored.error());

      return fetched;
    }

    /**
     * @brief Removes an entry from memory and deletes its file.
     * @return Success when the entry was absent; UnknownCacheBucket for unregistered buckets.
     */
    fn invalidateEntry(StringView bucket, StringView identifier) -> Result<>;

    /**
     * @brief Clears every resident bucket, its property slot and its entry files.
     * @note Buckets that were never loaded in this process keep their files.
     */
    fn invalidateCache() -> Unit;

    /**
     * @brief Writes every resident bucket to its property slot.
     */
    fn commit() -> Unit;

    [[nodiscard]] fn isResident(StringView bucket) const -> bool;

    [[nodiscard]] fn residentBuckets() const -> Vec<String>;

    /// Current time in whole seconds since the Unix epoch, from the configured clock.
    [[nodiscard]] fn now() const -> i64;

    [[nodiscard]] fn options() const -> const CacheOptions& {
      return m_options;
    }

    [[nodiscard]] fn diskStore() const -> const DiskStore& {
      return m_disk;
    }

   private:
    /// Drops an entry from its resident bucket only.
    fn forget(StringView bucket, StringView identifier) -> Unit;

    /// Removes an entry from a resident bucket and from disk. Caller holds the lock.
    fn purge(StringView bucket, StringView identifier, Bucket& contents) -> Unit;

    CacheOptions  m_options;
    DiskStore     m_disk;
    PropertyLayer m_properties;
    BucketStore   m_buckets;
    mutable Mutex m_cacheMutex;
  };
} // namespace bucketcache::cache
