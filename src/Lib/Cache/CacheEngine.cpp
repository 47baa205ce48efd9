#include <BucketCache/Cache/CacheEngine.hpp>

#include <limits>  // std::numeric_limits
#include <utility> // std::move

namespace bucketcache::cache {
  namespace {
    using utils::types::Err;
    using utils::types::LockGuard;
    using utils::types::usize;

    using enum utils::error::BkcErrorCode;

    fn EffectiveTtl(const Option<seconds> requested, const seconds fallback) -> seconds {
      if (!requested || *requested == seconds::zero())
        return fallback;

      return *requested;
    }

    // Saturates instead of overflowing, so seconds::max() never expires.
    fn ExpiryFrom(const i64 now, const seconds ttl) -> i64 {
      constexpr i64 LATEST   = std::numeric_limits<i64>::max();
      constexpr i64 EARLIEST = std::numeric_limits<i64>::min();

      const i64 span = ttl.count();

      if (span > 0 && now > LATEST - span)
        return LATEST;

      if (span < 0 && now < EARLIEST - span)
        return EARLIEST;

      return now + span;
    }
  } // namespace

  CacheEngine::CacheEngine(CacheOptions options, IPropertyStore& properties)
    : m_options(std::move(options)),
      m_disk(m_options.dataPath),
      m_properties(properties, m_options.propertyPrefix),
      m_buckets(m_properties) {
    if (!m_options.clock)
      m_options.clock = [] { return system_clock::now(); };

    if (m_options.defaultTtl <= seconds::zero())
      m_options.defaultTtl = DEFAULT_TTL;
  }

  fn CacheEngine::init() -> Result<> {
    if (Result<> layout = m_disk.ensureLayout(); !layout)
      ERR_FROM(layout.error());

    debug_log("Cache directory layout ready under {}", m_disk.root().string());
    return {};
  }

  fn CacheEngine::now() const -> i64 {
    using std::chrono::duration_cast;

    return duration_cast<seconds>(m_options.clock().time_since_epoch()).count();
  }

  fn CacheEngine::getRaw(const StringView bucket, const StringView identifier) -> Result<String> {
    const LockGuard lock(m_cacheMutex);

    Result<Bucket*> resident = m_buckets.getBucket(bucket);

    if (!resident) {
      error_at(resident.error());
      ERR_FROM(resident.error());
    }

    Bucket&      contents = **resident;
    const Entry* entry    = nullptr;

    if (const auto iter = contents.find(String(identifier)); iter != contents.end())
      entry = &iter->second;
    else {
      Result<Entry> stored = m_disk.read(bucket, identifier);

      if (!stored) {
        if (stored.error().code == NotFound)
          debug_log("Cache miss on {} in {}", identifier, bucket);
        else
          debug_log("Could not load {} in {} from disk: {}", identifier, bucket, stored.error().message);

        ERR_FMT(CacheMiss, "Cache miss on {} in {}", identifier, bucket);
      }

      entry = &contents.insert_or_assign(String(identifier), std::move(*stored)).first->second;
    }

    if (entry->isExpired(now())) {
      debug_log("Cache entry {} in {} expired at {}", identifier, bucket, entry->eol);
      purge(bucket, identifier, contents);
      ERR_FMT(CacheMiss, "Cache entry {} in {} has expired", identifier, bucket);
    }

    debug_log("Cache hit on {} in {} (valid until {})", identifier, bucket, entry->eol);

    return entry->content;
  }

  fn CacheEngine::addRaw(
    const StringView      bucket,
    const StringView      identifier,
    String                content,
    const Option<seconds> ttl,
    const bool            toDisk
  ) -> Result<> {
    const LockGuard lock(m_cacheMutex);

    Result<Bucket*> resident = m_buckets.getBucket(bucket);

    if (!resident) {
      error_at(resident.error());
      ERR_FROM(resident.error());
    }

    Entry entry {
      .content = std::move(content),
      .eol     = ExpiryFrom(now(), EffectiveTtl(ttl, m_options.defaultTtl)),
    };

    if (toDisk)
      if (Result<> written = m_disk.write(bucket, identifier, entry); !written)
        error_at(written.error());

    (*resident)->insert_or_assign(String(identifier), std::move(entry));

    return {};
  }

  fn CacheEngine::invalidateEntry(const StringView bucket, const StringView identifier) -> Result<> {
    const LockGuard lock(m_cacheMutex);

    Result<Bucket*> resident = m_buckets.getBucket(bucket);

    if (!resident) {
      error_at(resident.error());
      ERR_FROM(resident.error());
    }

    purge(bucket, identifier, **resident);

    return {};
  }

  fn CacheEngine::forget(const StringView bucket, const StringView identifier) -> Unit {
    const LockGuard lock(m_cacheMutex);

    if (Result<Bucket*> resident = m_buckets.getBucket(bucket); resident && (*resident)->erase(String(identifier)) > 0)
      debug_log("Dropped {} in {} from memory", identifier, bucket);
  }

  fn CacheEngine::purge(const StringView bucket, const StringView identifier, Bucket& contents) -> Unit {
    const bool inMemory = contents.erase(String(identifier)) > 0;
    const bool onDisk   = m_disk.exists(bucket, identifier);

    if (onDisk)
      if (Result<> removed = m_disk.remove(bucket, identifier); !removed)
        error_at(removed.error());

    if (inMemory || onDisk)
      debug_log("Invalidated {} in {}", identifier, bucket);
    else
      debug_log("Nothing to invalidate for {} in {}", identifier, bucket);
  }

  fn CacheEngine::invalidateCache() -> Unit {
    const LockGuard lock(m_cacheMutex);

    for (const String& bucket : m_buckets.residentNames()) {
      if (Result<> cleared = m_properties.clear(bucket); !cleared)
        error_at(cleared.error());

      if (Result<> swept = m_disk.clearBucket(bucket); !swept)
        error_at(swept.error());
    }

    m_buckets.clear();

    info_log("Cache invalidated");
  }

  fn CacheEngine::commit() -> Unit {
    const LockGuard lock(m_cacheMutex);

    usize failures = 0;

    for (const auto& [bucket, contents] : m_buckets.resident())
      if (Result<> saved = m_properties.save(bucket, contents); !saved) {
        error_at(saved.error());
        ++failures;
      }

    if (failures == 0)
      debug_log("Persisted {} cache buckets to the property store", m_buckets.resident().size());
    else
      warn_log("Failed to persist {} of {} cache buckets", failures, m_buckets.resident().size());
  }

  fn CacheEngine::isResident(const StringView bucket) const -> bool {
    const LockGuard lock(m_cacheMutex);
    return m_buckets.isResident(bucket);
  }

  fn CacheEngine::residentBuckets() const -> Vec<String> {
    const LockGuard lock(m_cacheMutex);
    return m_buckets.residentNames();
  }
} // namespace bucketcache::cache
