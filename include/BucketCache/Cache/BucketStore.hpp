#pragma once

#include <BucketCache/Cache/Entry.hpp>
#include <BucketCache/Cache/PropertyStore.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::UnorderedMap;
    using utils::types::Vec;
  } // namespace

  /**
   * @class BucketStore
   * @brief Resident buckets of one cache engine, loaded lazily from the property layer.
   */
  class BucketStore {
   public:
    explicit BucketStore(const PropertyLayer& properties);

    /**
     * @brief Returns the resident bucket, loading it on first access.
     * @param name A registered bucket name.
     * @return The bucket, or UnknownCacheBucket. A bucket that cannot be
     * loaded from the property layer starts out empty.
     */
    fn getBucket(StringView name) -> Result<Bucket*>;

    [[nodiscard]] fn isResident(StringView name) const -> bool;

    [[nodiscard]] fn residentNames() const -> Vec<String>;

    [[nodiscard]] fn resident() const -> const UnorderedMap<String, Bucket>& {
      return m_buckets;
    }

    /// Forgets every resident bucket.
    fn clear() -> void;

   private:
    const PropertyLayer&         m_properties;
    UnorderedMap<String, Bucket> m_buckets;
  };
} // namespace bucketcache::cache
