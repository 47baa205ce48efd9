#include <BucketCache/Cache/BucketStore.hpp>

#include <utility> // std::move

#include <BucketCache/Cache/Buckets.hpp>
#include <BucketCache/Utils/Logging.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Err;

    using enum utils::error::BkcErrorCode;
  } // namespace

  BucketStore::BucketStore(const PropertyLayer& properties)
    : m_properties(properties) {}

  fn BucketStore::getBucket(const StringView name) -> Result<Bucket*> {
    if (Result<> valid = ValidateBucket(name); !valid)
      ERR_FROM(valid.error());

    if (const auto iter = m_buckets.find(String(name)); iter != m_buckets.end())
      return &iter->second;

    Bucket contents;

    if (Result<Bucket> loaded = m_properties.load(name)) {
      debug_log("Loaded bucket {} from property slot {} ({} entries)", name, m_properties.slotName(name), loaded->size());
      contents = std::move(*loaded);
    } else if (loaded.error().code == NotFound)
      debug_log("No instance of {} found. Creating new instance...", name);
    else {
      warn_at(loaded.error());
      debug_log("Discarding unreadable instance of {}. Creating new instance...", name);
    }

    return &m_buckets.emplace(String(name), std::move(contents)).first->second;
  }

  fn BucketStore::isResident(const StringView name) const -> bool {
    return m_buckets.contains(String(name));
  }

  fn BucketStore::residentNames() const -> Vec<String> {
    Vec<String> names;
    names.reserve(m_buckets.size());

    for (const auto& [name, contents] : m_buckets)
      names.push_back(name);

    return names;
  }

  fn BucketStore::clear() -> void {
    m_buckets.clear();
  }
} // namespace bucketcache::cache
