#pragma once

#include <chrono>                // std::chrono::{seconds, hours}
#include <glaze/core/common.hpp> // glz::object
#include <glaze/core/meta.hpp>   // glz::meta

#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::i64;
    using utils::types::String;
    using utils::types::UnorderedMap;
  } // namespace

  /// TTL for entries that should effectively never expire (100 years).
  inline constexpr std::chrono::seconds TTL_INFINITE = std::chrono::hours(24 * 365 * 100);

  /**
   * @struct Entry
   * @brief A cached value together with its expiry instant.
   */
  struct Entry {
    String content; ///< BEVE-encoded value supplied by the caller.
    i64    eol = 0; ///< Expiry instant, seconds since the Unix epoch.

    /**
     * @brief Whether the entry has reached its end of life.
     * @param now Current time, seconds since the Unix epoch.
     */
    [[nodiscard]] constexpr fn isExpired(const i64 now) const -> bool {
      return now >= eol;
    }
  };

  /// Identifier -> Entry mapping of a single bucket.
  using Bucket = UnorderedMap<String, Entry>;
} // namespace bucketcache::cache

template <>
struct glz::meta<bucketcache::cache::Entry> {
  using T = bucketcache::cache::Entry;

  static constexpr auto value = object("content", &T::content, "eol", &T::eol);
};
