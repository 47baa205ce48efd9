#pragma once

#include <BucketCache/Cache/CacheEngine.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @class IListIdResolver
   * @brief Host lookup of the video list id behind a list type such as "queue".
   */
  class IListIdResolver {
   public:
    IListIdResolver(const IListIdResolver&) = delete;
    IListIdResolver(IListIdResolver&&)      = delete;

    fn operator=(const IListIdResolver&)->IListIdResolver& = delete;
    fn operator=(IListIdResolver&&)->IListIdResolver&      = delete;

    virtual ~IListIdResolver() = default;

    virtual fn listIdForType(StringView listType) -> Result<String> = 0;

   protected:
    IListIdResolver() = default;
  };

  /**
   * @class IHostLocation
   * @brief Host record of the last location the user navigated to.
   */
  class IHostLocation {
   public:
    IHostLocation(const IHostLocation&) = delete;
    IHostLocation(IHostLocation&&)      = delete;

    fn operator=(const IHostLocation&)->IHostLocation& = delete;
    fn operator=(IHostLocation&&)->IHostLocation&      = delete;

    virtual ~IHostLocation() = default;

    /// The last location as a `/`-separated path, or None when nothing was visited.
    [[nodiscard]] virtual fn lastLocation() const -> Option<String> = 0;

   protected:
    IHostLocation() = default;
  };

  /**
   * @brief Splits a location path on every `/`.
   * @note Empty segments are kept, so "/video_list/queue" yields {"", "video_list", "queue"}.
   */
  fn SplitLocation(StringView location) -> Vec<String>;

  inline const Vec<String> DEFAULT_LIST_TYPES = {
    "queue", "topTen", "netflixOriginals", "trendingNow", "newRelease", "popularTitles",
  };

  /**
   * @class LocationInvalidator
   * @brief Invalidates the cache entries behind the last visited location so
   * that revisiting it shows fresh data.
   */
  class LocationInvalidator {
   public:
    LocationInvalidator(CacheEngine& engine, IListIdResolver& resolver, Vec<String> knownListTypes = DEFAULT_LIST_TYPES);

    /**
     * @brief Invalidates the entries for a location given as path segments.
     *
     * - `<x>/video_list/<listType>`: the resolved list and the list type entry in common.
     * - `<x>/video_list/<listId>`: that list.
     * - `<x>/show/<showId>`: the seasons of the show.
     * - `<x>/show/<showId>/<y>/<seasonId>`: the episodes of the season.
     *
     * Other routes are ignored. A video_list or show location without an id is logged as an error.
     */
    fn invalidate(const Vec<String>& segments) -> Unit;

    /// Reads the last location from the host and invalidates it.
    fn invalidateLastLocation(const IHostLocation& host) -> Unit;

    [[nodiscard]] fn isListType(StringView segment) const -> bool;

   private:
    fn invalidateOne(StringView bucket, StringView identifier) -> Unit;

    CacheEngine&     m_engine;
    IListIdResolver& m_resolver;
    Vec<String>      m_listTypes;
  };
} // namespace bucketcache::cache
