#include <BucketCache/Cache/LocationInvalidator.hpp>

#include <algorithm> // std::ranges::find
#include <utility>   // std::move

#include <BucketCache/Cache/Buckets.hpp>
#include <BucketCache/Utils/Logging.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::usize;

    constexpr StringView SEGMENT_VIDEO_LIST = "video_list";
    constexpr StringView SEGMENT_SHOW       = "show";

    constexpr usize MIN_SEGMENTS     = 3;
    constexpr usize SEASON_SEGMENTS  = 4;
    constexpr usize SEASON_ID_INDEX  = 4;
    constexpr usize ROUTE_INDEX      = 1;
    constexpr usize PRIMARY_ID_INDEX = 2;
  } // namespace

  fn SplitLocation(const StringView location) -> Vec<String> {
    Vec<String> segments;
    usize       start = 0;

    while (true) {
      const usize slash = location.find('/', start);

      if (slash == StringView::npos) {
        segments.emplace_back(location.substr(start));
        break;
      }

      segments.emplace_back(location.substr(start, slash - start));
      start = slash + 1;
    }

    return segments;
  }

  LocationInvalidator::LocationInvalidator(CacheEngine& engine, IListIdResolver& resolver, Vec<String> knownListTypes)
    : m_engine(engine), m_resolver(resolver), m_listTypes(std::move(knownListTypes)) {}

  fn LocationInvalidator::isListType(const StringView segment) const -> bool {
    return std::ranges::find(m_listTypes, segment) != m_listTypes.end();
  }

  fn LocationInvalidator::invalidateOne(const StringView bucket, const StringView identifier) -> Unit {
    if (Result<> result = m_engine.invalidateEntry(bucket, identifier); !result)
      error_at(result.error());
  }

  fn LocationInvalidator::invalidate(const Vec<String>& segments) -> Unit {
    const StringView route = segments.size() > ROUTE_INDEX ? StringView(segments[ROUTE_INDEX]) : StringView();

    if (route != SEGMENT_VIDEO_LIST && route != SEGMENT_SHOW) {
      debug_log("No cache entries to invalidate for location route '{}'", route);
      return;
    }

    if (segments.size() < MIN_SEGMENTS) {
      error_log("Cannot invalidate cache for {} location with {} segments", route, segments.size());
      return;
    }

    const String& primaryId = segments[PRIMARY_ID_INDEX];

    if (route == SEGMENT_VIDEO_LIST) {
      if (!isListType(primaryId)) {
        invalidateOne(CACHE_VIDEO_LIST, primaryId);
        return;
      }

      if (Result<String> listId = m_resolver.listIdForType(primaryId))
        invalidateOne(CACHE_VIDEO_LIST, *listId);
      else {
        warn_log("Could not resolve list id for list type {}", primaryId);
        error_at(listId.error());
      }

      invalidateOne(CACHE_COMMON, primaryId);
    } else if (segments.size() > SEASON_SEGMENTS)
      invalidateOne(CACHE_EPISODES, segments[SEASON_ID_INDEX]);
    else
      invalidateOne(CACHE_SEASONS, primaryId);
  }

  fn LocationInvalidator::invalidateLastLocation(const IHostLocation& host) -> Unit {
    const Option<String> location = host.lastLocation();

    if (!location) {
      debug_log("No last location recorded, nothing to invalidate");
      return;
    }

    debug_log("Invalidating cache for last location {}", *location);
    invalidate(SplitLocation(*location));
  }
} // namespace bucketcache::cache
