#pragma once

#include <algorithm> // std::ranges::find

#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Array;
    using utils::types::Result;
    using utils::types::StringView;
  } // namespace

  inline constexpr StringView CACHE_COMMON     = "common";
  inline constexpr StringView CACHE_VIDEO_LIST = "video_list";
  inline constexpr StringView CACHE_SEASONS    = "seasons";
  inline constexpr StringView CACHE_EPISODES   = "episodes";
  inline constexpr StringView CACHE_METADATA   = "metadata";
  inline constexpr StringView CACHE_INFOLABELS = "infolabels";
  inline constexpr StringView CACHE_ARTINFO    = "artinfo";

  /// Reserved bucket. Stored as a single file in the data root, outside cache/.
  inline constexpr StringView CACHE_LIBRARY = "library";

  // clang-format off
  inline constexpr Array<StringView, 8> BUCKET_NAMES = {
    CACHE_COMMON,   CACHE_VIDEO_LIST, CACHE_SEASONS, CACHE_EPISODES,
    CACHE_METADATA, CACHE_INFOLABELS, CACHE_ARTINFO, CACHE_LIBRARY,
  };
  // clang-format on

  constexpr fn IsKnownBucket(const StringView name) -> bool {
    return std::ranges::find(BUCKET_NAMES, name) != BUCKET_NAMES.end();
  }

  constexpr fn IsReservedBucket(const StringView name) -> bool {
    return name == CACHE_LIBRARY;
  }

  /**
   * @brief Checks that a bucket name is registered.
   * @param name The bucket name supplied by the caller.
   * @return An UnknownCacheBucket error for unregistered names.
   */
  inline fn ValidateBucket(const StringView name) -> Result<> {
    using enum utils::error::BkcErrorCode;

    if (!IsKnownBucket(name))
      ERR_FMT(UnknownCacheBucket, "The requested cache bucket '{}' does not exist", name);

    return {};
  }
} // namespace bucketcache::cache
