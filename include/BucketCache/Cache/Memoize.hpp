#pragma once

#include <chrono>      // std::chrono::seconds
#include <format>      // std::{format, formattable}
#include <type_traits> // std::{is_same_v, type_identity_t}
#include <utility>     // std::{forward, move}

#include <BucketCache/Cache/CacheEngine.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Logging.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Err;
    using utils::types::Fn;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::UnorderedMap;
    using utils::types::usize;

    using std::chrono::seconds;
  } // namespace

  /**
   * @brief Named arguments of a memoized function.
   *
   * A memoized function that takes a KeywordArgs parameter can have its cache
   * identifier selected by name. KeywordArgs parameters are not counted as
   * positional arguments.
   */
  using KeywordArgs = UnorderedMap<String, String>;

  /**
   * @struct IdentifierSelector
   * @brief Chooses the cache identifier of a memoized call.
   */
  struct IdentifierSelector {
    Option<String> fixed;
    Option<String> keyword;
    Option<usize>  position;

    static fn Fixed(String identifier) -> IdentifierSelector {
      return { .fixed = std::move(identifier), .keyword = None, .position = None };
    }

    static fn Positional(const usize index) -> IdentifierSelector {
      return { .fixed = None, .keyword = None, .position = index };
    }

    /// Looks the identifier up by name, falling back to a positional argument when given one.
    static fn Named(String name, const Option<usize> fallback = None) -> IdentifierSelector {
      return { .fixed = None, .keyword = std::move(name), .position = fallback };
    }
  };

  struct MemoizeOptions {
    String             bucket;
    IdentifierSelector identifier;
    Option<seconds>    ttl    = None;
    bool               toDisk = false;
  };

  namespace detail {
    template <typename A>
    inline constexpr bool IS_KEYWORD_ARGS = std::is_same_v<A, KeywordArgs>;

    template <typename A>
    fn FormatIdentifier(const A& arg) -> Result<String> {
      using enum utils::error::BkcErrorCode;

      if constexpr (std::formattable<A, char>)
        return std::format("{}", arg);
      else
        ERR(ConfigurationError, "Argument cannot be formatted as a cache identifier");
    }

    template <typename... Args>
    fn FindKeyword(const String& name, const Args&... args) -> Option<String> {
      Option<String> value;

      const auto visit = [&]<typename A>(const A& arg) {
        if constexpr (IS_KEYWORD_ARGS<A>)
          if (!value)
            if (const auto iter = arg.find(name); iter != arg.end())
              value = iter->second;
      };

      (visit(args), ...);

      return value;
    }

    template <typename... Args>
    fn FormatPositional(const usize index, const Args&... args) -> Result<String> {
      using enum utils::error::BkcErrorCode;

      Option<Result<String>> found;
      usize                  position = 0;

      const auto visit = [&]<typename A>(const A& arg) {
        if constexpr (!IS_KEYWORD_ARGS<A>)
          if (position++ == index)
            found = FormatIdentifier(arg);
      };

      (visit(args), ...);

      if (!found)
        ERR_FMT(ConfigurationError, "Identifier position {} is out of range ({} positional arguments)", index, position);

      return *found;
    }
  } // namespace detail

  /**
   * @brief Resolves the cache identifier of a call.
   * @return The identifier, or a ConfigurationError when the selector does not
   * match the arguments.
   */
  template <typename... Args>
  fn ResolveIdentifier(const IdentifierSelector& selector, const Args&... args) -> Result<String> {
    using enum utils::error::BkcErrorCode;

    if (selector.fixed)
      return *selector.fixed;

    if (selector.keyword)
      if (Option<String> value = detail::FindKeyword(*selector.keyword, args...))
        return *value;

    if (selector.position)
      return detail::FormatPositional(*selector.position, args...);

    if (selector.keyword)
      ERR_FMT(ConfigurationError, "Keyword argument '{}' is missing and no positional fallback is set", *selector.keyword);

    ERR(ConfigurationError, "No cache identifier selector is set");
  }

  /**
   * @brief Wraps a producer so that its results are cached.
   *
   * The wrapper resolves the identifier from its arguments and returns the
   * cached value when there is one. Otherwise it calls the producer and stores
   * a successful result with the configured TTL. Producer errors are returned
   * without being cached; identifier errors are returned without calling the
   * producer.
   *
   * @tparam T The value type produced.
   * @tparam Args The argument types of the producer.
   * @param engine Must outlive the returned callable.
   *
   * @code
   * auto fetchSeasons = Memoize<Vec<String>, String>(
   *   engine,
   *   { .bucket = String(CACHE_SEASONS), .identifier = IdentifierSelector::Positional(0) },
   *   [](const String& showId) -> Result<Vec<String>> { return LoadSeasons(showId); }
   * );
   * @endcode
   */
  template <typename T, typename... Args>
  fn Memoize(
    CacheEngine&                                       engine,
    MemoizeOptions                                     options,
    std::type_identity_t<Fn<Result<T>(Args...)>> producer
  ) -> Fn<Result<T>(Args...)> {
    return [&engine, options = std::move(options), producer = std::move(producer)](Args... args) -> Result<T> {
      Result<String> identifier = ResolveIdentifier(options.identifier, args...);

      if (!identifier) {
        error_at(identifier.error());
        ERR_FROM(identifier.error());
      }

      return engine.getOrSet<T>(
        options.bucket,
        *identifier,
        [&]() -> Result<T> { return producer(std::forward<Args>(args)...); },
        options.ttl,
        options.toDisk
      );
    };
  }
} // namespace bucketcache::cache
