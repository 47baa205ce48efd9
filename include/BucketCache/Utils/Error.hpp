#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::{error_code, errc, generic_category}

#include "Definitions.hpp"
#include "Types.hpp"

namespace bucketcache::utils {
  namespace error {
    namespace {
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum BkcErrorCode
     * @brief Error categories reported by the cache and its storage backends.
     */
    enum class BkcErrorCode : u8 {
      CacheMiss,          ///< No valid entry exists for the requested (bucket, identifier).
      UnknownCacheBucket, ///< The bucket name is not one of the registered buckets.
      ConfigurationError, ///< Invalid cache or memoization configuration.
      InternalError,      ///< An error occurred within the cache's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or method.
      IoError,            ///< General I/O error (filesystem, property store).
      NotFound,           ///< A required resource (file, property slot) was not found.
      Other,              ///< A generic or unclassified error originating from an external library.
      ParseError,         ///< Failed to deserialize stored data.
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
      PlatformSpecific,   ///< An unmapped error specific to the underlying OS platform occurred (check message).
    };

    /**
     * @struct BkcError
     * @brief Holds structured information about a cache error.
     *
     * Used as the error type in Result throughout the library.
     */
    struct BkcError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      BkcErrorCode         code;     ///< The general category of the error.

      BkcError(const BkcErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      /**
       * @brief Builds an error from a std::error_code, as reported by std::filesystem.
       * @param context Prefix describing the failed operation.
       * @param errc The error code to translate.
       */
      BkcError(const String& context, const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(std::format("{}: {}", context, errc.message())), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum BkcErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error, no_space_on_device, read_only_file_system)    = IoError,
          is | or_(invalid_argument, filename_too_long)                                    = InvalidArgument,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | or_(permission_denied, operation_not_permitted)                             = PermissionDenied,
          is | _                                                                           = errc.category() == std::generic_category() ? InternalError : PlatformSpecific
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::BkcError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::BkcError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace bucketcache::utils

namespace std {
  template <>
  struct formatter<::bucketcache::utils::error::BkcErrorCode> : formatter<::bucketcache::utils::types::StringView> {
    template <typename FormatContext>
    fn format(bucketcache::utils::error::BkcErrorCode code, FormatContext& ctx) const {
      using enum bucketcache::utils::error::BkcErrorCode;
      using matchit::match, matchit::is, matchit::_;

      bucketcache::utils::types::StringView name = match(code)(
        is | CacheMiss          = "CacheMiss",
        is | UnknownCacheBucket = "UnknownCacheBucket",
        is | ConfigurationError = "ConfigurationError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NotFound           = "NotFound",
        is | Other              = "Other",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | PlatformSpecific   = "PlatformSpecific",
        is | _                  = "Unknown"
      );

      return formatter<bucketcache::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::bucketcache::utils::types::Err(::bucketcache::utils::error::BkcError(errc, msg))
#define ERR_FROM(err)           return ::bucketcache::utils::types::Err(err)
#define ERR_FMT(errc, fmt, ...) return ::bucketcache::utils::types::Err(::bucketcache::utils::error::BkcError(errc, std::format(fmt, __VA_ARGS__)))
