#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv, _dupenv_s, _putenv_s, free

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace bucketcache::utils::env {
  namespace {
    using types::i32;
    using types::PCStr;
    using types::Result;
    using types::String;

    using enum error::BkcErrorCode;
  } // namespace

  /**
   * @brief Reads an environment variable.
   * @return A copy of the value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char*        raw  = nullptr;
    types::usize size = 0;

    if (_dupenv_s(&raw, &size, name) != 0)
      ERR_FMT(PermissionDenied, "Cannot read environment variable '{}'", name);

    const types::UniquePointer<char, decltype(&free)> owned(raw, free);

    if (!owned)
      ERR_FMT(NotFound, "Environment variable '{}' is not set", name);

    return String(owned.get());
#else
    if (const PCStr value = std::getenv(name))
      return String(value);

    ERR_FMT(NotFound, "Environment variable '{}' is not set", name);
#endif
  }

  /// Sets or replaces an environment variable of this process.
  [[nodiscard]] inline fn SetEnv(const PCStr name, const PCStr value) -> Result<> {
#ifdef _WIN32
    const i32 status = _putenv_s(name, value);
#else
    const i32 status = setenv(name, value, 1);
#endif

    if (status != 0)
      ERR_FMT(InvalidArgument, "Cannot set environment variable '{}'", name);

    return {};
  }

  /// Removes an environment variable of this process. Unset variables are not an error.
  [[nodiscard]] inline fn UnsetEnv(const PCStr name) -> Result<> {
#ifdef _WIN32
    const i32 status = _putenv_s(name, "");
#else
    const i32 status = unsetenv(name);
#endif

    if (status != 0)
      ERR_FMT(InvalidArgument, "Cannot unset environment variable '{}'", name);

    return {};
  }
} // namespace bucketcache::utils::env
