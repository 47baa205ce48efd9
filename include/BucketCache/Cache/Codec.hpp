#pragma once

#include <format>                 // std::format
#include <glaze/beve/read.hpp>    // glz::read_beve
#include <glaze/beve/write.hpp>   // glz::write_beve
#include <glaze/core/context.hpp> // glz::{error_code, error_ctx}
#include <type_traits>            // std::is_default_constructible_v

#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::error::BkcError;
    using utils::types::Err;
    using utils::types::i32;
    using utils::types::Result;
    using utils::types::String;
  } // namespace

  /**
   * @brief Serializes a value to a BEVE buffer.
   * @tparam T The type of the value. Must be Glaze-compatible.
   * @param value The value to serialize.
   * @return The encoded buffer, or a ParseError if Glaze rejects the value.
   */
  template <typename T>
  fn Encode(const T& value) -> Result<String> {
    using enum utils::error::BkcErrorCode;

    String buffer;

    if (glz::error_ctx glazeErr = glz::write_beve(value, buffer); glazeErr)
      return Err(BkcError(ParseError, std::format("BEVE serialization error (code {})", static_cast<i32>(glazeErr.ec))));

    return buffer;
  }

  /**
   * @brief Deserializes a value from a BEVE buffer.
   * @tparam T The type of the value. Must be Glaze-compatible and default constructible.
   * @param buffer The encoded buffer.
   * @return The decoded value, or a ParseError for empty or malformed input.
   */
  template <typename T>
  fn Decode(const String& buffer) -> Result<T> {
    using enum utils::error::BkcErrorCode;

    static_assert(std::is_default_constructible_v<T>, "Cached type T must be default constructible for Glaze.");

    if (buffer.empty())
      return Err(BkcError(ParseError, "BEVE buffer is empty"));

    T result {};

    if (glz::error_ctx glazeErr = glz::read_beve(result, buffer); glazeErr.ec != glz::error_code::none)
      return Err(BkcError(ParseError, std::format("BEVE parse error (code {}): {}", static_cast<i32>(glazeErr.ec), glz::format_error(glazeErr, buffer))));

    return result;
  }
} // namespace bucketcache::cache
