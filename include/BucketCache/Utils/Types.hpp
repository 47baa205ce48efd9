/**
 * @file Types.hpp
 * @brief Short names for the standard types used across BucketCache.
 */

#pragma once

#include <array>         // std::array
#include <cstdint>       // std::{uint8_t, int32_t, int64_t}
#include <exception>     // std::exception
#include <functional>    // std::function
#include <memory>        // std::unique_ptr
#include <mutex>         // std::{mutex, lock_guard}
#include <optional>      // std::{optional, nullopt}
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map
#include <utility>       // std::pair
#include <vector>        // std::vector

#include "Definitions.hpp"

namespace bucketcache::utils::types {
  // Fixed-width integers. Timestamps and TTLs are i64 seconds.
  using u8    = std::uint8_t;
  using i32   = std::int32_t;
  using i64   = std::int64_t;
  using usize = std::size_t;
  using isize = std::ptrdiff_t;

  /// Owning string. Serialized BEVE payloads are stored in it as raw bytes.
  using String     = std::string;
  using StringView = std::string_view;
  using PCStr      = const char*;

  /// Return type of operations that produce nothing.
  using Unit = void;

  using Exception = std::exception;

  using Mutex     = std::mutex;
  using LockGuard = std::lock_guard<Mutex>;

  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename Tp>
  using Option = std::optional<Tp>;

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  /// Type-erased callable, used for producers and the engine clock.
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace bucketcache::utils::types
