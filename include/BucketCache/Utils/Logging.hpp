#pragma once

#include <atomic>                 // std::atomic
#include <chrono>                 // std::chrono::system_clock
#include <ctime>                  // localtime_r/s, time_t, tm
#include <filesystem>             // std::filesystem::path
#include <format>                 // std::{format, format_string}
#include <ftxui/screen/color.hpp> // ftxui::Color::Palette16
#include <source_location>        // std::source_location
#include <utility>                // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::println
#else
  #include <iostream> // std::cout
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace bucketcache::utils::logging {
  namespace {
    using types::Array;
    using types::i32;
    using types::LockGuard;
    using types::Mutex;
    using types::Option;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::usize;

    using Palette = ftxui::Color::Palette16;
  } // namespace

  /// ANSI escape sequences used to style terminal output.
  namespace ansi {
    inline constexpr StringView RESET      = "\033[0m";
    inline constexpr StringView BOLD_ON    = "\033[1m";
    inline constexpr StringView BOLD_OFF   = "\033[22m";
    inline constexpr StringView ITALIC_ON  = "\033[3m";
    inline constexpr StringView ITALIC_OFF = "\033[23m";

    /// 256-color foreground sequence for one of the 16 base palette entries.
    inline fn Foreground(const Palette color) -> String {
      return std::format("\033[38;5;{}m", static_cast<i32>(color));
    }
  } // namespace ansi

  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  struct LevelStyle {
    StringView label;
    Palette    color;
  };

  // Indexed by LogLevel. Labels are padded to a common width.
  inline constexpr Array<LevelStyle, 4> LEVEL_STYLES = { {
    { .label = "DEBUG", .color = Palette::Cyan },
    { .label = "INFO ", .color = Palette::Green },
    { .label = "WARN ", .color = Palette::Yellow },
    { .label = "ERROR", .color = Palette::Red },
  } };

  inline constexpr Palette DETAIL_COLOR = Palette::GrayLight;

  inline fn GetRuntimeLevelStore() -> std::atomic<LogLevel>& {
    static std::atomic<LogLevel> Level = LogLevel::Info;
    return Level;
  }

  /// Messages below this level are dropped.
  inline fn GetRuntimeLogLevel() -> LogLevel {
    return GetRuntimeLevelStore().load(std::memory_order_relaxed);
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLevelStore().store(level, std::memory_order_relaxed);
  }

  /**
   * @brief Parses a log level name as written in the config file or environment.
   * @param name One of "debug", "info", "warn", "error" (case-sensitive).
   * @return The matching level, or None for any other string.
   */
  inline fn ParseLogLevel(const StringView name) -> Option<LogLevel> {
    using matchit::match, matchit::is, matchit::_;
    using enum LogLevel;

    return match(name)(
      is | "debug" = Option<LogLevel>(Debug),
      is | "info"  = Option<LogLevel>(Info),
      is | "warn"  = Option<LogLevel>(Warn),
      is | "error" = Option<LogLevel>(Error),
      is | _       = Option<LogLevel>()
    );
  }

  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    return LEVEL_STYLES.at(static_cast<usize>(level)).label;
  }

  inline fn Colorize(const StringView text, const Palette color) -> String {
    return std::format("{}{}{}", ansi::Foreground(color), text, ansi::RESET);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", ansi::BOLD_ON, text, ansi::BOLD_OFF);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", ansi::ITALIC_ON, text, ansi::ITALIC_OFF);
  }

  namespace detail {
    inline fn GetLogMutex() -> Mutex& {
      static Mutex LogMutex;
      return LogMutex;
    }

    /// Local wall-clock time as HH:MM:SS, or "??:??:??" when the conversion fails.
    inline fn FormatTimestamp(const std::chrono::system_clock::time_point when) -> String {
      const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
      std::tm           local {};

#ifdef _WIN32
      const bool converted = localtime_s(&local, &seconds) == 0;
#else
      const bool converted = localtime_r(&seconds, &local) != nullptr;
#endif

      if (!converted)
        return "??:??:??";

      return std::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min, local.tm_sec);
    }

    inline fn WriteLine(const StringView line) -> void {
#ifdef __cpp_lib_print
      std::println("{}", line);
#else
      std::cout << line << '\n';
#endif
    }
  } // namespace detail

  /**
   * @brief Writes one log line: timestamp, colored level tag and message.
   *
   * Debug builds append the file and line of the call site.
   */
  template <typename... Args>
  fn LogImpl(const LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) -> void {
    if (level < GetRuntimeLogLevel())
      return;

    const LevelStyle& style = LEVEL_STYLES.at(static_cast<usize>(level));

    String line = std::format(
      "{} {} {}",
      Colorize(std::format("[{}]", detail::FormatTimestamp(std::chrono::system_clock::now())), DETAIL_COLOR),
      Bold(Colorize(style.label, style.color)),
      std::format(fmt, std::forward<Args>(args)...)
    );

#ifndef NDEBUG
    const String site = std::format("{}:{}", std::filesystem::path(loc.file_name()).filename().string(), loc.line());
    line += " " + Italic(Colorize(site, DETAIL_COLOR));
#else
    static_cast<void>(loc);
#endif

    const LockGuard lock(detail::GetLogMutex());
    detail::WriteLine(line);
  }

  /// Logs a BkcError as "[Code] message", attributed to the place it was raised.
  inline fn LogError(const LogLevel level, const error::BkcError& err) -> void {
    LogImpl(level, err.location, "[{}] {}", err.code, err.message);
  }
} // namespace bucketcache::utils::logging

#define debug_at(error_obj) ::bucketcache::utils::logging::LogError(::bucketcache::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::bucketcache::utils::logging::LogError(::bucketcache::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::bucketcache::utils::logging::LogError(::bucketcache::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::bucketcache::utils::logging::LogError(::bucketcache::utils::logging::LogLevel::Error, error_obj)

#define BKC_LOG(level, fmt, ...) \
  ::bucketcache::utils::logging::LogImpl(::bucketcache::utils::logging::LogLevel::level, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) BKC_LOG(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  BKC_LOG(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  BKC_LOG(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) BKC_LOG(Error, fmt __VA_OPT__(, ) __VA_ARGS__)
