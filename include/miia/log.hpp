/**
 * @file log.hpp
 * @brief Leveled, printf-style logging to stderr.
 *
 * Two filters apply to every statement:
 *   - MIIA_LOG_MIN_LEVEL  compile-time floor (0=Debug .. 4=Fatal); statements
 *                         below it compile to nothing.
 *   - SetLevel()          runtime threshold, default kDebug (kInfo with NDEBUG).
 *
 * Output format:
 *   [2026-10-19 20:01:02.345] [INFO] [session] port opened (serial_session.hpp:210)
 *
 * ERROR and FATAL flush stderr; FATAL aborts after writing.
 */

#ifndef MIIA_LOG_HPP_
#define MIIA_LOG_HPP_

#include "miia/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#if defined(MIIA_PLATFORM_POSIX)
#include <sys/time.h>
#include <time.h>
#endif

#ifndef MIIA_LOG_MIN_LEVEL
#define MIIA_LOG_MIN_LEVEL 0
#endif

namespace miia {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(MIIA_PLATFORM_POSIX)
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  const time_t sec = tv.tv_sec;
  ::localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "-");
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// Marks the logger ready. Logging before Init() still works (stderr is
/// always available); the flag lets applications check their own startup.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/// Parse "debug" / "info" / "warn" / "error" / "fatal" / "off".
/// @return true and writes @p out on a recognised name.
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"error", Level::kError},
      {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const auto& entry : kNames) {
    const char* a = name;
    const char* b = entry.name;
    while (*a != '\0' && *b != '\0') {
      const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);

  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
  if (level == Level::kFatal) {
    std::abort();
  }
}

MIIA_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace miia

// ============================================================================
// Macros
// ============================================================================

#define MIIA_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                       \
    if (MIIA_LOG_MIN_LEVEL <= 0) {                                           \
      ::miia::log::LogWrite(::miia::log::Level::kDebug, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define MIIA_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                       \
    if (MIIA_LOG_MIN_LEVEL <= 1) {                                           \
      ::miia::log::LogWrite(::miia::log::Level::kInfo, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define MIIA_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                       \
    if (MIIA_LOG_MIN_LEVEL <= 2) {                                           \
      ::miia::log::LogWrite(::miia::log::Level::kWarn, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define MIIA_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                       \
    if (MIIA_LOG_MIN_LEVEL <= 3) {                                           \
      ::miia::log::LogWrite(::miia::log::Level::kError, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define MIIA_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                       \
    ::miia::log::LogWrite(::miia::log::Level::kFatal, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                     \
  } while (0)

#endif  // MIIA_LOG_HPP_
