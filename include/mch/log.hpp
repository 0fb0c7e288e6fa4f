/**
 * @file log.hpp
 * @brief Synchronous leveled logger with printf-style macros.
 *
 * Output format (stderr):
 *   [2026-10-19 12:00:00.123] [INFO] [Registry] channel 3 registered (main.cpp:42)
 *
 * Two filters apply:
 *   - compile time: MCH_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF) removes
 *     the call entirely,
 *   - run time: SetLevel() (default kDebug, or kInfo when NDEBUG is set).
 *
 * Header-only, no heap allocation, compatible with -fno-exceptions.
 */

#ifndef MCH_LOG_HPP_
#define MCH_LOG_HPP_

#include "mch/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(MCH_PLATFORM_LINUX) || defined(MCH_PLATFORM_MACOS)
#include <sys/time.h>
#endif

#ifndef MCH_LOG_MIN_LEVEL
#ifdef NDEBUG
#define MCH_LOG_MIN_LEVEL 1
#else
#define MCH_LOG_MIN_LEVEL 0
#endif
#endif

namespace mch {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

inline constexpr const char* LevelToString(Level level) noexcept {
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
      return "OFF";
  }
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...).
 * @return true and writes @p out when the name is recognized.
 */
inline bool LevelFromString(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static constexpr Level kLevels[] = {Level::kDebug, Level::kInfo,
                                      Level::kWarn,  Level::kError,
                                      Level::kFatal, Level::kOff};
  for (Level l : kLevels) {
    const char* ref = LevelToString(l);
    const char* a = name;
    const char* b = ref;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'a' && *a <= 'z') ? static_cast<char>(*a - 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = l;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Global State
// ============================================================================

namespace detail {

struct LogState {
  std::atomic<Level> level{
#ifdef NDEBUG
      Level::kInfo
#else
      Level::kDebug
#endif
  };
  std::atomic<bool> initialized{false};
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

/** @brief Mark the logger initialized (idempotent). */
inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

/** @brief Flush stderr and mark the logger uninitialized. */
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

// ============================================================================
// LogWrite
// ============================================================================

/**
 * @brief Format and write one log line to stderr.
 *
 * Messages longer than the internal buffer are truncated. A single fprintf
 * per line keeps concurrent lines from interleaving.
 */
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (level < GetLevel()) return;

  char msg[512];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  char ts[32] = "0000-00-00 00:00:00.000";
#if defined(MCH_PLATFORM_LINUX) || defined(MCH_PLATFORM_MACOS)
  struct timeval tv;
  if (::gettimeofday(&tv, nullptr) == 0) {
    struct tm tm_buf;
    time_t sec = tv.tv_sec;
    if (::localtime_r(&sec, &tm_buf) != nullptr) {
      size_t n = std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
      (void)std::snprintf(ts + n, sizeof(ts) - n, ".%03d",
                          static_cast<int>(tv.tv_usec / 1000));
    }
  }
#endif

  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     LevelToString(level),
                     category != nullptr ? category : "-", msg,
                     detail::Basename(file), line);

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace mch

// ============================================================================
// Macros
// ============================================================================

#if MCH_LOG_MIN_LEVEL <= 0
#define MCH_LOG_DEBUG(cat, ...) \
  ::mch::log::LogWrite(::mch::log::Level::kDebug, cat, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MCH_LOG_DEBUG(cat, ...) ((void)0)
#endif

#if MCH_LOG_MIN_LEVEL <= 1
#define MCH_LOG_INFO(cat, ...) \
  ::mch::log::LogWrite(::mch::log::Level::kInfo, cat, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MCH_LOG_INFO(cat, ...) ((void)0)
#endif

#if MCH_LOG_MIN_LEVEL <= 2
#define MCH_LOG_WARN(cat, ...) \
  ::mch::log::LogWrite(::mch::log::Level::kWarn, cat, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MCH_LOG_WARN(cat, ...) ((void)0)
#endif

#if MCH_LOG_MIN_LEVEL <= 3
#define MCH_LOG_ERROR(cat, ...) \
  ::mch::log::LogWrite(::mch::log::Level::kError, cat, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MCH_LOG_ERROR(cat, ...) ((void)0)
#endif

#define MCH_LOG_FATAL(cat, ...) \
  ::mch::log::LogWrite(::mch::log::Level::kFatal, cat, __FILE__, __LINE__, __VA_ARGS__)

#endif  // MCH_LOG_HPP_
