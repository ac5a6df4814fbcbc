/**
 * @file log.hpp
 * @brief Synchronous printf-style logging with runtime and compile-time
 *        level filtering.
 *
 * Output format (stderr):
 *   [2024-01-01 12:00:00.123] [INFO] [Provider] message (file.hpp:42)
 *
 * The source location is omitted in release (NDEBUG) builds.
 *
 * Compile-time configuration:
 *   PEERLINK_LOG_MIN_LEVEL -- statements below this level compile to nothing
 *                             (0=debug, 1=info, 2=warn, 3=error, 4=fatal)
 */

#ifndef PEERLINK_LOG_HPP_
#define PEERLINK_LOG_HPP_

#include "peerlink/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef PEERLINK_LOG_MIN_LEVEL
#define PEERLINK_LOG_MIN_LEVEL 0
#endif

namespace peerlink {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

struct LogState {
#ifdef NDEBUG
  std::atomic<Level> level{Level::kInfo};
#else
  std::atomic<Level> level{Level::kDebug};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);
  char date[32];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03d", date, static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "off").
 * @return Parsed level, or @p fallback for unknown names.
 */
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  if (std::strcmp(name, "debug") == 0) return Level::kDebug;
  if (std::strcmp(name, "info") == 0) return Level::kInfo;
  if (std::strcmp(name, "warn") == 0) return Level::kWarn;
  if (std::strcmp(name, "error") == 0) return Level::kError;
  if (std::strcmp(name, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(name, "off") == 0) return Level::kOff;
  return fallback;
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Init(Level level) noexcept {
  SetLevel(level);
  Init();
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (level < GetLevel()) return;

  char ts_buf[48];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::State().write_mutex);
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace peerlink

// ============================================================================
// Macros
// ============================================================================

#define PEERLINK_LOG_DEBUG(cat, fmt, ...)                                    \
  do {                                                                       \
    if (PEERLINK_LOG_MIN_LEVEL <= 0) {                                       \
      ::peerlink::log::LogWrite(::peerlink::log::Level::kDebug, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define PEERLINK_LOG_INFO(cat, fmt, ...)                                     \
  do {                                                                       \
    if (PEERLINK_LOG_MIN_LEVEL <= 1) {                                       \
      ::peerlink::log::LogWrite(::peerlink::log::Level::kInfo, cat,          \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define PEERLINK_LOG_WARN(cat, fmt, ...)                                     \
  do {                                                                       \
    if (PEERLINK_LOG_MIN_LEVEL <= 2) {                                       \
      ::peerlink::log::LogWrite(::peerlink::log::Level::kWarn, cat,          \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define PEERLINK_LOG_ERROR(cat, fmt, ...)                                    \
  do {                                                                       \
    if (PEERLINK_LOG_MIN_LEVEL <= 3) {                                       \
      ::peerlink::log::LogWrite(::peerlink::log::Level::kError, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                        \
  } while (0)

#define PEERLINK_LOG_FATAL(cat, fmt, ...)                                    \
  do {                                                                       \
    ::peerlink::log::LogWrite(::peerlink::log::Level::kFatal, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    std::abort();                                                            \
  } while (0)

#endif  // PEERLINK_LOG_HPP_
