/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Synchronous, category-tagged printf-style logging to stderr.
 *
 * Two level gates:
 *   - LANXFER_LOG_MIN_LEVEL  compile-time floor (0=DEBUG .. 4=FATAL)
 *   - log::SetLevel()        runtime threshold
 *
 * Line format:
 *   [2024-01-01 12:00:00.123] [INFO] [Transport] message (file.hpp:42)
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_LOG_HPP_
#define LANXFER_LOG_HPP_

#include "lanxfer/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <strings.h>
#include <sys/time.h>

#ifndef LANXFER_LOG_MIN_LEVEL
#define LANXFER_LOG_MIN_LEVEL 0
#endif

#ifndef LANXFER_LOG_LINE_SIZE
#define LANXFER_LOG_LINE_SIZE 512U
#endif

namespace lanxfer {
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

/// Serializes whole lines so concurrent threads never interleave output.
inline std::mutex& SinkMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  timeval tv{};
  ::gettimeofday(&tv, nullptr);
  std::tm tm_buf{};
  time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld",
                      static_cast<long>(tv.tv_usec / 1000));
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

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return true and sets out on success, false on unknown name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"warning", Level::kWarn},
                {"error", Level::kError}, {"fatal", Level::kFatal},
                {"off", Level::kOff}};
  for (const auto& entry : kNames) {
    if (::strcasecmp(entry.name, name) == 0) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

/** @brief Mark the logger ready. Safe to call more than once. */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and mark the logger shut down. */
inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::SinkMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[LANXFER_LOG_LINE_SIZE];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::SinkMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (level != Level::kFatal &&
      static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
  if (level == Level::kFatal) {
    std::abort();
  }
}

}  // namespace log
}  // namespace lanxfer

// ============================================================================
// Macros
// ============================================================================

#define LANXFER_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (LANXFER_LOG_MIN_LEVEL <= 0) {                                      \
      ::lanxfer::log::LogWrite(::lanxfer::log::Level::kDebug, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LANXFER_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (LANXFER_LOG_MIN_LEVEL <= 1) {                                      \
      ::lanxfer::log::LogWrite(::lanxfer::log::Level::kInfo, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LANXFER_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (LANXFER_LOG_MIN_LEVEL <= 2) {                                      \
      ::lanxfer::log::LogWrite(::lanxfer::log::Level::kWarn, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LANXFER_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                     \
    if (LANXFER_LOG_MIN_LEVEL <= 3) {                                      \
      ::lanxfer::log::LogWrite(::lanxfer::log::Level::kError, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LANXFER_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                     \
    ::lanxfer::log::LogWrite(::lanxfer::log::Level::kFatal, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);                \
  } while (0)

#endif  // LANXFER_LOG_HPP_
