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
 * @brief Synchronous printf-style logger with category tags.
 *
 * Format:
 *   [2026-01-01 12:00:00.123] [WARN ] [Supervisor] message (supervisor.hpp:42)
 *
 * Two filters apply: CLIGR_LOG_MIN_LEVEL strips calls at compile time,
 * SetLevel() filters at runtime. Records are written to stderr (or the stream
 * given to Init()) under a mutex so lines from the coordinator thread and the
 * caller never interleave.
 */

#ifndef CLIGR_LOG_HPP_
#define CLIGR_LOG_HPP_

#include "cligr/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <strings.h>
#include <sys/time.h>
#include <time.h>

#ifndef CLIGR_LOG_MIN_LEVEL
#define CLIGR_LOG_MIN_LEVEL 0
#endif

namespace cligr {
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

struct LogContext {
  std::mutex mutex;
  std::atomic<uint8_t> level{
#ifdef NDEBUG
      static_cast<uint8_t>(Level::kInfo)
#else
      static_cast<uint8_t>(Level::kDebug)
#endif
  };
  std::atomic<bool> initialized{false};
  FILE* stream = nullptr;
};

inline LogContext& Context() {
  static LogContext ctx;
  return ctx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO ";
    case Level::kWarn: return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff: break;
  }
  return "?????";
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::Context().level.store(static_cast<uint8_t>(level),
                                std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::Context().level.load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"; case-insensitive).
 * @return true on success, @p out untouched otherwise.
 */
inline bool ParseLevel(const char* text, Level& out) noexcept {
  if (text == nullptr) return false;
  struct Name {
    const char* name;
    Level level;
  };
  static const Name kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const Name& n : kNames) {
    if (strcasecmp(text, n.name) == 0) {
      out = n.level;
      return true;
    }
  }
  return false;
}

/** @brief Redirect output to @p stream (nullptr = stderr). */
inline void Init(FILE* stream = nullptr) {
  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lock(ctx.mutex);
  ctx.stream = stream;
  ctx.initialized.store(true, std::memory_order_release);
}

inline void Shutdown() {
  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lock(ctx.mutex);
  if (ctx.stream != nullptr) {
    (void)std::fflush(ctx.stream);
  }
  ctx.stream = nullptr;
  ctx.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::Context().initialized.load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  localtime_r(&tv.tv_sec, &tm_buf);
  char ts[32];
  (void)strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  char msg[1024];
  (void)vsnprintf(msg, sizeof(msg), fmt, args);

  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lock(ctx.mutex);
  FILE* out = (ctx.stream != nullptr) ? ctx.stream : stderr;
  (void)std::fprintf(out, "[%s.%03ld] [%s] [%s] %s (%s:%d)\n", ts,
                     static_cast<long>(tv.tv_usec / 1000), detail::LevelTag(level),
                     category, msg, detail::Basename(file), line);
  if (level >= Level::kWarn) {
    (void)std::fflush(out);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) CLIGR_PRINTF_FMT(5, 6);

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace cligr

// ============================================================================
// Logging Macros
// ============================================================================

#define CLIGR_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                     \
    if (CLIGR_LOG_MIN_LEVEL <= 0) {                                        \
      ::cligr::log::LogWrite(::cligr::log::Level::kDebug, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define CLIGR_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                     \
    if (CLIGR_LOG_MIN_LEVEL <= 1) {                                        \
      ::cligr::log::LogWrite(::cligr::log::Level::kInfo, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define CLIGR_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                     \
    if (CLIGR_LOG_MIN_LEVEL <= 2) {                                        \
      ::cligr::log::LogWrite(::cligr::log::Level::kWarn, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define CLIGR_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                     \
    if (CLIGR_LOG_MIN_LEVEL <= 3) {                                        \
      ::cligr::log::LogWrite(::cligr::log::Level::kError, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define CLIGR_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                     \
    ::cligr::log::LogWrite(::cligr::log::Level::kFatal, cat, __FILE__,     \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                          \
  } while (0)

#endif  // CLIGR_LOG_HPP_
