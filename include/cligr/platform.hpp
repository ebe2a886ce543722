/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef CLIGR_PLATFORM_HPP_
#define CLIGR_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace cligr {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define CLIGR_PLATFORM_LINUX 1
#else
#error "cligr requires Linux (epoll, eventfd, /proc)"
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define CLIGR_LIKELY(x) __builtin_expect(!!(x), 1)
#define CLIGR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define CLIGR_PRINTF_FMT(a, b) __attribute__((format(printf, a, b)))
#else
#define CLIGR_LIKELY(x) (x)
#define CLIGR_UNLIKELY(x) (x)
#define CLIGR_PRINTF_FMT(a, b)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "CLIGR_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define CLIGR_ASSERT(cond) ((void)0)
#else
#define CLIGR_ASSERT(cond) \
  ((cond) ? ((void)0) : ::cligr::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace cligr

#endif  // CLIGR_PLATFORM_HPP_
