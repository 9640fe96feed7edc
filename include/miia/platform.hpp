/**
 * @file platform.hpp
 * @brief Platform detection, printf format attribute and assertion macro.
 */

#ifndef MIIA_PLATFORM_HPP_
#define MIIA_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace miia {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MIIA_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MIIA_PLATFORM_MACOS 1
#endif

#if defined(MIIA_PLATFORM_LINUX) || defined(MIIA_PLATFORM_MACOS)
#define MIIA_PLATFORM_POSIX 1
#endif

// ============================================================================
// Format Attribute
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define MIIA_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define MIIA_PRINTF_FORMAT(fmt_idx, arg_idx)
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
  (void)std::fprintf(stderr, "MIIA_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MIIA_ASSERT(cond) ((void)0)
#else
#define MIIA_ASSERT(cond) \
  ((cond) ? ((void)0) : ::miia::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace miia

#endif  // MIIA_PLATFORM_HPP_
