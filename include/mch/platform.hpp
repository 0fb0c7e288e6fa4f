/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 *
 * Invariant violations inside the registry (duplicate channel id, a channel
 * missing from its priority group) are implementation bugs, not runtime
 * conditions, and are reported through MCH_ASSERT / MCH_ASSERT_MSG.
 */

#ifndef MCH_PLATFORM_HPP_
#define MCH_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace mch {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MCH_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MCH_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MCH_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define MCH_LIKELY(x) __builtin_expect(!!(x), 1)
#define MCH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define MCH_LIKELY(x) (x)
#define MCH_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, optional context, file, and line to stderr,
 * then aborts.
 */
inline void AssertFail(const char* cond, const char* msg, const char* file,
                       int line) {
  if (msg != nullptr) {
    (void)std::fprintf(stderr, "MCH_ASSERT failed: %s (%s) at %s:%d\n", cond,
                       msg, file, line);
  } else {
    (void)std::fprintf(stderr, "MCH_ASSERT failed: %s at %s:%d\n", cond, file,
                       line);
  }
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MCH_ASSERT(cond) ((void)0)
#define MCH_ASSERT_MSG(cond, msg) ((void)0)
#else
#define MCH_ASSERT(cond)                                                \
  ((cond) ? ((void)0)                                                   \
          : ::mch::detail::AssertFail(#cond, nullptr, __FILE__, __LINE__))
#define MCH_ASSERT_MSG(cond, msg)                                       \
  ((cond) ? ((void)0)                                                   \
          : ::mch::detail::AssertFail(#cond, (msg), __FILE__, __LINE__))
#endif

}  // namespace mch

#endif  // MCH_PLATFORM_HPP_
