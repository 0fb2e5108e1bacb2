/*
 * chunkq_tools.hpp
 *
 *  Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * Tiny portability helpers shared by every chunkq header.
 * - Zero dependencies, header-only, safe for inclusion from multiple TUs.
 * - One token for "force inline" / "no inline" and branch hints.
 * - Exception helpers so the same code compiles with and without -fno-exceptions.
 *
 * Notes:
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. Keep the definition in the header if you expect inlining.
 */

#ifndef CHUNKQ_TOOLS_HPP_
#define CHUNKQ_TOOLS_HPP_

#include <cstdlib>  // std::abort (default CHUNKQ_ON_ALLOC_FAILURE)
#include <new>      // std::bad_alloc

#include "chunkq_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef CHUNKQ_ASSERT
#  define CHUNKQ_ASSERT(x)
#endif /* CHUNKQ_ASSERT */

/* ---------------------------------------------------------------------------
 * CHUNKQ_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef CHUNKQ_FORCEINLINE
#  if defined(_MSC_VER)
#    define CHUNKQ_FORCEINLINE __forceinline
  /* Clang also defines __GNUC__ */
#  elif defined(__clang__) || defined(__GNUC__)
#    define CHUNKQ_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define CHUNKQ_FORCEINLINE inline
#  endif
#endif /* CHUNKQ_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * CHUNKQ_NOINLINE: keep the cold rollover path out of push()
 * ------------------------------------------------------------------------- */
#ifndef CHUNKQ_NOINLINE
#  if defined(_MSC_VER)
#    define CHUNKQ_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define CHUNKQ_NOINLINE __attribute__((noinline))
#  else
#    define CHUNKQ_NOINLINE
#  endif
#endif /* CHUNKQ_NOINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hints.
 * Separate guards prevent losing CHUNKQ_UNLIKELY if CHUNKQ_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef CHUNKQ_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define CHUNKQ_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define CHUNKQ_LIKELY(x)   (x)
#  endif
#endif /* CHUNKQ_LIKELY */

#ifndef CHUNKQ_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define CHUNKQ_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define CHUNKQ_UNLIKELY(x) (x)
#  endif
#endif /* CHUNKQ_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

// If user forces 1 but compiler clearly has no exceptions,
// fail at compile-time instead of pretending everything is fine.
#if CHUNKQ_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
		!(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "CHUNKQ_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* CHUNKQ_ENABLE_EXCEPTIONS */

#if !defined(CHUNKQ_TRY)
#  if CHUNKQ_ENABLE_EXCEPTIONS
#    define CHUNKQ_TRY       try
#    define CHUNKQ_CATCH_ALL catch (...)
#    define CHUNKQ_RETHROW   throw
#  else
#    define CHUNKQ_TRY
#    define CHUNKQ_CATCH_ALL if constexpr (false)
#    define CHUNKQ_RETHROW
#  endif
#endif /* CHUNKQ_TRY */

namespace chunkq::detail {

/*
 * Growth failed and the caller has no way to report it (push, emplace, ctor).
 * Exceptions build: std::bad_alloc. Otherwise the fatal hook, which must not return.
 */
[[noreturn]] inline void raise_alloc_failure()
{
#if CHUNKQ_ENABLE_EXCEPTIONS
    throw std::bad_alloc{};
#else
    CHUNKQ_ON_ALLOC_FAILURE();
    std::abort();
#endif
}

} // namespace chunkq::detail

#endif /* CHUNKQ_TOOLS_HPP_ */
