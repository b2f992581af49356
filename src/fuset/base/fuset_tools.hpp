/*
 * fuset_tools.hpp
 *
 *  Created on: 19 Oct. 2026
 *      Author: fuset authors
 *
 * Small portability helpers shared by the fuset headers.
 * - Force/no-inline attributes.
 * - Branch prediction hints.
 * - Exception-mode sanity check.
 *
 * Usage:
 *   FUSET_FORCEINLINE bool is_stub(const ready_node* n) noexcept { ... }
 *   if (FUSET_UNLIKELY(next == nullptr)) { ... }
 */

#ifndef FUSET_TOOLS_HPP_
#define FUSET_TOOLS_HPP_

#include "fuset_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef FUSET_ASSERT
#  define FUSET_ASSERT(x)
#endif /* FUSET_ASSERT */

/* ---------------------------------------------------------------------------
 * FUSET_FORCEINLINE: "strong" inlining hint for the hot paths
 * (enqueue/dequeue, link/unlink, reference counting).
 * ------------------------------------------------------------------------- */
#ifndef FUSET_FORCEINLINE
#  if defined(_MSC_VER)
#    define FUSET_FORCEINLINE __forceinline
  /* Clang also defines __GNUC__ */
#  elif defined(__clang__) || defined(__GNUC__)
#    define FUSET_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define FUSET_FORCEINLINE inline
#  endif
#endif /* FUSET_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * FUSET_NOINLINE: keep cold paths (queue teardown, slow wake path) out of
 * the inlined callers.
 * ------------------------------------------------------------------------- */
#ifndef FUSET_NOINLINE
#  if defined(_MSC_VER)
#    define FUSET_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define FUSET_NOINLINE __attribute__((noinline))
#  else
#    define FUSET_NOINLINE
#  endif
#endif /* FUSET_NOINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hint for failure paths.
 * ------------------------------------------------------------------------- */

#ifndef FUSET_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define FUSET_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define FUSET_UNLIKELY(x) (x)
#  endif
#endif /* FUSET_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

// If the user forces 1 but the compiler clearly has no exceptions, fail at
// compile-time instead of pretending everything is fine.
#if FUSET_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
		!(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "FUSET_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* FUSET_ENABLE_EXCEPTIONS */

static_assert(FUSET_ENABLE_EXCEPTIONS == 0 || FUSET_ENABLE_EXCEPTIONS == 1,
              "FUSET_ENABLE_EXCEPTIONS must be 0 or 1");


#endif /* FUSET_TOOLS_HPP_ */
