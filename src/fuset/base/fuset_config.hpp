/*
 * fuset_config.hpp
 *
 *  Created on: 19 Oct. 2026
 *      Author: fuset authors
 */

#ifndef FUSET_CONFIG_HPP_
#define FUSET_CONFIG_HPP_

/*
 * Build toggles (all overridable with -D on the compiler line):
 *
 *   - FUSET_ALIGN_NODES (default: 1)
 *       0 -> member records use the natural alignment of their contents
 *       1 -> member records are aligned to FUSET_CACHELINE_BYTES, so that the
 *            producer-written queued flag / ready link of one record never
 *            shares a line with a neighbouring record
 *
 *   - FUSET_FORCE_CACHELINE (default: unset)
 *       Overrides cache-line detection (see fuset_cacheline.hpp).
 *
 *   - FUSET_REQUIRE_LOCK_FREE (default: 1)
 *       1 -> static_assert that every atomic used by the ready queue, the
 *            reference count and the atomic waker is always lock-free
 *       0 -> allow toolchains that fall back to libatomic
 */
#ifndef FUSET_ALIGN_NODES
#  define FUSET_ALIGN_NODES 1
#endif /* FUSET_ALIGN_NODES */

#ifndef FUSET_REQUIRE_LOCK_FREE
#  define FUSET_REQUIRE_LOCK_FREE 1
#endif /* FUSET_REQUIRE_LOCK_FREE */


// assert ------------------------
#ifndef FUSET_ASSERT
#  define FUSET_ASSERT(x)
#endif /* FUSET_ASSERT */


// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - FUSET_ENABLE_EXCEPTIONS == 0 : allocation failure is reported by value
//                                    (try_push() returns false).
//   - FUSET_ENABLE_EXCEPTIONS == 1 : allocation failure throws std::bad_alloc.
//
// Exceptions thrown by user futures always propagate out of poll_next(),
// whatever this switch says.
//
// Default: 0.
//

#ifndef FUSET_ENABLE_EXCEPTIONS
#  define FUSET_ENABLE_EXCEPTIONS 0
#endif /* FUSET_ENABLE_EXCEPTIONS */

/*
 * Optional: prefer aligned-new when available.
 */
#ifndef FUSET_ALLOC_PREFER_ALIGNED_NEW
#  define FUSET_ALLOC_PREFER_ALIGNED_NEW 0
#endif /* FUSET_ALLOC_PREFER_ALIGNED_NEW */


#endif /* FUSET_CONFIG_HPP_ */
