/*
 * fuset_cacheline.hpp
 *
 * Created on: 19 Oct. 2026
 *      Author: fuset authors
 *
 * Cache-line size deduction used to pad the ready queue's producer/consumer
 * ends and (optionally) member records.
 *
 * Exposes:
 *   - Macro  FUSET_CACHELINE_BYTES     : detected / forced cache-line size
 *   - C++    fuset::hw::cacheline_bytes : constexpr mirror of the macro
 *
 * Overrides:
 *   -DFUSET_FORCE_CACHELINE=128
 *
 * Detection order:
 *   1) Explicit override
 *   2) Apple Silicon (128B)
 *   3) Qt-hosted targets through Q_PROCESSOR_* (when QtCore is in the build)
 *   4) Architecture families
 *   5) 64B fallback
 */

#ifndef FUSET_CACHELINE_HPP_
#define FUSET_CACHELINE_HPP_

#include "fuset_config.hpp"

#if defined(FUSET_FORCE_CACHELINE)
#  define FUSET__FORCED_CL_BYTES (0u + FUSET_FORCE_CACHELINE)
#endif

/* Floor for targets without a data cache. */
#ifndef FUSET_CACHELINE_MIN
#  define FUSET_CACHELINE_MIN 32u
#endif /* FUSET_CACHELINE_MIN */

#if ((FUSET_CACHELINE_MIN & (FUSET_CACHELINE_MIN - 1u)) != 0)
#  error "FUSET_CACHELINE_MIN must be a power-of-two"
#endif

/* ────────────────────────────────────────────────────────────────────────────
 * Optional Qt awareness: the tests link QtCore, so Q_PROCESSOR_* is available
 * there. Plain library users without Qt skip this block.
 * ──────────────────────────────────────────────────────────────────────────── */
#ifndef FUSET__HAVE_QT
#  define FUSET__HAVE_QT 0
#endif /* FUSET__HAVE_QT */

#if (defined(QT_CORE_LIB) || defined(QT_VERSION)) && !defined(FUSET_NO_QT_CACHELINE)
#  include <QtCore/qglobal.h>
#  undef  FUSET__HAVE_QT
#  define FUSET__HAVE_QT 1
#endif /* FUSET__HAVE_QT */

#ifndef FUSET_CACHELINE_BYTES

# if defined(FUSET__FORCED_CL_BYTES)

#   define FUSET_CACHELINE_BYTES FUSET__FORCED_CL_BYTES

# elif defined(__APPLE__) && defined(__aarch64__)

#   define FUSET_CACHELINE_BYTES 128u

# elif (FUSET__HAVE_QT) && (defined(Q_PROCESSOR_X86_64) || defined(Q_PROCESSOR_X86))

#   define FUSET_CACHELINE_BYTES 64u

# elif (FUSET__HAVE_QT) && (defined(Q_PROCESSOR_ARM_64) || defined(Q_PROCESSOR_ARM))

#   define FUSET_CACHELINE_BYTES 64u

/* PowerPC: 128B lines on most ppc64 parts. */
# elif defined(__powerpc64__) || defined(__ppc64__) || \
		defined(__powerpc__)   || defined(__ppc__)

#   define FUSET_CACHELINE_BYTES 128u

/* Cortex-M and other cache-less MCUs. */
# elif defined(__ARM_ARCH_8M_MAIN__) || defined(__ARM_ARCH_8_1M_MAIN__) || \
		defined(__ARM_ARCH_7EM__)     || defined(__ARM_ARCH_7M__)        || \
		defined(__ARM_ARCH_6M__)      || defined(__AVR__)                || \
		defined(__XTENSA__)

#   define FUSET_CACHELINE_BYTES 32u

/* x86/x64, ARM A-profile, RISC-V hosts, everything else. */
# else

#   define FUSET_CACHELINE_BYTES 64u

# endif
#endif /* !FUSET_CACHELINE_BYTES */

#if (FUSET_CACHELINE_BYTES < FUSET_CACHELINE_MIN)
#  undef  FUSET_CACHELINE_BYTES
#  define FUSET_CACHELINE_BYTES FUSET_CACHELINE_MIN
#endif

#if ((FUSET_CACHELINE_BYTES & (FUSET_CACHELINE_BYTES - 1u)) != 0)
#  error "FUSET_CACHELINE_BYTES must be a power-of-two"
#endif

#ifdef __cplusplus
namespace fuset::hw {
	static constexpr unsigned cacheline_bytes = FUSET_CACHELINE_BYTES;
}
#endif /* __cplusplus */

#endif /* FUSET_CACHELINE_HPP_ */
