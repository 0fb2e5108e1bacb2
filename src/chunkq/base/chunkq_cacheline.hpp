/*
 * chunkq_cacheline.hpp
 *
 *  Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * Cache-line size deduction for the producer/consumer split.
 *
 * Exposes:
 *   - Macro  CHUNKQ_CACHELINE_BYTES  : detected / forced cache-line size in bytes
 *   - C++    chunkq::hw::cacheline_bytes : constexpr wrapper for CHUNKQ_CACHELINE_BYTES
 *
 * The queue puts the consumer cursor, the producer cursors and the spare
 * cell on separate lines so that a pop never invalidates the line a push is
 * writing.
 *
 * Overrides:
 *   -DCHUNKQ_FORCE_CACHELINE=128
 */

#ifndef CHUNKQ_CACHELINE_HPP_
#define CHUNKQ_CACHELINE_HPP_

#include "chunkq_config.hpp"

#if defined(CHUNKQ_FORCE_CACHELINE)
#  define CHUNKQ__FORCED_CL_BYTES (0u + CHUNKQ_FORCE_CACHELINE)
#endif

/* Floor used when the platform reports something smaller (or nothing). */
#ifndef CHUNKQ_CACHELINE_MIN
#  define CHUNKQ_CACHELINE_MIN 32u
#endif /* CHUNKQ_CACHELINE_MIN */

#if ((CHUNKQ_CACHELINE_MIN & (CHUNKQ_CACHELINE_MIN - 1u)) != 0)
#  error "CHUNKQ_CACHELINE_MIN must be a power-of-two"
#endif

#ifndef CHUNKQ_CACHELINE_BYTES

# if defined(CHUNKQ__FORCED_CL_BYTES)

#   define CHUNKQ_CACHELINE_BYTES CHUNKQ__FORCED_CL_BYTES

/* Apple Silicon: 128B L1D lines in practice */
# elif defined(__APPLE__) && defined(__aarch64__)

#   define CHUNKQ_CACHELINE_BYTES 128u

/* ppc64 parts commonly use 128B lines */
# elif defined(__powerpc64__) || defined(__ppc64__) || \
		defined(__powerpc__)   || defined(__ppc__)

#   define CHUNKQ_CACHELINE_BYTES 128u

/* x86/x64 and ARM A-profile: 64B */
# elif defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86) || \
		defined(__aarch64__) || defined(_M_ARM64)

#   define CHUNKQ_CACHELINE_BYTES 64u

/* RISC-V: full OS -> 64B desktop, otherwise 32B */
# elif defined(__riscv)

#   if defined(__linux__) || defined(_WIN32) || defined(__APPLE__)
#     define CHUNKQ_CACHELINE_BYTES 64u
#   else
#     define CHUNKQ_CACHELINE_BYTES 32u
#   endif

# else

#   define CHUNKQ_CACHELINE_BYTES 64u

# endif
#endif /* !CHUNKQ_CACHELINE_BYTES */

#if (CHUNKQ_CACHELINE_BYTES < CHUNKQ_CACHELINE_MIN)
#  undef  CHUNKQ_CACHELINE_BYTES
#  define CHUNKQ_CACHELINE_BYTES CHUNKQ_CACHELINE_MIN
#endif

#if ((CHUNKQ_CACHELINE_BYTES & (CHUNKQ_CACHELINE_BYTES - 1u)) != 0)
#  error "CHUNKQ_CACHELINE_BYTES must be a power-of-two"
#endif

namespace chunkq::hw {
	static constexpr unsigned cacheline_bytes = CHUNKQ_CACHELINE_BYTES;
}

#endif /* CHUNKQ_CACHELINE_HPP_ */
