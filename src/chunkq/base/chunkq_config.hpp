/*
 * chunkq_config.hpp
 *
 *  Created on: 14 Jan. 2026
 *      Author: Shpegun60
 */

#ifndef CHUNKQ_CONFIG_HPP_
#define CHUNKQ_CONFIG_HPP_

/*
 * chunked_queue settings
 * Build toggles:
 *   - CHUNKQ_ENABLE_EXCEPTIONS (default: 1)
 *       0 -> allocation failure in push()/emplace()/ctor calls CHUNKQ_ON_ALLOC_FAILURE()
 *       1 -> allocation failure throws std::bad_alloc
 *
 *   - CHUNKQ_DEFAULT_POLICY_ATOMIC (default: 1)
 *       0 -> default_policy is P (plain spare cell, single thread only)
 *       1 -> default_policy is A<> (acquire/release spare handoff)
 *
 *   - CHUNKQ_REQUIRE_LOCK_FREE (default: 1)
 *       1 -> AtomicCell static_asserts std::atomic<chunk_id>::is_always_lock_free
 *
 *   - CHUNKQ_USER_CONFIG (default: unset)
 *       header included before any default below, so a whole target shares
 *       one set of overrides (e.g. -DCHUNKQ_USER_CONFIG="my_chunkq_config.h")
 */

#ifdef CHUNKQ_USER_CONFIG
#  include CHUNKQ_USER_CONFIG
#endif /* CHUNKQ_USER_CONFIG */

// assert ------------------------
#ifndef CHUNKQ_ASSERT
#  define CHUNKQ_ASSERT(x)
#endif /* CHUNKQ_ASSERT */

#ifndef CHUNKQ_DEFAULT_POLICY_ATOMIC
#  define CHUNKQ_DEFAULT_POLICY_ATOMIC 1
#endif /* CHUNKQ_DEFAULT_POLICY_ATOMIC */

#ifndef CHUNKQ_REQUIRE_LOCK_FREE
#  define CHUNKQ_REQUIRE_LOCK_FREE 1
#endif /* CHUNKQ_REQUIRE_LOCK_FREE */

// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - CHUNKQ_ENABLE_EXCEPTIONS == 0 : library assumes "no exceptions" mode.
//   - CHUNKQ_ENABLE_EXCEPTIONS == 1 : allocation failure throws std::bad_alloc.
//
// Default: 1. A queue that cannot grow has no way to keep the push contract,
// so the failure has to leave the call one way or the other.
//

#ifndef CHUNKQ_ENABLE_EXCEPTIONS
#  define CHUNKQ_ENABLE_EXCEPTIONS 1
#endif /* CHUNKQ_ENABLE_EXCEPTIONS */

/*
 * Fatal hook for "no exceptions" builds. Must not return.
 * Override with e.g. -DCHUNKQ_ON_ALLOC_FAILURE()=my_panic()
 */
#ifndef CHUNKQ_ON_ALLOC_FAILURE
#  define CHUNKQ_ON_ALLOC_FAILURE() std::abort()
#endif /* CHUNKQ_ON_ALLOC_FAILURE */

#endif /* CHUNKQ_CONFIG_HPP_ */
