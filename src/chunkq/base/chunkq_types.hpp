/*
 * chunkq_types.hpp
 *
 *  Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * Integer vocabulary shared by the chunk, the arena and the queue.
 *
 *  Alias     │ Purpose
 * ───────────┼──────────────────────────────────────────────────────────
 *  reg       │ unsigned native word (chunk sizes, in-chunk offsets)
 *  pos_type  │ global slot position, 64-bit on every target
 *  chunk_id  │ index of a chunk record inside its arena
 *  npos_chunk│ "no chunk" (end of a prev/next chain, empty spare cell)
 */

#ifndef CHUNKQ_TYPES_HPP_
#define CHUNKQ_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace chunkq {

using reg      = std::size_t;
using pos_type = std::uint64_t;
using chunk_id = std::uint32_t;

inline constexpr chunk_id npos_chunk = std::numeric_limits<chunk_id>::max();

static_assert(std::is_unsigned_v<reg>, "[chunkq]: 'reg' must be unsigned");
static_assert(sizeof(reg) == sizeof(void*), "[chunkq]: 'reg' must match pointer size");
static_assert(std::numeric_limits<pos_type>::digits == 64,
              "[chunkq]: global positions must not wrap in practice");

} // namespace chunkq

#endif /* CHUNKQ_TYPES_HPP_ */
