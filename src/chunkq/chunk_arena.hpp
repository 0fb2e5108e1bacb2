/*
 * chunk_arena.hpp
 *
 * Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * Owner of every chunk record of one chunked_queue.
 *
 * Records are addressed by chunk_id and live in segments of doubling size:
 *
 *   segment │ records  │ ids
 *   ────────┼──────────┼──────────────
 *      0    │    8     │  0 ..  7
 *      1    │   16     │  8 .. 23
 *      2    │   32     │ 24 .. 55
 *     ...   │   ...    │  ...
 *
 * A segment is never moved or freed before the arena dies, so a record
 * reference taken once stays valid. Only the producer calls create();
 * both sides may call operator[] for ids they legitimately own.
 */

#ifndef CHUNKQ_CHUNK_ARENA_HPP_
#define CHUNKQ_CHUNK_ARENA_HPP_

#include <cstddef>
#include <memory>       // std::allocator_traits, std::destroy_n
#include <new>
#include <type_traits>

#include "chunk.hpp"
#include "base/chunkq_alloc.hpp"
#include "base/chunkq_tools.hpp"
#include "base/chunkq_types.hpp"

namespace chunkq {

template<
    class T,
    typename Alloc = ::chunkq::alloc::default_alloc
    >
class chunk_arena
{
public:
    using chunk_type = ::chunkq::chunk<T, Alloc>;
    using size_type  = reg;

    using base_allocator_type = Alloc;
    using allocator_type      = typename std::allocator_traits<base_allocator_type>
                                    ::template rebind_alloc<chunk_type>;
    using alloc_traits        = std::allocator_traits<allocator_type>;
    using pointer             = typename alloc_traits::pointer;

    static_assert(std::is_pointer_v<pointer>,
                  "[chunkq::chunk_arena]: allocator pointer must be a raw pointer");
    static_assert(alloc_traits::is_always_equal::value,
                  "[chunkq::chunk_arena]: allocator must be stateless (is_always_equal)");

    static constexpr size_type kFirstSegment = 8u;
    static constexpr size_type kMaxSegments  = 28u;

    // 8 * (2^28 - 1): below npos_chunk, so every id fits.
    static constexpr size_type kMaxRecords = kFirstSegment * ((size_type{1} << kMaxSegments) - 1u);

    static_assert(kMaxRecords < static_cast<size_type>(npos_chunk),
                  "[chunkq::chunk_arena]: record ids must stay below npos_chunk");

    chunk_arena() noexcept = default;

    ~chunk_arena() noexcept
    {
        for (size_type s = 0; s < kMaxSegments; ++s) {
            pointer seg = segs_[s];
            if (!seg) {
                break;
            }
            const size_type n = segment_size(s);
            // ~chunk() releases storage and destroys engaged values.
            std::destroy_n(seg, n);

            allocator_type alloc{};
            alloc_traits::deallocate(alloc, seg, n);
            segs_[s] = nullptr;
        }
    }

    chunk_arena(const chunk_arena&)            = delete;
    chunk_arena& operator=(const chunk_arena&) = delete;
    chunk_arena(chunk_arena&&)                 = delete;
    chunk_arena& operator=(chunk_arena&&)      = delete;

    // Appends one storage-less record.
    // npos_chunk: a null-returning allocator refused the next segment, or the
    // id space is exhausted. A throwing allocator propagates.
    [[nodiscard]] chunk_id create()
    {
        if (CHUNKQ_UNLIKELY(size_ >= kMaxRecords)) {
            return npos_chunk;
        }

        size_type seg = 0;
        size_type idx = 0;
        locate(size_, seg, idx);

        if (!segs_[seg]) {
            const size_type n = segment_size(seg);

            allocator_type alloc{};
            pointer p = alloc_traits::allocate(alloc, n);
            if (CHUNKQ_UNLIKELY(!p)) {
                return npos_chunk;
            }
            for (size_type i = 0; i < n; ++i) {
                ::new (static_cast<void*>(p + i)) chunk_type();
            }
            segs_[seg] = p;
        }

        const chunk_id id = static_cast<chunk_id>(size_);
        ++size_;
        return id;
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_type& operator[](const chunk_id id) noexcept
    {
        size_type seg = 0;
        size_type idx = 0;
        locate(id, seg, idx);
        CHUNKQ_ASSERT(segs_[seg] != nullptr);
        return segs_[seg][idx];
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE const chunk_type& operator[](const chunk_id id) const noexcept
    {
        size_type seg = 0;
        size_type idx = 0;
        locate(id, seg, idx);
        CHUNKQ_ASSERT(segs_[seg] != nullptr);
        return segs_[seg][idx];
    }

    // Records created so far (producer side).
    [[nodiscard]] size_type size() const noexcept { return size_; }

    // Segments currently allocated (producer side, tests).
    [[nodiscard]] size_type segments() const noexcept
    {
        size_type n = 0;
        while (n < kMaxSegments && segs_[n]) {
            ++n;
        }
        return n;
    }

    [[nodiscard]] static constexpr size_type segment_size(const size_type seg) noexcept
    {
        return kFirstSegment << seg;
    }

private:
    static constexpr size_type floor_log2(size_type x) noexcept
    {
        size_type r = 0;
        while (x > 1u) {
            x >>= 1u;
            ++r;
        }
        return r;
    }

    // id + 8 lies in [8 << seg, 16 << seg).
    static CHUNKQ_FORCEINLINE void locate(const size_type id, size_type& seg, size_type& idx) noexcept
    {
        const size_type x = id + kFirstSegment;
        seg = floor_log2(x) - floor_log2(kFirstSegment);
        idx = x - (kFirstSegment << seg);
    }

    pointer   segs_[kMaxSegments] = {};
    size_type size_ = 0;
};

} // namespace chunkq

#endif /* CHUNKQ_CHUNK_ARENA_HPP_ */
