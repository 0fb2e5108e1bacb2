/*
 * chunk.hpp
 *
 * Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * One link of a chunked_queue: a fixed block of slots plus their global
 * positions, and the prev/next ids of its neighbours inside the arena.
 *
 * Storage model:
 * - The record itself never moves (it lives in a chunk_arena segment).
 * - Storage is allocated on demand and released on demand, so a record can
 *   exist "dead" (no storage, ids only) and be revived later with allocate().
 * - Every entry starts vacant. release() destroys whatever is still engaged.
 *
 * Concurrency:
 * - Not thread-safe. The queue guarantees that producer and consumer never
 *   write the same field of the same record concurrently.
 */

#ifndef CHUNKQ_CHUNK_HPP_
#define CHUNKQ_CHUNK_HPP_

#include <cstddef>
#include <memory>       // std::allocator_traits, std::destroy_n
#include <new>
#include <type_traits>

#include "base/chunkq_alloc.hpp"
#include "base/chunkq_slot.hpp"
#include "base/chunkq_tools.hpp"
#include "base/chunkq_types.hpp"

namespace chunkq {

template<
    class T,
    typename Alloc = ::chunkq::alloc::default_alloc
    >
class chunk
{
public:
    using value_type = T;
    using size_type  = reg;
    using slot_type  = ::chunkq::slot<T>;

    struct entry {
        slot_type value;
        pos_type  pos = 0;
    };

    using base_allocator_type = Alloc;
    using allocator_type      = typename std::allocator_traits<base_allocator_type>
                                    ::template rebind_alloc<entry>;
    using alloc_traits        = std::allocator_traits<allocator_type>;
    using pointer             = typename alloc_traits::pointer;

    static_assert(std::is_pointer_v<pointer>,
                  "[chunkq::chunk]: allocator pointer must be a raw pointer");
    static_assert(alloc_traits::is_always_equal::value,
                  "[chunkq::chunk]: allocator must be stateless (is_always_equal)");
    static_assert(std::is_default_constructible_v<allocator_type>,
                  "[chunkq::chunk]: allocator must be default-constructible");

    chunk() noexcept = default;

    ~chunk() noexcept { release(); }

    chunk(const chunk&)            = delete;
    chunk& operator=(const chunk&) = delete;
    chunk(chunk&&)                 = delete;
    chunk& operator=(chunk&&)      = delete;

    // --------------------------------------------------------------------------
    // Storage
    // --------------------------------------------------------------------------

    // Gives the record storage for n vacant entries.
    // false: the allocator returned null. A throwing allocator propagates.
    [[nodiscard]] bool allocate(const size_type n)
    {
        CHUNKQ_ASSERT(storage_ == nullptr);
        CHUNKQ_ASSERT(n != 0u);

        allocator_type alloc{};
        pointer p = alloc_traits::allocate(alloc, n);
        if (CHUNKQ_UNLIKELY(!p)) {
            return false;
        }

        for (size_type i = 0; i < n; ++i) {
            ::new (static_cast<void*>(p + i)) entry{};
        }

        storage_ = p;
        size_    = n;
        return true;
    }

    // Destroys engaged values, then returns the storage. Links are kept.
    void release() noexcept
    {
        if (!storage_) {
            return;
        }

        std::destroy_n(storage_, size_);

        allocator_type alloc{};
        alloc_traits::deallocate(alloc, storage_, size_);
        storage_ = nullptr;
        size_    = 0;
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE bool has_storage() const noexcept { return storage_ != nullptr; }
    [[nodiscard]] CHUNKQ_FORCEINLINE size_type size() const noexcept { return size_; }

    // Assigns positions first, first+1, ... to the entries.
    void stamp(const pos_type first) noexcept
    {
        CHUNKQ_ASSERT(storage_ != nullptr);
        for (size_type i = 0; i < size_; ++i) {
            storage_[i].pos = first + static_cast<pos_type>(i);
        }
    }

    // --------------------------------------------------------------------------
    // Entries
    // --------------------------------------------------------------------------
    [[nodiscard]] CHUNKQ_FORCEINLINE slot_type& slot(const size_type i) noexcept {
        CHUNKQ_ASSERT(i < size_);
        return storage_[i].value;
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE const slot_type& slot(const size_type i) const noexcept {
        CHUNKQ_ASSERT(i < size_);
        return storage_[i].value;
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE pos_type pos(const size_type i) const noexcept {
        CHUNKQ_ASSERT(i < size_);
        return storage_[i].pos;
    }

    // Number of engaged slots (diagnostics, tests).
    [[nodiscard]] size_type engaged_count() const noexcept
    {
        size_type n = 0;
        for (size_type i = 0; i < size_; ++i) {
            if (storage_[i].value.engaged()) {
                ++n;
            }
        }
        return n;
    }

    // --------------------------------------------------------------------------
    // Links
    // --------------------------------------------------------------------------
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id prev() const noexcept { return prev_; }
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id next() const noexcept { return next_; }

    CHUNKQ_FORCEINLINE void set_prev(const chunk_id id) noexcept { prev_ = id; }
    CHUNKQ_FORCEINLINE void set_next(const chunk_id id) noexcept { next_ = id; }

private:
    pointer   storage_ = nullptr;
    size_type size_    = 0;
    chunk_id  prev_    = npos_chunk;
    chunk_id  next_    = npos_chunk;
};

} // namespace chunkq

#endif /* CHUNKQ_CHUNK_HPP_ */
