/*
 * chunked_queue.hpp
 *
 * Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * Unbounded SPSC queue built from a chain of fixed-size chunks.
 *
 * Design goals:
 * - Amortized:  one allocation per chunk_size pushes at most, none in steady
 *               state (the last chunk the consumer left is recycled).
 * - Lock-free:  the only shared mutable field is the spare cell.
 * - Ordered:    every slot carries a 64-bit global position that never
 *               repeats for another element.
 *
 * Concurrency model:
 * - Single Producer / Single Consumer, no locks.
 * - Producer:    push, try_push, emplace, try_emplace, unpush, back, back_pos.
 * - Consumer:    front, front_pos, pop, for_each.
 * - Visibility of a pushed value to the consumer is the caller's business
 *   (a release/acquire flag or counter published after push()).
 *
 * Cursors:
 *
 *     begin                          back end
 *       │                              │   │
 *   [ x x x x ] <-> [ x x x x ] <-> [ x x . . ]
 *     chunk A         chunk B         chunk C
 *
 * - begin : oldest element (consumer).
 * - back  : the slot the next push writes (producer).
 * - end   : one slot after back. Reaching the chunk boundary links a chunk.
 *
 * Chunk recycling:
 * - pop() that leaves a chunk deposits it in the spare cell. A spare that is
 *   still waiting there is released (storage freed) and chained behind it.
 * - The producer takes the spare on the next rollover and keeps the released
 *   records on its own dead list, so record ids are reused before the arena
 *   grows.
 * - unpush() that severs the tail chunk frees its storage immediately and
 *   keeps the id on the dead list; it never feeds the spare cell.
 */

#ifndef CHUNKQ_CHUNKED_QUEUE_HPP_
#define CHUNKQ_CHUNKED_QUEUE_HPP_

#include <cstddef>
#include <type_traits>
#include <utility>      // std::move, std::forward

#include "chunk.hpp"
#include "chunk_arena.hpp"
#include "base/chunkq_alloc.hpp"
#include "base/chunkq_cacheline.hpp"
#include "base/chunkq_policy.hpp"
#include "base/chunkq_tools.hpp"
#include "base/chunkq_types.hpp"

namespace chunkq {

/* =======================================================================
 * chunked_queue<T, Policy, Alloc>
 *
 * Notes:
 * - The queue starts with one chunk and a one-slot gap between back and end.
 * - Preconditions (non-empty for pop/front/back, a pending push for unpush)
 *   are checked by CHUNKQ_ASSERT only.
 * - Alloc must be stateless; it is rebound to chunk entries and to arena
 *   records.
 * ======================================================================= */
template <class T,
         typename Policy = ::chunkq::policy::default_policy,
         typename Alloc  = ::chunkq::alloc::align_alloc<::chunkq::hw::cacheline_bytes>>
class chunked_queue
{
public:
    using value_type      = T;
    using size_type       = reg;
    using reference       = T&;
    using const_reference = const T&;
    using pointer         = T*;

    using chunk_type      = ::chunkq::chunk<T, Alloc>;
    using arena_type      = ::chunkq::chunk_arena<T, Alloc>;
    using slot_type       = typename chunk_type::slot_type;
    using spare_cell_type = typename Policy::spare_cell_type;
    using allocator_type  = Alloc;

    static_assert(std::is_move_constructible_v<T>,
                  "[chunkq::chunked_queue]: T must be move-constructible");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "[chunkq::chunked_queue]: T must be nothrow-destructible");

#if (CHUNKQ_ENABLE_EXCEPTIONS == 0)
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "[chunkq::chunked_queue]: no-exceptions mode requires noexcept move");
#endif

    // ------------------------------------------------------------------------------------------
    // Ctors / Dtor
    // ------------------------------------------------------------------------------------------

    // chunk_size == 0 is treated as 1.
    explicit chunked_queue(const size_type chunk_size)
        : size_((chunk_size == 0u) ? size_type{1} : chunk_size)
    {
        const chunk_id first = acquire_chunk_();
        if (CHUNKQ_UNLIKELY(first == npos_chunk)) {
            detail::raise_alloc_failure();
        }

        chunk_type& c = arena_[first];
        begin_ = cursor{&c, first, 0u};
        back_  = begin_;
        end_   = cursor{&c, first, 1u};

        // chunk_size == 1: end already sits on the boundary.
        if (end_.off == size_) {
            const chunk_id nid = acquire_chunk_();
            if (CHUNKQ_UNLIKELY(nid == npos_chunk)) {
                detail::raise_alloc_failure();
            }
            link_tail_(nid);
        }
    }

    // Remaining elements are destroyed by the arena (chunk::release()).
    ~chunked_queue() noexcept = default;

    chunked_queue(const chunked_queue&)            = delete;
    chunked_queue& operator=(const chunked_queue&) = delete;
    chunked_queue(chunked_queue&&)                 = delete;
    chunked_queue& operator=(chunked_queue&&)      = delete;

    // ------------------------------------------------------------------------------------------
    // Producer API
    // ------------------------------------------------------------------------------------------
    void push(const T& v) { (void)emplace_impl_<true>(v); }
    void push(T&& v) { (void)emplace_impl_<true>(std::move(v)); }

    template <class... Args>
    T& emplace(Args&&... args) {
        return *emplace_impl_<true>(std::forward<Args>(args)...);
    }

    // false / nullptr: a null-returning allocator refused a new chunk.
    // The queue is unchanged in that case.
    [[nodiscard]] bool try_push(const T& v) { return emplace_impl_<false>(v) != nullptr; }
    [[nodiscard]] bool try_push(T&& v) { return emplace_impl_<false>(std::move(v)) != nullptr; }

    template <class... Args>
    [[nodiscard]] T* try_emplace(Args&&... args) {
        return emplace_impl_<false>(std::forward<Args>(args)...);
    }

    // Rolls back the most recent push and destroys its value.
    // Move the value out through back() first if it is still needed.
    void unpush() noexcept
    {
        CHUNKQ_ASSERT(back_.off != 0u || back_.chunk->prev() != npos_chunk);

        if (back_.off != 0u) {
            --back_.off;
        } else {
            const chunk_id pid = back_.chunk->prev();
            back_ = cursor{&arena_[pid], pid, size_ - 1u};
        }

        slot_type& s = back_.chunk->slot(back_.off);
        CHUNKQ_ASSERT(s.engaged());
        s.reset();

        if (end_.off != 0u) {
            --end_.off;
            return;
        }

        // end leaves its chunk: sever it from the tail.
        chunk_type* const cut    = end_.chunk;
        const chunk_id    cut_id = end_.id;
        const chunk_id    pid    = cut->prev();

        end_ = cursor{&arena_[pid], pid, size_ - 1u};
        end_.chunk->set_next(npos_chunk);

        next_pos_ = cut->pos(0u);
        cut->release();
        bury_(cut_id);
    }

    // Most recently pushed element.
    [[nodiscard]] T& back() noexcept { return newest_slot_().get(); }
    [[nodiscard]] const T& back() const noexcept { return newest_slot_().get(); }

    // Position the next push takes.
    [[nodiscard]] CHUNKQ_FORCEINLINE pos_type back_pos() const noexcept {
        return back_.chunk->pos(back_.off);
    }

    // ------------------------------------------------------------------------------------------
    // Consumer API
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] CHUNKQ_FORCEINLINE T& front() noexcept {
        return begin_.chunk->slot(begin_.off).get();
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE const T& front() const noexcept {
        return begin_.chunk->slot(begin_.off).get();
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE pos_type front_pos() const noexcept {
        return begin_.chunk->pos(begin_.off);
    }

    // Moves the oldest element out. The slot is vacated.
    [[nodiscard]] T pop() noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        T out = begin_.chunk->slot(begin_.off).take();
        advance_begin_();
        return out;
    }

    // Visits queued elements oldest first.
    template <class Fn>
    void for_each(Fn&& fn) const
    {
        const chunk_type* c   = begin_.chunk;
        size_type         off = begin_.off;
        const pos_type    stop = back_pos();

        while (c->pos(off) != stop) {
            fn(c->slot(off).get());
            if (++off == size_) {
                c   = &arena_[c->next()];
                off = 0u;
            }
        }
    }

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------

    // Queued elements. Reads both sides' cursors: advisory under concurrency.
    [[nodiscard]] size_type fill() const noexcept {
        return static_cast<size_type>(back_pos() - front_pos());
    }

    [[nodiscard]] bool empty() const noexcept { return fill() == 0u; }

    [[nodiscard]] CHUNKQ_FORCEINLINE size_type chunk_size() const noexcept { return size_; }

    [[nodiscard]] bool has_spare() const noexcept { return spare_.peek() != npos_chunk; }

    // Records ever created by the arena. Producer side.
    [[nodiscard]] size_type chunk_records() const noexcept { return arena_.size(); }

    // Records currently holding storage. Quiescent queue only.
    [[nodiscard]] size_type allocated_chunks() const noexcept
    {
        size_type n = 0;
        for (size_type i = 0; i < arena_.size(); ++i) {
            if (arena_[static_cast<chunk_id>(i)].has_storage()) {
                ++n;
            }
        }
        return n;
    }

private:
    struct cursor {
        chunk_type* chunk = nullptr;
        chunk_id    id    = npos_chunk;
        size_type   off   = 0u;
    };

    template <bool Fatal, class... Args>
    T* emplace_impl_(Args&&... args)
    {
        slot_type& s = back_.chunk->slot(back_.off);
        T& ref = s.emplace(std::forward<Args>(args)...);

        chunk_id nid = npos_chunk;
        if (CHUNKQ_UNLIKELY(end_.off + 1u == size_)) {
            CHUNKQ_TRY {
                nid = acquire_chunk_();
            } CHUNKQ_CATCH_ALL {
                s.reset();
                CHUNKQ_RETHROW;
            }

            if (CHUNKQ_UNLIKELY(nid == npos_chunk)) {
                s.reset();
                if constexpr (Fatal) {
                    detail::raise_alloc_failure();
                } else {
                    return nullptr;
                }
            }
        }

        back_ = end_;
        ++end_.off;
        if (nid != npos_chunk) {
            link_tail_(nid);
        }
        return &ref;
    }

    // Producer: the next chunk for the tail, stamped with the next position
    // range. Spare first, then a dead record, then a new record.
    CHUNKQ_NOINLINE chunk_id acquire_chunk_()
    {
        chunk_id id = spare_.take();
        if (id != npos_chunk) {
            chunk_type& c = arena_[id];
            adopt_dead_(c.next());
            c.set_next(npos_chunk);
            c.set_prev(npos_chunk);
        } else {
            id = revive_or_create_();
            if (id == npos_chunk) {
                return npos_chunk;
            }
        }

        arena_[id].stamp(next_pos_);
        next_pos_ += static_cast<pos_type>(size_);
        return id;
    }

    chunk_id revive_or_create_()
    {
        chunk_id id = dead_;
        if (id != npos_chunk) {
            dead_ = arena_[id].next();
            arena_[id].set_next(npos_chunk);
        } else {
            id = arena_.create();
            if (id == npos_chunk) {
                return npos_chunk;
            }
        }

        bool ok = false;
        CHUNKQ_TRY {
            ok = arena_[id].allocate(size_);
        } CHUNKQ_CATCH_ALL {
            bury_(id);
            CHUNKQ_RETHROW;
        }

        if (!ok) {
            bury_(id);
            return npos_chunk;
        }
        return id;
    }

    // Producer: storage-less record onto the dead list.
    void bury_(const chunk_id id) noexcept
    {
        chunk_type& c = arena_[id];
        c.set_prev(npos_chunk);
        c.set_next(dead_);
        dead_ = id;
    }

    // Producer: splice a chain of released records (linked through next)
    // in front of the dead list.
    void adopt_dead_(const chunk_id head) noexcept
    {
        if (head == npos_chunk) {
            return;
        }
        chunk_id tail = head;
        while (arena_[tail].next() != npos_chunk) {
            tail = arena_[tail].next();
        }
        arena_[tail].set_next(dead_);
        dead_ = head;
    }

    // Producer: end_ sits on the boundary of its chunk, link nid behind it.
    void link_tail_(const chunk_id nid) noexcept
    {
        chunk_type& c = arena_[nid];
        c.set_prev(end_.id);
        c.set_next(npos_chunk);
        end_.chunk->set_next(nid);
        end_ = cursor{&c, nid, 0u};
    }

    // Consumer
    void advance_begin_() noexcept
    {
        if (++begin_.off != size_) {
            return;
        }

        chunk_type* const left    = begin_.chunk;
        const chunk_id    left_id = begin_.id;
        const chunk_id    nid     = left->next();

        chunk_type& nc = arena_[nid];
        nc.set_prev(npos_chunk);
        begin_ = cursor{&nc, nid, 0u};

        retire_(*left, left_id);
    }

    // Consumer: hand the chunk just left to the producer. An older spare
    // still in the cell loses its storage and is chained behind it.
    void retire_(chunk_type& left, const chunk_id left_id) noexcept
    {
        const chunk_id displaced = spare_.take();
        if (displaced != npos_chunk) {
            arena_[displaced].release();
        }
        left.set_prev(npos_chunk);
        left.set_next(displaced);
        spare_.put(left_id);
    }

    // Slot just before back_, possibly in the previous chunk.
    slot_type& newest_slot_() const noexcept
    {
        if (back_.off != 0u) {
            return back_.chunk->slot(back_.off - 1u);
        }
        CHUNKQ_ASSERT(back_.chunk->prev() != npos_chunk);
        return const_cast<chunk_type&>(arena_[back_.chunk->prev()]).slot(size_ - 1u);
    }

    const size_type size_;
    arena_type      arena_;

    // consumer
    alignas(::chunkq::hw::cacheline_bytes) cursor begin_{};

    // producer
    alignas(::chunkq::hw::cacheline_bytes) cursor back_{};
    cursor   end_{};
    chunk_id dead_     = npos_chunk;
    pos_type next_pos_ = 0u;

    // shared
    alignas(::chunkq::hw::cacheline_bytes) spare_cell_type spare_{};
};

} // namespace chunkq

#endif /* CHUNKQ_CHUNKED_QUEUE_HPP_ */
