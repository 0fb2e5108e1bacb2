/*
 * chunkq_cell.hpp
 *
 * Created on: 14 Jan. 2026
 *   Author: Shpegun60
 *
 *
 * Single-slot handoff cells for the spare chunk id.
 *
 * The cell holds at most one chunk_id; npos_chunk means "empty".
 * The consumer deposits the chunk it has just left, the producer takes it
 * back on the next rollover. Uniform API:
 *   - take()     : read the held id and leave the cell empty
 *   - put(id)    : deposit an id (caller owns the cell content at this point)
 *   - peek()     : read without taking (introspection only)
 *
 * Backends:
 *   * PlainCell
 *       - Raw chunk_id, no fences. Single thread or external locking.
 *
 *   * AtomicCell<Orders>
 *       - std::atomic<chunk_id>.
 *           Orders::load  → peek()
 *           Orders::store → put()
 *           Orders::rmw   → take() (exchange with npos_chunk)
 *       - The consumer's writes to the deposited chunk record happen-before
 *         the producer's take() that returns it.
 *
 *   * CachelineCell<Cell, AlignB>
 *       - Puts any cell on its own cache line(s).
 *
 * Configuration:
 *   - CHUNKQ_REQUIRE_LOCK_FREE (default 1):
 *       * 1 → static_assert std::atomic<chunk_id>::is_always_lock_free.
 */

#ifndef CHUNKQ_CELL_HPP_
#define CHUNKQ_CELL_HPP_

#include <atomic>
#include <type_traits>

#include "chunkq_tools.hpp"
#include "chunkq_cacheline.hpp"
#include "chunkq_types.hpp"

namespace chunkq::cell {

/* ------------------------------ PlainCell ------------------------------ */
class PlainCell {
public:
    static constexpr bool is_atomic = false;
    using value_type = chunk_id;

private:
    chunk_id v{npos_chunk};

public:
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id take() noexcept {
        const chunk_id cur = v;
        v = npos_chunk;
        return cur;
    }
    CHUNKQ_FORCEINLINE void put(const chunk_id id) noexcept { v = id; }
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id peek() const noexcept { return v; }
};

/* ------------------------------- Orders palette --------------------------- */
struct default_orders {
    static constexpr std::memory_order load  = std::memory_order_acquire;
    static constexpr std::memory_order store = std::memory_order_release;
    static constexpr std::memory_order rmw   = std::memory_order_acq_rel;
};

struct seq_cst_orders {
    static constexpr std::memory_order load  = std::memory_order_seq_cst;
    static constexpr std::memory_order store = std::memory_order_seq_cst;
    static constexpr std::memory_order rmw   = std::memory_order_seq_cst;
};

namespace detail {

    constexpr bool valid_load_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_relaxed:
            case std::memory_order_consume:
            case std::memory_order_acquire:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false;
        }
    }

    constexpr bool valid_store_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_relaxed:
            case std::memory_order_release:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false;
        }
    }

    /* take() hands a chunk record over, it must both acquire and release. */
    constexpr bool valid_handoff_rmw_order(std::memory_order mo) {
        return (mo == std::memory_order_acq_rel) || (mo == std::memory_order_seq_cst);
    }

    constexpr bool valid_handoff_store_order(std::memory_order mo) {
        return (mo == std::memory_order_release) || (mo == std::memory_order_seq_cst);
    }

    template<reg PadBytes>
    struct cell_pad {
        unsigned char padding[PadBytes];
    };

    template<>
    struct cell_pad<0> {
    };

    /* Aligns Cell to L and pads sizeof to a multiple of L. */
    template<class Cell, reg L>
    struct CellSlot {
        static_assert(L != 0, "CellSlot: alignment L must be non-zero");
        static_assert((L & (L - 1u)) == 0u, "CellSlot: alignment L must be power-of-two");
        static_assert(L >= alignof(Cell), "CellSlot: L must be >= alignof(Cell)");

        static constexpr reg kRem = sizeof(Cell) % L;
        static constexpr reg kPad = (kRem == 0u) ? 0u : (L - kRem);

        alignas(L) Cell value{};
        cell_pad<kPad> pad;
    };

} // namespace detail

/* ------------------------------ AtomicCell ------------------------------ */
template<typename Orders = default_orders>
class AtomicCell {
public:
    static constexpr bool is_atomic = true;
    using value_type = chunk_id;

private:
    static_assert(detail::valid_load_order(Orders::load),           "AtomicCell: invalid load memory_order");
    static_assert(detail::valid_handoff_store_order(Orders::store), "AtomicCell: put() needs release ordering");
    static_assert(detail::valid_handoff_rmw_order(Orders::rmw),     "AtomicCell: take() needs acq_rel ordering");

    std::atomic<chunk_id> v{npos_chunk};

#if CHUNKQ_REQUIRE_LOCK_FREE
    static_assert(std::atomic<chunk_id>::is_always_lock_free, "AtomicCell: not always lock-free on this target");
#endif /* CHUNKQ_REQUIRE_LOCK_FREE */

public:
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id take() noexcept { return v.exchange(npos_chunk, Orders::rmw); }
    CHUNKQ_FORCEINLINE void put(const chunk_id id) noexcept { v.store(id, Orders::store); }
    [[nodiscard]] CHUNKQ_FORCEINLINE chunk_id peek() const noexcept { return v.load(Orders::load); }
};

/* ---------------------------- CachelineCell ----------------------------- */
template<
    class Cell,
    reg AlignB = ::chunkq::hw::cacheline_bytes
>
class alignas(AlignB) CachelineCell {
public:
    static constexpr bool is_atomic = Cell::is_atomic;
    using underlying_type = Cell;
    using value_type      = typename Cell::value_type;

private:
    static_assert(AlignB != 0, "CachelineCell: AlignB must be non-zero");
    static_assert((AlignB & (AlignB - 1u)) == 0u,
                  "CachelineCell: AlignB must be power-of-two");

    using Slot = detail::CellSlot<Cell, AlignB>;

    Slot slot_{};

    static_assert(sizeof(Slot) % AlignB == 0,
                  "CachelineCell: Slot size must be multiple of AlignB");

public:
    CachelineCell() = default;

    [[nodiscard]] CHUNKQ_FORCEINLINE value_type take() noexcept { return slot_.value.take(); }
    CHUNKQ_FORCEINLINE void put(const value_type id) noexcept { slot_.value.put(id); }
    [[nodiscard]] CHUNKQ_FORCEINLINE value_type peek() const noexcept { return slot_.value.peek(); }

    [[nodiscard]] CHUNKQ_FORCEINLINE underlying_type&       underlying()       noexcept { return slot_.value; }
    [[nodiscard]] CHUNKQ_FORCEINLINE const underlying_type& underlying() const noexcept { return slot_.value; }
};

} // namespace chunkq::cell

#endif /* CHUNKQ_CELL_HPP_ */
