/*
 * chunkq_policy.hpp
 *
 * Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 *
 * Zero-runtime policy traits for chunked_queue.
 *
 * A policy tells the queue one thing: which cell type carries the spare
 * chunk id from the consumer back to the producer.
 *
 *   1) Base Policy<Cell>
 *
 *   2) Ready-made aliases:
 *        - P    : plain cell, single thread or external locking
 *        - A<O> : atomic cell with configurable orders
 *
 *   3) default_policy:
 *        - Controlled via CHUNKQ_DEFAULT_POLICY_ATOMIC:
 *            0 → P
 *            1 → A<>
 *
 *   4) CacheAligned<Base, AlignB>:
 *        - spare_cell_type → CachelineCell<Base::spare_cell_type, AlignB>
 *
 * Usage:
 *
 *   chunkq::chunked_queue<Msg>                        q1(256); // default_policy
 *   chunkq::chunked_queue<Msg, chunkq::policy::P>     q2(256); // one thread
 *   chunkq::chunked_queue<Msg, chunkq::policy::CA<>>  q3(256); // padded atomic
 */

#ifndef CHUNKQ_POLICY_HPP_
#define CHUNKQ_POLICY_HPP_

#include <type_traits>

#include "chunkq_cacheline.hpp"
#include "chunkq_cell.hpp"
#include "chunkq_types.hpp"

namespace chunkq::policy {

using ::chunkq::cell::AtomicCell;
using ::chunkq::cell::CachelineCell;
using ::chunkq::cell::default_orders;
using ::chunkq::cell::PlainCell;

namespace detail {

/* Helper trait: detect a cell backend.
 * Requirements:
 *   - T has:  chunk_id take()
 *   - T has:  void put(chunk_id)
 *   - T has:  chunk_id peek() const
 */
template <typename T, typename = void>
struct is_cell_like : std::false_type {};

template <typename T>
struct is_cell_like<
    T, std::void_t<decltype(std::declval<T &>().take()),
                   decltype(std::declval<T &>().put(std::declval<chunk_id>())),
                   decltype(std::declval<const T &>().peek())>>
    : std::bool_constant<
          std::is_same_v<decltype(std::declval<T &>().take()), chunk_id> &&
          std::is_same_v<decltype(std::declval<const T &>().peek()), chunk_id>> {};

template <typename T>
inline constexpr bool is_cell_like_v = is_cell_like<T>::value;

} // namespace detail

template <class Cell = PlainCell>
struct Policy {
    static_assert(detail::is_cell_like_v<Cell>,
                  "[Policy]: spare_cell_type must implement take/put/peek over chunk_id");
    static_assert(std::is_default_constructible_v<Cell>,
                  "[Policy]: spare_cell_type must start empty when default-constructed");

    using spare_cell_type = Cell;
};

using P = Policy<>;

template <class O = default_orders>
using A = Policy<AtomicCell<O>>;

static_assert(CHUNKQ_DEFAULT_POLICY_ATOMIC == 0 ||
                  CHUNKQ_DEFAULT_POLICY_ATOMIC == 1,
              "CHUNKQ_DEFAULT_POLICY_ATOMIC must be 0 or 1");

using default_policy = std::conditional_t<CHUNKQ_DEFAULT_POLICY_ATOMIC, A<>, P>;

template <
    class Base = default_policy,
    reg AlignB = ::chunkq::hw::cacheline_bytes
>
struct CacheAligned {
private:
    using base_cell_type = typename Base::spare_cell_type;

    static_assert(detail::is_cell_like_v<base_cell_type>,
                  "[CacheAligned]: Base::spare_cell_type must be cell-like");
    static_assert(AlignB != 0, "[CacheAligned]: AlignB must be non-zero");
    static_assert((AlignB & (AlignB - 1u)) == 0u,
                  "[CacheAligned]: AlignB must be power-of-two");

public:
    using spare_cell_type = CachelineCell<base_cell_type, AlignB>;

    static_assert(detail::is_cell_like_v<spare_cell_type>,
                  "[CacheAligned]: resulting spare_cell_type must remain cell-like");
};

using CP = CacheAligned<P>;

template <class O = default_orders> using CA = CacheAligned<A<O>>;

} // namespace chunkq::policy

#endif /* CHUNKQ_POLICY_HPP_ */
