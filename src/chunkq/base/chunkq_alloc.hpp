/*
 * chunkq_alloc.hpp
 *
 * Created on: 14 Jan. 2026
 * Author: Shpegun60
 *
 * Stateless allocators for chunk storage and arena segments.
 *
 * The allocator is is_always_equal: the queue default-constructs one
 * whenever it needs to allocate or deallocate, rebinding it to the chunk
 * entry type or to the arena record type.
 *
 * fail_mode decides how a failed allocation leaves allocate():
 *   - throws        : std::bad_alloc (requires CHUNKQ_ENABLE_EXCEPTIONS != 0)
 *   - returns_null  : nullptr, the queue turns it into try_push() == false
 *                     or into the fatal path of push()
 */

#ifndef CHUNKQ_ALLOC_HPP_
#define CHUNKQ_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::ptrdiff_t
#include <limits>      // std::numeric_limits
#include <new>         // std::nothrow, std::align_val_t
#include <type_traits> // std::true_type

#include "chunkq_tools.hpp"

namespace chunkq::alloc {

enum class fail_mode : unsigned {
    throws,
    returns_null
};

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

constexpr std::size_t max_sz(const std::size_t a, const std::size_t b) noexcept {
    return (a > b) ? a : b;
}

template<fail_mode Mode>
[[nodiscard]] inline void* fail_ptr() noexcept(Mode == fail_mode::returns_null)
{
    static_assert((Mode != fail_mode::throws) || (CHUNKQ_ENABLE_EXCEPTIONS != 0),
                  "fail_mode::throws requires CHUNKQ_ENABLE_EXCEPTIONS != 0");

    if constexpr (Mode == fail_mode::throws) {
#if (CHUNKQ_ENABLE_EXCEPTIONS != 0)
        throw std::bad_alloc{};
#else
        return nullptr;
#endif
    } else {
        return nullptr;
    }
}

/*
 * One place for the four ::operator new flavours.
 * Align <= kDefaultNewAlign uses the plain overloads so that the matching
 * delete is the plain one as well.
 */
template<std::size_t Align, fail_mode Mode>
[[nodiscard]] inline void* raw_allocate(const std::size_t bytes) noexcept(Mode == fail_mode::returns_null)
{
    if constexpr (Align <= kDefaultNewAlign) {
        if constexpr (Mode == fail_mode::throws) {
            return ::operator new(bytes);
        } else {
            return ::operator new(bytes, std::nothrow);
        }
    } else {
        if constexpr (Mode == fail_mode::throws) {
            return ::operator new(bytes, std::align_val_t(Align));
        } else {
            return ::operator new(bytes, std::align_val_t(Align), std::nothrow);
        }
    }
}

template<std::size_t Align>
inline void raw_deallocate(void* p) noexcept
{
    if constexpr (Align <= kDefaultNewAlign) {
        ::operator delete(p);
    } else {
        ::operator delete(p, std::align_val_t(Align));
    }
}

template<class T, std::size_t Align, fail_mode Mode>
[[nodiscard]] inline T* typed_allocate(const std::size_t n) noexcept(Mode == fail_mode::returns_null)
{
    if (CHUNKQ_UNLIKELY(n == 0u)) {
        return nullptr;
    }
    if (CHUNKQ_UNLIKELY(n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))) {
        return static_cast<T*>(fail_ptr<Mode>());
    }
    return static_cast<T*>(raw_allocate<Align, Mode>(n * sizeof(T)));
}

} // namespace detail

// ============================================================================
// aligned_allocator<T, Alignment, Mode>
//   Every block starts on an Alignment boundary (at least alignof(T)).
//   Alignment 1 gives the natural alignment of whatever it is rebound to.
// ============================================================================

template<class T, std::size_t Alignment, fail_mode Mode>
class aligned_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    static_assert(detail::is_pow2(Alignment), "aligned_allocator: Alignment must be pow2");
    static_assert((Mode != fail_mode::throws) || (CHUNKQ_ENABLE_EXCEPTIONS != 0),
                  "aligned_allocator: fail_mode::throws requires exceptions");

    static constexpr std::size_t kEffAlign = detail::max_sz(Alignment, alignof(T));

    aligned_allocator() noexcept = default;

    template<class U>
    aligned_allocator(const aligned_allocator<U, Alignment, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        return detail::typed_allocate<T, kEffAlign, Mode>(n);
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (CHUNKQ_UNLIKELY(!p)) {
            return;
        }
        detail::raw_deallocate<kEffAlign>(p);
    }

    template<class U>
    struct rebind {
        using other = aligned_allocator<U, Alignment, Mode>;
    };
};

template<class T1, std::size_t A1, fail_mode M1, class T2, std::size_t A2, fail_mode M2>
inline bool operator==(const aligned_allocator<T1, A1, M1>&,
                       const aligned_allocator<T2, A2, M2>&) noexcept
{
    return (A1 == A2) && (M1 == M2);
}

template<class T1, std::size_t A1, fail_mode M1, class T2, std::size_t A2, fail_mode M2>
inline bool operator!=(const aligned_allocator<T1, A1, M1>& a,
                       const aligned_allocator<T2, A2, M2>& b) noexcept
{
    return !(a == b);
}

// ============================================================================
// Default allocator aliases
// ============================================================================

static_assert(CHUNKQ_ENABLE_EXCEPTIONS == 0 || CHUNKQ_ENABLE_EXCEPTIONS == 1,
              "CHUNKQ_ENABLE_EXCEPTIONS must be 0 or 1");

inline constexpr fail_mode default_fail_mode =
    (CHUNKQ_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null;

// natural alignment: arena segments, plain chunk storage
using default_alloc = aligned_allocator<std::byte, 1u, default_fail_mode>;

// chunk storage that never shares a cache line with a neighbour
template<std::size_t Alignment>
using align_alloc = aligned_allocator<std::byte, Alignment, default_fail_mode>;

} // namespace chunkq::alloc

#endif /* CHUNKQ_ALLOC_HPP_ */
