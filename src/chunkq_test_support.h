// chunkq_test_support.h
// Payloads and allocators shared by the chunkq test suites.
//
//  - Tracked      : counts constructions/destructions (lifetime checks)
//  - Throwy       : constructor throws on demand (strong-guarantee checks)
//  - AllocStats   : global counters fed by the allocators below
//  - AllocBudget  : number of allocations left before the allocator fails
//  - CountingAlloc<T, Mode>
//                 : stateless, counts every allocation, honours AllocBudget.
//                   Mode selects nullptr or std::bad_alloc on failure.

#ifndef CHUNKQ_TEST_SUPPORT_H
#define CHUNKQ_TEST_SUPPORT_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <type_traits>

#include "base/chunkq_alloc.hpp"

#if !defined(CHUNKQ_TEST_ASSERTS_ON)
#  error "chunkq tests need -DCHUNKQ_USER_CONFIG=\"src/chunkq_test_config.h\""
#endif

namespace chunkq_test {

// -------------------------
// Test payloads
// -------------------------

struct Blob {
    std::uint32_t seq{0};
    std::uint32_t tag{0xA5A5A5A5u};
};

struct Tracked {
    std::uint32_t seq{0};
    std::uint32_t cookie{0xC0FFEEu};

    static inline std::atomic<int> live{0};
    static inline std::atomic<long long> ctor{0};
    static inline std::atomic<long long> dtor{0};

    Tracked() { ++live; ++ctor; }
    explicit Tracked(std::uint32_t s) : seq(s) { ++live; ++ctor; }

    Tracked(const Tracked& o) : seq(o.seq), cookie(o.cookie) { ++live; ++ctor; }

    Tracked(Tracked&& o) noexcept : seq(o.seq), cookie(o.cookie) {
        o.cookie = 0xDEADu;
        ++live; ++ctor;
    }

    Tracked& operator=(const Tracked&) = delete;
    Tracked& operator=(Tracked&&) = delete;

    ~Tracked() {
        cookie = 0xBADC0DEu;
        ++dtor;
        --live;
    }
};

inline void tracked_reset() {
    Tracked::live.store(0);
    Tracked::ctor.store(0);
    Tracked::dtor.store(0);
}

struct Throwy {
    std::uint32_t seq{0};

    static inline bool arm = false;
    static inline std::atomic<int> live{0};

    explicit Throwy(std::uint32_t s) : seq(s) {
        if (arm) {
            throw std::runtime_error("Throwy armed");
        }
        ++live;
    }

    Throwy(Throwy&& o) noexcept : seq(o.seq) { ++live; }
    Throwy(const Throwy&) = delete;
    Throwy& operator=(const Throwy&) = delete;
    Throwy& operator=(Throwy&&) = delete;

    ~Throwy() { --live; }
};

// -------------------------
// Counting allocator (stateless)
// -------------------------

struct AllocStats {
    static inline std::atomic<std::size_t> allocs{0};
    static inline std::atomic<std::size_t> deallocs{0};
    static inline std::atomic<std::size_t> bytes_live{0};
    static inline std::atomic<std::size_t> bytes_peak{0};

    static void reset() {
        allocs.store(0);
        deallocs.store(0);
        bytes_live.store(0);
        bytes_peak.store(0);
    }

    static void on_alloc(std::size_t bytes) {
        allocs.fetch_add(1);
        const auto live_now = bytes_live.fetch_add(bytes) + bytes;
        auto peak = bytes_peak.load();
        while (live_now > peak && !bytes_peak.compare_exchange_weak(peak, live_now)) {
            // CAS loop
        }
    }

    static void on_dealloc(std::size_t bytes) {
        deallocs.fetch_add(1);
        bytes_live.fetch_sub(bytes);
    }
};

// Negative: unlimited. Zero: the next allocation fails.
struct AllocBudget {
    static inline std::atomic<long long> left{-1};

    static void unlimited() { left.store(-1); }
    static void set(long long n) { left.store(n); }

    static bool consume() {
        long long cur = left.load();
        while (cur > 0) {
            if (left.compare_exchange_weak(cur, cur - 1)) {
                return true;
            }
        }
        return cur < 0;
    }
};

template <class T, chunkq::alloc::fail_mode Mode = chunkq::alloc::fail_mode::returns_null>
struct CountingAlloc {
    using value_type = T;
    using pointer = T*;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using is_always_equal = std::true_type;

    CountingAlloc() = default;

    template <class U>
    CountingAlloc(const CountingAlloc<U, Mode>&) noexcept {}

    template <class U>
    struct rebind { using other = CountingAlloc<U, Mode>; };

    [[nodiscard]] pointer allocate(size_type n) {
        if (n == 0) {
            return nullptr;
        }
        if (!AllocBudget::consume()) {
            if constexpr (Mode == chunkq::alloc::fail_mode::throws) {
                throw std::bad_alloc{};
            } else {
                return nullptr;
            }
        }
        const std::size_t bytes = n * sizeof(T);
        void* p = ::operator new(bytes, std::align_val_t(alignof(T)), std::nothrow);
        if (!p) {
            return nullptr;
        }
        AllocStats::on_alloc(bytes);
        return static_cast<pointer>(p);
    }

    void deallocate(pointer p, size_type n) noexcept {
        if (!p || n == 0) {
            return;
        }
        AllocStats::on_dealloc(n * sizeof(T));
        ::operator delete(p, std::align_val_t(alignof(T)));
    }
};

template <class T, class U, chunkq::alloc::fail_mode M>
inline bool operator==(const CountingAlloc<T, M>&, const CountingAlloc<U, M>&) noexcept { return true; }

template <class T, class U, chunkq::alloc::fail_mode M>
inline bool operator!=(const CountingAlloc<T, M>&, const CountingAlloc<U, M>&) noexcept { return false; }

using NullAlloc  = CountingAlloc<std::byte, chunkq::alloc::fail_mode::returns_null>;
using ThrowAlloc = CountingAlloc<std::byte, chunkq::alloc::fail_mode::throws>;

} // namespace chunkq_test

#endif // CHUNKQ_TEST_SUPPORT_H
