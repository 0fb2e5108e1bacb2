/*
 * chunkq_slot.hpp
 *
 * Created on: 14 Jan. 2026
 *      Author: Shpegun60
 *
 * slot<T>: raw storage for one T plus an explicit occupied/vacant flag.
 *
 * A chunk entry is either vacant (no live T) or occupied (exactly one live T).
 * The queue vacates a slot on pop() and unpush(), so a popped chunk never
 * keeps stale values alive.
 *
 * Not thread-safe; the queue decides which side touches which slot.
 */

#ifndef CHUNKQ_SLOT_HPP_
#define CHUNKQ_SLOT_HPP_

#include <new>          // placement new, std::launder
#include <type_traits>
#include <utility>      // std::move, std::forward

#include "chunkq_tools.hpp"

namespace chunkq {

template<class T>
class slot
{
public:
    using value_type = T;

    static_assert(!std::is_reference_v<T>, "[chunkq::slot]: T must not be a reference");
    static_assert(std::is_object_v<T>,     "[chunkq::slot]: T must be an object type");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "[chunkq::slot]: T must be nothrow-destructible");

    slot() noexcept = default;

    ~slot() noexcept { reset(); }

    slot(const slot&)            = delete;
    slot& operator=(const slot&) = delete;
    slot(slot&&)                 = delete;
    slot& operator=(slot&&)      = delete;

    // Constructs a T in place. The slot must be vacant.
    // On a throwing constructor the slot stays vacant.
    template<class... Args>
    T& emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args&&...>)
    {
        CHUNKQ_ASSERT(!engaged_);
        T* p = ::new (static_cast<void*>(&storage_)) T(std::forward<Args>(args)...);
        engaged_ = true;
        return *p;
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE T& get() noexcept {
        CHUNKQ_ASSERT(engaged_);
        return *ptr();
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE const T& get() const noexcept {
        CHUNKQ_ASSERT(engaged_);
        return *ptr();
    }

    // Moves the value out and vacates.
    [[nodiscard]] T take() noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        CHUNKQ_ASSERT(engaged_);
        T out(std::move(*ptr()));
        reset();
        return out;
    }

    void reset() noexcept
    {
        if (engaged_) {
            if constexpr (!std::is_trivially_destructible_v<T>) {
                ptr()->~T();
            }
            engaged_ = false;
        }
    }

    [[nodiscard]] CHUNKQ_FORCEINLINE bool engaged() const noexcept { return engaged_; }

private:
    CHUNKQ_FORCEINLINE T* ptr() noexcept {
        return std::launder(reinterpret_cast<T*>(&storage_));
    }
    CHUNKQ_FORCEINLINE const T* ptr() const noexcept {
        return std::launder(reinterpret_cast<const T*>(&storage_));
    }

    alignas(T) unsigned char storage_[sizeof(T)];
    bool engaged_ = false;
};

} // namespace chunkq

#endif /* CHUNKQ_SLOT_HPP_ */
