/*
 * fuset_refcount.hpp
 *
 * Created on: 19 Oct. 2026
 *   Author: fuset authors
 *
 *
 * Atomic intrusive reference count for member records and wake targets.
 *
 *   - ref_count<Orders>
 *       * retain()  : +1, returns nothing
 *       * release() : -1, returns true for the caller that dropped the last
 *                     reference (that caller destroys the object)
 *       * load()    : current value, diagnostics only
 *
 *   - Memory ordering is configurable via Orders:
 *       Orders::retain  → order for the increment (relaxed is enough: a new
 *                         reference is always derived from an existing one)
 *       Orders::release → order for the decrement (release, so every write
 *                         made through a reference happens-before destruction)
 *       Orders::destroy → fence issued by the last releaser before it
 *                         destroys the object (acquire)
 *
 *   - cache_padded<T>
 *       Places T alone on its cache line(s). The ready queue uses it to keep
 *       the producer-side head and the consumer-side tail apart.
 *
 * Configuration:
 *   - FUSET_REQUIRE_LOCK_FREE (default 1):
 *       * 1 → static_assert if std::atomic<U>::is_always_lock_free is false.
 */

#ifndef FUSET_REFCOUNT_HPP_
#define FUSET_REFCOUNT_HPP_

#include <atomic>
#include <limits>
#include <type_traits>

#include "basic_types.h"       // reg
#include "fuset_cacheline.hpp" // ::fuset::hw::cacheline_bytes
#include "fuset_tools.hpp"     // FUSET_FORCEINLINE / FUSET_ASSERT

namespace fuset::cnt {

/* ------------------------------- Orders palette --------------------------- */
struct refcount_orders {
    static constexpr std::memory_order retain  = std::memory_order_relaxed;
    static constexpr std::memory_order release = std::memory_order_release;
    static constexpr std::memory_order destroy = std::memory_order_acquire;
};

/* Internal constexpr checks to catch nonsense orders at compile-time. */
namespace detail {

    constexpr bool valid_rmw_order(std::memory_order mo) {
        return mo != std::memory_order_consume;
    }

    constexpr bool valid_release_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_release:
            case std::memory_order_acq_rel:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false; // a relaxed/acquire decrement lets writes leak past destruction
        }
    }

    constexpr bool valid_fence_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_acquire:
            case std::memory_order_acq_rel:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false;
        }
    }

    template<reg PadBytes>
    struct cacheline_pad {
        unsigned char padding[PadBytes];
    };

    template<>
    struct cacheline_pad<0> {
    };

} // namespace detail

/* ------------------------------- ref_count --------------------------------
 * Starts at 1: the creator owns the first reference.
 * --------------------------------------------------------------------------- */
template<typename Orders = refcount_orders>
class ref_count {
public:
    using value_type = reg;

private:
    static_assert(detail::valid_rmw_order(Orders::retain),       "ref_count: invalid retain memory_order");
    static_assert(detail::valid_release_order(Orders::release),  "ref_count: invalid release memory_order");
    static_assert(detail::valid_fence_order(Orders::destroy),    "ref_count: invalid destroy memory_order");

#if FUSET_REQUIRE_LOCK_FREE
    static_assert(std::atomic<value_type>::is_always_lock_free, "ref_count: not always lock-free on this target");
#endif /* FUSET_REQUIRE_LOCK_FREE */

    // Overflow guard: a count this large means references are being leaked.
    static constexpr value_type kMaxRefs = std::numeric_limits<value_type>::max() / 2u;

    std::atomic<value_type> v_{1};

public:
    ref_count() noexcept = default;
    ref_count(const ref_count&) = delete;
    ref_count& operator=(const ref_count&) = delete;

    FUSET_FORCEINLINE void retain() noexcept {
        const value_type prev = v_.fetch_add(1u, Orders::retain);
        FUSET_ASSERT(prev != 0u && "ref_count::retain() on a dead object");
        FUSET_ASSERT(prev < kMaxRefs && "ref_count::retain() overflow");
        (void)prev;
    }

    [[nodiscard]] FUSET_FORCEINLINE bool release() noexcept {
        const value_type prev = v_.fetch_sub(1u, Orders::release);
        FUSET_ASSERT(prev != 0u && "ref_count::release() underflow");
        if (prev != 1u) {
            return false;
        }
        std::atomic_thread_fence(Orders::destroy);
        return true;
    }

    [[nodiscard]] FUSET_FORCEINLINE value_type load() const noexcept {
        return v_.load(std::memory_order_relaxed);
    }
};

/* ------------------------------ cache_padded -------------------------------
 * Aligns T to AlignB and pads sizeof(...) up to a multiple of AlignB.
 * --------------------------------------------------------------------------- */
template<class T, reg AlignB = ::fuset::hw::cacheline_bytes>
struct cache_padded {
    static_assert(AlignB != 0, "cache_padded: AlignB must be non-zero");
    static_assert((AlignB & (AlignB - 1u)) == 0u, "cache_padded: AlignB must be power-of-two");
    static_assert(AlignB >= alignof(T), "cache_padded: AlignB must be >= alignof(T)");

    static constexpr reg kRem = sizeof(T) % AlignB;
    static constexpr reg kPad = (kRem == 0u) ? 0u : (AlignB - kRem);

    alignas(AlignB) T value;
    detail::cacheline_pad<kPad> pad;
};

} // namespace fuset::cnt

#endif /* FUSET_REFCOUNT_HPP_ */
