/*
 * atomic_waker.hpp
 *
 * Single-slot waker register shared between one registering task and any
 * number of waking threads.
 *
 * Concurrency model:
 * - register_waker(): one thread at a time (the task that polls the owner).
 * - wake() / take():  any thread, any time, lock-free.
 *
 * State machine over one atomic word:
 *
 *   WAITING      slot is stable, nobody touches it
 *   REGISTERING  the registering thread owns the slot
 *   WAKING       a waking thread owns the slot
 *
 *   - A wake() that lands while a registration is in flight sets WAKING on
 *     top of REGISTERING; the registering thread notices on its way out and
 *     wakes the freshly stored waker itself. No wakeup is lost.
 *   - A registration that lands while a wake() owns the slot wakes the new
 *     waker immediately instead of storing it.
 */

#ifndef FUSET_ATOMIC_WAKER_HPP_
#define FUSET_ATOMIC_WAKER_HPP_

#include <atomic>
#include <utility> // std::move

#include "basic_types.h"        // reg
#include "base/fuset_tools.hpp" // FUSET_ASSERT / FUSET_UNLIKELY
#include "waker.hpp"

namespace fuset {

class atomic_waker {
public:
    atomic_waker() noexcept = default;
    atomic_waker(const atomic_waker&) = delete;
    atomic_waker& operator=(const atomic_waker&) = delete;

    ~atomic_waker() = default;

    void register_waker(const waker& w) noexcept {
        reg cur = kWaiting;
        if (state_.compare_exchange_strong(cur, kRegistering,
                                           std::memory_order_acquire,
                                           std::memory_order_acquire)) {
            // The slot is ours. Replacing a waker that reschedules the same
            // task is pointless, skip the refcount traffic.
            waker old;
            if (!slot_.will_wake(w)) {
                old = std::move(slot_);
                slot_ = w;
            }

            reg expect = kRegistering;
            if (!state_.compare_exchange_strong(expect, kWaiting,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
                // A concurrent wake() arrived while we held the slot: it could
                // not take the waker, so we deliver the wakeup ourselves.
                FUSET_ASSERT(expect == (kRegistering | kWaking));
                waker pending_wake = std::move(slot_);
                state_.exchange(kWaiting, std::memory_order_acq_rel);
                std::move(pending_wake).wake();
            }
            // `old` is released here, outside the critical section.
            return;
        }

        if (cur == kWaking) {
            // A wake() currently owns the slot; deliver directly.
            w.wake_by_ref();
            return;
        }

        // REGISTERING (with or without WAKING): concurrent registration from
        // two threads, which the single-registrant contract forbids.
        FUSET_ASSERT(!"atomic_waker::register_waker() called concurrently");
    }

    // Wakes and clears the registered waker, if any.
    void wake() noexcept {
        waker w = take();
        if (w) {
            std::move(w).wake();
        }
    }

    // Removes the registered waker. Returns an empty waker when the slot is
    // empty or when another thread currently owns it.
    [[nodiscard]] waker take() noexcept {
        const reg prev = state_.fetch_or(kWaking, std::memory_order_acq_rel);
        if (prev == kWaiting) {
            waker w = std::move(slot_);
            state_.fetch_and(~kWaking, std::memory_order_release);
            return w;
        }

        // REGISTERING: the registrant will observe WAKING and wake itself.
        // WAKING: another thread is already delivering.
        FUSET_ASSERT(prev == kRegistering || prev == (kRegistering | kWaking) || prev == kWaking);
        return waker{};
    }

private:
    static constexpr reg kWaiting     = 0u;
    static constexpr reg kRegistering = 0b01u;
    static constexpr reg kWaking      = 0b10u;

#if FUSET_REQUIRE_LOCK_FREE
    static_assert(std::atomic<reg>::is_always_lock_free, "atomic_waker: not always lock-free on this target");
#endif /* FUSET_REQUIRE_LOCK_FREE */

    std::atomic<reg> state_{kWaiting};
    waker slot_{};
};

} // namespace fuset

#endif /* FUSET_ATOMIC_WAKER_HPP_ */
