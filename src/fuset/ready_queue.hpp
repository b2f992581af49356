/*
 * ready_queue.hpp
 *
 * Intrusive lock-free MPSC queue of records that asked to be polled again
 * (Vyukov's non-blocking intrusive queue with a permanent stub).
 *
 * Roles:
 * - enqueue(): any number of producer threads (waker invocations).
 * - dequeue(): exactly one consumer at a time (the poller of the owning set).
 *
 * Structure:
 *
 *   tail_ -> [stub] -> [A] -> [B] -> ... -> [Z] <- head_
 *
 * - Producers swap themselves into head_ and only then link the previous head
 *   to themselves. Between those two steps the chain is broken; the consumer
 *   reports that window as dequeue_status::inconsistent instead of treating
 *   it as empty.
 * - The stub never carries a computation. When the consumer reaches the last
 *   real record it re-enqueues the stub behind it so that the record can be
 *   detached without touching head_ concurrently with producers.
 *
 * Reference counting:
 * - enqueue() does NOT take a reference: a queued record is kept alive by its
 *   owning reference (all-list, in-flight poller, or a handoff to this queue).
 * - ~ready_queue() drains every record still queued and releases one
 *   reference on each. Those records were finalized while still queued, which
 *   is the only way the queue can hold the owning reference.
 *
 * Lifetime:
 * - The owning set holds the queue through std::shared_ptr, every record
 *   through std::weak_ptr. The destructor therefore runs on whichever thread
 *   drops the last strong reference (the set, or a waker that had upgraded).
 */

#ifndef FUSET_READY_QUEUE_HPP_
#define FUSET_READY_QUEUE_HPP_

#include <atomic>

#include "base/fuset_refcount.hpp" // cnt::cache_padded
#include "base/fuset_tools.hpp"
#include "atomic_waker.hpp"
#include "waker.hpp"

namespace fuset::detail {

/* -------------------------------- ready_node -------------------------------
 * Queue hook. Both fields are shared with producer threads.
 * --------------------------------------------------------------------------- */
class ready_node : public wake_target {
public:
    // Written by the producer that enqueues this record and by the consumer.
    std::atomic<ready_node*> next_ready{nullptr};

    // true  : in the queue, insertion in flight, or finalized
    // false : free to be enqueued by the next wake
    std::atomic<bool> queued{true};

protected:
    ready_node() noexcept = default;
    ~ready_node() = default;
};

#if FUSET_REQUIRE_LOCK_FREE
static_assert(std::atomic<ready_node*>::is_always_lock_free, "ready_queue: pointer atomics are not lock-free");
static_assert(std::atomic<bool>::is_always_lock_free, "ready_queue: bool atomics are not lock-free");
#endif /* FUSET_REQUIRE_LOCK_FREE */

enum class dequeue_status {
    empty,
    inconsistent,
    data
};

struct dequeue_result {
    dequeue_status status;
    ready_node* node; // non-null only for dequeue_status::data
};

class ready_queue {
public:
    ready_queue() noexcept {
        stub_.next_ready.store(nullptr, std::memory_order_relaxed);
        head_.value.store(&stub_, std::memory_order_relaxed);
        tail_.value = &stub_;
    }

    ready_queue(const ready_queue&) = delete;
    ready_queue& operator=(const ready_queue&) = delete;

    FUSET_NOINLINE ~ready_queue() noexcept {
        for (;;) {
            const dequeue_result r = dequeue();
            switch (r.status) {
                case dequeue_status::empty:
                    return;

                case dequeue_status::inconsistent:
                    // No producer can be mid-enqueue while the last strong
                    // reference goes away: the producer would hold one.
                    FUSET_ASSERT(!"ready_queue destroyed while inconsistent");
                    return;

                case dequeue_status::data:
                    if (r.node != &stub_) {
                        r.node->release();
                    }
                    break;
            }
        }
    }

    // Producer side, any thread. The caller must have won the queued flag.
    FUSET_FORCEINLINE void enqueue(ready_node* n) noexcept {
        FUSET_ASSERT(n != nullptr);
        FUSET_ASSERT(n->queued.load(std::memory_order_relaxed) && "ready_queue::enqueue() of a record that was not claimed");

        n->next_ready.store(nullptr, std::memory_order_relaxed);
        ready_node* const prev = head_.value.exchange(n, std::memory_order_acq_rel);
        // The chain is broken until this store becomes visible.
        prev->next_ready.store(n, std::memory_order_release);
    }

    // Consumer side. Caller guarantees mutual exclusion with other dequeue()
    // calls and with destruction.
    [[nodiscard]] dequeue_result dequeue() noexcept {
        ready_node* tail = tail_.value;
        ready_node* next = tail->next_ready.load(std::memory_order_acquire);

        if (tail == &stub_) {
            if (next == nullptr) {
                return {dequeue_status::empty, nullptr};
            }
            tail_.value = next;
            tail = next;
            next = next->next_ready.load(std::memory_order_acquire);
        }

        if (next != nullptr) {
            tail_.value = next;
            return {dequeue_status::data, tail};
        }

        if (head_.value.load(std::memory_order_acquire) != tail) {
            return {dequeue_status::inconsistent, nullptr};
        }

        // tail is the last real record: put the stub behind it.
        enqueue(&stub_);

        next = tail->next_ready.load(std::memory_order_acquire);
        if (next != nullptr) {
            tail_.value = next;
            return {dequeue_status::data, tail};
        }

        return {dequeue_status::inconsistent, nullptr};
    }

    [[nodiscard]] const ready_node* stub() const noexcept { return &stub_; }

    // Waker of whichever task polls the owning set.
    [[nodiscard]] atomic_waker& parent() noexcept { return parent_; }

private:
    class stub_node final : public ready_node {
    public:
        stub_node() noexcept = default;
        ~stub_node() = default;

        void retain() noexcept override {}
        void release() noexcept override {}
        void wake() noexcept override {}
    };

    // Producers hammer head_, the consumer owns tail_: keep them apart.
    cnt::cache_padded<std::atomic<ready_node*>> head_{};
    cnt::cache_padded<ready_node*> tail_{};
    stub_node stub_{};
    atomic_waker parent_{};
};

} // namespace fuset::detail

#endif /* FUSET_READY_QUEUE_HPP_ */
