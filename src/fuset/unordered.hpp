/*
 * unordered.hpp
 *
 * fuset::unordered<F, Alloc>: an unbounded set of futures polled as one stream.
 * Each computation's output is yielded exactly once, in completion order, and
 * only computations that were woken are polled again.
 *
 * Engine:
 * - all-list: doubly-linked list of every live record. Single owner, no
 *   atomics. Used for size(), iteration and teardown.
 * - ready queue: lock-free MPSC queue (ready_queue.hpp). A record's waker
 *   pushes it there from any thread; poll_next() drains it.
 *
 *   push(f)         record created, linked, enqueued (first poll is scheduled)
 *   wake (any thr)  queued false -> true, enqueue, wake the set's poller
 *   poll_next(cx)   dequeue -> unlink -> queued := false -> f.poll()
 *                     pending : re-link
 *                     ready   : finalize, return the value
 *                     throws  : finalize, rethrow
 *
 * Finalizing a record clears its computation and sets queued = true so that
 * no later wake enqueues it. If it was still in the ready queue, the owning
 * reference is handed to the queue; a later dequeue finds the empty record
 * and releases it.
 *
 * Threading contract:
 * - push/emplace/try_push/poll_next/clear/iteration/move/swap/destruction:
 *   one thread at a time (caller serializes).
 * - Wakers of member computations: any thread, any time, also after the set
 *   is destroyed.
 *
 * Usage:
 *   fuset::unordered<my_future> set;
 *   set.push(my_future{...});
 *   while (auto item = fuset::block_on(set.next())) { use(*item); }
 */

#ifndef FUSET_UNORDERED_HPP_
#define FUSET_UNORDERED_HPP_

#include <cstdlib>  // std::abort
#include <iterator> // std::begin, std::end
#include <memory>   // std::shared_ptr, std::make_shared
#include <optional>
#include <type_traits>
#include <utility>  // std::move, std::exchange, std::forward

#include "basic_types.h"
#include "base/fuset_alloc.hpp"
#include "base/fuset_tools.hpp"
#include "context.hpp"
#include "future.hpp"
#include "node.hpp"
#include "poll.hpp"
#include "ready_queue.hpp"
#include "waker.hpp"

namespace fuset {

template<class F, class Alloc = alloc::default_alloc>
class unordered {
    static_assert(is_future_v<F>, "unordered: F must provide poll(fuset::context&) -> fuset::poll<T>");
    static_assert(std::is_move_constructible_v<F>, "unordered: F must be move-constructible");

    using node_type = detail::node<F, Alloc>;
    using node_base = detail::node_base;
    using node_owner = detail::node_owner;

public:
    using future_type    = F;
    using output_type    = future_output_t<F>;
    using allocator_type = Alloc;
    using size_type      = reg;
    using poll_type      = ::fuset::poll<std::optional<output_type>>;

    using iterator       = detail::node_iterator<F, Alloc, false>;
    using const_iterator = detail::node_iterator<F, Alloc, true>;

    // Future resolving to the next item of a set (std::nullopt once the set
    // is exhausted). The set must outlive it.
    class next_future {
    public:
        explicit next_future(unordered& set) noexcept : set_(&set) {}

        poll_type poll(context& cx) { return set_->poll_next(cx); }

    private:
        unordered* set_;
    };

    // ------------------------------------------------------------------------------------------
    // Construction / destruction
    // ------------------------------------------------------------------------------------------
    unordered() : queue_(std::make_shared<detail::ready_queue>()) {}

    template<class InputIt>
    unordered(InputIt first, InputIt last) : unordered() {
        for (; first != last; ++first) {
            push(*first);
        }
    }

    unordered(const unordered&) = delete;
    unordered& operator=(const unordered&) = delete;

    unordered(unordered&& other) noexcept
        : head_all_(std::exchange(other.head_all_, nullptr))
        , len_(std::exchange(other.len_, 0u))
        , queue_(std::move(other.queue_))
    {}

    unordered& operator=(unordered&& other) noexcept {
        if (this != &other) {
            unordered tmp(std::move(other));
            swap(tmp);
        }
        return *this;
    }

    // Drops every linked computation on this thread. Records still referenced
    // by wakers or by the ready queue are freed when those references go.
    ~unordered() noexcept { clear(); }

    void swap(unordered& other) noexcept {
        std::swap(head_all_, other.head_all_);
        std::swap(len_, other.len_);
        queue_.swap(other.queue_);
    }

    // ------------------------------------------------------------------------------------------
    // Status
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] size_type size() const noexcept { return len_; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0u; }

    // false only for a moved-from set
    [[nodiscard]] bool is_valid() const noexcept { return queue_ != nullptr; }

    // ------------------------------------------------------------------------------------------
    // Insertion
    // ------------------------------------------------------------------------------------------
    void push(F&& f) { emplace(std::move(f)); }
    void push(const F& f) { emplace(f); }

    // The computation is not polled here; its first poll is scheduled.
    // A record allocation failure terminates (throws with a throwing
    // allocator); use try_push() to handle it.
    template<class... Args>
    void emplace(Args&&... args) {
        if (FUSET_UNLIKELY(!insert_(std::forward<Args>(args)...))) {
            FUSET_ASSERT(false && "unordered::push(): record allocation failed");
            std::abort();
        }
    }

    // Returns false if the allocator could not provide a record; `f` is left
    // untouched in that case.
    [[nodiscard]] bool try_push(F&& f) { return insert_(std::move(f)); }
    [[nodiscard]] bool try_push(const F& f) { return insert_(f); }

    // ------------------------------------------------------------------------------------------
    // Polling
    // ------------------------------------------------------------------------------------------

    /*
     * pending            : no member is ready; cx's waker will be woken.
     * ready(value)       : one member completed and was removed.
     * ready(std::nullopt): the set is empty.
     *
     * An exception thrown by a member's poll() removes that member and
     * propagates; the set remains usable.
     */
    [[nodiscard]] poll_type poll_next(context& cx) {
        FUSET_ASSERT(is_valid() && "unordered::poll_next() on a moved-from set");

        queue_->parent().register_waker(cx.current_waker());

        for (;;) {
            const detail::dequeue_result r = queue_->dequeue();

            if (r.status == detail::dequeue_status::empty) {
                if (empty()) {
                    return ready(std::optional<output_type>{});
                }
                return pending;
            }

            if (r.status == detail::dequeue_status::inconsistent) {
                // A producer is mid-enqueue. Come back later instead of spinning.
                cx.reschedule();
                return pending;
            }

            if (r.node == queue_->stub()) {
                continue;
            }

            node_type* const n = static_cast<node_type*>(static_cast<node_base*>(r.node));

            if (!n->future.has_value()) {
                // Finalized while queued: the queue owned the last owning reference.
                FUSET_ASSERT(n->owner == node_owner::ready_queue);
                FUSET_ASSERT(n->next_all == nullptr && n->prev_all == nullptr);
                n->owner = node_owner::released;
                n->release();
                continue;
            }

            unlink_(n);

            // Cleared before polling, so a wake during poll() reschedules.
            const bool was_queued = n->queued.exchange(false, std::memory_order_seq_cst);
            FUSET_ASSERT(was_queued && "unordered::poll_next(): dequeued record was not marked queued");
            (void)was_queued;

            release_guard guard(*this, n);

            const waker w = n->make_waker();
            context node_cx(w);
            auto res = n->future->poll(node_cx);

            if (res.is_pending()) {
                guard.disarm();
                link_(n);
                continue;
            }

            return ready(std::optional<output_type>(std::move(res).take()));
        }
    }

    [[nodiscard]] next_future next() noexcept { return next_future(*this); }

    // ------------------------------------------------------------------------------------------
    // Iteration (exclusive access required)
    // ------------------------------------------------------------------------------------------
    iterator begin() noexcept { return iterator(head_all_); }
    iterator end() noexcept { return iterator(nullptr); }
    const_iterator begin() const noexcept { return cbegin(); }
    const_iterator end() const noexcept { return cend(); }
    const_iterator cbegin() const noexcept { return const_iterator(head_all_); }
    const_iterator cend() const noexcept { return const_iterator(nullptr); }

    // ------------------------------------------------------------------------------------------
    // Bulk removal
    // ------------------------------------------------------------------------------------------

    // Drops every member computation. The set stays usable.
    void clear() noexcept {
        while (head_all_ != nullptr) {
            node_type* const n = static_cast<node_type*>(head_all_);
            unlink_(n);
            release_node_(n);
        }
    }

private:
    /* Finalizes an in-flight record unless disarmed. Move-only. */
    class release_guard {
    public:
        release_guard(unordered& set, node_type* n) noexcept : set_(&set), node_(n) {}

        release_guard(const release_guard&) = delete;
        release_guard& operator=(const release_guard&) = delete;

        release_guard(release_guard&& other) noexcept
            : set_(other.set_)
            , node_(std::exchange(other.node_, nullptr))
        {}

        release_guard& operator=(release_guard&&) = delete;

        ~release_guard() noexcept {
            if (node_ != nullptr) {
                set_->release_node_(node_);
            }
        }

        void disarm() noexcept { node_ = nullptr; }

    private:
        unordered* set_;
        node_type* node_;
    };

    template<class... Args>
    bool insert_(Args&&... args) {
        FUSET_ASSERT(is_valid() && "unordered: insertion into a moved-from set");

        node_type* const n = node_type::create(queue_, std::forward<Args>(args)...);
        if (FUSET_UNLIKELY(n == nullptr)) {
            return false;
        }

        link_(n);
        queue_->enqueue(n);
        return true;
    }

    // Takes over the owning reference of an in-flight record.
    FUSET_FORCEINLINE void link_(node_base* n) noexcept {
        FUSET_ASSERT(n->owner == node_owner::in_flight);
        FUSET_ASSERT(n->next_all == nullptr && n->prev_all == nullptr);

        n->next_all = head_all_;
        if (head_all_ != nullptr) {
            head_all_->prev_all = n;
        }
        head_all_ = n;
        ++len_;
        n->owner = node_owner::all_list;
    }

    // Hands the owning reference to the caller (in-flight).
    FUSET_FORCEINLINE void unlink_(node_base* n) noexcept {
        FUSET_ASSERT(n->owner == node_owner::all_list);
        FUSET_ASSERT(len_ != 0u);

        node_base* const next = n->next_all;
        node_base* const prev = n->prev_all;
        n->next_all = nullptr;
        n->prev_all = nullptr;

        if (next != nullptr) {
            next->prev_all = prev;
        }
        if (prev != nullptr) {
            prev->next_all = next;
        } else {
            head_all_ = next;
        }
        --len_;
        n->owner = node_owner::in_flight;
    }

    // Drops the computation and gives up the owning reference, or hands it to
    // the ready queue when the record is still queued there.
    void release_node_(node_type* n) noexcept {
        FUSET_ASSERT(n->owner == node_owner::in_flight);
        FUSET_ASSERT(n->next_all == nullptr && n->prev_all == nullptr);

        // From now on no wake will enqueue this record.
        const bool was_queued = n->queued.exchange(true, std::memory_order_seq_cst);

        n->future.reset();

        if (was_queued) {
            n->owner = node_owner::ready_queue;
            return;
        }
        n->owner = node_owner::released;
        n->release();
    }

    node_base* head_all_{nullptr};
    size_type len_{0u};
    std::shared_ptr<detail::ready_queue> queue_;
};

template<class F, class Alloc>
inline void swap(unordered<F, Alloc>& a, unordered<F, Alloc>& b) noexcept {
    a.swap(b);
}

/* ------------------------------ make_unordered ------------------------------ */
template<class InputIt>
[[nodiscard]] auto make_unordered(InputIt first, InputIt last)
    -> unordered<typename std::iterator_traits<InputIt>::value_type>
{
    return unordered<typename std::iterator_traits<InputIt>::value_type>(first, last);
}

// Copies the elements of an lvalue range, moves them out of an rvalue one.
template<class Range>
[[nodiscard]] auto make_unordered(Range&& range)
    -> unordered<std::decay_t<decltype(*std::begin(range))>>
{
    unordered<std::decay_t<decltype(*std::begin(range))>> set;
    for (auto&& f : range) {
        if constexpr (std::is_lvalue_reference_v<Range>) {
            set.push(f);
        } else {
            set.push(std::move(f));
        }
    }
    return set;
}

} // namespace fuset

#endif /* FUSET_UNORDERED_HPP_ */
