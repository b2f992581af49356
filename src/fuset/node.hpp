/*
 * node.hpp
 *
 * Member record of an unordered set: one per registered computation.
 *
 * Field ownership:
 * - future, next_all, prev_all, owner: touched only by the thread that has
 *   exclusive access to the owning set (poll/push/clear/iterate).
 * - next_ready, queued: shared with producer threads (see ready_queue.hpp).
 * - refs_: shared, atomic.
 *
 * References:
 * - One owning reference, held by exactly one of: the all-list, the in-flight
 *   poller, the ready queue (finalized while queued). `owner` tracks which.
 * - One reference per outstanding waker clone.
 * The record is destroyed and its memory returned to the set's allocator when
 * the last reference is released, on whatever thread that happens.
 */

#ifndef FUSET_NODE_HPP_
#define FUSET_NODE_HPP_

#include <cstddef>
#include <iterator> // std::forward_iterator_tag
#include <memory>   // std::weak_ptr, std::shared_ptr, std::allocator_traits, std::addressof
#include <new>      // placement new
#include <optional>
#include <type_traits>
#include <utility>  // std::forward, std::move

#include "basic_types.h"
#include "base/fuset_cacheline.hpp"
#include "base/fuset_refcount.hpp"
#include "base/fuset_tools.hpp"
#include "ready_queue.hpp"
#include "waker.hpp"

namespace fuset::detail {

enum class node_owner : u8 {
    all_list,
    in_flight,
    ready_queue,
    released
};

inline constexpr std::size_t kNodeAlign =
#if FUSET_ALIGN_NODES
    static_cast<std::size_t>(::fuset::hw::cacheline_bytes);
#else
    alignof(std::max_align_t);
#endif /* FUSET_ALIGN_NODES */

class alignas(kNodeAlign) node_base : public ready_node {
public:
    // all-list links (single owner)
    node_base* next_all{nullptr};
    node_base* prev_all{nullptr};
    node_owner owner{node_owner::in_flight};

    // Never keeps the queue alive on its own.
    std::weak_ptr<ready_queue> queue;

    void retain() noexcept override { refs_.retain(); }

    void release() noexcept override {
        if (refs_.release()) {
            dispose();
        }
    }

    // Schedules this record for another poll. Any thread, any time, also
    // after the owning set is gone.
    void wake() noexcept override {
        const std::shared_ptr<ready_queue> q = queue.lock();
        if (!q) {
            return;
        }

        // Already queued, or finalized: nothing to do.
        if (queued.exchange(true, std::memory_order_seq_cst)) {
            return;
        }

        q->enqueue(this);
        q->parent().wake();
    }

    // Waker bound to this record; takes a reference.
    [[nodiscard]] waker make_waker() noexcept { return waker::share(this); }

    [[nodiscard]] virtual bool has_future() const noexcept = 0;

    [[nodiscard]] cnt::ref_count<>::value_type use_count() const noexcept { return refs_.load(); }

protected:
    explicit node_base(std::weak_ptr<ready_queue> q) noexcept : queue(std::move(q)) {}
    ~node_base() = default;

    // Destroys the record and frees its memory.
    virtual void dispose() noexcept = 0;

private:
    cnt::ref_count<> refs_{};
};

template<class F, class Alloc>
class node final : public node_base {
    using alloc_traits = typename std::allocator_traits<Alloc>::template rebind_traits<node>;
    using node_alloc   = typename alloc_traits::allocator_type;

public:
    std::optional<F> future;

    // Returns nullptr when the allocator reports failure in returns_null mode;
    // a throwing allocator or a throwing F constructor propagates.
    template<class... Args>
    [[nodiscard]] static node* create(std::weak_ptr<ready_queue> q, Args&&... args) {
        node_alloc a{};
        node* const mem = alloc_traits::allocate(a, 1u);
        if (FUSET_UNLIKELY(mem == nullptr)) {
            return nullptr;
        }

        struct dealloc_on_throw {
            node_alloc& a;
            node* p;
            ~dealloc_on_throw() {
                if (p != nullptr) {
                    alloc_traits::deallocate(a, p, 1u);
                }
            }
        } guard{a, mem};

        node* const n = ::new (static_cast<void*>(mem)) node(std::move(q), std::forward<Args>(args)...);
        guard.p = nullptr;
        return n;
    }

    [[nodiscard]] bool has_future() const noexcept override { return future.has_value(); }

private:
    template<class... Args>
    explicit node(std::weak_ptr<ready_queue> q, Args&&... args)
        : node_base(std::move(q)), future(std::in_place, std::forward<Args>(args)...) {}

    ~node() = default;

    void dispose() noexcept override {
        FUSET_ASSERT(!future.has_value() && "record destroyed while its computation is still alive");
        FUSET_ASSERT(owner == node_owner::released || owner == node_owner::ready_queue);
        node_alloc a{};
        this->~node();
        alloc_traits::deallocate(a, this, 1u);
    }
};

/* ------------------------------ node_iterator ------------------------------
 * Forward walk over the all-list. Every linked record holds a computation.
 * --------------------------------------------------------------------------- */
template<class F, class Alloc, bool Const>
class node_iterator
{
    using record = node<F, Alloc>;

public:
    using value_type        = F;
    using difference_type   = std::ptrdiff_t;
    using reference         = std::conditional_t<Const, const F&, F&>;
    using pointer           = std::conditional_t<Const, const F*, F*>;
    using iterator_category = std::forward_iterator_tag;

    node_iterator() noexcept = default;

    explicit node_iterator(node_base* n) noexcept : node_(n) {}

    // Implicit conversion from non-const to const iterator.
    template<bool C = Const, typename = std::enable_if_t<C>>
    node_iterator(const node_iterator<F, Alloc, false>& other) noexcept
        : node_(other.node_)
    {}

    reference operator*() const noexcept {
        FUSET_ASSERT(node_ != nullptr);
        return *static_cast<record*>(node_)->future;
    }

    pointer operator->() const noexcept {
        return std::addressof(**this);
    }

    node_iterator& operator++() noexcept {
        node_ = node_->next_all;
        return *this;
    }

    node_iterator operator++(int) noexcept {
        node_iterator tmp(*this);
        ++(*this);
        return tmp;
    }

    [[nodiscard]] const node_base* get() const noexcept { return node_; }

private:
    template<class, class, bool> friend class node_iterator;

    node_base* node_{nullptr};
};

template<class F, class Alloc, bool C1, bool C2>
inline bool operator==(const node_iterator<F, Alloc, C1>& a,
                       const node_iterator<F, Alloc, C2>& b) noexcept
{
    return a.get() == b.get();
}

template<class F, class Alloc, bool C1, bool C2>
inline bool operator!=(const node_iterator<F, Alloc, C1>& a,
                       const node_iterator<F, Alloc, C2>& b) noexcept
{
    return !(a == b);
}

} // namespace fuset::detail

#endif /* FUSET_NODE_HPP_ */
