/*
 * context.hpp
 *
 * Per-poll context handed to a future: carries the waker of the task that is
 * currently polling it.
 *
 * A context only borrows the waker; it never outlives the poll call it was
 * built for. A future that wants to be polled again clones the waker
 * (current_waker() copy) and stores it wherever the wakeup will come from.
 */

#ifndef FUSET_CONTEXT_HPP_
#define FUSET_CONTEXT_HPP_

#include "waker.hpp"

namespace fuset {

class context {
public:
    explicit context(const waker& w) noexcept : waker_(&w) {}

    context(const context&) = delete;
    context& operator=(const context&) = delete;

    [[nodiscard]] const waker& current_waker() const noexcept { return *waker_; }

    // Ask to be polled again as soon as possible.
    void reschedule() const noexcept { waker_->wake_by_ref(); }

private:
    const waker* waker_;
};

} // namespace fuset

#endif /* FUSET_CONTEXT_HPP_ */
