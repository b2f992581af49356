/*
 * block_on.hpp
 *
 * Drives one future to completion on the calling thread.
 *
 *   int v = fuset::block_on(fuset::ready_future(7));
 *   auto item = fuset::block_on(set.next());
 *
 * The thread parks on a condition variable between polls. Wakes are sticky:
 * a wake that arrives before the thread parks makes the next park() return
 * immediately, so no wakeup is lost between poll() returning pending and the
 * thread going to sleep.
 */

#ifndef FUSET_BLOCK_ON_HPP_
#define FUSET_BLOCK_ON_HPP_

#include <condition_variable>
#include <mutex>
#include <type_traits>
#include <utility> // std::move

#include "base/fuset_refcount.hpp"
#include "context.hpp"
#include "future.hpp"
#include "waker.hpp"

namespace fuset {

class thread_notify final : public wake_target {
public:
    // The caller owns the initial reference (adopt it into a waker).
    [[nodiscard]] static thread_notify* create() {
        return new thread_notify();
    }

    void retain() noexcept override { refs_.retain(); }

    void release() noexcept override {
        if (refs_.release()) {
            delete this;
        }
    }

    void wake() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            unparked_ = true;
        }
        cv_.notify_one();
    }

    // Blocks until a wake token is available, then consumes it.
    void park() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return unparked_; });
        unparked_ = false;
    }

    [[nodiscard]] cnt::ref_count<>::value_type use_count() const noexcept { return refs_.load(); }

private:
    thread_notify() = default;
    ~thread_notify() = default;

    cnt::ref_count<> refs_{};
    std::mutex mtx_{};
    std::condition_variable cv_{};
    bool unparked_{false};
};

template<class F>
[[nodiscard]] future_output_t<F> block_on(F fut) {
    static_assert(is_future_v<F>, "block_on: F must provide poll(fuset::context&) -> fuset::poll<T>");

    const waker w = waker::adopt(thread_notify::create());
    auto* const notify = static_cast<thread_notify*>(w.target());
    context cx(w);

    for (;;) {
        auto p = fut.poll(cx);
        if (p.is_ready()) {
            return std::move(p).take();
        }
        notify->park();
    }
}

} // namespace fuset

#endif /* FUSET_BLOCK_ON_HPP_ */
