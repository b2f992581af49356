/*
 * waker.hpp
 *
 * Wake handles.
 *
 * - wake_target: an intrusively reference-counted endpoint that knows how to
 *   reschedule one task (a member record of an unordered set, a parked
 *   thread, a test probe, ...).
 * - waker: a value handle owning exactly one reference to a wake_target.
 *   Copying takes another reference, destruction drops it.
 *
 * Thread-safety:
 * - Distinct waker objects that share a target may be used, copied and
 *   destroyed concurrently from any thread.
 * - A single waker object is not synchronized (like std::shared_ptr).
 *
 * A default-constructed waker is empty; waking it does nothing.
 */

#ifndef FUSET_WAKER_HPP_
#define FUSET_WAKER_HPP_

#include <utility> // std::exchange, std::swap

#include "base/fuset_tools.hpp" // FUSET_FORCEINLINE

namespace fuset {

class wake_target {
public:
    virtual void retain() noexcept = 0;
    virtual void release() noexcept = 0;

    // Reschedule the task bound to this target. Must be callable from any
    // thread, any number of times.
    virtual void wake() noexcept = 0;

protected:
    wake_target() noexcept = default;
    ~wake_target() = default;

    wake_target(const wake_target&) = delete;
    wake_target& operator=(const wake_target&) = delete;
};

class waker {
public:
    waker() noexcept = default;

    // Takes over a reference the caller already owns.
    [[nodiscard]] static waker adopt(wake_target* target) noexcept {
        return waker(target);
    }

    // Takes a new reference.
    [[nodiscard]] static waker share(wake_target* target) noexcept {
        if (target != nullptr) {
            target->retain();
        }
        return waker(target);
    }

    waker(const waker& other) noexcept : target_(other.target_) {
        if (target_ != nullptr) {
            target_->retain();
        }
    }

    waker(waker&& other) noexcept : target_(std::exchange(other.target_, nullptr)) {}

    waker& operator=(const waker& other) noexcept {
        if (this != &other) {
            waker tmp(other);
            swap(tmp);
        }
        return *this;
    }

    waker& operator=(waker&& other) noexcept {
        if (this != &other) {
            reset();
            target_ = std::exchange(other.target_, nullptr);
        }
        return *this;
    }

    ~waker() noexcept { reset(); }

    FUSET_FORCEINLINE void wake_by_ref() const noexcept {
        if (target_ != nullptr) {
            target_->wake();
        }
    }

    // Wakes and gives up this handle's reference.
    void wake() && noexcept {
        wake_by_ref();
        reset();
    }

    void reset() noexcept {
        if (wake_target* t = std::exchange(target_, nullptr)) {
            t->release();
        }
    }

    // True when both handles reschedule the same task.
    [[nodiscard]] bool will_wake(const waker& other) const noexcept {
        return target_ == other.target_;
    }

    [[nodiscard]] wake_target* target() const noexcept { return target_; }

    explicit operator bool() const noexcept { return target_ != nullptr; }

    void swap(waker& other) noexcept { std::swap(target_, other.target_); }

private:
    explicit waker(wake_target* target) noexcept : target_(target) {}

    wake_target* target_{nullptr};
};

inline void swap(waker& a, waker& b) noexcept { a.swap(b); }

} // namespace fuset

#endif /* FUSET_WAKER_HPP_ */
