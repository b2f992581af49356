/*
 * poll.hpp
 *
 * Result of polling a future once: either pending (not finished, a wakeup
 * has been arranged) or ready with the produced value.
 *
 *   fuset::poll<int> p = fuset::pending;
 *   fuset::poll<int> q = fuset::ready(42);
 *
 * A stream (the unordered set) reports through poll<std::optional<T>>:
 *   pending            - nothing ready yet
 *   ready(value)       - one item produced
 *   ready(std::nullopt) - exhausted, no further items will ever be produced
 */

#ifndef FUSET_POLL_HPP_
#define FUSET_POLL_HPP_

#include <optional>
#include <type_traits>
#include <utility> // std::move, std::forward

#include "base/fuset_tools.hpp" // FUSET_ASSERT

namespace fuset {

struct pending_t {
    explicit constexpr pending_t() = default;
};

inline constexpr pending_t pending{};

template<class T>
struct ready_t {
    T value;
};

template<class T>
[[nodiscard]] constexpr ready_t<std::decay_t<T>> ready(T&& value) {
    return ready_t<std::decay_t<T>>{std::forward<T>(value)};
}

template<class T>
class [[nodiscard]] poll {
    static_assert(!std::is_void_v<T>, "fuset::poll<void> is not supported; use a unit type");
    static_assert(!std::is_reference_v<T>, "fuset::poll<T&> is not supported");

public:
    using value_type = T;

    constexpr poll(pending_t) noexcept {}

    template<class U, typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    constexpr poll(ready_t<U>&& r) : value_(std::in_place, std::move(r.value)) {}

    [[nodiscard]] constexpr bool is_ready() const noexcept { return value_.has_value(); }
    [[nodiscard]] constexpr bool is_pending() const noexcept { return !value_.has_value(); }
    constexpr explicit operator bool() const noexcept { return is_ready(); }

    [[nodiscard]] T& value() & noexcept {
        FUSET_ASSERT(is_ready() && "poll::value() on a pending result");
        return *value_;
    }

    [[nodiscard]] const T& value() const& noexcept {
        FUSET_ASSERT(is_ready() && "poll::value() on a pending result");
        return *value_;
    }

    // Moves the value out; the poll is left in an unspecified ready state.
    [[nodiscard]] T take() && {
        FUSET_ASSERT(is_ready() && "poll::take() on a pending result");
        return std::move(*value_);
    }

private:
    std::optional<T> value_{};
};

} // namespace fuset

#endif /* FUSET_POLL_HPP_ */
