/*
 * future.hpp
 *
 * Future concept (duck-typed, checked at compile time):
 *
 *   struct my_future {
 *       fuset::poll<T> poll(fuset::context& cx);
 *   };
 *
 * - poll() is called by exactly one thread at a time.
 * - Returning pending obliges the future to arrange for cx.current_waker()
 *   (or a clone of it) to be woken once progress is possible.
 * - After poll() returned ready the future is never polled again.
 * - T must not be void.
 *
 * Helpers:
 *   poll_fn(fn)      future whose poll() forwards to fn(cx)
 *   ready_future(v)  future that completes with v on the first poll
 */

#ifndef FUSET_FUTURE_HPP_
#define FUSET_FUTURE_HPP_

#include <optional>
#include <type_traits>
#include <utility> // std::declval, std::move, std::forward

#include "base/fuset_tools.hpp" // FUSET_ASSERT
#include "context.hpp"
#include "poll.hpp"

namespace fuset {

namespace detail {

template<class P>
struct is_poll : std::false_type {
    using output = void;
};

template<class T>
struct is_poll<::fuset::poll<T>> : std::true_type {
    using output = T;
};

template<class F, class = void>
struct future_traits {
    static constexpr bool value = false;
};

template<class F>
struct future_traits<F, std::void_t<decltype(std::declval<F&>().poll(std::declval<context&>()))>> {
private:
    using result = std::decay_t<decltype(std::declval<F&>().poll(std::declval<context&>()))>;

public:
    static constexpr bool value = is_poll<result>::value;
    using output = typename is_poll<result>::output;
};

} // namespace detail

template<class F>
struct is_future : std::bool_constant<detail::future_traits<F>::value> {};

template<class F>
inline constexpr bool is_future_v = is_future<F>::value;

template<class F>
using future_output_t = typename detail::future_traits<F>::output;

/* --------------------------------- poll_fn -------------------------------- */
template<class Fn>
class poll_fn_future {
public:
    explicit poll_fn_future(Fn fn) : fn_(std::move(fn)) {}

    auto poll(context& cx) -> decltype(std::declval<Fn&>()(cx)) {
        return fn_(cx);
    }

private:
    Fn fn_;
};

template<class Fn>
[[nodiscard]] poll_fn_future<std::decay_t<Fn>> poll_fn(Fn&& fn) {
    return poll_fn_future<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

/* ------------------------------ ready_future ------------------------------ */
template<class T>
class ready_future_t {
public:
    explicit ready_future_t(T value) : value_(std::in_place, std::move(value)) {}

    ::fuset::poll<T> poll(context&) {
        FUSET_ASSERT(value_.has_value() && "ready_future polled after completion");
        ::fuset::poll<T> out = ready(std::move(*value_));
        value_.reset();
        return out;
    }

private:
    std::optional<T> value_;
};

template<class T>
[[nodiscard]] ready_future_t<std::decay_t<T>> ready_future(T&& value) {
    return ready_future_t<std::decay_t<T>>(std::forward<T>(value));
}

} // namespace fuset

#endif /* FUSET_FUTURE_HPP_ */
