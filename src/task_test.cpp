// task_test.cpp
// Contract test for the task plumbing: poll, waker, atomic_waker, context,
// future traits and block_on.
//
// Goals:
//  - waker reference counting (share/adopt/copy/move/reset/wake).
//  - atomic_waker registration/wake protocol, including wakes racing with
//    registration (no lost wakeup).
//  - block_on parks and resumes across threads; wakes are sticky.

#include <QtTest/QtTest>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if !defined(FUSET_ASSERT) && !defined(NDEBUG)
#  define FUSET_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "atomic_waker.hpp"
#include "block_on.hpp"
#include "context.hpp"
#include "future.hpp"
#include "poll.hpp"
#include "waker.hpp"


namespace {

#if defined(NDEBUG)
constexpr int kRaceIters       = 20'000;
constexpr int kThreadTimeoutMs = 6'000;
#else
constexpr int kRaceIters       = 5'000;
constexpr int kThreadTimeoutMs = 15'000;
#endif

struct Probe final : fuset::wake_target {
    std::atomic<int> refs{0};
    std::atomic<int> wakes{0};

    void retain() noexcept override { refs.fetch_add(1, std::memory_order_relaxed); }
    void release() noexcept override { refs.fetch_sub(1, std::memory_order_acq_rel); }
    void wake() noexcept override { wakes.fetch_add(1, std::memory_order_acq_rel); }
};

struct Immediate {
    int value{0};
    fuset::poll<int> poll(fuset::context&) { return fuset::ready(value); }
};

struct NotAFuture {
    int poll(fuset::context&) { return 0; }
};

// Compile-time trait checks.
static_assert(fuset::is_future_v<Immediate>);
static_assert(std::is_same_v<fuset::future_output_t<Immediate>, int>);
static_assert(!fuset::is_future_v<NotAFuture>);
static_assert(!fuset::is_future_v<int>);
static_assert(fuset::is_future_v<fuset::ready_future_t<std::string>>);
static_assert(std::is_same_v<fuset::future_output_t<fuset::ready_future_t<std::string>>, std::string>);

static_assert(std::is_constructible_v<fuset::poll<int>, fuset::pending_t>);
static_assert(std::is_convertible_v<fuset::ready_t<int>, fuset::poll<long>>);
static_assert(!std::is_convertible_v<fuset::ready_t<std::string>, fuset::poll<int>>);

static_assert(std::is_nothrow_move_constructible_v<fuset::waker>);
static_assert(std::is_copy_constructible_v<fuset::waker>);
static_assert(!std::is_copy_constructible_v<fuset::atomic_waker>);
static_assert(!std::is_copy_constructible_v<fuset::context>);


class tst_task_api_paranoid : public QObject {
    Q_OBJECT

private slots:
    void poll_basics() {
        fuset::poll<int> p = fuset::pending;
        QVERIFY(p.is_pending());
        QVERIFY(!p.is_ready());
        QVERIFY(!static_cast<bool>(p));

        fuset::poll<int> q = fuset::ready(5);
        QVERIFY(q.is_ready());
        QCOMPARE(q.value(), 5);

        fuset::poll<std::unique_ptr<int>> u = fuset::ready(std::make_unique<int>(9));
        std::unique_ptr<int> taken = std::move(u).take();
        QVERIFY(taken != nullptr);
        QCOMPARE(*taken, 9);

        fuset::poll<std::optional<int>> done = fuset::ready(std::optional<int>{});
        QVERIFY(done.is_ready());
        QVERIFY(!done.value().has_value());
    }

    void waker_refcounting() {
        Probe probe;
        {
            fuset::waker empty;
            QVERIFY(!empty);
            empty.wake_by_ref(); // no-op
            std::move(empty).wake();

            fuset::waker a = fuset::waker::share(&probe);
            QVERIFY(static_cast<bool>(a));
            QCOMPARE(probe.refs.load(), 1);

            fuset::waker b = a;
            QCOMPARE(probe.refs.load(), 2);
            QVERIFY(a.will_wake(b));
            QVERIFY(!a.will_wake(empty));

            fuset::waker c = std::move(b);
            QVERIFY(!b);
            QCOMPARE(probe.refs.load(), 2);

            c.wake_by_ref();
            QCOMPARE(probe.wakes.load(), 1);
            QCOMPARE(probe.refs.load(), 2);

            std::move(c).wake();
            QCOMPARE(probe.wakes.load(), 2);
            QCOMPARE(probe.refs.load(), 1);
            QVERIFY(!c);

            b = a;
            QCOMPARE(probe.refs.load(), 2);
            b = b;
            QCOMPARE(probe.refs.load(), 2);
            b.reset();
            QCOMPARE(probe.refs.load(), 1);

            probe.retain();
            fuset::waker d = fuset::waker::adopt(&probe);
            QCOMPARE(probe.refs.load(), 2);

            swap(a, b);
            QVERIFY(!a);
            QVERIFY(b.target() == &probe);
        }
        QCOMPARE(probe.refs.load(), 0);
    }

    void context_reschedule() {
        Probe probe;
        {
            const fuset::waker w = fuset::waker::share(&probe);
            fuset::context cx(w);
            QVERIFY(&cx.current_waker() == &w);
            cx.reschedule();
            cx.reschedule();
            QCOMPARE(probe.wakes.load(), 2);
            QCOMPARE(probe.refs.load(), 1);
        }
        QCOMPARE(probe.refs.load(), 0);
    }

    void atomic_waker_register_and_wake() {
        Probe a;
        Probe b;
        {
            fuset::atomic_waker aw;
            aw.wake(); // nothing registered
            QVERIFY(!aw.take());

            const fuset::waker wa = fuset::waker::share(&a);
            const fuset::waker wb = fuset::waker::share(&b);

            aw.register_waker(wa);
            QCOMPARE(a.refs.load(), 2);

            // Same task again: no churn.
            aw.register_waker(wa);
            QCOMPARE(a.refs.load(), 2);

            // Replacing drops the old clone.
            aw.register_waker(wb);
            QCOMPARE(a.refs.load(), 1);
            QCOMPARE(b.refs.load(), 2);

            aw.wake();
            QCOMPARE(b.wakes.load(), 1);
            QCOMPARE(a.wakes.load(), 0);
            QCOMPARE(b.refs.load(), 1);

            aw.wake();
            QCOMPARE(b.wakes.load(), 1);

            aw.register_waker(wa);
            fuset::waker taken = aw.take();
            QVERIFY(taken.will_wake(wa));
            QCOMPARE(a.wakes.load(), 0);
        }
        QCOMPARE(a.refs.load(), 0);
        QCOMPARE(b.refs.load(), 0);
    }

    void atomic_waker_no_lost_wakeup() {
        // Registrant: register, then check the flag. Waker: set the flag, then
        // wake. Either the registrant sees the flag, or its waker gets woken.
        std::atomic<bool> abort{false};
        int lost = 0;

        for (int i = 0; i < kRaceIters && !abort.load(std::memory_order_relaxed); ++i) {
            Probe probe;
            fuset::atomic_waker aw;
            std::atomic<bool> flag{false};
            const fuset::waker w = fuset::waker::share(&probe);

            std::thread waker_thread([&] {
                flag.store(true, std::memory_order_seq_cst);
                aw.wake();
            });

            aw.register_waker(w);
            const bool saw_flag = flag.load(std::memory_order_seq_cst);

            waker_thread.join();

            if (!saw_flag && probe.wakes.load() == 0) {
                ++lost;
                abort.store(true, std::memory_order_relaxed);
            }
            (void)aw.take();
        }

        QCOMPARE(lost, 0);
    }

    void atomic_waker_concurrent_wakers() {
        Probe probe;
        {
            fuset::atomic_waker aw;
            const fuset::waker w = fuset::waker::share(&probe);

            std::atomic<bool> stop{false};
            std::vector<std::thread> wakers;
            for (int t = 0; t < 4; ++t) {
                wakers.emplace_back([&] {
                    while (!stop.load(std::memory_order_relaxed)) {
                        aw.wake();
                    }
                });
            }

            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(kThreadTimeoutMs);
            int registered = 0;
            while (registered < 10'000 && std::chrono::steady_clock::now() < deadline) {
                aw.register_waker(w);
                ++registered;
            }
            stop.store(true, std::memory_order_relaxed);
            for (auto& th : wakers) {
                th.join();
            }

            QVERIFY(probe.wakes.load() > 0);
            (void)aw.take();
            QCOMPARE(probe.refs.load(), 1);
        }
        QCOMPARE(probe.refs.load(), 0);
    }

    void block_on_ready() {
        QCOMPARE(fuset::block_on(fuset::ready_future(7)), 7);
        QCOMPARE(fuset::block_on(Immediate{11}), 11);
        QVERIFY(fuset::block_on(fuset::ready_future(std::string("abc"))) == "abc");
    }

    void block_on_cross_thread() {
        struct Shared {
            std::mutex m;
            bool done{false};
            fuset::waker w;
        };
        auto shared = std::make_shared<Shared>();

        std::thread producer;
        int polls = 0;
        auto fut = fuset::poll_fn([&](fuset::context& cx) -> fuset::poll<int> {
            ++polls;
            std::lock_guard<std::mutex> lk(shared->m);
            if (shared->done) {
                return fuset::ready(99);
            }
            shared->w = cx.current_waker();
            if (!producer.joinable()) {
                producer = std::thread([shared] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    fuset::waker w;
                    {
                        std::lock_guard<std::mutex> lk2(shared->m);
                        shared->done = true;
                        w = std::move(shared->w);
                    }
                    std::move(w).wake();
                });
            }
            return fuset::pending;
        });

        QCOMPARE(fuset::block_on(std::move(fut)), 99);
        producer.join();
        QVERIFY(polls >= 2);
    }

    void thread_notify_sticky_wake() {
        const fuset::waker w = fuset::waker::adopt(fuset::thread_notify::create());
        auto* n = static_cast<fuset::thread_notify*>(w.target());
        QCOMPARE(n->use_count(), std::size_t{1});

        // Woken before parking: park() returns at once and consumes the token.
        w.wake_by_ref();
        w.wake_by_ref();
        n->park();

        fuset::waker copy = w;
        QCOMPARE(n->use_count(), std::size_t{2});
        std::thread th([copy = std::move(copy)]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            std::move(copy).wake();
        });
        n->park();
        th.join();
        QCOMPARE(n->use_count(), std::size_t{1});
    }
};

} // namespace


int run_tst_task_api_paranoid(int argc, char** argv) {
    tst_task_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "task_test.moc"
