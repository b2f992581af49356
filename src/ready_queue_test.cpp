// ready_queue_test.cpp
// Contract test for fuset::detail::ready_queue (intrusive MPSC queue).
//
// Goals:
//  - Empty / data reporting, FIFO per producer, stub re-insertion when the
//    last real record is detached.
//  - Teardown releases exactly the records still queued.
//  - Multi-producer stress: every record arrives exactly once, producers'
//    own orders are preserved, inconsistent windows are survived.
//
// Notes:
//  - Records here are plain test nodes that count release() calls; the queue
//    never retains, so a correct run releases only on teardown.

#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QProcess>
#include <QProcessEnvironment>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#if !defined(FUSET_ASSERT) && !defined(NDEBUG)
#  define FUSET_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "ready_queue.hpp"


namespace {

struct TestNode final : fuset::detail::ready_node {
    int producer{0};
    int seq{0};
    std::atomic<int> releases{0};

    void retain() noexcept override {}
    void release() noexcept override { releases.fetch_add(1, std::memory_order_relaxed); }
    void wake() noexcept override {}
};

struct Probe final : fuset::wake_target {
    std::atomic<int> refs{0};
    std::atomic<int> wakes{0};

    void retain() noexcept override { refs.fetch_add(1, std::memory_order_relaxed); }
    void release() noexcept override { refs.fetch_sub(1, std::memory_order_acq_rel); }
    void wake() noexcept override { wakes.fetch_add(1, std::memory_order_relaxed); }
};

using fuset::detail::dequeue_status;

} // namespace


namespace fuset_ready_queue_death_detail {

#if !defined(NDEBUG)

static constexpr int kDeathExitCode = 0xAB;

static void sigabrt_handler_(int) noexcept {
    std::_Exit(kDeathExitCode);
}

[[noreturn]] static void run_case_(const char* mode) {
    std::signal(SIGABRT, &sigabrt_handler_);

    if (std::strcmp(mode, "enqueue_unclaimed") == 0) {
        fuset::detail::ready_queue q;
        TestNode n;
        n.queued.store(false);
        q.enqueue(&n); // Must assert: queued flag was not won.
    } else {
        std::_Exit(0xEF);
    }

    std::_Exit(0xF0);
}

struct Runner_ {
    Runner_() {
        const char* mode = std::getenv("FUSET_READY_QUEUE_DEATH");
        if (mode && *mode) {
            run_case_(mode);
        }
    }
};

static const Runner_ g_runner_{};

#endif // !defined(NDEBUG)

} // namespace fuset_ready_queue_death_detail

namespace {

#if defined(NDEBUG)
constexpr int kProducers       = 4;
constexpr int kPerProducer     = 200'000;
constexpr int kThreadTimeoutMs = 10'000;
#else
constexpr int kProducers       = 4;
constexpr int kPerProducer     = 40'000;
constexpr int kThreadTimeoutMs = 20'000;
#endif

class tst_ready_queue_api_paranoid : public QObject {
    Q_OBJECT

private slots:
    void fresh_queue_is_empty() {
        fuset::detail::ready_queue q;
        for (int i = 0; i < 3; ++i) {
            const auto r = q.dequeue();
            QVERIFY(r.status == dequeue_status::empty);
            QVERIFY(r.node == nullptr);
        }
    }

    void fifo_single_producer() {
        fuset::detail::ready_queue q;
        auto nodes = std::make_unique<TestNode[]>(5);
        for (int i = 0; i < 5; ++i) {
            nodes[i].seq = i;
            q.enqueue(&nodes[i]);
        }

        for (int i = 0; i < 5; ++i) {
            const auto r = q.dequeue();
            QVERIFY(r.status == dequeue_status::data);
            QVERIFY(r.node != q.stub());
            QCOMPARE(static_cast<TestNode*>(r.node)->seq, i);
        }
        QVERIFY(q.dequeue().status == dequeue_status::empty);

        for (int i = 0; i < 5; ++i) {
            QCOMPARE(nodes[i].releases.load(), 0);
        }
    }

    void stub_reinsertion_single_record() {
        fuset::detail::ready_queue q;
        TestNode n;

        // Each round detaches the only real record, which forces the stub back
        // into the queue behind it.
        for (int round = 0; round < 16; ++round) {
            q.enqueue(&n);
            const auto r = q.dequeue();
            QVERIFY(r.status == dequeue_status::data);
            QVERIFY(r.node == &n);
            QVERIFY(q.dequeue().status == dequeue_status::empty);
        }
        QCOMPARE(n.releases.load(), 0);
    }

    void interleaved_enqueue_dequeue() {
        fuset::detail::ready_queue q;
        TestNode a, b, c;

        q.enqueue(&a);
        q.enqueue(&b);
        QVERIFY(q.dequeue().node == &a);
        q.enqueue(&c);
        QVERIFY(q.dequeue().node == &b);
        QVERIFY(q.dequeue().node == &c);
        QVERIFY(q.dequeue().status == dequeue_status::empty);

        // A record can come back after it was detached.
        q.enqueue(&a);
        QVERIFY(q.dequeue().node == &a);
        QVERIFY(q.dequeue().status == dequeue_status::empty);
    }

    void destructor_releases_remaining() {
        TestNode a, b, c;
        {
            auto q = std::make_unique<fuset::detail::ready_queue>();
            q->enqueue(&a);
            q->enqueue(&b);
            q->enqueue(&c);
            QVERIFY(q->dequeue().node == &a);
        }
        QCOMPARE(a.releases.load(), 0);
        QCOMPARE(b.releases.load(), 1);
        QCOMPARE(c.releases.load(), 1);
    }

    void parent_waker_slot() {
        Probe probe;
        {
            fuset::detail::ready_queue q;
            const fuset::waker w = fuset::waker::share(&probe);
            q.parent().register_waker(w);
            QCOMPARE(probe.refs.load(), 2);

            q.parent().wake();
            QCOMPARE(probe.wakes.load(), 1);
            QCOMPARE(probe.refs.load(), 1);

            // The slot was consumed by the first wake.
            q.parent().wake();
            QCOMPARE(probe.wakes.load(), 1);

            q.parent().register_waker(w);
            QCOMPARE(probe.refs.load(), 2);
        }
        // Teardown drops the registered clone.
        QCOMPARE(probe.refs.load(), 0);
    }

    void mpsc_stress() {
        const std::size_t total = static_cast<std::size_t>(kProducers) * kPerProducer;
        auto nodes = std::make_unique<TestNode[]>(total);
        fuset::detail::ready_queue q; // dies before the records it may still hold

        std::atomic<bool> abort{false};
        std::atomic<int> started{0};

        std::vector<std::thread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&, p] {
                started.fetch_add(1, std::memory_order_acq_rel);
                while (started.load(std::memory_order_acquire) < kProducers) {
                    std::this_thread::yield();
                }
                const std::size_t base = static_cast<std::size_t>(p) * kPerProducer;
                for (int i = 0; i < kPerProducer && !abort.load(std::memory_order_relaxed); ++i) {
                    TestNode& n = nodes[base + static_cast<std::size_t>(i)];
                    n.producer = p;
                    n.seq = i;
                    q.enqueue(&n);
                }
            });
        }

        std::size_t received = 0;
        std::size_t inconsistent = 0;
        std::vector<int> next_seq(static_cast<std::size_t>(kProducers), 0);
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(kThreadTimeoutMs);

        while (received < total) {
            if (std::chrono::steady_clock::now() > deadline) {
                abort.store(true, std::memory_order_relaxed);
                break;
            }

            const auto r = q.dequeue();
            if (r.status == dequeue_status::empty) {
                std::this_thread::yield();
                continue;
            }
            if (r.status == dequeue_status::inconsistent) {
                ++inconsistent;
                std::this_thread::yield();
                continue;
            }
            if (r.node == q.stub()) {
                continue;
            }

            const auto* n = static_cast<const TestNode*>(r.node);
            int& expect = next_seq[static_cast<std::size_t>(n->producer)];
            if (n->seq != expect) {
                abort.store(true, std::memory_order_relaxed);
                break;
            }
            ++expect;
            ++received;
        }

        for (auto& th : producers) {
            th.join();
        }

        QVERIFY2(!abort.load(std::memory_order_relaxed), "mpsc_stress: timeout or per-producer order violated");
        QCOMPARE(received, total);
        QVERIFY(q.dequeue().status == dequeue_status::empty);
        for (std::size_t i = 0; i < total; ++i) {
            if (nodes[i].releases.load(std::memory_order_relaxed) != 0) {
                QFAIL("mpsc_stress: queue released a record it never owned");
            }
        }

        qInfo() << "mpsc_stress:" << static_cast<qulonglong>(received) << "records,"
                << static_cast<qulonglong>(inconsistent) << "inconsistent observations";
    }

    void death_tests_debug_only() {
#if !defined(NDEBUG)
        QProcess p;
        p.setProgram(QCoreApplication::applicationFilePath());
        p.setArguments(QStringList{});

        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        env.insert("FUSET_READY_QUEUE_DEATH", QStringLiteral("enqueue_unclaimed"));
        p.setProcessEnvironment(env);

        p.start();
        QVERIFY2(p.waitForStarted(1500), "Death child failed to start.");
        if (!p.waitForFinished(8000)) {
            p.kill();
            QVERIFY2(false, "Death child did not finish (possible crash dialog).");
        }
        QCOMPARE(p.exitCode(), fuset_ready_queue_death_detail::kDeathExitCode);
#else
        QSKIP("Death tests are debug-only (assertions disabled).");
#endif
    }
};

} // namespace


int run_tst_ready_queue_api_paranoid(int argc, char** argv) {
    tst_ready_queue_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "ready_queue_test.moc"
