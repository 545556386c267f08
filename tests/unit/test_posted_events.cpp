/**
 * @file test_posted_events.cpp
 * @brief Unit tests for the cross-thread loop event queue and the event loop
 */

#include <QTest>

#include "event_loop.h"
#include "posted_events.h"

#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>

#include <thread>
#include <vector>

namespace
{

bool readable(int fd)
{
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    return poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN);
}

} // anonymous namespace

class TestPostedEvents : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void empty_isNotReadable()
    {
        PostedEvents posted;
        QVERIFY(posted.fd() >= 0);
        QVERIFY(!readable(posted.fd()));
        QCOMPARE(posted.drain([](LoopEvent) {}), size_t(0));
    }

    void drain_deliversInOrderAndClearsWakeup()
    {
        PostedEvents posted;
        QVERIFY(posted.post(LoopEvent::Trigger));
        QVERIFY(posted.post(LoopEvent::Trigger));
        QVERIFY(posted.post(LoopEvent::Quit));
        QVERIFY(readable(posted.fd()));

        std::vector<LoopEvent> seen;
        QCOMPARE(posted.drain([&](LoopEvent e) { seen.push_back(e); }),
                 size_t(3));
        QCOMPARE(seen.size(), size_t(3));
        QCOMPARE(seen[0], LoopEvent::Trigger);
        QCOMPARE(seen[1], LoopEvent::Trigger);
        QCOMPARE(seen[2], LoopEvent::Quit);
        QVERIFY(!readable(posted.fd()));
    }

    void full_rejectsPost()
    {
        PostedEvents posted;
        for (size_t i = 0; i < PostedEvents::capacity(); ++i) {
            QVERIFY(posted.post(LoopEvent::Trigger));
        }
        QVERIFY(!posted.post(LoopEvent::Quit));

        QCOMPARE(posted.drain([](LoopEvent) {}), PostedEvents::capacity());
        QVERIFY(posted.post(LoopEvent::Quit));
    }

    void eventsFromAnotherThread_reachTheLoop()
    {
        constexpr int TRIGGERS = 500;
        EventLoop loop;
        PostedEvents posted;

        int triggers = 0;
        loop.add_fd(posted.fd(), EPOLLIN, [&](uint32_t) {
            posted.drain([&](LoopEvent event) {
                if (event == LoopEvent::Trigger) {
                    ++triggers;
                } else {
                    loop.stop();
                }
            });
        });

        std::thread producer([&posted]() {
            for (int i = 0; i < TRIGGERS; ++i) {
                while (!posted.post(LoopEvent::Trigger)) {
                    std::this_thread::yield();
                }
            }
            while (!posted.post(LoopEvent::Quit)) {
                std::this_thread::yield();
            }
        });

        loop.run();
        producer.join();

        QCOMPARE(triggers, TRIGGERS);
    }

    void postSteps_runAfterEachBatch()
    {
        EventLoop loop;
        PostedEvents posted;
        int steps = 0;

        loop.add_fd(posted.fd(), EPOLLIN, [&](uint32_t) {
            posted.drain([&](LoopEvent) { loop.stop(); });
        });
        loop.add_post_step([&steps]() { ++steps; });

        QVERIFY(posted.post(LoopEvent::Quit));
        loop.run();

        // Once before waiting, once after the batch
        QCOMPARE(steps, 2);
    }

    void terminationSignal_postsQuitThatStopsTheLoop()
    {
        EventLoop loop;
        PostedEvents posted;
        std::vector<LoopEvent> seen;

        loop.add_fd(posted.fd(), EPOLLIN, [&](uint32_t) {
            posted.drain([&](LoopEvent event) {
                seen.push_back(event);
                if (event == LoopEvent::Quit) {
                    loop.stop();
                }
            });
        });
        loop.watch_termination_signals(
            [&posted]() { QVERIFY(posted.post(LoopEvent::Quit)); });

        QVERIFY(posted.post(LoopEvent::Trigger));
        QCOMPARE(::raise(SIGTERM), 0);
        loop.run();

        QVERIFY(!seen.empty());
        QCOMPARE(seen.back(), LoopEvent::Quit);
    }
};

QTEST_GUILESS_MAIN(TestPostedEvents)
#include "test_posted_events.moc"
