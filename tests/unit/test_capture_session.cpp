/**
 * @file test_capture_session.cpp
 * @brief Unit tests for CaptureSession (exactly one outcome per session)
 */

#include <QTest>

#include "capture_session.h"
#include "fakes.h"

class TestCaptureSession : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void newSession_isActive()
    {
        RecordingListener listener;
        CaptureSession session(listener);
        QVERIFY(session.active());
    }

    void submit_forwardsTextAndEndsSession()
    {
        RecordingListener listener;
        CaptureSession session(listener);

        session.on_submit("Buy milk");

        QVERIFY(!session.active());
        QCOMPARE(listener.submitted.size(), size_t(1));
        QCOMPARE(listener.submitted.front(), std::string("Buy milk"));
        QCOMPARE(listener.cancels, 0);
    }

    void cancel_forwardsOnce()
    {
        RecordingListener listener;
        CaptureSession session(listener);

        session.on_cancel();
        session.on_cancel();

        QVERIFY(!session.active());
        QCOMPARE(listener.cancels, 1);
        QVERIFY(listener.submitted.empty());
    }

    void outcomesAfterTheFirst_areIgnored()
    {
        RecordingListener listener;
        CaptureSession session(listener);

        session.on_submit("first");
        session.on_cancel();
        session.on_submit("second");

        QCOMPARE(listener.submitted.size(), size_t(1));
        QCOMPARE(listener.submitted.front(), std::string("first"));
        QCOMPARE(listener.cancels, 0);
    }

    void abandon_endsSilently()
    {
        RecordingListener listener;
        CaptureSession session(listener);

        session.abandon();
        session.on_submit("late");
        session.on_cancel();

        QVERIFY(!session.active());
        QVERIFY(listener.submitted.empty());
        QCOMPARE(listener.cancels, 0);
    }
};

QTEST_GUILESS_MAIN(TestCaptureSession)
#include "test_capture_session.moc"
