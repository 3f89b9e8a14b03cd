/**
 * @file test_connectivityprobe.cpp
 * @brief Unit tests for ConnectivityProbe
 *
 * Tests transition detection, in-flight debouncing, completion ordering
 * and failure handling using injected reachability checks.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QSignalSpy>
#include <stdexcept>

#include "sync/connectivityprobe.h"

using namespace FieldSync;

class TestConnectivityProbe : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Construction Tests ==========
    void testDefaults();

    // ========== Transition Tests ==========
    void testFirstSuccessRestores();
    void testConsecutiveSuccessesRestoreOnce();
    void testFailureSetsOffline();
    void testFailureWhileOfflineEmitsNoChange();
    void testTransportOfflineIsImmediate();
    void testTransportOnlineProbes();

    // ========== Failure Tests ==========
    void testThrowingCheckIsOffline();
    void testInvalidEndpointIsOffline();

    // ========== Debounce Tests ==========
    void testIntervalTickSkippedWhileInFlight();
    void testExternalTriggerAllowsOneExtraProbe();
    void testStateReflectsLastCompletedProbe();

    // ========== Asynchronous Check Tests ==========
    void testCheckPendingUntilDone();
    void testEarlierStartedCheckCompletingFirst();
    void testLaterStartedCheckCompletingFirst();
    void testIntervalTickSkippedWhileCheckPending();
    void testSecondCompletionIgnored();
    void testCompletionAfterDestructionIgnored();

    // ========== Timer Tests ==========
    void testStartProbesImmediately();
    void testIntervalTimerProbes();

private:
    void usePendingChecks();

    ConnectivityProbe *m_probe;
    bool m_reachable;
    int m_checks;
    QList<ConnectivityProbe::CheckCallback> m_pending;
};

void TestConnectivityProbe::init()
{
    m_reachable = false;
    m_checks = 0;
    m_probe = new ConnectivityProbe();
    m_probe->setReachabilityCheck([this]() {
        ++m_checks;
        return m_reachable;
    });
}

void TestConnectivityProbe::cleanup()
{
    delete m_probe;
    m_probe = nullptr;
    m_pending.clear();
}

void TestConnectivityProbe::usePendingChecks()
{
    // Each check waits until the test completes it
    m_probe->setAsyncReachabilityCheck([this](ConnectivityProbe::CheckCallback done) {
        ++m_checks;
        m_pending.append(done);
    });
}

// ========== Construction Tests ==========

void TestConnectivityProbe::testDefaults()
{
    ConnectivityProbe probe;
    QVERIFY(!probe.isOnline());
    QCOMPARE(probe.state(), ConnectivityState::Offline);
    QCOMPARE(probe.interval(), 30000);
    QCOMPARE(probe.timeout(), 3000);
    QCOMPARE(probe.probeCount(), 0);
    QVERIFY(!probe.isRunning());
    QVERIFY(probe.endpoint().isValid());
}

// ========== Transition Tests ==========

void TestConnectivityProbe::testFirstSuccessRestores()
{
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);
    QSignalSpy changedSpy(m_probe, &ConnectivityProbe::connectivityChanged);

    m_reachable = true;
    m_probe->checkNow();

    QVERIFY(m_probe->isOnline());
    QCOMPARE(restoredSpy.count(), 1);
    QCOMPARE(changedSpy.count(), 1);
    QCOMPARE(changedSpy.at(0).at(0).toBool(), true);
}

void TestConnectivityProbe::testConsecutiveSuccessesRestoreOnce()
{
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);
    QSignalSpy finishedSpy(m_probe, &ConnectivityProbe::probeFinished);

    m_reachable = true;
    m_probe->checkNow();
    m_probe->checkNow();
    m_probe->checkNow();

    QCOMPARE(restoredSpy.count(), 1);
    QCOMPARE(finishedSpy.count(), 3);
    QCOMPARE(m_probe->probeCount(), 3);
}

void TestConnectivityProbe::testFailureSetsOffline()
{
    QSignalSpy lostSpy(m_probe, &ConnectivityProbe::connectionLost);

    m_reachable = true;
    m_probe->checkNow();
    QVERIFY(m_probe->isOnline());

    m_reachable = false;
    m_probe->checkNow();

    QVERIFY(!m_probe->isOnline());
    QCOMPARE(lostSpy.count(), 1);
}

void TestConnectivityProbe::testFailureWhileOfflineEmitsNoChange()
{
    QSignalSpy changedSpy(m_probe, &ConnectivityProbe::connectivityChanged);
    QSignalSpy lostSpy(m_probe, &ConnectivityProbe::connectionLost);

    m_probe->checkNow();
    m_probe->checkNow();

    QVERIFY(!m_probe->isOnline());
    QCOMPARE(changedSpy.count(), 0);
    QCOMPARE(lostSpy.count(), 0);
}

void TestConnectivityProbe::testTransportOfflineIsImmediate()
{
    m_reachable = true;
    m_probe->checkNow();
    const int checksBefore = m_checks;

    m_probe->onTransportOffline();

    QVERIFY(!m_probe->isOnline());
    QCOMPARE(m_checks, checksBefore);
}

void TestConnectivityProbe::testTransportOnlineProbes()
{
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);

    m_reachable = true;
    m_probe->onTransportOnline();

    QCOMPARE(m_checks, 1);
    QVERIFY(m_probe->isOnline());
    QCOMPARE(restoredSpy.count(), 1);
}

// ========== Failure Tests ==========

void TestConnectivityProbe::testThrowingCheckIsOffline()
{
    m_reachable = true;
    m_probe->checkNow();

    m_probe->setReachabilityCheck([]() -> bool {
        throw std::runtime_error("socket exploded");
    });

    int answers = 0;
    bool answer = true;
    m_probe->check([&answers, &answer](bool online) {
        ++answers;
        answer = online;
    });
    QCOMPARE(answers, 1);
    QVERIFY(!answer);

    m_probe->checkNow();
    QVERIFY(!m_probe->isOnline());
    QCOMPARE(m_probe->probesInFlight(), 0);
}

void TestConnectivityProbe::testInvalidEndpointIsOffline()
{
    ConnectivityProbe probe;
    probe.setEndpoint(QUrl());
    QSignalSpy finishedSpy(&probe, &ConnectivityProbe::probeFinished);

    int answers = 0;
    bool answer = true;
    probe.check([&answers, &answer](bool online) {
        ++answers;
        answer = online;
    });
    QCOMPARE(answers, 1);
    QVERIFY(!answer);

    // Checking alone does not touch the state
    QCOMPARE(finishedSpy.count(), 0);

    probe.checkNow();
    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(!probe.isOnline());
    QCOMPARE(probe.probesInFlight(), 0);
}

// ========== Debounce Tests ==========

void TestConnectivityProbe::testIntervalTickSkippedWhileInFlight()
{
    int nested = 0;
    m_probe->setReachabilityCheck([this, &nested]() {
        ++m_checks;
        if (m_checks == 1) {
            // Interval tick arriving while this probe waits on the network
            QMetaObject::invokeMethod(m_probe, "onIntervalTick", Qt::DirectConnection);
            nested = m_probe->probeCount();
        }
        return true;
    });

    m_probe->checkNow();

    QCOMPARE(m_checks, 1);
    QCOMPARE(nested, 1);
    QCOMPARE(m_probe->probeCount(), 1);
}

void TestConnectivityProbe::testExternalTriggerAllowsOneExtraProbe()
{
    m_probe->setReachabilityCheck([this]() {
        ++m_checks;
        if (m_checks == 1) {
            // Two external events while the first probe is in flight:
            // the first starts a second probe, the third is suppressed
            // because two are now in flight
            m_probe->checkNow();
        } else if (m_checks == 2) {
            m_probe->checkNow();
        }
        return true;
    });

    m_probe->checkNow();

    QCOMPARE(m_checks, 2);
    QCOMPARE(m_probe->probeCount(), 2);
    QCOMPARE(m_probe->probesInFlight(), 0);
}

void TestConnectivityProbe::testStateReflectsLastCompletedProbe()
{
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);
    bool onlineAfterNested = false;

    m_probe->setReachabilityCheck([this, &onlineAfterNested]() {
        ++m_checks;
        if (m_checks == 1) {
            // Nested probe completes first with success
            m_probe->checkNow();
            onlineAfterNested = m_probe->isOnline();
            return false;
        }
        return true;
    });

    m_probe->checkNow();

    QVERIFY(onlineAfterNested);

    // Outer probe completed last with failure
    QVERIFY(!m_probe->isOnline());
    QCOMPARE(restoredSpy.count(), 1);
}

// ========== Asynchronous Check Tests ==========

void TestConnectivityProbe::testCheckPendingUntilDone()
{
    usePendingChecks();
    QSignalSpy finishedSpy(m_probe, &ConnectivityProbe::probeFinished);

    m_probe->checkNow();
    QCOMPARE(m_checks, 1);
    QCOMPARE(m_probe->probesInFlight(), 1);
    QCOMPARE(finishedSpy.count(), 0);
    QVERIFY(!m_probe->isOnline());

    m_pending.at(0)(true);
    QCOMPARE(m_probe->probesInFlight(), 0);
    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(m_probe->isOnline());
}

void TestConnectivityProbe::testEarlierStartedCheckCompletingFirst()
{
    usePendingChecks();
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);
    QSignalSpy lostSpy(m_probe, &ConnectivityProbe::connectionLost);

    m_probe->checkNow();
    m_probe->checkNow();
    QCOMPARE(m_pending.size(), 2);
    QCOMPARE(m_probe->probesInFlight(), 2);

    // The first request answers online, then the second answers offline
    m_pending.at(0)(true);
    QVERIFY(m_probe->isOnline());
    m_pending.at(1)(false);

    QVERIFY(!m_probe->isOnline());
    QCOMPARE(restoredSpy.count(), 1);
    QCOMPARE(lostSpy.count(), 1);
    QCOMPARE(m_probe->probesInFlight(), 0);
}

void TestConnectivityProbe::testLaterStartedCheckCompletingFirst()
{
    usePendingChecks();
    QSignalSpy restoredSpy(m_probe, &ConnectivityProbe::connectionRestored);

    m_probe->checkNow();
    m_probe->checkNow();

    m_pending.at(1)(false);
    QVERIFY(!m_probe->isOnline());
    m_pending.at(0)(true);

    QVERIFY(m_probe->isOnline());
    QCOMPARE(restoredSpy.count(), 1);
}

void TestConnectivityProbe::testIntervalTickSkippedWhileCheckPending()
{
    usePendingChecks();

    m_probe->checkNow();
    QMetaObject::invokeMethod(m_probe, "onIntervalTick", Qt::DirectConnection);
    QCOMPARE(m_checks, 1);
    QCOMPARE(m_probe->probeCount(), 1);

    m_pending.at(0)(true);
    QMetaObject::invokeMethod(m_probe, "onIntervalTick", Qt::DirectConnection);
    QCOMPARE(m_checks, 2);
    QCOMPARE(m_probe->probesInFlight(), 1);
}

void TestConnectivityProbe::testSecondCompletionIgnored()
{
    usePendingChecks();
    QSignalSpy finishedSpy(m_probe, &ConnectivityProbe::probeFinished);

    m_probe->checkNow();
    m_pending.at(0)(true);
    m_pending.at(0)(false);

    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(m_probe->isOnline());
    QCOMPARE(m_probe->probesInFlight(), 0);
}

void TestConnectivityProbe::testCompletionAfterDestructionIgnored()
{
    ConnectivityProbe::CheckCallback late;
    {
        ConnectivityProbe probe;
        probe.setAsyncReachabilityCheck([&late](ConnectivityProbe::CheckCallback done) {
            late = done;
        });
        probe.checkNow();
        QCOMPARE(probe.probesInFlight(), 1);
    }

    QVERIFY(late);
    late(true);
}

// ========== Timer Tests ==========

void TestConnectivityProbe::testStartProbesImmediately()
{
    m_reachable = true;
    m_probe->setInterval(60000);
    m_probe->start();

    QVERIFY(m_probe->isRunning());
    QCOMPARE(m_checks, 1);
    QVERIFY(m_probe->isOnline());

    m_probe->stop();
    QVERIFY(!m_probe->isRunning());
}

void TestConnectivityProbe::testIntervalTimerProbes()
{
    m_probe->setInterval(20);
    m_probe->start();

    QTRY_VERIFY_WITH_TIMEOUT(m_checks >= 3, 2000);
    m_probe->stop();
}

QTEST_MAIN(TestConnectivityProbe)
#include "test_connectivityprobe.moc"
