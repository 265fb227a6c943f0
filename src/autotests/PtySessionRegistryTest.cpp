/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "PtySessionRegistryTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// DevHaven
#include "../workspace/PtySessionRegistry.h"
#include "FakePtyBackend.h"

using namespace DevHaven;

namespace
{

const SessionKey KeyA{QStringLiteral("terminal-alpha"), QStringLiteral("session-a")};
const SessionKey KeyB{QStringLiteral("terminal-alpha"), QStringLiteral("session-b")};

SpawnRequest request(const QString &cwd = QStringLiteral("/tmp"))
{
    SpawnRequest r;
    r.cwd = cwd;
    r.cols = 100;
    r.rows = 30;
    return r;
}

// Acquire @p key and wait until its shell is up
FakeTerminalProcess *startSession(PtySessionRegistry &registry, const SessionKey &key)
{
    registry.acquire(key);
    TerminalProcess *started = nullptr;
    bool done = false;
    registry.ensureProcess(key, request(), [&](TerminalProcess *process, const QString &) {
        started = process;
        done = true;
    });
    if (!QTest::qWaitFor([&]() {
            return done;
        })) {
        return nullptr;
    }
    return qobject_cast<FakeTerminalProcess *>(started);
}

}

void PtySessionRegistryTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<DevHaven::SessionKey>();
}

void PtySessionRegistryTest::testSessionKey()
{
    QVERIFY(KeyA.isValid());
    QVERIFY(!SessionKey{QString(), QStringLiteral("x")}.isValid());
    QCOMPARE(KeyA.toString(), QStringLiteral("terminal-alpha:session-a"));
    QVERIFY(KeyA != KeyB);
    QVERIFY(KeyA == (SessionKey{QStringLiteral("terminal-alpha"), QStringLiteral("session-a")}));
    QCOMPARE(qHash(KeyA), qHash(SessionKey{QStringLiteral("terminal-alpha"), QStringLiteral("session-a")}));
}

void PtySessionRegistryTest::testWindowLabelForProject()
{
    QCOMPARE(SessionKey::windowLabelForProject(QStringLiteral("p1")), QStringLiteral("terminal-p1"));
    QCOMPARE(SessionKey::windowLabelForProject(QString()), QStringLiteral("terminal"));
}

void PtySessionRegistryTest::testAcquireRelease()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(20);

    QVERIFY(!registry.hasEntry(KeyA));
    registry.acquire(KeyA);
    registry.acquire(KeyA);
    QCOMPARE(registry.refCount(KeyA), 2);

    registry.release(KeyA);
    QCOMPARE(registry.refCount(KeyA), 1);
    registry.release(KeyA);
    QCOMPARE(registry.refCount(KeyA), 0);

    // The entry lives on until the grace period is over
    QVERIFY(registry.hasEntry(KeyA));
    QTRY_VERIFY(!registry.hasEntry(KeyA));
}

void PtySessionRegistryTest::testUnbalancedRelease()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    registry.release(KeyA);
    QVERIFY(!registry.hasEntry(KeyA));

    registry.acquire(KeyA);
    registry.release(KeyA);
    registry.release(KeyA);
    QCOMPARE(registry.refCount(KeyA), 0);
}

void PtySessionRegistryTest::testInvalidKeyIgnored()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    const SessionKey invalid{QStringLiteral("terminal"), QString()};
    registry.acquire(invalid);
    QVERIFY(!registry.hasEntry(invalid));
}

void PtySessionRegistryTest::testConcurrentEnsureSpawnsOnce()
{
    FakePtyBackend backend;
    backend.setMode(FakePtyBackend::Mode::Deferred);
    PtySessionRegistry registry(&backend);
    QSignalSpy startedSpy(&registry, &PtySessionRegistry::processStarted);

    registry.acquire(KeyA);
    registry.acquire(KeyA);

    QList<TerminalProcess *> results;
    for (int i = 0; i < 5; ++i) {
        registry.ensureProcess(KeyA, request(), [&results](TerminalProcess *process, const QString &error) {
            QVERIFY(error.isEmpty());
            results.append(process);
        });
    }

    QCOMPARE(backend.spawnCount, 1);
    QVERIFY(registry.isSpawning(KeyA));
    QVERIFY(results.isEmpty());

    QCOMPARE(backend.completePending(), 1);
    QCOMPARE(results.size(), 5);
    for (TerminalProcess *process : std::as_const(results)) {
        QVERIFY(process);
        QCOMPARE(process, results.first());
    }
    QVERIFY(!registry.isSpawning(KeyA));
    QVERIFY(registry.hasLiveProcess(KeyA));
    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(startedSpy.first().at(1).toLongLong(), results.first()->pid());
    QCOMPARE(backend.requests.first().cwd, QStringLiteral("/tmp"));
}

void PtySessionRegistryTest::testEnsureReturnsLiveProcess()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    // Returned before ensureProcess comes back, without a new spawn
    TerminalProcess *again = nullptr;
    registry.ensureProcess(KeyA, request(), [&again](TerminalProcess *p, const QString &) {
        again = p;
    });
    QCOMPARE(again, process);
    QCOMPARE(backend.spawnCount, 1);
    QCOMPARE(registry.process(KeyA), process);
    QCOMPARE(registry.liveKeys(), QList<SessionKey>{KeyA});
}

void PtySessionRegistryTest::testEnsureWithoutAcquire()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    QString failure;
    registry.ensureProcess(KeyA, request(), [&failure](TerminalProcess *process, const QString &error) {
        QVERIFY(!process);
        failure = error;
    });
    QVERIFY(!failure.isEmpty());
    QCOMPARE(backend.spawnCount, 0);
}

void PtySessionRegistryTest::testSpawnFailureReachesEveryWaiter()
{
    FakePtyBackend backend;
    backend.setMode(FakePtyBackend::Mode::Deferred);
    PtySessionRegistry registry(&backend);
    QSignalSpy failedSpy(&registry, &PtySessionRegistry::spawnFailed);

    registry.acquire(KeyA);
    QStringList errors;
    for (int i = 0; i < 3; ++i) {
        registry.ensureProcess(KeyA, request(), [&errors](TerminalProcess *process, const QString &error) {
            QVERIFY(!process);
            errors.append(error);
        });
    }

    QCOMPARE(backend.failPending(QStringLiteral("no such directory")), 1);
    QCOMPARE(errors, QStringList(3, QStringLiteral("no such directory")));
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).value<DevHaven::SessionKey>(), KeyA);
    QVERIFY(!registry.isSpawning(KeyA));
    QVERIFY(registry.hasEntry(KeyA));
}

void PtySessionRegistryTest::testSpawnFailureIsRetryable()
{
    FakePtyBackend backend;
    backend.setMode(FakePtyBackend::Mode::Fail);
    PtySessionRegistry registry(&backend);

    registry.acquire(KeyA);
    bool failed = false;
    registry.ensureProcess(KeyA, request(), [&failed](TerminalProcess *process, const QString &error) {
        failed = !process && error == QStringLiteral("shell not found");
    });
    QTRY_VERIFY(failed);

    backend.setMode(FakePtyBackend::Mode::Immediate);
    TerminalProcess *started = nullptr;
    registry.ensureProcess(KeyA, request(), [&started](TerminalProcess *process, const QString &) {
        started = process;
    });
    QTRY_VERIFY(started);
    QCOMPARE(backend.spawnCount, 2);
}

void PtySessionRegistryTest::testKeysAreIsolated()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    const SessionKey otherWindow{QStringLiteral("terminal-beta"), KeyA.sessionId};
    FakeTerminalProcess *first = startSession(registry, KeyA);
    FakeTerminalProcess *second = startSession(registry, otherWindow);

    QVERIFY(first && second);
    QVERIFY(first != second);
    QCOMPARE(backend.spawnCount, 2);
}

void PtySessionRegistryTest::testReleaseThenAcquireKeepsProcess()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(50);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    // Pane unmounts and remounts right away
    registry.release(KeyA);
    registry.acquire(KeyA);
    QTest::qWait(150);

    QCOMPARE(process->terminateCount, 0);
    QVERIFY(registry.hasLiveProcess(KeyA));

    TerminalProcess *again = nullptr;
    registry.ensureProcess(KeyA, request(), [&again](TerminalProcess *p, const QString &) {
        again = p;
    });
    QCOMPARE(again, process);
    QCOMPARE(backend.spawnCount, 1);
}

void PtySessionRegistryTest::testGracePeriodKillsOnce()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(30);
    QSignalSpy removedSpy(&registry, &PtySessionRegistry::entryRemoved);

    QVERIFY(startSession(registry, KeyA));
    registry.release(KeyA);
    QCOMPARE(backend.totalTerminateCount(), 0);

    QTRY_VERIFY(!registry.hasEntry(KeyA));
    QTest::qWait(100);
    QCOMPARE(backend.totalTerminateCount(), 1);
    QCOMPARE(removedSpy.count(), 1);
}

void PtySessionRegistryTest::testReleaseDuringSpawn()
{
    FakePtyBackend backend;
    backend.setMode(FakePtyBackend::Mode::Deferred);
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(0);

    registry.acquire(KeyA);
    QString error;
    registry.ensureProcess(KeyA, request(), [&error](TerminalProcess *process, const QString &message) {
        QVERIFY(!process);
        error = message;
    });
    registry.release(KeyA);
    QTRY_VERIFY(!registry.hasEntry(KeyA));
    QVERIFY(!error.isEmpty());

    // The shell that shows up late is not adopted
    backend.completePending();
    QCOMPARE(backend.totalTerminateCount(), 1);
    QVERIFY(!registry.hasEntry(KeyA));
}

void PtySessionRegistryTest::testTerminateSkipsGracePeriod()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(60000);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);
    registry.terminate(KeyA);

    QVERIFY(!registry.hasEntry(KeyA));
    QCOMPARE(backend.totalTerminateCount(), 1);
}

void PtySessionRegistryTest::testWriteForwarded()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);
    registry.write(KeyA, "ls -la\r");
    registry.write(KeyA, "\x03");

    QCOMPARE(process->writes, (QList<QByteArray>{"ls -la\r", "\x03"}));
}

void PtySessionRegistryTest::testWriteWithoutProcessDropped()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    registry.acquire(KeyA);
    registry.write(KeyA, "echo lost\r");
    registry.write(KeyB, "echo lost\r");
    QCOMPARE(backend.spawnCount, 0);
}

void PtySessionRegistryTest::testResizeCoalesced()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);
    process->sizes.clear();

    registry.resize(KeyA, 80, 24);
    registry.resize(KeyA, 90, 25);
    registry.resize(KeyA, 120, 40);
    registry.resize(KeyA, 0, 40);
    QVERIFY(process->sizes.isEmpty());

    QTRY_COMPARE(process->sizes.size(), 1);
    QTest::qWait(20);
    QCOMPARE(process->sizes, QList<QSize>{QSize(120, 40)});
}

void PtySessionRegistryTest::testResizeBeforeSpawnApplied()
{
    FakePtyBackend backend;
    backend.setMode(FakePtyBackend::Mode::Deferred);
    PtySessionRegistry registry(&backend);

    registry.acquire(KeyA);
    registry.ensureProcess(KeyA, request(), nullptr);
    registry.resize(KeyA, 132, 43);
    QTest::qWait(10);

    backend.completePending();
    FakeTerminalProcess *process = backend.processes.first();
    QVERIFY(process);
    QCOMPARE(process->sizes, QList<QSize>{QSize(132, 43)});
}

void PtySessionRegistryTest::testFanOutInOrder()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    QByteArray first;
    QByteArray second;
    PtySessionRegistry::Unsubscribe unsubscribeFirst = registry.subscribeOutput(KeyA, [&first](const QByteArray &data) {
        first.append(data);
    });
    PtySessionRegistry::Unsubscribe unsubscribeSecond = registry.subscribeOutput(KeyA, [&second](const QByteArray &data) {
        second.append(data);
    });
    QVERIFY(unsubscribeFirst);
    QVERIFY(unsubscribeSecond);
    QCOMPARE(registry.subscriberCount(KeyA), 2);

    for (const char *chunk : {"a", "b", "c", "d"}) {
        process->emitOutput(chunk);
    }
    QCOMPARE(first, QByteArray("abcd"));
    QCOMPARE(second, QByteArray("abcd"));

    unsubscribeFirst();
    process->emitOutput("e");
    QCOMPARE(first, QByteArray("abcd"));
    QCOMPARE(second, QByteArray("abcde"));
    QCOMPARE(registry.subscriberCount(KeyA), 1);
}

void PtySessionRegistryTest::testUnsubscribeDuringDelivery()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    int laterCalls = 0;
    PtySessionRegistry::Unsubscribe unsubscribeLater;
    PtySessionRegistry::Unsubscribe unsubscribeFirst = registry.subscribeOutput(KeyA, [&unsubscribeLater](const QByteArray &) {
        if (unsubscribeLater) {
            unsubscribeLater();
        }
    });
    unsubscribeLater = registry.subscribeOutput(KeyA, [&laterCalls](const QByteArray &) {
        ++laterCalls;
    });

    process->emitOutput("x");
    QCOMPARE(laterCalls, 0);
    QCOMPARE(registry.subscriberCount(KeyA), 1);
    unsubscribeFirst();
}

void PtySessionRegistryTest::testReplayBufferBounded()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setReplayBufferLimit(10);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    process->emitOutput("012345");
    QCOMPARE(registry.replayBuffer(KeyA), QByteArray("012345"));
    process->emitOutput("6789ab");
    QCOMPARE(registry.replayBuffer(KeyA), QByteArray("23456789ab"));
    QVERIFY(registry.replayBuffer(KeyB).isEmpty());
}

void PtySessionRegistryTest::testOutputActivityAfterSubscribers()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    bool delivered = false;
    bool deliveredBeforeSignal = false;
    PtySessionRegistry::Unsubscribe unsubscribe = registry.subscribeOutput(KeyA, [&delivered](const QByteArray &) {
        delivered = true;
    });
    connect(&registry, &PtySessionRegistry::outputActivity, this, [&](const SessionKey &key) {
        QCOMPARE(key, KeyA);
        deliveredBeforeSignal = delivered;
    });

    process->emitOutput("prompt$ ");
    QVERIFY(deliveredBeforeSignal);
    unsubscribe();
}

void PtySessionRegistryTest::testSubscribeWithoutEntry()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    QSignalSpy failedSpy(&registry, &PtySessionRegistry::sessionFailed);

    const PtySessionRegistry::Unsubscribe unsubscribe = registry.subscribeOutput(KeyA, [](const QByteArray &) { });
    QVERIFY(!unsubscribe);
    QCOMPARE(failedSpy.count(), 1);
}

void PtySessionRegistryTest::testSubscribeToDeadProcessTearsDown()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(60000);
    QSignalSpy failedSpy(&registry, &PtySessionRegistry::sessionFailed);
    QSignalSpy removedSpy(&registry, &PtySessionRegistry::entryRemoved);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);
    process->markDead();

    const PtySessionRegistry::Unsubscribe unsubscribe = registry.subscribeOutput(KeyA, [](const QByteArray &) { });
    QVERIFY(!unsubscribe);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(removedSpy.count(), 1);

    // Torn down at once, not after the grace period
    QVERIFY(!registry.hasEntry(KeyA));
}

void PtySessionRegistryTest::testExitKeepsSubscribersAndRespawns()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    QSignalSpy exitedSpy(&registry, &PtySessionRegistry::processExited);

    FakeTerminalProcess *process = startSession(registry, KeyA);
    QVERIFY(process);

    QByteArray received;
    PtySessionRegistry::Unsubscribe unsubscribe = registry.subscribeOutput(KeyA, [&received](const QByteArray &data) {
        received.append(data);
    });

    process->exitWith(3);
    QCOMPARE(exitedSpy.count(), 1);
    QCOMPARE(exitedSpy.first().at(1).toInt(), 3);
    QVERIFY(!registry.hasLiveProcess(KeyA));
    QVERIFY(registry.hasEntry(KeyA));
    QCOMPARE(registry.subscriberCount(KeyA), 1);

    TerminalProcess *respawned = nullptr;
    registry.ensureProcess(KeyA, request(), [&respawned](TerminalProcess *p, const QString &) {
        respawned = p;
    });
    QTRY_VERIFY(respawned);
    QCOMPARE(backend.spawnCount, 2);

    static_cast<FakeTerminalProcess *>(respawned)->emitOutput("again");
    QCOMPARE(received, QByteArray("again"));
    unsubscribe();
}

void PtySessionRegistryTest::testSnapshotProvider()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);

    QVERIFY(registry.snapshot(KeyA).isNull());

    registry.acquire(KeyA);
    QVERIFY(registry.snapshot(KeyA).isNull());

    QString surface = QStringLiteral("first screen");
    const quint64 token = registry.setSnapshotProvider(KeyA, [&surface]() {
        return surface;
    });
    QVERIFY(token != 0);
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("first screen"));

    surface = QStringLiteral("second screen");
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("second screen"));

    // The last serialized state survives the surface going away
    registry.clearSnapshotProvider(KeyA, token);
    surface = QStringLiteral("never seen");
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("second screen"));
}

void PtySessionRegistryTest::testReplacedSnapshotProviderNotCleared()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.acquire(KeyA);
    registry.acquire(KeyA);

    const quint64 first = registry.setSnapshotProvider(KeyA, []() {
        return QStringLiteral("old surface");
    });
    int calls = 0;
    const quint64 second = registry.setSnapshotProvider(KeyA, [&calls]() {
        ++calls;
        return QStringLiteral("new surface %1").arg(calls);
    });
    QVERIFY(first != second);

    // The outdated registration cannot remove its successor
    registry.clearSnapshotProvider(KeyA, first);
    QCOMPARE(calls, 0);
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("new surface 1"));
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("new surface 2"));

    registry.clearSnapshotProvider(KeyA, second);
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("new surface 3"));
    QCOMPARE(calls, 3);

    QCOMPARE(registry.setSnapshotProvider(KeyB, []() {
        return QString();
    }),
             quint64(0));
}

void PtySessionRegistryTest::testSnapshotCachedOnRelease()
{
    FakePtyBackend backend;
    PtySessionRegistry registry(&backend);
    registry.setGracePeriod(60000);

    registry.acquire(KeyA);
    int calls = 0;
    registry.setSnapshotProvider(KeyA, [&calls]() {
        ++calls;
        return QStringLiteral("buffer %1").arg(calls);
    });

    registry.release(KeyA);
    QCOMPARE(calls, 1);

    registry.setSnapshotProvider(KeyA, []() {
        return QString();
    });
    QCOMPARE(registry.snapshot(KeyA), QStringLiteral("buffer 1"));
}

QTEST_GUILESS_MAIN(PtySessionRegistryTest)

#include "moc_PtySessionRegistryTest.cpp"
