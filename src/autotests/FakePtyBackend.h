/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEPTYBACKEND_H
#define FAKEPTYBACKEND_H

#include <QList>
#include <QPointer>
#include <QSize>

#include "../workspace/PtyBackend.h"

namespace DevHaven
{

/**
 * In-memory process that records what the registry does to it
 */
class FakeTerminalProcess : public TerminalProcess
{
    Q_OBJECT

public:
    FakeTerminalProcess(qint64 pid, int *terminateTally, QObject *parent = nullptr);

    bool isRunning() const override
    {
        return m_running;
    }
    qint64 pid() const override
    {
        return m_pid;
    }
    void write(const QByteArray &data) override;
    void setWindowSize(int cols, int rows) override;
    void terminate() override;

    // Test controls
    void emitOutput(const QByteArray &data);
    void exitWith(int exitCode);

    // Stop reporting as running without delivering finished()
    void markDead()
    {
        m_running = false;
    }

    QList<QByteArray> writes;
    QList<QSize> sizes;
    int terminateCount = 0;

private:
    qint64 m_pid;
    int *m_terminateTally;
    bool m_running = true;
};

/**
 * Backend whose spawns complete from the event loop, on demand, or fail
 */
class FakePtyBackend : public PtyBackend
{
    Q_OBJECT

public:
    enum class Mode {
        Immediate,
        Deferred,
        Fail
    };

    explicit FakePtyBackend(QObject *parent = nullptr);

    void spawn(const SpawnRequest &request, SpawnCallback callback) override;

    void setMode(Mode mode)
    {
        m_mode = mode;
    }

    /**
     * Complete every deferred spawn; returns how many were pending
     */
    int completePending();
    int failPending(const QString &error);

    int pendingCount() const
    {
        return m_pending.size();
    }

    /**
     * Terminate calls summed over every process this backend created
     */
    int totalTerminateCount() const
    {
        return m_terminateTally;
    }

    int spawnCount = 0;
    QList<SpawnRequest> requests;
    QList<QPointer<FakeTerminalProcess>> processes;
    QString failureMessage = QStringLiteral("shell not found");

private:
    FakeTerminalProcess *createProcess();

    Mode m_mode = Mode::Immediate;
    QList<SpawnCallback> m_pending;
    int m_terminateTally = 0;
};

}

#endif // FAKEPTYBACKEND_H
