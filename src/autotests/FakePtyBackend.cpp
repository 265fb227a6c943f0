/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "FakePtyBackend.h"

// Qt
#include <QTimer>

#include <utility>

namespace DevHaven
{

FakeTerminalProcess::FakeTerminalProcess(qint64 pid, int *terminateTally, QObject *parent)
    : TerminalProcess(parent)
    , m_pid(pid)
    , m_terminateTally(terminateTally)
{
}

void FakeTerminalProcess::write(const QByteArray &data)
{
    writes.append(data);
}

void FakeTerminalProcess::setWindowSize(int cols, int rows)
{
    sizes.append(QSize(cols, rows));
}

void FakeTerminalProcess::terminate()
{
    ++terminateCount;
    ++*m_terminateTally;
    if (!m_running) {
        return;
    }
    m_running = false;
    QTimer::singleShot(0, this, [this]() {
        Q_EMIT finished(-1);
    });
}

void FakeTerminalProcess::emitOutput(const QByteArray &data)
{
    Q_EMIT dataReceived(data);
}

void FakeTerminalProcess::exitWith(int exitCode)
{
    m_running = false;
    Q_EMIT finished(exitCode);
}

FakePtyBackend::FakePtyBackend(QObject *parent)
    : PtyBackend(parent)
{
}

FakeTerminalProcess *FakePtyBackend::createProcess()
{
    auto *process = new FakeTerminalProcess(1000 + processes.size(), &m_terminateTally);
    processes.append(process);
    return process;
}

void FakePtyBackend::spawn(const SpawnRequest &request, SpawnCallback callback)
{
    ++spawnCount;
    requests.append(request);

    switch (m_mode) {
    case Mode::Immediate:
        QTimer::singleShot(0, this, [this, callback]() {
            callback(createProcess(), QString());
        });
        break;
    case Mode::Deferred:
        m_pending.append(callback);
        break;
    case Mode::Fail:
        QTimer::singleShot(0, this, [this, callback]() {
            callback(nullptr, failureMessage);
        });
        break;
    }
}

int FakePtyBackend::completePending()
{
    const QList<SpawnCallback> pending = std::exchange(m_pending, {});
    for (const SpawnCallback &callback : pending) {
        callback(createProcess(), QString());
    }
    return pending.size();
}

int FakePtyBackend::failPending(const QString &error)
{
    const QList<SpawnCallback> pending = std::exchange(m_pending, {});
    for (const SpawnCallback &callback : pending) {
        callback(nullptr, error);
    }
    return pending.size();
}

}

#include "moc_FakePtyBackend.cpp"
