/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYBACKEND_H
#define PTYBACKEND_H

#include "devhavenprivate_export.h"

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>

namespace DevHaven
{

/**
 * Parameters for starting an interactive shell
 */
struct DEVHAVENPRIVATE_EXPORT SpawnRequest {
    QString cwd;
    int cols = 80;
    int rows = 24;
};

/**
 * TerminalProcess is one live interactive process attached to a
 * pseudo-terminal. Output arrives through dataReceived() in the order the
 * process produced it.
 */
class DEVHAVENPRIVATE_EXPORT TerminalProcess : public QObject
{
    Q_OBJECT

public:
    explicit TerminalProcess(QObject *parent = nullptr);
    ~TerminalProcess() override;

    virtual bool isRunning() const = 0;
    virtual qint64 pid() const = 0;

    /**
     * Send keystroke bytes to the process
     */
    virtual void write(const QByteArray &data) = 0;

    virtual void setWindowSize(int cols, int rows) = 0;

    /**
     * Ask the process to exit. finished() follows once it is gone.
     */
    virtual void terminate() = 0;

Q_SIGNALS:
    void dataReceived(const QByteArray &data);
    void finished(int exitCode);
};

/**
 * PtyBackend starts shells. The production implementation is KPtyBackend;
 * tests substitute their own.
 */
class DEVHAVENPRIVATE_EXPORT PtyBackend : public QObject
{
    Q_OBJECT

public:
    /**
     * Receives the started process, or nullptr and a message on failure.
     * The callee takes ownership of the process.
     */
    using SpawnCallback = std::function<void(TerminalProcess *process, const QString &error)>;

    explicit PtyBackend(QObject *parent = nullptr);
    ~PtyBackend() override;

    /**
     * Start a shell for @p request. @p callback runs exactly once, from the
     * event loop or before spawn() returns.
     */
    virtual void spawn(const SpawnRequest &request, SpawnCallback callback) = 0;
};

} // namespace DevHaven

#endif // PTYBACKEND_H
