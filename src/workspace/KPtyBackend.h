/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef KPTYBACKEND_H
#define KPTYBACKEND_H

#include "devhavenprivate_export.h"

#include "PtyBackend.h"

#include <QPointer>

class KPtyProcess;

namespace DevHaven
{

/**
 * TerminalProcess backed by a KPtyProcess
 */
class DEVHAVENPRIVATE_EXPORT KPtyTerminalProcess : public TerminalProcess
{
    Q_OBJECT

public:
    explicit KPtyTerminalProcess(QObject *parent = nullptr);
    ~KPtyTerminalProcess() override;

    KPtyProcess *ptyProcess() const
    {
        return m_process;
    }

    bool isRunning() const override;
    qint64 pid() const override;
    void write(const QByteArray &data) override;
    void setWindowSize(int cols, int rows) override;
    void terminate() override;

private:
    KPtyProcess *m_process = nullptr;
    static constexpr int KILL_TIMEOUT_MS = 3000;
};

/**
 * KPtyBackend runs the user's shell in a KDE pseudo-terminal.
 *
 * Shell resolution order: the explicit shell path (settings), $SHELL, the
 * passwd entry of the current user, then /bin/sh. The shell starts as a
 * login shell with TERM=xterm-256color.
 */
class DEVHAVENPRIVATE_EXPORT KPtyBackend : public PtyBackend
{
    Q_OBJECT

public:
    explicit KPtyBackend(QObject *parent = nullptr);
    ~KPtyBackend() override;

    /**
     * Override the shell. Empty restores login shell detection.
     */
    void setShellPath(const QString &path)
    {
        m_shellPath = path;
    }
    QString shellPath() const
    {
        return m_shellPath;
    }

    /**
     * The shell spawn() will run
     */
    QString resolveShell() const;

    /**
     * Login shell of the current user: $SHELL, passwd, /bin/sh
     */
    static QString userShell();

    void spawn(const SpawnRequest &request, SpawnCallback callback) override;

private:
    QString m_shellPath;
};

} // namespace DevHaven

#endif // KPTYBACKEND_H
