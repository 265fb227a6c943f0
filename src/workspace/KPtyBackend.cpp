/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "KPtyBackend.h"

#include "DevhavenSettings.h"

#include <KLocalizedString>
#include <KPtyDevice>
#include <KPtyProcess>

#include <QDebug>
#include <QFileInfo>
#include <QTimer>

#include <pwd.h>
#include <signal.h>
#include <unistd.h>

namespace DevHaven
{

KPtyTerminalProcess::KPtyTerminalProcess(QObject *parent)
    : TerminalProcess(parent)
    , m_process(new KPtyProcess(this))
{
    m_process->setPtyChannels(KPtyProcess::AllChannels);

    connect(m_process->pty(), &KPtyDevice::readyRead, this, [this]() {
        const QByteArray data = m_process->pty()->readAll();
        if (!data.isEmpty()) {
            Q_EMIT dataReceived(data);
        }
    });
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this](int exitCode, QProcess::ExitStatus) {
        Q_EMIT finished(exitCode);
    });
}

KPtyTerminalProcess::~KPtyTerminalProcess()
{
    if (isRunning()) {
        // Reaped from the event loop; the process outlives this wrapper
        m_process->disconnect(this);
        m_process->pty()->disconnect(this);
        m_process->setParent(nullptr);
        connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), m_process, &QObject::deleteLater);
        m_process->kill();
    }
}

bool KPtyTerminalProcess::isRunning() const
{
    return m_process->state() == QProcess::Running;
}

qint64 KPtyTerminalProcess::pid() const
{
    return m_process->processId();
}

void KPtyTerminalProcess::write(const QByteArray &data)
{
    if (!isRunning()) {
        return;
    }
    m_process->pty()->write(data);
}

void KPtyTerminalProcess::setWindowSize(int cols, int rows)
{
    if (cols <= 0 || rows <= 0) {
        return;
    }
    m_process->pty()->setWinSize(rows, cols);
}

void KPtyTerminalProcess::terminate()
{
    if (!isRunning()) {
        return;
    }

    // Interactive shells ignore SIGTERM; hang up like a closed terminal would
    ::kill(static_cast<pid_t>(m_process->processId()), SIGHUP);

    QPointer<KPtyProcess> process = m_process;
    QTimer::singleShot(KILL_TIMEOUT_MS, this, [process]() {
        if (process && process->state() == QProcess::Running) {
            qWarning() << "KPtyTerminalProcess: shell ignored SIGHUP, killing" << process->processId();
            process->kill();
        }
    });
}

KPtyBackend::KPtyBackend(QObject *parent)
    : PtyBackend(parent)
{
    if (auto *settings = DevhavenSettings::instance()) {
        m_shellPath = settings->shellPath();
    }
}

KPtyBackend::~KPtyBackend() = default;

QString KPtyBackend::resolveShell() const
{
    if (!m_shellPath.isEmpty()) {
        return m_shellPath;
    }
    return userShell();
}

QString KPtyBackend::userShell()
{
    const QString envShell = qEnvironmentVariable("SHELL");
    if (!envShell.isEmpty() && QFileInfo::exists(envShell)) {
        return envShell;
    }

    if (const struct passwd *pw = ::getpwuid(::getuid())) {
        if (pw->pw_shell) {
            const QString passwdShell = QString::fromLocal8Bit(pw->pw_shell);
            if (!passwdShell.isEmpty() && QFileInfo::exists(passwdShell)) {
                return passwdShell;
            }
        }
    }

    return QStringLiteral("/bin/sh");
}

void KPtyBackend::spawn(const SpawnRequest &request, SpawnCallback callback)
{
    const QFileInfo cwdInfo(request.cwd);
    if (request.cwd.isEmpty() || !cwdInfo.isDir()) {
        const QString message = i18n("Working directory does not exist: %1", request.cwd);
        QTimer::singleShot(0, this, [callback, message]() {
            callback(nullptr, message);
        });
        return;
    }

    const QString shell = resolveShell();
    const QFileInfo shellInfo(shell);
    if (!shellInfo.isFile() || !shellInfo.isExecutable()) {
        const QString message = i18n("Shell is not executable: %1", shell);
        QTimer::singleShot(0, this, [callback, message]() {
            callback(nullptr, message);
        });
        return;
    }

    auto *terminal = new KPtyTerminalProcess();
    KPtyProcess *process = terminal->ptyProcess();
    process->setProgram(shell, {QStringLiteral("-l")});
    process->setWorkingDirectory(cwdInfo.absoluteFilePath());
    process->setEnv(QStringLiteral("TERM"), QStringLiteral("xterm-256color"));
    process->setEnv(QStringLiteral("COLORTERM"), QStringLiteral("truecolor"));
    process->setEnv(QStringLiteral("SHELL"), shell);
    terminal->setWindowSize(request.cols, request.rows);

    // started and errorOccurred are mutually exclusive for a single start()
    connect(process, &QProcess::started, terminal, [terminal, callback]() {
        qDebug() << "KPtyBackend: started shell, pid" << terminal->pid();
        callback(terminal, QString());
    });
    connect(process, &QProcess::errorOccurred, terminal, [terminal, callback, shell](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        const QString message = i18n("Failed to start %1: %2", shell, terminal->ptyProcess()->errorString());
        terminal->deleteLater();
        callback(nullptr, message);
    });

    process->start();
}

} // namespace DevHaven

#include "moc_KPtyBackend.cpp"
