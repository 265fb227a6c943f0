/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeEnvironment.h"

#include "KPtyBackend.h"

#include <KLocalizedString>

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QTimer>

namespace DevHaven
{

namespace
{

const QString SetupDir = QStringLiteral(".devhaven");
const QString SetupConfig = QStringLiteral("config.json");

bool copyDirectory(const QString &source, const QString &target, QString *error)
{
    if (!QDir().mkpath(target)) {
        *error = i18n("Cannot create %1", target);
        return false;
    }

    const QFileInfoList entries = QDir(source).entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo &entry : entries) {
        const QString targetPath = QDir(target).filePath(entry.fileName());
        if (entry.isDir()) {
            // Symlinked directories are skipped, like the setup tooling expects
            if (entry.isSymLink()) {
                continue;
            }
            if (!copyDirectory(entry.absoluteFilePath(), targetPath, error)) {
                return false;
            }
            continue;
        }
        if (!QFile::copy(entry.absoluteFilePath(), targetPath)) {
            *error = i18n("Cannot copy %1 to %2", entry.absoluteFilePath(), targetPath);
            return false;
        }
    }
    return true;
}

} // namespace

WorktreeEnvironment::WorktreeEnvironment(QObject *parent)
    : QObject(parent)
{
}

WorktreeEnvironment::~WorktreeEnvironment() = default;

QStringList WorktreeEnvironment::loadSetupCommands(const QString &mainRepoPath, QString *error)
{
    QFile file(QDir(mainRepoPath).filePath(SetupDir + QLatin1Char('/') + SetupConfig));
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = i18n("Cannot read setup config %1: %2", file.fileName(), file.errorString());
        }
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = i18n("Cannot parse setup config %1: %2", file.fileName(), parseError.errorString());
        }
        return {};
    }

    QStringList commands;
    const QJsonArray setup = doc.object().value(QStringLiteral("setup")).toArray();
    for (const QJsonValue &value : setup) {
        const QString command = value.toString().trimmed();
        if (!command.isEmpty()) {
            commands.append(command);
        }
    }
    return commands;
}

bool WorktreeEnvironment::copySetupDirectory(const QString &mainRepoPath, const QString &worktreePath, QString *error)
{
    const QFileInfo source(QDir(mainRepoPath).filePath(SetupDir));
    const QString target = QDir(worktreePath).filePath(SetupDir);

    if (!source.exists() || QFileInfo::exists(target)) {
        return true;
    }
    if (!source.isDir()) {
        if (error) {
            *error = i18n("%1 is not a directory", source.absoluteFilePath());
        }
        return false;
    }

    QString copyError;
    if (!copyDirectory(source.absoluteFilePath(), target, &copyError)) {
        if (error) {
            *error = copyError;
        }
        return false;
    }
    return true;
}

void WorktreeEnvironment::prepare(const QString &mainRepoPath, const QString &worktreePath, const QString &workspaceName, DoneCallback callback)
{
    m_mainRepoPath = mainRepoPath;
    m_worktreePath = worktreePath;
    m_workspaceName = workspaceName;
    m_callback = std::move(callback);
    m_warnings.clear();

    QString error;
    if (!copySetupDirectory(mainRepoPath, worktreePath, &error)) {
        m_warnings.append(i18n("Copying .devhaven failed: %1", error));
    }

    error.clear();
    m_pending = loadSetupCommands(mainRepoPath, &error);
    if (!error.isEmpty()) {
        m_warnings.append(error);
    }

    QTimer::singleShot(0, this, &WorktreeEnvironment::runNext);
}

void WorktreeEnvironment::runNext()
{
    if (m_pending.isEmpty()) {
        finish();
        return;
    }

    const QString command = m_pending.takeFirst();
    const QString shell = m_shell.isEmpty() ? KPtyBackend::userShell() : m_shell;

    qDebug() << "WorktreeEnvironment: running setup command" << command << "in" << m_worktreePath;

    auto *process = new QProcess(this);
    process->setWorkingDirectory(m_worktreePath);
    process->setProcessChannelMode(QProcess::MergedChannels);
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("DEVHAVEN_WORKSPACE_NAME"), m_workspaceName);
    env.insert(QStringLiteral("DEVHAVEN_ROOT_PATH"), m_mainRepoPath);
    process->setProcessEnvironment(env);

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, process, command](int exitCode, QProcess::ExitStatus status) {
        if (status != QProcess::NormalExit || exitCode != 0) {
            const QString output = QString::fromUtf8(process->readAll()).trimmed().right(2000);
            m_warnings.append(i18n("Setup command failed with exit code %1:\n$ %2\n%3", exitCode, command, output));
            process->deleteLater();
            // Later commands usually depend on earlier ones
            m_pending.clear();
            finish();
            return;
        }
        process->deleteLater();
        runNext();
    });
    connect(process, &QProcess::errorOccurred, this, [this, process, command](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        m_warnings.append(i18n("Could not run setup command %1: %2", command, process->errorString()));
        process->deleteLater();
        m_pending.clear();
        finish();
    });

    QTimer::singleShot(COMMAND_TIMEOUT_MS, process, [process]() {
        if (process->state() != QProcess::NotRunning) {
            qWarning() << "WorktreeEnvironment: setup command timed out";
            process->kill();
        }
    });

    process->start(shell, {QStringLiteral("-lc"), command});
}

void WorktreeEnvironment::finish()
{
    if (!m_callback) {
        return;
    }
    const QString warning = m_warnings.join(QLatin1Char('\n'));
    if (!warning.isEmpty()) {
        qWarning() << "WorktreeEnvironment: preparation finished with warnings:" << warning;
    }
    DoneCallback callback = std::move(m_callback);
    m_callback = nullptr;
    callback(warning);
}

} // namespace DevHaven

#include "moc_WorktreeEnvironment.cpp"
