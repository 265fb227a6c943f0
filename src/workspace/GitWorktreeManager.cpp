/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GitWorktreeManager.h"

#include "DevhavenSettings.h"

#include <KLocalizedString>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QTimer>

#include <memory>

namespace DevHaven
{

GitWorktreeManager::GitWorktreeManager(QObject *parent)
    : QObject(parent)
{
    if (auto *settings = DevhavenSettings::instance()) {
        m_gitExecutable = settings->gitExecutable();
    }
}

GitWorktreeManager::~GitWorktreeManager() = default;

bool GitWorktreeManager::isAvailable(const QString &executable)
{
    if (QFileInfo(executable).isAbsolute()) {
        return QFileInfo(executable).isExecutable();
    }
    return !QStandardPaths::findExecutable(executable).isEmpty();
}

bool GitWorktreeManager::isGitRepository(const QString &path) const
{
    if (path.isEmpty()) {
        return false;
    }
    return QFileInfo::exists(QDir(path).filePath(QStringLiteral(".git")));
}

void GitWorktreeManager::listBranches(const QString &repoPath, BranchesCallback callback)
{
    if (!isGitRepository(repoPath)) {
        const QString message = i18n("%1 is not a Git repository", repoPath);
        QTimer::singleShot(0, this, [callback, message]() {
            callback(false, {}, message);
        });
        return;
    }

    executeCommandAsync(repoPath,
                        {QStringLiteral("branch"), QStringLiteral("--list")},
                        [this, repoPath, callback](bool ok, const QString &output, const QString &errorOutput) {
                            if (!ok) {
                                callback(false, {}, errorOutput);
                                return;
                            }

                            const QStringList names = parseBranchList(output);
                            executeCommandAsync(repoPath,
                                                {QStringLiteral("symbolic-ref"), QStringLiteral("refs/remotes/origin/HEAD")},
                                                [names, callback](bool headOk, const QString &headOutput, const QString &) {
                                                    const QString mainBranch = resolveDefaultBranch(names, headOk ? headOutput : QString());
                                                    QList<BranchInfo> branches;
                                                    for (const QString &name : names) {
                                                        branches.append(BranchInfo{name, name == mainBranch});
                                                    }
                                                    callback(true, branches, QString());
                                                });
                        });
}

void GitWorktreeManager::listWorktrees(const QString &repoPath, WorktreesCallback callback)
{
    executeCommandAsync(repoPath,
                        {QStringLiteral("worktree"), QStringLiteral("list"), QStringLiteral("--porcelain")},
                        [callback](bool ok, const QString &output, const QString &errorOutput) {
                            if (!ok) {
                                callback(false, {}, errorOutput);
                                return;
                            }
                            callback(true, parseWorktreeList(output), QString());
                        });
}

void GitWorktreeManager::addWorktree(const QString &repoPath,
                                     const QString &worktreePath,
                                     const QString &branch,
                                     bool createBranch,
                                     const QString &baseBranch,
                                     ResultCallback callback)
{
    // git worktree add -b <branch> <path> [<base>]
    // git worktree add <path> <branch>
    QStringList args{QStringLiteral("worktree"), QStringLiteral("add")};
    if (createBranch) {
        args << QStringLiteral("-b") << branch << worktreePath;
        if (!baseBranch.isEmpty()) {
            args << baseBranch;
        }
    } else {
        args << worktreePath << branch;
    }

    qDebug() << "GitWorktreeManager: adding worktree" << worktreePath << "for" << branch << "in" << repoPath;

    executeCommandAsync(repoPath, args, [callback](bool ok, const QString &, const QString &errorOutput) {
        callback(ok, ok ? QString() : errorOutput.trimmed());
    });
}

void GitWorktreeManager::removeWorktree(const QString &repoPath, const QString &worktreePath, bool force, ResultCallback callback)
{
    QStringList args{QStringLiteral("worktree"), QStringLiteral("remove")};
    if (force) {
        args << QStringLiteral("--force");
    }
    args << worktreePath;

    executeCommandAsync(repoPath, args, [callback](bool ok, const QString &, const QString &errorOutput) {
        callback(ok, ok ? QString() : errorOutput.trimmed());
    });
}

QStringList GitWorktreeManager::parseBranchList(const QString &output)
{
    QStringList branches;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString name = line;
        // "* current" and "+ checked out in another worktree"
        if (name.startsWith(QLatin1Char('*')) || name.startsWith(QLatin1Char('+'))) {
            name.remove(0, 1);
        }
        name = name.trimmed();
        if (name.isEmpty() || name.startsWith(QLatin1Char('('))) {
            continue;
        }
        branches.append(name);
    }

    return branches;
}

QString GitWorktreeManager::resolveDefaultBranch(const QStringList &branches, const QString &originHead)
{
    const QString head = originHead.trimmed().section(QLatin1Char('/'), -1);
    if (!head.isEmpty() && branches.contains(head)) {
        return head;
    }
    if (branches.contains(QStringLiteral("main"))) {
        return QStringLiteral("main");
    }
    if (branches.contains(QStringLiteral("master"))) {
        return QStringLiteral("master");
    }
    return QString();
}

QList<GitWorktreeManager::WorktreeInfo> GitWorktreeManager::parseWorktreeList(const QString &output)
{
    QList<WorktreeInfo> worktrees;
    WorktreeInfo current;
    bool inRecord = false;

    auto finish = [&]() {
        if (inRecord && !current.path.isEmpty()) {
            current.isMain = worktrees.isEmpty();
            worktrees.append(current);
        }
        current = WorktreeInfo();
        inRecord = false;
    };

    const QStringList lines = output.split(QLatin1Char('\n'));
    for (const QString &rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty()) {
            finish();
            continue;
        }

        inRecord = true;
        if (line.startsWith(QLatin1String("worktree "))) {
            current.path = line.mid(9);
        } else if (line.startsWith(QLatin1String("HEAD "))) {
            current.head = line.mid(5);
        } else if (line.startsWith(QLatin1String("branch "))) {
            QString ref = line.mid(7);
            if (ref.startsWith(QLatin1String("refs/heads/"))) {
                ref = ref.mid(11);
            }
            current.branch = ref;
        } else if (line == QLatin1String("detached")) {
            current.detached = true;
        } else if (line.startsWith(QLatin1String("prunable"))) {
            current.prunable = true;
        }
    }
    finish();

    return worktrees;
}

bool GitWorktreeManager::isValidBranchName(const QString &name)
{
    if (name.isEmpty() || name == QLatin1String("@") || name.startsWith(QLatin1Char('-')) || name.startsWith(QLatin1Char('/'))
        || name.endsWith(QLatin1Char('/')) || name.endsWith(QLatin1Char('.')) || name.endsWith(QLatin1String(".lock"))) {
        return false;
    }
    if (name.contains(QLatin1String("..")) || name.contains(QLatin1String("//")) || name.contains(QLatin1String("@{"))) {
        return false;
    }

    static const QRegularExpression forbidden(QStringLiteral("[\\x00-\\x20\\x7f~^:?*\\[\\\\]"));
    if (forbidden.match(name).hasMatch()) {
        return false;
    }

    const QStringList components = name.split(QLatin1Char('/'));
    for (const QString &component : components) {
        if (component.startsWith(QLatin1Char('.'))) {
            return false;
        }
    }
    return true;
}

void GitWorktreeManager::executeCommandAsync(const QString &workingDir,
                                             const QStringList &args,
                                             std::function<void(bool, const QString &, const QString &)> callback)
{
    auto *process = new QProcess(this);
    process->setWorkingDirectory(workingDir);

    // finished and a start failure are reported once between them
    auto done = std::make_shared<bool>(false);

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, process, callback, done](int exitCode, QProcess::ExitStatus status) {
        if (*done) {
            return;
        }
        *done = true;

        const bool ok = (status == QProcess::NormalExit && exitCode == 0);
        const QString output = QString::fromUtf8(process->readAllStandardOutput());
        const QString errorOutput = QString::fromUtf8(process->readAllStandardError());
        if (!ok && !errorOutput.isEmpty()) {
            Q_EMIT errorOccurred(errorOutput);
        }
        if (callback) {
            callback(ok, output, errorOutput);
        }
        process->deleteLater();
    });
    connect(process, &QProcess::errorOccurred, this, [this, process, callback, done](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart || *done) {
            return;
        }
        *done = true;

        const QString message = i18n("Could not run %1: %2", m_gitExecutable, process->errorString());
        qWarning() << "GitWorktreeManager:" << message;
        Q_EMIT errorOccurred(message);
        if (callback) {
            callback(false, QString(), message);
        }
        process->deleteLater();
    });

    QTimer::singleShot(COMMAND_TIMEOUT_MS, process, [process]() {
        if (process->state() != QProcess::NotRunning) {
            qWarning() << "GitWorktreeManager: git command timed out:" << process->arguments();
            process->kill();
        }
    });

    process->start(m_gitExecutable, args);
}

} // namespace DevHaven

#include "moc_GitWorktreeManager.cpp"
