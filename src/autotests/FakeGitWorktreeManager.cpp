/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "FakeGitWorktreeManager.h"

// Qt
#include <QDir>
#include <QTimer>

#include <utility>

namespace DevHaven
{

FakeGitWorktreeManager::FakeGitWorktreeManager(QObject *parent)
    : GitWorktreeManager(parent)
{
}

bool FakeGitWorktreeManager::isGitRepository(const QString &path) const
{
    return repositories.contains(QDir::cleanPath(path));
}

void FakeGitWorktreeManager::listBranches(const QString &repoPath, BranchesCallback callback)
{
    Q_UNUSED(repoPath)

    if (holdBranches) {
        m_heldBranches = std::move(callback);
        return;
    }
    QTimer::singleShot(0, this, [this, callback]() {
        QList<BranchInfo> result;
        for (const QString &name : std::as_const(branches)) {
            result.append(BranchInfo{name, name == QLatin1String("main")});
        }
        callback(true, result, QString());
    });
}

void FakeGitWorktreeManager::releaseBranches()
{
    holdBranches = false;
    BranchesCallback callback = std::exchange(m_heldBranches, nullptr);
    if (callback) {
        listBranches(QString(), callback);
    }
}

void FakeGitWorktreeManager::listWorktrees(const QString &repoPath, WorktreesCallback callback)
{
    QTimer::singleShot(0, this, [this, repoPath, callback]() {
        QList<WorktreeInfo> result;
        WorktreeInfo main;
        main.path = QDir::cleanPath(repoPath);
        main.branch = QStringLiteral("main");
        main.isMain = true;
        result.append(main);
        for (const QString &path : std::as_const(worktreePaths)) {
            WorktreeInfo info;
            info.path = path;
            result.append(info);
        }
        callback(true, result, QString());
    });
}

void FakeGitWorktreeManager::addWorktree(const QString &repoPath,
                                         const QString &worktreePath,
                                         const QString &branch,
                                         bool createBranch,
                                         const QString &baseBranch,
                                         ResultCallback callback)
{
    Q_UNUSED(repoPath)

    ++addCount;
    lastBaseBranch = baseBranch;

    auto reply = [this, worktreePath, branch, createBranch, callback]() {
        if (!addError.isEmpty()) {
            callback(false, addError);
            return;
        }
        if (!QDir().mkpath(worktreePath)) {
            callback(false, QStringLiteral("fatal: could not create directory '%1'").arg(worktreePath));
            return;
        }
        if (createBranch) {
            branches.append(branch);
        }
        worktreePaths.append(QDir::cleanPath(worktreePath));
        callback(true, QString());
    };

    if (holdAdd) {
        m_heldAdd = reply;
        return;
    }
    QTimer::singleShot(0, this, reply);
}

void FakeGitWorktreeManager::releaseAdd()
{
    holdAdd = false;
    std::function<void()> reply = std::exchange(m_heldAdd, nullptr);
    if (reply) {
        QTimer::singleShot(0, this, reply);
    }
}

}

#include "moc_FakeGitWorktreeManager.cpp"
