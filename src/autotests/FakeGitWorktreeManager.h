/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEGITWORKTREEMANAGER_H
#define FAKEGITWORKTREEMANAGER_H

#include <QSet>
#include <QStringList>

#include "../workspace/GitWorktreeManager.h"

namespace DevHaven
{

/**
 * Scripted repository. Replies arrive from the event loop, or are held
 * until released when the matching hold flag is set.
 */
class FakeGitWorktreeManager : public GitWorktreeManager
{
    Q_OBJECT

public:
    explicit FakeGitWorktreeManager(QObject *parent = nullptr);

    bool isGitRepository(const QString &path) const override;
    void listBranches(const QString &repoPath, BranchesCallback callback) override;
    void listWorktrees(const QString &repoPath, WorktreesCallback callback) override;
    void addWorktree(const QString &repoPath,
                     const QString &worktreePath,
                     const QString &branch,
                     bool createBranch,
                     const QString &baseBranch,
                     ResultCallback callback) override;

    void releaseBranches();
    void releaseAdd();

    QSet<QString> repositories;
    QStringList branches;
    QStringList worktreePaths;
    QString addError;

    bool holdBranches = false;
    bool holdAdd = false;

    int addCount = 0;
    QString lastBaseBranch;

private:
    BranchesCallback m_heldBranches;
    std::function<void()> m_heldAdd;
};

}

#endif // FAKEGITWORKTREEMANAGER_H
